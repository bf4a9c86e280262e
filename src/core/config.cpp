#include <stdexcept>
#include "config.hpp"
#include "helpers.hpp"
#include "logger.hpp"
using namespace std;

LedgerConfig defaultLedgerConfig() {
    LedgerConfig config;
    config.dbPath = LEDGER_FILE_PATH;
    config.owner = NULL_ADDRESS;
    config.logging = true;
    config.mockFeedDecimals = MOCK_FEED_DECIMALS;
    config.mockFeedInitialAnswer = OracleAnswer(MOCK_FEED_INITIAL_PRICE);
    return config;
}

LedgerConfig ledgerConfigFromJson(const json& data) {
    LedgerConfig config = defaultLedgerConfig();
    if (!data.is_object()) {
        return config;
    }
    if (data.contains("dbPath")) {
        config.dbPath = data["dbPath"].get<string>();
    }
    if (data.contains("owner")) {
        config.owner = stringToAddress(data["owner"].get<string>());
    }
    if (data.contains("logging")) {
        config.logging = data["logging"].get<bool>();
    }
    if (data.contains("mockFeed")) {
        const json& feed = data["mockFeed"];
        if (feed.contains("decimals")) {
            int decimals = feed["decimals"].get<int>();
            if (decimals < 0 || decimals > 77) throw std::runtime_error("mockFeed.decimals out of range");
            config.mockFeedDecimals = (uint8_t)decimals;
        }
        if (feed.contains("initialAnswer")) {
            // string form keeps answers wider than 64 bits intact
            if (feed["initialAnswer"].is_string()) {
                config.mockFeedInitialAnswer = OracleAnswer(feed["initialAnswer"].get<string>());
            } else {
                config.mockFeedInitialAnswer = OracleAnswer(feed["initialAnswer"].get<int64_t>());
            }
        }
    }
    return config;
}

LedgerConfig loadLedgerConfig(string filePath) {
    json data = readJsonFromFile(filePath);
    if (!data.is_object()) {
        Logger::logStatus(YELLOW + "[CONFIG]" + RESET + " No config at " + filePath + ", using defaults");
        return defaultLedgerConfig();
    }
    LedgerConfig config = ledgerConfigFromJson(data);
    Logger::logStatus(GREEN + "[CONFIG]" + RESET + " Loaded " + filePath + " (db: " + config.dbPath + ", owner: " + addressToString(config.owner) + ")");
    return config;
}

json ledgerConfigToJson(const LedgerConfig& config) {
    return {
        {"dbPath", config.dbPath},
        {"owner", addressToString(config.owner)},
        {"logging", config.logging},
        {"mockFeed", {
            {"decimals", (int)config.mockFeedDecimals},
            {"initialAnswer", config.mockFeedInitialAnswer.str()}
        }}
    };
}

void applyLedgerConfig(const LedgerConfig& config) {
    Logger::setEnabled(config.logging);
}
