#pragma once
#include <string>
#include "common.hpp"

struct LedgerConfig {
    std::string dbPath;
    ContributorAddress owner;
    bool logging;
    uint8_t mockFeedDecimals;
    OracleAnswer mockFeedInitialAnswer;
};

LedgerConfig defaultLedgerConfig();
LedgerConfig ledgerConfigFromJson(const json& data);
LedgerConfig loadLedgerConfig(std::string filePath = CONFIG_FILE_PATH);
json ledgerConfigToJson(const LedgerConfig& config);
void applyLedgerConfig(const LedgerConfig& config);
