#include <chrono>
#include "mock_price_feed.hpp"
using namespace std;

static uint64_t nowSeconds() {
    return (uint64_t)std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

MockPriceFeed::MockPriceFeed(uint8_t decimals, OracleAnswer initialAnswer) : feedDecimals(decimals), currentRound(0) {
    updateAnswer(initialAnswer);
}

uint8_t MockPriceFeed::decimals() const {
    return feedDecimals;
}

string MockPriceFeed::description() const {
    return MOCK_FEED_DESCRIPTION;
}

uint64_t MockPriceFeed::version() const {
    return MOCK_FEED_VERSION;
}

RoundData MockPriceFeed::getRoundData(uint64_t roundId) const {
    std::lock_guard<std::mutex> guard(lock);
    auto it = rounds.find(roundId);
    if (it == rounds.end()) {
        throw OracleError("No data present for round " + std::to_string(roundId));
    }
    return it->second;
}

RoundData MockPriceFeed::latestRoundData() const {
    std::lock_guard<std::mutex> guard(lock);
    auto it = rounds.find(currentRound);
    if (it == rounds.end()) {
        throw OracleError("No data present");
    }
    return it->second;
}

void MockPriceFeed::updateAnswer(OracleAnswer answer) {
    std::lock_guard<std::mutex> guard(lock);
    uint64_t now = nowSeconds();
    currentRound++;
    rounds[currentRound] = RoundData{currentRound, answer, now, now, currentRound};
}

void MockPriceFeed::updateRoundData(uint64_t roundId, OracleAnswer answer, uint64_t timestamp, uint64_t startedAt) {
    std::lock_guard<std::mutex> guard(lock);
    currentRound = roundId;
    rounds[roundId] = RoundData{roundId, answer, startedAt, timestamp, roundId};
}

uint64_t MockPriceFeed::latestRound() const {
    std::lock_guard<std::mutex> guard(lock);
    return currentRound;
}

OracleAnswer MockPriceFeed::latestAnswer() const {
    return latestRoundData().answer;
}

uint64_t MockPriceFeed::latestTimestamp() const {
    return latestRoundData().updatedAt;
}

OracleAnswer MockPriceFeed::getAnswer(uint64_t roundId) const {
    return getRoundData(roundId).answer;
}

uint64_t MockPriceFeed::getTimestamp(uint64_t roundId) const {
    return getRoundData(roundId).updatedAt;
}

std::unique_ptr<MockPriceFeed> mockPriceFeedFromConfig(const LedgerConfig& config) {
    return std::unique_ptr<MockPriceFeed>(new MockPriceFeed(config.mockFeedDecimals, config.mockFeedInitialAnswer));
}
