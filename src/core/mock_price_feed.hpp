#pragma once
#include <map>
#include <memory>
#include <mutex>
#include "price_feed.hpp"
#include "config.hpp"

// Settable in-process feed with the same read surface as a production
// aggregator. Every updateAnswer starts a new round stamped with the
// current time.
class MockPriceFeed : public PriceFeed {
    public:
        MockPriceFeed(uint8_t decimals = MOCK_FEED_DECIMALS, OracleAnswer initialAnswer = OracleAnswer(MOCK_FEED_INITIAL_PRICE));
        uint8_t decimals() const;
        std::string description() const;
        uint64_t version() const;
        RoundData getRoundData(uint64_t roundId) const;
        RoundData latestRoundData() const;

        void updateAnswer(OracleAnswer answer);
        void updateRoundData(uint64_t roundId, OracleAnswer answer, uint64_t timestamp, uint64_t startedAt);

        uint64_t latestRound() const;
        OracleAnswer latestAnswer() const;
        uint64_t latestTimestamp() const;
        OracleAnswer getAnswer(uint64_t roundId) const;
        uint64_t getTimestamp(uint64_t roundId) const;

    protected:
        uint8_t feedDecimals;
        uint64_t currentRound;
        std::map<uint64_t, RoundData> rounds;
        mutable std::mutex lock;
};

std::unique_ptr<MockPriceFeed> mockPriceFeedFromConfig(const LedgerConfig& config);
