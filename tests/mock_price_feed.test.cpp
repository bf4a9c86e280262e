#include <gtest/gtest.h>
#include "core/mock_price_feed.hpp"
using namespace std;

TEST(mock_price_feed, starts_at_round_one) {
    MockPriceFeed feed;
    EXPECT_EQ(feed.decimals(), MOCK_FEED_DECIMALS);
    EXPECT_EQ(feed.version(), (uint64_t)MOCK_FEED_VERSION);
    EXPECT_EQ(feed.description(), MOCK_FEED_DESCRIPTION);

    RoundData round = feed.latestRoundData();
    EXPECT_EQ(round.roundId, 1u);
    EXPECT_EQ(round.answeredInRound, 1u);
    EXPECT_EQ(round.answer, OracleAnswer(MOCK_FEED_INITIAL_PRICE));
    EXPECT_EQ(round.startedAt, round.updatedAt);
    EXPECT_GT(round.updatedAt, 0u);
}

TEST(mock_price_feed, update_answer_opens_new_round) {
    MockPriceFeed feed(8, OracleAnswer(100));
    feed.updateAnswer(OracleAnswer(250));
    EXPECT_EQ(feed.latestRound(), 2u);
    EXPECT_EQ(feed.latestAnswer(), OracleAnswer(250));
    EXPECT_EQ(feed.getAnswer(1), OracleAnswer(100));
    EXPECT_EQ(feed.getAnswer(2), OracleAnswer(250));

    LatestAnswer latest = feed.latest();
    EXPECT_EQ(latest.answer, OracleAnswer(250));
    EXPECT_EQ(latest.updatedAt, feed.latestTimestamp());
}

TEST(mock_price_feed, update_round_data_sets_explicit_round) {
    MockPriceFeed feed;
    feed.updateRoundData(42, OracleAnswer(-5), 1700000100, 1700000000);
    RoundData round = feed.latestRoundData();
    EXPECT_EQ(round.roundId, 42u);
    EXPECT_EQ(round.answer, OracleAnswer(-5));
    EXPECT_EQ(round.updatedAt, 1700000100u);
    EXPECT_EQ(round.startedAt, 1700000000u);
    EXPECT_EQ(round.answeredInRound, 42u);
    EXPECT_EQ(feed.getTimestamp(42), 1700000100u);

    feed.updateAnswer(OracleAnswer(7));
    EXPECT_EQ(feed.latestRound(), 43u);
}

TEST(mock_price_feed, unknown_round_is_an_oracle_error) {
    MockPriceFeed feed;
    EXPECT_THROW(feed.getRoundData(99), OracleError);
    EXPECT_THROW(feed.getAnswer(0), OracleError);
}

TEST(mock_price_feed, built_from_config) {
    json data = {{"mockFeed", {{"decimals", 18}, {"initialAnswer", "2000000000000000000000"}}}};
    std::unique_ptr<MockPriceFeed> feed = mockPriceFeedFromConfig(ledgerConfigFromJson(data));
    EXPECT_EQ(feed->decimals(), 18);
    EXPECT_EQ(feed->latestAnswer(), OracleAnswer("2000000000000000000000"));
    EXPECT_EQ(feed->latestRound(), 1u);

    std::unique_ptr<MockPriceFeed> defaults = mockPriceFeedFromConfig(defaultLedgerConfig());
    EXPECT_EQ(defaults->decimals(), MOCK_FEED_DECIMALS);
    EXPECT_EQ(defaults->latestAnswer(), OracleAnswer(MOCK_FEED_INITIAL_PRICE));
}
