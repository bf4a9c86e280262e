#pragma once
#include <stdexcept>
#include <string>
#include "common.hpp"

class OracleError : public std::runtime_error {
    public:
        explicit OracleError(const std::string& what) : std::runtime_error(what) {}
};

struct RoundData {
    uint64_t roundId;
    OracleAnswer answer;
    uint64_t startedAt;
    uint64_t updatedAt;
    uint64_t answeredInRound;
};

struct LatestAnswer {
    OracleAnswer answer;
    uint64_t updatedAt;
};

// Read surface of an external price oracle. Implementations throw
// OracleError when no answer is available.
class PriceFeed {
    public:
        virtual ~PriceFeed() {}
        virtual uint8_t decimals() const = 0;
        virtual std::string description() const = 0;
        virtual uint64_t version() const = 0;
        virtual RoundData getRoundData(uint64_t roundId) const = 0;
        virtual RoundData latestRoundData() const = 0;

        LatestAnswer latest() const {
            RoundData round = latestRoundData();
            return LatestAnswer{round.answer, round.updatedAt};
        }
};
