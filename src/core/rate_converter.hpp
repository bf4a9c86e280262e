#pragma once
#include "common.hpp"
#include "price_feed.hpp"

class RateConverter {
    public:
        // latest oracle answer rescaled to REFERENCE_DECIMALS; throws OracleError
        // when the feed has no usable (positive) answer
        static TransactionAmount normalizedRate(const PriceFeed& feed);

        // rawAmount * normalizedRate / 10^REFERENCE_DECIMALS
        static TransactionAmount convert(const TransactionAmount& rawAmount, const PriceFeed& feed);
};
