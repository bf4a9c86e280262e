#include <limits>
#include <stdexcept>
#include "rate_converter.hpp"
using namespace std;

typedef boost::multiprecision::uint1024_t ProductAmount;

static WideAmount pow10Wide(unsigned exponent) {
    return boost::multiprecision::pow(WideAmount(10), exponent);
}

static TransactionAmount narrow(const WideAmount& value, const string& context) {
    if (value > WideAmount((std::numeric_limits<TransactionAmount>::max)())) {
        throw std::overflow_error(context + " does not fit in 256 bits");
    }
    return TransactionAmount(value);
}

// rate at REFERENCE_DECIMALS; any positive int256 answer fits in 512 bits
static WideAmount wideRate(const PriceFeed& feed) {
    LatestAnswer latest;
    uint8_t feedDecimals = 0;
    try {
        latest = feed.latest();
        feedDecimals = feed.decimals();
    } catch (const OracleError&) {
        throw;
    } catch (const std::exception& e) {
        throw OracleError(string("Price feed unavailable: ") + e.what());
    }

    if (latest.answer <= 0) {
        throw OracleError("Price feed returned non-positive answer " + latest.answer.str());
    }

    WideAmount answer = WideAmount(TransactionAmount(latest.answer));
    if (feedDecimals <= REFERENCE_DECIMALS) {
        return answer * pow10Wide(REFERENCE_DECIMALS - feedDecimals);
    }
    if (feedDecimals - REFERENCE_DECIMALS > MAX_RESCALE_DIGITS) {
        throw OracleError("Price feed declares " + std::to_string(feedDecimals) + " decimals, no answer survives rescaling");
    }
    WideAmount rate = answer / pow10Wide(feedDecimals - REFERENCE_DECIMALS);
    if (rate == 0) {
        throw OracleError("Price feed answer " + latest.answer.str() + " rounds to zero at " + std::to_string(REFERENCE_DECIMALS) + " decimals");
    }
    return rate;
}

TransactionAmount RateConverter::normalizedRate(const PriceFeed& feed) {
    return narrow(wideRate(feed), "Normalized rate");
}

TransactionAmount RateConverter::convert(const TransactionAmount& rawAmount, const PriceFeed& feed) {
    ProductAmount product = ProductAmount(rawAmount) * ProductAmount(wideRate(feed));
    ProductAmount value = product / ProductAmount(pow10Wide(REFERENCE_DECIMALS));
    if (value > ProductAmount((std::numeric_limits<TransactionAmount>::max)())) {
        throw std::overflow_error("Converted value does not fit in 256 bits");
    }
    return TransactionAmount(value);
}
