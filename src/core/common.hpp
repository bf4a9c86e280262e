#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <boost/multiprecision/cpp_int.hpp>
#include <nlohmann/json.hpp>
#include "constants.hpp"

using json = nlohmann::json;

typedef std::array<uint8_t, 20> ContributorAddress;
typedef boost::multiprecision::uint256_t TransactionAmount;
typedef boost::multiprecision::int256_t OracleAnswer;
typedef boost::multiprecision::uint512_t WideAmount;

#define NULL_ADDRESS ContributorAddress()

// whole units of the reference currency scaled to REFERENCE_DECIMALS
#define USD(x) (TransactionAmount(x) * TransactionAmount(REFERENCE_SCALE))

enum ExecutionStatus {
    SUCCESS,
    ORACLE_ERROR,
    INSUFFICIENT_CONTRIBUTION,
    NOT_AUTHORIZED,
    TRANSFER_FAILED,
    BALANCE_OVERFLOW
};

std::string executionStatusAsString(ExecutionStatus status);
