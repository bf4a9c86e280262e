#pragma once
#include <string>
#include <cstdint>

// Reference currency
#define REFERENCE_DECIMALS 18
#define REFERENCE_SCALE "1000000000000000000"
#define MINIMUM_USD_WHOLE 5
// 10^77 is the largest power of ten below 2^256
#define MAX_RESCALE_DIGITS 77

// Raw value unit
#define WEI_PER_ETH "1000000000000000000"

// Mock oracle defaults
#define MOCK_FEED_DECIMALS 8
#define MOCK_FEED_INITIAL_PRICE 200000000000LL
#define MOCK_FEED_DESCRIPTION "ETH / USD (mock)"
#define MOCK_FEED_VERSION 0

// Files
#define LEDGER_FILE_PATH "./data/ledger"
#define CONFIG_FILE_PATH "./config.json"

// Store keys
#define OWNER_KEY "meta:owner"
#define BALANCE_KEY "meta:balance"
#define FUNDER_COUNT_KEY "meta:funders"
#define RECORD_PREFIX 'c'
#define FUNDER_PREFIX 's'

#define AMOUNT_BYTES 32
