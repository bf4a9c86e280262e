#pragma once
#include <map>
#include <vector>
#include "../core/common.hpp"

// LedgerState represents a snapshot of contributor records
using LedgerState = std::map<ContributorAddress, TransactionAmount>;

// Bookkeeping cleared by a withdrawal, kept so a failed release can be undone
struct WithdrawalSnapshot {
    std::vector<ContributorAddress> funders;
    LedgerState amounts;
    TransactionAmount balance;
};
