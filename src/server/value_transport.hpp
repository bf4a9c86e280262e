#pragma once
#include "../core/common.hpp"

// Outbound value release. transfer may run arbitrary receiver code, including
// calls back into the ledger, before it returns. Returns false when the
// destination refuses the value.
class ValueTransport {
    public:
        virtual ~ValueTransport() {}
        virtual bool transfer(const ContributorAddress& to, const TransactionAmount& amount) = 0;
};
