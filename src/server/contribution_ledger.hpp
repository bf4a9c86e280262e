#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "../core/common.hpp"
#include "../core/price_feed.hpp"
#include "contributor_store.hpp"
#include "value_transport.hpp"

#define MINIMUM_USD USD(MINIMUM_USD_WHOLE)

class ContributionLedger {
    public:
        ContributionLedger(const ContributorAddress& owner, const PriceFeed& priceFeed, ContributorStore& store, ValueTransport& transport);

        ExecutionStatus contribute(const ContributorAddress& contributor, const TransactionAmount& amount);
        ExecutionStatus receive(const ContributorAddress& sender, const TransactionAmount& amount);
        ExecutionStatus fallback(const ContributorAddress& sender, const TransactionAmount& amount, const std::string& data);
        ExecutionStatus withdraw(const ContributorAddress& caller);
        ExecutionStatus cheaperWithdraw(const ContributorAddress& caller);

        TransactionAmount getAddressToAmountFunded(const ContributorAddress& contributor) const;
        ContributorAddress getFunder(uint64_t index) const;
        uint64_t getFunderCount() const;
        const ContributorAddress& getOwner() const;
        const PriceFeed& getPriceFeed() const;
        uint64_t getVersion() const;
        TransactionAmount getBalance() const;
        LedgerState getState() const;
        json toJson() const;

    protected:
        ExecutionStatus release(const ContributorAddress& caller, const std::vector<ContributorAddress>& funders);

        const ContributorAddress owner;
        const PriceFeed& priceFeed;
        ContributorStore& store;
        ValueTransport& transport;
        // recursive so a transport may call back in during release
        mutable std::recursive_mutex ledgerMutex;
};
