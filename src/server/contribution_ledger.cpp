#include <stdexcept>
#include "../core/helpers.hpp"
#include "../core/logger.hpp"
#include "../core/rate_converter.hpp"
#include "contribution_ledger.hpp"

using namespace std;

string executionStatusAsString(ExecutionStatus status) {
    switch(status) {
        case SUCCESS:
            return "SUCCESS";
        break;
        case ORACLE_ERROR:
            return "ORACLE_ERROR";
        break;
        case INSUFFICIENT_CONTRIBUTION:
            return "INSUFFICIENT_CONTRIBUTION";
        break;
        case NOT_AUTHORIZED:
            return "NOT_AUTHORIZED";
        break;
        case TRANSFER_FAILED:
            return "TRANSFER_FAILED";
        break;
        case BALANCE_OVERFLOW:
            return "BALANCE_OVERFLOW";
        break;
    }
    return "UNKNOWN_STATUS";
}

ContributionLedger::ContributionLedger(const ContributorAddress& owner, const PriceFeed& priceFeed, ContributorStore& store, ValueTransport& transport)
    : owner(owner), priceFeed(priceFeed), store(store), transport(transport) {
    if (store.hasOwner()) {
        ContributorAddress stored = store.getOwner();
        if (stored != owner) {
            throw std::runtime_error("Contributor store belongs to " + addressToString(stored) + ", not " + addressToString(owner));
        }
    } else {
        store.setOwner(owner);
    }
    Logger::logStatus("Contribution ledger ready. Owner: " + addressToString(owner) + ". Feed: " + priceFeed.description());
}

ExecutionStatus ContributionLedger::contribute(const ContributorAddress& contributor, const TransactionAmount& amount) {
    std::lock_guard<std::recursive_mutex> guard(ledgerMutex);

    bool aboveMinimum = false;
    try {
        TransactionAmount value = RateConverter::convert(amount, priceFeed);
        aboveMinimum = value >= MINIMUM_USD;
    } catch (const OracleError& e) {
        Logger::logError(RED + "[ORACLE]" + RESET, string(e.what()) + ". Rejected " + amountToString(amount) + " from " + addressToString(contributor));
        return ORACLE_ERROR;
    } catch (const std::overflow_error&) {
        // a value too large for 256 bits is above the minimum unless nothing was sent
        aboveMinimum = amount > 0;
    }

    if (!aboveMinimum) {
        Logger::logStatus("Contribution of " + amountToString(amount) + " from " + addressToString(contributor) + " is below the minimum");
        return INSUFFICIENT_CONTRIBUTION;
    }

    try {
        store.recordContribution(contributor, amount);
    } catch (const std::overflow_error& e) {
        Logger::logError(RED + "[ERROR]" + RESET, string(e.what()) + " recording " + amountToString(amount) + " from " + addressToString(contributor));
        return BALANCE_OVERFLOW;
    }

    Logger::logStatus(GREEN + "[FUNDED]" + RESET + " " + addressToString(contributor) + " contributed " + amountToString(amount));
    return SUCCESS;
}

ExecutionStatus ContributionLedger::receive(const ContributorAddress& sender, const TransactionAmount& amount) {
    return contribute(sender, amount);
}

ExecutionStatus ContributionLedger::fallback(const ContributorAddress& sender, const TransactionAmount& amount, const string& data) {
    if (!data.empty()) {
        Logger::logStatus("Ignoring " + std::to_string(data.size()) + " bytes of call data from " + addressToString(sender));
    }
    return contribute(sender, amount);
}

ExecutionStatus ContributionLedger::withdraw(const ContributorAddress& caller) {
    std::lock_guard<std::recursive_mutex> guard(ledgerMutex);
    if (caller != owner) {
        Logger::logStatus("Withdraw refused for non-owner " + addressToString(caller));
        return NOT_AUTHORIZED;
    }

    vector<ContributorAddress> funders;
    uint64_t count = store.getFunderCount();
    for (uint64_t i = 0; i < count; i++) {
        funders.push_back(store.getFunder(i));
    }
    return release(caller, funders);
}

ExecutionStatus ContributionLedger::cheaperWithdraw(const ContributorAddress& caller) {
    std::lock_guard<std::recursive_mutex> guard(ledgerMutex);
    if (caller != owner) {
        Logger::logStatus("Withdraw refused for non-owner " + addressToString(caller));
        return NOT_AUTHORIZED;
    }
    return release(caller, store.getFunders());
}

// Bookkeeping is cleared before the transport runs so that any call back
// into the ledger during transfer sees no outstanding balances. A refused
// transfer re-credits everything that was cleared.
ExecutionStatus ContributionLedger::release(const ContributorAddress& caller, const vector<ContributorAddress>& funders) {
    WithdrawalSnapshot snapshot = store.resetFunders(funders);

    bool sent = false;
    try {
        sent = transport.transfer(caller, snapshot.balance);
    } catch (const std::exception& e) {
        Logger::logError(RED + "[TRANSFER]" + RESET, e.what());
        sent = false;
    }

    if (!sent) {
        store.restoreFunders(snapshot);
        Logger::logError(RED + "[TRANSFER]" + RESET, "Release of " + amountToString(snapshot.balance) + " to " + addressToString(caller) + " failed, ledger restored");
        return TRANSFER_FAILED;
    }

    Logger::logStatus(GREEN + "[WITHDRAWN]" + RESET + " " + amountToString(snapshot.balance) + " released to " + addressToString(caller) + " from " + std::to_string(funders.size()) + " contributions");
    return SUCCESS;
}

TransactionAmount ContributionLedger::getAddressToAmountFunded(const ContributorAddress& contributor) const {
    std::lock_guard<std::recursive_mutex> guard(ledgerMutex);
    return store.getRecord(contributor);
}

ContributorAddress ContributionLedger::getFunder(uint64_t index) const {
    std::lock_guard<std::recursive_mutex> guard(ledgerMutex);
    return store.getFunder(index);
}

uint64_t ContributionLedger::getFunderCount() const {
    std::lock_guard<std::recursive_mutex> guard(ledgerMutex);
    return store.getFunderCount();
}

const ContributorAddress& ContributionLedger::getOwner() const {
    return owner;
}

const PriceFeed& ContributionLedger::getPriceFeed() const {
    return priceFeed;
}

uint64_t ContributionLedger::getVersion() const {
    return priceFeed.version();
}

TransactionAmount ContributionLedger::getBalance() const {
    std::lock_guard<std::recursive_mutex> guard(ledgerMutex);
    return store.getBalance();
}

LedgerState ContributionLedger::getState() const {
    std::lock_guard<std::recursive_mutex> guard(ledgerMutex);
    return store.getState();
}

json ContributionLedger::toJson() const {
    std::lock_guard<std::recursive_mutex> guard(ledgerMutex);
    json funders = json::array();
    for (const auto& funder : store.getFunders()) {
        funders.push_back(addressToString(funder));
    }
    json contributions = json::object();
    for (const auto& entry : store.getState()) {
        contributions[addressToString(entry.first)] = amountToString(entry.second);
    }
    return {
        {"owner", addressToString(owner)},
        {"priceFeed", {
            {"description", priceFeed.description()},
            {"version", priceFeed.version()},
            {"decimals", (int)priceFeed.decimals()}
        }},
        {"balance", amountToString(store.getBalance())},
        {"funders", funders},
        {"contributions", contributions}
    };
}
