#pragma once
#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <mutex>
#include <memory>
#include <vector>
#include "../core/common.hpp"
#include "ledger_state.hpp"

class ContributorStore {
    public:
        ContributorStore();
        ~ContributorStore();
        void init(const std::string& dbPath);
        void closeDB();
        void deleteDB();
        bool isOpen() const;

        bool hasOwner() const;
        ContributorAddress getOwner() const;
        void setOwner(const ContributorAddress& owner);

        bool hasRecord(const ContributorAddress& contributor) const;
        TransactionAmount getRecord(const ContributorAddress& contributor) const;
        TransactionAmount getBalance() const;
        uint64_t getFunderCount() const;
        ContributorAddress getFunder(uint64_t index) const;
        std::vector<ContributorAddress> getFunders() const;

        // Atomic operations
        void recordContribution(const ContributorAddress& contributor, const TransactionAmount& amount);
        WithdrawalSnapshot resetFunders(const std::vector<ContributorAddress>& funders);
        void restoreFunders(const WithdrawalSnapshot& snapshot);

        // State management
        void clear();
        LedgerState getState() const;

    protected:
        std::string get(const std::string& key) const;
        bool tryGet(const std::string& key, std::string& value) const;
        void write(leveldb::WriteBatch& batch);
        uint64_t funderCount() const;
        TransactionAmount record(const ContributorAddress& contributor) const;
        std::vector<ContributorAddress> funderRange(uint64_t count) const;

        std::unique_ptr<leveldb::DB> db;
        std::string dbPath;
        mutable std::mutex lock;
};
