#include <filesystem>
#include <stdexcept>
#include <cstring>
#include "../core/helpers.hpp"
#include "../core/logger.hpp"
#include "contributor_store.hpp"
using namespace std;


ContributorStore::ContributorStore() {
}

static string recordKey(const ContributorAddress& contributor) {
    string key(1, RECORD_PREFIX);
    key.append((const char*) contributor.data(), contributor.size());
    return key;
}

static string funderKey(uint64_t index) {
    string key(1, FUNDER_PREFIX);
    for (int shift = 56; shift >= 0; shift -= 8) {
        key.push_back((char)((index >> shift) & 0xff));
    }
    return key;
}

static string countToBytes(uint64_t count) {
    string out;
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back((char)((count >> shift) & 0xff));
    }
    return out;
}

static uint64_t countFromBytes(const string& bytes) {
    if (bytes.size() != sizeof(uint64_t)) throw std::runtime_error("Corrupt funder count");
    uint64_t count = 0;
    for (char c : bytes) {
        count = (count << 8) | (uint8_t)c;
    }
    return count;
}

static ContributorAddress addressFromBytes(const string& bytes) {
    ContributorAddress address;
    if (bytes.size() != address.size()) throw std::runtime_error("Corrupt address record");
    std::memcpy(address.data(), bytes.data(), address.size());
    return address;
}

void ContributorStore::init(const string& path) {
    std::lock_guard<std::mutex> guard(lock);
    this->dbPath = path;
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    leveldb::Options options;
    options.create_if_missing = true;
    leveldb::DB* raw = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, path, &raw);
    if (!status.ok()) throw std::runtime_error("Could not open contributor store at " + path + ": " + status.ToString());
    db.reset(raw);
    Logger::logStatus("Opened contributor store at " + path);
}

void ContributorStore::closeDB() {
    std::lock_guard<std::mutex> guard(lock);
    db.reset();
}

void ContributorStore::deleteDB() {
    closeDB();
    leveldb::Status status = leveldb::DestroyDB(dbPath, leveldb::Options());
    if (!status.ok()) throw std::runtime_error("Could not delete contributor store: " + status.ToString());
}

bool ContributorStore::isOpen() const {
    std::lock_guard<std::mutex> guard(lock);
    return db != nullptr;
}

bool ContributorStore::tryGet(const string& key, string& value) const {
    if (!db) throw std::runtime_error("Contributor store is not open");
    leveldb::Status status = db->Get(leveldb::ReadOptions(), key, &value);
    if (status.IsNotFound()) return false;
    if (!status.ok()) throw std::runtime_error("Read failed: " + status.ToString());
    return true;
}

string ContributorStore::get(const string& key) const {
    string value;
    if (!tryGet(key, value)) throw std::runtime_error("Missing store key");
    return value;
}

void ContributorStore::write(leveldb::WriteBatch& batch) {
    if (!db) throw std::runtime_error("Contributor store is not open");
    leveldb::WriteOptions options;
    options.sync = true;
    leveldb::Status status = db->Write(options, &batch);
    if (!status.ok()) throw std::runtime_error("Write failed: " + status.ToString());
}

uint64_t ContributorStore::funderCount() const {
    string value;
    if (!tryGet(FUNDER_COUNT_KEY, value)) return 0;
    return countFromBytes(value);
}

TransactionAmount ContributorStore::record(const ContributorAddress& contributor) const {
    string value;
    if (!tryGet(recordKey(contributor), value)) return 0;
    return amountFromBytes(value);
}

vector<ContributorAddress> ContributorStore::funderRange(uint64_t count) const {
    vector<ContributorAddress> funders;
    funders.reserve(count);
    for (uint64_t i = 0; i < count; i++) {
        funders.push_back(addressFromBytes(get(funderKey(i))));
    }
    return funders;
}

bool ContributorStore::hasOwner() const {
    std::lock_guard<std::mutex> guard(lock);
    string value;
    return tryGet(OWNER_KEY, value);
}

ContributorAddress ContributorStore::getOwner() const {
    std::lock_guard<std::mutex> guard(lock);
    string value;
    if (!tryGet(OWNER_KEY, value)) throw std::runtime_error("Contributor store has no owner");
    return addressFromBytes(value);
}

void ContributorStore::setOwner(const ContributorAddress& owner) {
    std::lock_guard<std::mutex> guard(lock);
    string value;
    if (tryGet(OWNER_KEY, value)) throw std::runtime_error("Owner already set");
    leveldb::WriteBatch batch;
    batch.Put(OWNER_KEY, string((const char*) owner.data(), owner.size()));
    write(batch);
}

bool ContributorStore::hasRecord(const ContributorAddress& contributor) const {
    std::lock_guard<std::mutex> guard(lock);
    string value;
    return tryGet(recordKey(contributor), value);
}

TransactionAmount ContributorStore::getRecord(const ContributorAddress& contributor) const {
    std::lock_guard<std::mutex> guard(lock);
    return record(contributor);
}

TransactionAmount ContributorStore::getBalance() const {
    std::lock_guard<std::mutex> guard(lock);
    string value;
    if (!tryGet(BALANCE_KEY, value)) return 0;
    return amountFromBytes(value);
}

uint64_t ContributorStore::getFunderCount() const {
    std::lock_guard<std::mutex> guard(lock);
    return funderCount();
}

ContributorAddress ContributorStore::getFunder(uint64_t index) const {
    std::lock_guard<std::mutex> guard(lock);
    uint64_t count = funderCount();
    if (index >= count) {
        throw std::out_of_range("Funder index " + std::to_string(index) + " out of range (" + std::to_string(count) + " funders)");
    }
    return addressFromBytes(get(funderKey(index)));
}

vector<ContributorAddress> ContributorStore::getFunders() const {
    std::lock_guard<std::mutex> guard(lock);
    return funderRange(funderCount());
}

void ContributorStore::recordContribution(const ContributorAddress& contributor, const TransactionAmount& amount) {
    std::lock_guard<std::mutex> guard(lock);
    TransactionAmount value = record(contributor);
    string balanceBytes;
    TransactionAmount balance = tryGet(BALANCE_KEY, balanceBytes) ? amountFromBytes(balanceBytes) : TransactionAmount(0);
    if (value + amount < value || balance + amount < balance) { // Check for overflow
        throw std::overflow_error("Balance overflow");
    }
    uint64_t count = funderCount();

    leveldb::WriteBatch batch;
    batch.Put(recordKey(contributor), amountToBytes(value + amount));
    batch.Put(funderKey(count), string((const char*) contributor.data(), contributor.size()));
    batch.Put(FUNDER_COUNT_KEY, countToBytes(count + 1));
    batch.Put(BALANCE_KEY, amountToBytes(balance + amount));
    write(batch);
}

WithdrawalSnapshot ContributorStore::resetFunders(const vector<ContributorAddress>& funders) {
    std::lock_guard<std::mutex> guard(lock);
    WithdrawalSnapshot snapshot;
    snapshot.funders = funders;
    string balanceBytes;
    snapshot.balance = tryGet(BALANCE_KEY, balanceBytes) ? amountFromBytes(balanceBytes) : TransactionAmount(0);

    leveldb::WriteBatch batch;
    for (const auto& funder : funders) {
        if (snapshot.amounts.find(funder) == snapshot.amounts.end()) {
            snapshot.amounts[funder] = record(funder);
        }
        batch.Put(recordKey(funder), amountToBytes(0));
    }
    uint64_t count = funderCount();
    for (uint64_t i = 0; i < count; i++) {
        batch.Delete(funderKey(i));
    }
    batch.Put(FUNDER_COUNT_KEY, countToBytes(0));
    batch.Put(BALANCE_KEY, amountToBytes(0));
    write(batch);
    return snapshot;
}

// Re-credits a cleared snapshot on top of whatever was recorded since the
// reset. Snapshot funders go back in front of any newer sequence entries.
void ContributorStore::restoreFunders(const WithdrawalSnapshot& snapshot) {
    std::lock_guard<std::mutex> guard(lock);
    uint64_t count = funderCount();
    vector<ContributorAddress> newer = funderRange(count);
    string balanceBytes;
    TransactionAmount balance = tryGet(BALANCE_KEY, balanceBytes) ? amountFromBytes(balanceBytes) : TransactionAmount(0);
    if (balance + snapshot.balance < balance) {
        throw std::overflow_error("Balance overflow");
    }

    leveldb::WriteBatch batch;
    for (const auto& entry : snapshot.amounts) {
        TransactionAmount value = record(entry.first);
        if (value + entry.second < value) {
            throw std::overflow_error("Balance overflow");
        }
        batch.Put(recordKey(entry.first), amountToBytes(value + entry.second));
    }
    uint64_t index = 0;
    for (const auto& funder : snapshot.funders) {
        batch.Put(funderKey(index++), string((const char*) funder.data(), funder.size()));
    }
    for (const auto& funder : newer) {
        batch.Put(funderKey(index++), string((const char*) funder.data(), funder.size()));
    }
    batch.Put(FUNDER_COUNT_KEY, countToBytes(index));
    batch.Put(BALANCE_KEY, amountToBytes(balance + snapshot.balance));
    write(batch);
}

void ContributorStore::clear() {
    std::lock_guard<std::mutex> guard(lock);
    if (!db) throw std::runtime_error("Contributor store is not open");
    leveldb::WriteBatch batch;
    std::unique_ptr<leveldb::Iterator> it(db->NewIterator(leveldb::ReadOptions()));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        if (it->key().ToString() == OWNER_KEY) continue;
        batch.Delete(it->key());
    }
    if (!it->status().ok()) throw std::runtime_error("Iteration failed: " + it->status().ToString());
    write(batch);
}

LedgerState ContributorStore::getState() const {
    std::lock_guard<std::mutex> guard(lock);
    if (!db) throw std::runtime_error("Contributor store is not open");
    LedgerState state;
    std::unique_ptr<leveldb::Iterator> it(db->NewIterator(leveldb::ReadOptions()));
    string prefix(1, RECORD_PREFIX);
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        ContributorAddress contributor = addressFromBytes(it->key().ToString().substr(1));
        state[contributor] = amountFromBytes(it->value().ToString());
    }
    if (!it->status().ok()) throw std::runtime_error("Iteration failed: " + it->status().ToString());
    return state;
}

ContributorStore::~ContributorStore() {
    closeDB();
}
