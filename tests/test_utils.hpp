#pragma once
#include <string>
#include "core/common.hpp"
#include "core/logger.hpp"

inline ContributorAddress addressOf(uint8_t seed) {
    ContributorAddress address;
    address.fill(seed);
    return address;
}

inline std::string testDbPath(const std::string& name) {
    return "./test-data/" + name;
}

// keeps test output readable
struct QuietLogs {
    QuietLogs() : previous(Logger::isEnabled()) { Logger::setEnabled(false); }
    ~QuietLogs() { Logger::setEnabled(previous); }
    bool previous;
};
