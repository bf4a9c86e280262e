#include <iostream>
#include <iomanip>
#include <sstream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <atomic>
#include "logger.hpp"
using namespace std;

static std::mutex logMutex;
static std::atomic<bool> loggingEnabled(true);

static string timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local;
    localtime_r(&now, &local);
    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void Logger::logStatus(string message) {
    if (!loggingEnabled) return;
    std::lock_guard<std::mutex> lock(logMutex);
    cout << "[" << timestamp() << "] " << message << endl;
}

void Logger::logError(string heading, string message) {
    if (!loggingEnabled) return;
    std::lock_guard<std::mutex> lock(logMutex);
    cerr << "[" << timestamp() << "] " << heading << " " << message << endl;
}

void Logger::setEnabled(bool enabled) {
    loggingEnabled = enabled;
}

bool Logger::isEnabled() {
    return loggingEnabled;
}
