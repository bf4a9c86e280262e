#pragma once
#include <string>

const std::string RED = "\033[31m";
const std::string GREEN = "\033[32m";
const std::string YELLOW = "\033[33m";
const std::string RESET = "\033[0m";

class Logger {
    public:
        static void logStatus(std::string message);
        static void logError(std::string heading, std::string message);
        static void setEnabled(bool enabled);
        static bool isEnabled();
};
