#pragma once
#include <string>
#include <vector>
#include "common.hpp"

json readJsonFromFile(std::string filePath);
void writeJsonToFile(json data, std::string filePath);

std::string hexEncode(const uint8_t* data, size_t len);
std::vector<uint8_t> hexDecode(const std::string& hex);

std::string addressToString(const ContributorAddress& address);
ContributorAddress stringToAddress(const std::string& s);

std::string amountToString(const TransactionAmount& amount);
std::string amountToBytes(const TransactionAmount& amount);
TransactionAmount amountFromBytes(const std::string& bytes);

// parses a decimal string such as "0.1" into wei
TransactionAmount ethToWei(const std::string& eth);
