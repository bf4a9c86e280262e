#include <fstream>
#include <sstream>
#include <stdexcept>
#include <iterator>
#include "helpers.hpp"
using namespace std;

json readJsonFromFile(string filePath) {
    ifstream input(filePath);
    if (!input.is_open()) {
        return json::array();
    }
    return json::parse(input);
}

void writeJsonToFile(json data, string filePath) {
    ofstream output(filePath);
    if (!output.is_open()) throw std::runtime_error("Could not open " + filePath + " for writing");
    output << data.dump(4);
    if (output.fail()) throw std::runtime_error("Failed writing " + filePath);
}

string hexEncode(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    string ret;
    ret.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        ret.push_back(digits[data[i] >> 4]);
        ret.push_back(digits[data[i] & 0x0f]);
    }
    return ret;
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    throw std::runtime_error(string("Invalid hex character: ") + c);
}

vector<uint8_t> hexDecode(const string& hex) {
    if (hex.size() % 2 != 0) throw std::runtime_error("Hex string has odd length");
    vector<uint8_t> ret;
    ret.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        ret.push_back((uint8_t)((hexValue(hex[i]) << 4) | hexValue(hex[i + 1])));
    }
    return ret;
}

string addressToString(const ContributorAddress& address) {
    return "0x" + hexEncode(address.data(), address.size());
}

ContributorAddress stringToAddress(const string& s) {
    string hex = s;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }
    vector<uint8_t> bytes = hexDecode(hex);
    ContributorAddress address;
    if (bytes.size() != address.size()) {
        throw std::runtime_error("Address must be " + std::to_string(address.size()) + " bytes: " + s);
    }
    std::copy(bytes.begin(), bytes.end(), address.begin());
    return address;
}

string amountToString(const TransactionAmount& amount) {
    return amount.str();
}

// fixed width big endian, so keys and values compare the same way as numbers
string amountToBytes(const TransactionAmount& amount) {
    string out(AMOUNT_BYTES, '\0');
    TransactionAmount value = amount;
    for (int i = AMOUNT_BYTES - 1; i >= 0; i--) {
        out[i] = (char)static_cast<uint8_t>(value & 0xff);
        value >>= 8;
    }
    return out;
}

TransactionAmount amountFromBytes(const string& bytes) {
    if (bytes.size() != AMOUNT_BYTES) throw std::runtime_error("Corrupt amount record");
    TransactionAmount value = 0;
    for (char c : bytes) {
        value <<= 8;
        value |= (uint8_t)c;
    }
    return value;
}

TransactionAmount ethToWei(const string& eth) {
    size_t dot = eth.find('.');
    string whole = eth.substr(0, dot);
    string fraction = dot == string::npos ? "" : eth.substr(dot + 1);
    if (fraction.size() > REFERENCE_DECIMALS) throw std::runtime_error("Too many decimals in " + eth);
    fraction.append(REFERENCE_DECIMALS - fraction.size(), '0');
    string digits = (whole.empty() ? "0" : whole) + fraction;
    for (char c : digits) {
        if (c < '0' || c > '9') throw std::runtime_error("Invalid amount: " + eth);
    }
    // a leading zero would be parsed as octal
    size_t first = digits.find_first_not_of('0');
    if (first == string::npos) return 0;
    return TransactionAmount(digits.substr(first));
}
