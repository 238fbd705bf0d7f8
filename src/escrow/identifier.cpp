#include "escrow/identifier.h"

#include <algorithm>
#include <cctype>

namespace mpay {

std::string normalize_identifier(const std::string& identifier) {
    auto a = identifier.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    auto b = identifier.find_last_not_of(" \t\r\n");
    std::string s = identifier.substr(a, b - a + 1);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

Hash256 identifier_hash(const std::string& identifier) {
    return sha256(normalize_identifier(identifier));
}

bool validate_identifier(const std::string& identifier, std::string& err) {
    const std::string s = normalize_identifier(identifier);
    if (s.empty()) { err = "Recipient identifier is required"; return false; }
    auto at = s.find('@');
    if (at == std::string::npos || at == 0 || at + 1 >= s.size() || s.find('@', at + 1) != std::string::npos) {
        err = "Invalid recipient identifier: " + s;
        return false;
    }
    for (unsigned char c : s) {
        if (std::isspace(c)) { err = "Recipient identifier contains whitespace"; return false; }
    }
    return true;
}

}
