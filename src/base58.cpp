#include "base58.h"
#include <cstring>

static const char* ALPH = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

static int alph_index(char c) {
    if (c == '\0') return -1;
    const char* p = std::strchr(ALPH, c);
    return p ? int(p - ALPH) : -1;
}

namespace mpay {

// Big-number base conversion on a byte buffer, most significant digit first.
// Leading zero bytes map to leading '1' characters and back.
std::string base58_encode(const uint8_t* p, size_t n) {
    size_t zeros = 0;
    while (zeros < n && p[zeros] == 0) ++zeros;

    std::vector<uint8_t> digits((n - zeros) * 138 / 100 + 1, 0);
    size_t used = 0;
    for (size_t i = zeros; i < n; ++i) {
        int carry = p[i];
        size_t k = 0;
        for (auto it = digits.rbegin(); (carry != 0 || k < used) && it != digits.rend(); ++it, ++k) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        used = k;
    }

    auto it = digits.begin() + (digits.size() - used);
    while (it != digits.end() && *it == 0) ++it;

    std::string out(zeros, '1');
    for (; it != digits.end(); ++it) out.push_back(ALPH[*it]);
    return out;
}

std::string base58_encode(const std::vector<uint8_t>& in) {
    return base58_encode(in.data(), in.size());
}

bool base58_decode(const std::string& s, std::vector<uint8_t>& out) {
    size_t zeros = 0;
    while (zeros < s.size() && s[zeros] == '1') ++zeros;

    std::vector<uint8_t> bytes((s.size() - zeros) * 733 / 1000 + 1, 0);
    size_t used = 0;
    for (size_t i = zeros; i < s.size(); ++i) {
        int carry = alph_index(s[i]);
        if (carry < 0) return false;
        size_t k = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || k < used) && it != bytes.rend(); ++it, ++k) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        used = k;
    }

    auto it = bytes.begin() + (bytes.size() - used);
    while (it != bytes.end() && *it == 0) ++it;

    out.assign(zeros, 0);
    out.insert(out.end(), it, bytes.end());
    return true;
}

}
