#include "client/amount.h"
#include "constants.h"

#include <cctype>
#include <limits>

namespace mpay {

static uint64_t scale() {
    uint64_t s = 1;
    for (int i = 0; i < MPAY_TOKEN_DECIMALS; ++i) s *= 10;
    return s;
}

std::string format_amount(uint64_t base_units) {
    const uint64_t whole = base_units / scale();
    std::string frac = std::to_string(base_units % scale());
    frac.insert(0, MPAY_TOKEN_DECIMALS - frac.size(), '0');
    return std::to_string(whole) + "." + frac;
}

bool parse_amount(const std::string& s, uint64_t& out, std::string& err) {
    if (s.empty()) { err = "amount is empty"; return false; }
    const auto dot = s.find('.');
    const std::string whole = s.substr(0, dot);
    const std::string frac = dot == std::string::npos ? "" : s.substr(dot + 1);
    if (whole.empty() && frac.empty()) { err = "malformed amount '" + s + "'"; return false; }
    for (char c : whole) if (!std::isdigit((unsigned char)c)) { err = "malformed amount '" + s + "'"; return false; }
    for (char c : frac) if (!std::isdigit((unsigned char)c)) { err = "malformed amount '" + s + "'"; return false; }
    if (frac.size() > (size_t)MPAY_TOKEN_DECIMALS) { err = "amount has more than 6 decimals"; return false; }

    const uint64_t max = std::numeric_limits<uint64_t>::max();
    uint64_t w = 0;
    for (char c : whole) {
        const uint64_t d = uint64_t(c - '0');
        if (w > (max - d) / 10) { err = "amount too large"; return false; }
        w = w * 10 + d;
    }
    uint64_t f = 0;
    for (int i = 0; i < MPAY_TOKEN_DECIMALS; ++i) f = f * 10 + (i < (int)frac.size() ? uint64_t(frac[i] - '0') : 0);
    if (w > (max - f) / scale()) { err = "amount too large"; return false; }
    out = w * scale() + f;
    return true;
}

}
