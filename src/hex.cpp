#include "hex.h"
#include <cctype>

namespace mpay {

static inline int unhex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}

std::vector<uint8_t> from_hex(const std::string& h) {
    if (h.size() % 2 != 0) return {};
    std::vector<uint8_t> out(h.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        const int hi = unhex_nibble(h[2 * i]);
        const int lo = unhex_nibble(h[2 * i + 1]);
        if (hi < 0 || lo < 0) return {};
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

std::string to_hex(const uint8_t* p, size_t n) {
    static constexpr char LUT[] = "0123456789abcdef";
    std::string out(n * 2, '0');
    for (size_t i = 0; i < n; ++i) {
        out[2 * i]     = LUT[p[i] >> 4];
        out[2 * i + 1] = LUT[p[i] & 0x0F];
    }
    return out;
}

std::string to_hex(const std::vector<uint8_t>& v) {
    return to_hex(v.data(), v.size());
}

} // namespace mpay
