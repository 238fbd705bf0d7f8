#pragma once
#include <array>
#include <vector>
#include <cstdint>

namespace mpay::crypto {

using PubKey33 = std::array<uint8_t, 33>;   // SEC1 compressed
using Sig64    = std::array<uint8_t, 64>;   // compact r||s, low-S

struct ECDSA {
    static bool generate_priv(std::vector<uint8_t>& out32);
    static bool derive_pub(const std::vector<uint8_t>& priv, PubKey33& out33);
    static bool sign_compact(const uint8_t msg32[32], const std::vector<uint8_t>& priv, Sig64& sig64);
    static bool verify_compact(const uint8_t msg32[32], const PubKey33& pubkey, const Sig64& sig64);
    static const char* backend();
};

}
