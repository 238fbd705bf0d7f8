#pragma once
#include <array>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

#include "crypto/ecdsa_iface.h"

namespace mpay {

// 32-byte account address, rendered in base58
struct Address {
    std::array<uint8_t, 32> bytes{};

    bool is_zero() const;
    std::string to_base58() const;
    static bool from_base58(const std::string& s, Address& out);
    static Address from_bytes(const uint8_t* p);

    const uint8_t* data() const { return bytes.data(); }
    static constexpr size_t size() { return 32; }

    bool operator==(const Address& o) const { return bytes == o.bytes; }
    bool operator!=(const Address& o) const { return bytes != o.bytes; }
    bool operator<(const Address& o) const { return bytes < o.bytes; }
};

struct AddressHasher {
    size_t operator()(const Address& a) const noexcept;
};

// Address owned by a secp256k1 key: SHA256("mailpay/key" || pub33)
Address key_address(const crypto::PubKey33& pub);

// Fixed id of a built-in program: SHA256("mailpay/program/" || name)
Address program_id_from_name(const std::string& name);

// Program-derived address: SHA256(seed_1 || ... || seed_n || program || "ProgramDerivedAddress").
// No private key exists for it; only `program` can authorize on its behalf.
static constexpr size_t MAX_SEEDS = 16;
static constexpr size_t MAX_SEED_LEN = 32;
bool derive_program_address(const std::vector<std::vector<uint8_t>>& seeds,
                            const Address& program,
                            Address& out,
                            std::string* err = nullptr);

// Seed helpers
std::vector<uint8_t> seed_of(const Address& a);
std::vector<uint8_t> seed_of(const std::string& s);
std::vector<uint8_t> seed_of_u64le(uint64_t v);

}
