#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "address.h"
#include "hash.h"

namespace mpay {

struct Unclaimed {};
struct ClaimedBy { Address wallet; };
// Set exactly once, by a successful claim
using RecipientSlot = std::variant<Unclaimed, ClaimedBy>;

enum class EscrowStatus : uint8_t {
    Active    = 0,
    Claimed   = 1,
    Reclaimed = 2,
};

const char* escrow_status_name(EscrowStatus s);

struct EscrowAccount {
    Address sender;
    Hash256 identifier_hash{};
    RecipientSlot recipient{Unclaimed{}};
    Address token_kind;
    Address custody;
    uint64_t amount{0};
    int64_t created_at{0};
    int64_t expires_at{0};
    EscrowStatus status{EscrowStatus::Active};
    uint64_t nonce{0};

    std::optional<Address> claimed_by() const;
};

// Serialized layout (little-endian):
//   discriminator[8] version:u8 sender[32] identifier_hash[32]
//   recipient_tag:u8 recipient[32] token_kind[32] custody[32]
//   amount:u64 created_at:i64 expires_at:i64 status:u8 nonce:u64
static constexpr size_t ESCROW_ACCOUNT_SIZE = 8 + 1 + 32 + 32 + 1 + 32 + 32 + 32 + 8 + 8 + 8 + 1 + 8;
static constexpr uint8_t ESCROW_LAYOUT_VERSION = 1;

const std::array<uint8_t, 8>& escrow_discriminator();
std::vector<uint8_t> encode_escrow(const EscrowAccount& e);
bool decode_escrow(const std::vector<uint8_t>& data, EscrowAccount& out, std::string* err = nullptr);

// Seeds ("escrow", sender, identifier_hash, nonce LE) under the escrow program
std::vector<std::vector<uint8_t>> escrow_seeds(const Address& sender, const Hash256& identifier_hash, uint64_t nonce);
Address escrow_address(const Address& sender, const Hash256& identifier_hash, uint64_t nonce);
// Associated funding account of the escrow address
Address custody_address(const Address& escrow, const Address& token_kind);

}
