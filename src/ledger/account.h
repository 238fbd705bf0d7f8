#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "address.h"

namespace mpay {

// One ledger account. A record with zero lamports and no data is the same as no record.
struct AccountRecord {
    Address owner;
    uint64_t lamports{0};
    std::vector<uint8_t> data;

    bool exists() const { return lamports != 0 || !data.empty(); }
};

std::string encode_account(const AccountRecord& a);
bool decode_account(const std::string& raw, AccountRecord& out);

// Lamports an account holding `data_len` bytes must carry
uint64_t reserve_for(size_t data_len);

// Read-only account lookup (the ledger, or any view of it)
class AccountReader {
public:
    virtual ~AccountReader() = default;
    virtual std::optional<AccountRecord> fetch(const Address& addr) const = 0;
};

}
