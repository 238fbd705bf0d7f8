#pragma once
#include <cstdint>
#include <string>

#include "address.h"
#include "constants.h"
#include "hash.h"
#include "ledger/account.h"

namespace mpay {

// Picks the first free escrow slot for (sender, identifier hash) by probing
// nonces upward. The answer can be stale by the time it is used; creation
// must still be prepared for AccountInUse.
class NonceResolver {
public:
    explicit NonceResolver(const AccountReader& reader, unsigned max_probe = MPAY_MAX_NONCE_PROBE)
        : reader_(reader), max_probe_(max_probe) {}

    Address derive(const Address& sender, const Hash256& identifier_hash, uint64_t nonce) const;

    // Smallest nonce >= start whose escrow address holds no account
    bool resolve(const Address& sender, const Hash256& identifier_hash, uint64_t& nonce,
                 std::string& err, uint64_t start = 0) const;

    // Like resolve, but moves on window by window (max_probe nonces each) until a
    // free slot turns up. Claimed escrows keep their nonce for good.
    bool next_free(const Address& sender, const Hash256& identifier_hash, uint64_t& nonce,
                   std::string& err, uint64_t start = 0) const;

    unsigned max_probe() const { return max_probe_; }

private:
    const AccountReader& reader_;
    unsigned max_probe_;
};

}
