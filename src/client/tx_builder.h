#pragma once
#include <cstdint>
#include <string>

#include "address.h"
#include "hash.h"
#include "client/nonce_resolver.h"
#include "escrow/escrow_state.h"
#include "ledger/account.h"
#include "ledger/transaction.h"

namespace mpay {

// Where a built escrow instruction points
struct EscrowHandle {
    Address escrow;
    Address custody;
    uint64_t nonce{0};
    Hash256 identifier_hash{};
    int64_t expires_at{0};
};

struct FundingResolution {
    Address address;
    bool exists{false};
};

// Assembles unsigned messages (fee payer = sponsor) for the escrow instructions
// and for direct transfers between registered wallets.
class TransactionBuilder {
public:
    TransactionBuilder(const AccountReader& reader, const NonceResolver& resolver,
                       const Address& token_kind, const Address& sponsor)
        : reader_(reader), resolver_(resolver), token_kind_(token_kind), sponsor_(sponsor) {}

    FundingResolution resolve_funding_account(const Address& owner) const;

    // Resolves the first free nonce >= start_nonce, then builds initialize
    bool build_initialize(const Address& sender, const Hash256& identifier_hash, uint64_t amount,
                          int64_t expires_at, uint64_t start_nonce,
                          Message& out, EscrowHandle& handle, std::string& err) const;
    bool build_claim(const Address& escrow, const Address& recipient,
                     Message& out, EscrowHandle& handle, std::string& err) const;
    bool build_reclaim(const Address& escrow, const Address& sender,
                       Message& out, EscrowHandle& handle, std::string& err) const;
    bool build_direct_transfer(const Address& sender, const Address& recipient, uint64_t amount,
                               Message& out, std::string& err) const;

    const Address& token_kind() const { return token_kind_; }

private:
    bool load_escrow(const Address& escrow, EscrowAccount& out, std::string& err) const;

    const AccountReader& reader_;
    const NonceResolver& resolver_;
    Address token_kind_;
    Address sponsor_;
};

}
