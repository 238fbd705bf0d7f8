#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "keys.h"
#include "ledger/ledger.h"
#include "ledger/transaction.h"

namespace mpay {

// The fund-owning party of a sponsored transaction: sender or recipient.
class PrincipalSigner {
public:
    virtual ~PrincipalSigner() = default;
    virtual Address address() const = 0;
    virtual bool sign(const Hash256& message_hash, TxSignature& out, std::string& err) = 0;
};

// Principal backed by a local key
class KeyPrincipal : public PrincipalSigner {
public:
    explicit KeyPrincipal(const KeyPair& key) : key_(key) {}
    Address address() const override { return key_.address(); }
    bool sign(const Hash256& message_hash, TxSignature& out, std::string& err) override;

private:
    KeyPair key_;
};

// A message that needs two signatures, the sponsor's (fee payer) and the
// principal's, bound to a checkpoint that stops being accepted after
// `last_valid_slot`.
struct SponsoredAuthorization {
    Message message;
    Address sponsor;
    Address principal;
    std::optional<TxSignature> sponsor_signature;
    std::optional<TxSignature> principal_signature;
    uint64_t last_valid_slot{0};

    std::vector<Address> required_signers() const { return {sponsor, principal}; }

    // Both check the signer binding and verify against the current message
    bool attach_sponsor(const TxSignature& sig, std::string& err);
    bool attach_principal(const TxSignature& sig, std::string& err);

    bool complete() const { return sponsor_signature.has_value() && principal_signature.has_value(); }
    bool is_stale(uint64_t current_slot) const { return current_slot > last_valid_slot; }

    // Submittable transaction, only when both signatures are present and valid and the window is open
    bool finalize(uint64_t current_slot, Transaction& out, std::string& err) const;
};

// Let the principal add the second signature
bool countersign(SponsoredAuthorization& auth, PrincipalSigner& principal, std::string& err);

struct SponsorPolicy {
    bool enabled{true};
};

// Pays fees and reserves for escrow traffic without ever holding authority over the funds.
class FeeSponsor {
public:
    FeeSponsor(const KeyPair& key, const Ledger& ledger, SponsorPolicy policy = SponsorPolicy())
        : key_(key), ledger_(ledger), policy_(policy) {}

    const Address& address() const { return key_.address(); }
    bool enabled() const { return policy_.enabled; }

    // Binds `msg` to the latest checkpoint with the sponsor as fee payer, checks policy, signs first.
    bool sponsor(Message msg, const Address& principal, SponsoredAuthorization& out, std::string& err) const;
    // Drops both signatures, rebinds to a fresh checkpoint and signs again.
    bool refresh(SponsoredAuthorization& auth, std::string& err) const;

    bool check_policy(const Message& msg, const Address& principal, std::string& err) const;

private:
    bool bind_and_sign(SponsoredAuthorization& auth, std::string& err) const;

    KeyPair key_;
    const Ledger& ledger_;
    SponsorPolicy policy_;
};

}
