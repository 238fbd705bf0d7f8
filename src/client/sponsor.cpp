#include "client/sponsor.h"
#include "escrow/escrow_program.h"
#include "ledger/programs.h"
#include "ledger/token.h"
#include "hex.h"
#include "log.h"

#include <algorithm>

namespace mpay {

bool KeyPrincipal::sign(const Hash256& message_hash, TxSignature& out, std::string& err) {
    out.pubkey = key_.pubkey();
    if (!key_.sign(message_hash, out.sig)) { err = "signing failed for " + key_.address().to_base58(); return false; }
    return true;
}

static bool check_signature(const Message& msg, const Address& expected, const TxSignature& sig,
                            const char* role, std::string& err) {
    if (sig.signer() != expected) {
        err = std::string(role) + " signature is bound to " + sig.signer().to_base58() +
              ", expected " + expected.to_base58();
        return false;
    }
    const Hash256 h = msg.hash();
    if (!crypto::ECDSA::verify_compact(h.data(), sig.pubkey, sig.sig)) {
        err = std::string(role) + " signature does not verify over the message";
        return false;
    }
    return true;
}

bool SponsoredAuthorization::attach_sponsor(const TxSignature& sig, std::string& err) {
    if (!check_signature(message, sponsor, sig, "sponsor", err)) return false;
    sponsor_signature = sig;
    return true;
}

bool SponsoredAuthorization::attach_principal(const TxSignature& sig, std::string& err) {
    if (!check_signature(message, principal, sig, "principal", err)) return false;
    principal_signature = sig;
    return true;
}

bool SponsoredAuthorization::finalize(uint64_t current_slot, Transaction& out, std::string& err) const {
    if (!sponsor_signature) { err = "missing sponsor signature"; return false; }
    if (!principal_signature) { err = "missing principal signature"; return false; }
    if (is_stale(current_slot)) {
        err = "authorization expired at slot " + std::to_string(last_valid_slot) +
              " (now " + std::to_string(current_slot) + ")";
        return false;
    }
    if (message.fee_payer != sponsor || message.required_signers() != required_signers()) {
        err = "message signers do not match the authorization";
        return false;
    }
    // signatures may have been attached to an earlier version of the message
    if (!check_signature(message, sponsor, *sponsor_signature, "sponsor", err)) return false;
    if (!check_signature(message, principal, *principal_signature, "principal", err)) return false;

    out.message = message;
    out.signatures = {*sponsor_signature, *principal_signature};
    return true;
}

bool countersign(SponsoredAuthorization& auth, PrincipalSigner& principal, std::string& err) {
    if (principal.address() != auth.principal) {
        err = "signer " + principal.address().to_base58() + " is not the principal of this authorization";
        return false;
    }
    TxSignature sig;
    if (!principal.sign(auth.message.hash(), sig, err)) return false;
    return auth.attach_principal(sig, err);
}

bool FeeSponsor::check_policy(const Message& msg, const Address& principal, std::string& err) const {
    const Address& me = key_.address();
    if (!policy_.enabled) { err = "fee sponsoring is disabled"; return false; }
    if (principal == me) { err = "sponsor cannot act as principal"; return false; }
    if (msg.instructions.empty()) { err = "nothing to sponsor"; return false; }

    for (const auto& ix : msg.instructions) {
        if (ix.program_id == escrow_program_id()) {
            // accounts[4] is the sender (initialize, reclaim) or the recipient (claim)
            if (ix.accounts.size() > 4 && ix.accounts[4].addr == me) {
                err = "sponsor cannot be an escrow party";
                return false;
            }
        } else if (ix.program_id == token_program_id()) {
            if (ix.data.empty()) { err = "empty token instruction"; return false; }
            const auto tag = static_cast<TokenIx>(ix.data[0]);
            if ((tag == TokenIx::Transfer || tag == TokenIx::Close) && ix.accounts.size() > 2 &&
                ix.accounts[2].addr == me) {
                err = "sponsor cannot authorize fund movement";
                return false;
            }
        } else {
            err = "program " + ix.program_id.to_base58() + " is not sponsorable";
            return false;
        }
    }

    std::vector<Address> expected = {me, principal};
    Message bound = msg;
    bound.fee_payer = me;
    if (bound.required_signers() != expected) {
        err = "message must be signed by exactly the sponsor and the principal";
        return false;
    }
    return true;
}

bool FeeSponsor::bind_and_sign(SponsoredAuthorization& auth, std::string& err) const {
    const Checkpoint cp = ledger_.latest_checkpoint();
    auth.message.fee_payer = key_.address();
    auth.message.checkpoint = cp.hash;
    auth.last_valid_slot = cp.last_valid_slot;
    auth.sponsor_signature.reset();
    auth.principal_signature.reset();

    TxSignature sig;
    sig.pubkey = key_.pubkey();
    if (!key_.sign(auth.message.hash(), sig.sig)) { err = "sponsor signing failed"; return false; }
    return auth.attach_sponsor(sig, err);
}

bool FeeSponsor::sponsor(Message msg, const Address& principal, SponsoredAuthorization& out, std::string& err) const {
    if (!check_policy(msg, principal, err)) {
        MPAY_LOG_WARN(LogCategory::SPONSOR, "refused to sponsor: " + err);
        return false;
    }
    SponsoredAuthorization auth;
    auth.message = std::move(msg);
    auth.sponsor = key_.address();
    auth.principal = principal;
    if (!bind_and_sign(auth, err)) return false;
    MPAY_LOG_DEBUG(LogCategory::SPONSOR, "sponsored message for " + principal.to_base58() +
                   ", valid through slot " + std::to_string(auth.last_valid_slot));
    out = std::move(auth);
    return true;
}

bool FeeSponsor::refresh(SponsoredAuthorization& auth, std::string& err) const {
    if (auth.sponsor != key_.address()) { err = "authorization belongs to another sponsor"; return false; }
    if (!check_policy(auth.message, auth.principal, err)) return false;
    const uint64_t old_last = auth.last_valid_slot;
    if (!bind_and_sign(auth, err)) return false;
    MPAY_LOG_INFO(LogCategory::SPONSOR, "refreshed stale authorization (was valid through slot " +
                  std::to_string(old_last) + ", now " + std::to_string(auth.last_valid_slot) + ")");
    return true;
}

}
