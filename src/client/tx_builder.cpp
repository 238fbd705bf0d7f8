#include "client/tx_builder.h"
#include "escrow/escrow_program.h"
#include "ledger/programs.h"
#include "ledger/token.h"
#include "log.h"

namespace mpay {

FundingResolution TransactionBuilder::resolve_funding_account(const Address& owner) const {
    FundingResolution r;
    r.address = associated_funding_address(owner, token_kind_);
    auto rec = reader_.fetch(r.address);
    r.exists = rec && rec->exists() && rec->owner == token_program_id();
    return r;
}

bool TransactionBuilder::build_initialize(const Address& sender, const Hash256& identifier_hash, uint64_t amount,
                                          int64_t expires_at, uint64_t start_nonce,
                                          Message& out, EscrowHandle& handle, std::string& err) const {
    if (!resolve_funding_account(sender).exists) {
        err = "Sender does not have a funding account";
        return false;
    }
    uint64_t nonce = 0;
    if (!resolver_.resolve(sender, identifier_hash, nonce, err, start_nonce)) return false;

    InitializeArgs args;
    args.amount = amount;
    args.identifier_hash = identifier_hash;
    args.expires_at = expires_at;
    args.nonce = nonce;

    Message m;
    m.fee_payer = sponsor_;
    m.instructions.push_back(make_escrow_initialize(sender, sponsor_, token_kind_, args));
    out = std::move(m);

    handle.escrow = escrow_address(sender, identifier_hash, nonce);
    handle.custody = custody_address(handle.escrow, token_kind_);
    handle.nonce = nonce;
    handle.identifier_hash = identifier_hash;
    handle.expires_at = expires_at;
    return true;
}

bool TransactionBuilder::load_escrow(const Address& escrow, EscrowAccount& out, std::string& err) const {
    auto rec = reader_.fetch(escrow);
    if (!rec || !rec->exists()) { err = "Escrow account not found"; return false; }
    std::string derr;
    if (rec->owner != escrow_program_id() || !decode_escrow(rec->data, out, &derr)) {
        err = "Account " + escrow.to_base58() + " is not an escrow" + (derr.empty() ? "" : ": " + derr);
        return false;
    }
    return true;
}

static void fill_handle(const Address& escrow, const EscrowAccount& e, EscrowHandle& h) {
    h.escrow = escrow;
    h.custody = e.custody;
    h.nonce = e.nonce;
    h.identifier_hash = e.identifier_hash;
    h.expires_at = e.expires_at;
}

bool TransactionBuilder::build_claim(const Address& escrow, const Address& recipient,
                                     Message& out, EscrowHandle& handle, std::string& err) const {
    EscrowAccount e;
    if (!load_escrow(escrow, e, err)) return false;
    Message m;
    m.fee_payer = sponsor_;
    m.instructions.push_back(make_escrow_claim(escrow, e.custody, recipient, sponsor_, e.token_kind));
    out = std::move(m);
    fill_handle(escrow, e, handle);
    return true;
}

bool TransactionBuilder::build_reclaim(const Address& escrow, const Address& sender,
                                       Message& out, EscrowHandle& handle, std::string& err) const {
    EscrowAccount e;
    if (!load_escrow(escrow, e, err)) return false;
    Message m;
    m.fee_payer = sponsor_;
    m.instructions.push_back(make_escrow_reclaim(escrow, e.custody, sender, sponsor_, e.token_kind));
    out = std::move(m);
    fill_handle(escrow, e, handle);
    return true;
}

bool TransactionBuilder::build_direct_transfer(const Address& sender, const Address& recipient, uint64_t amount,
                                               Message& out, std::string& err) const {
    if (amount == 0) { err = "Amount must be greater than 0"; return false; }
    const FundingResolution from = resolve_funding_account(sender);
    if (!from.exists) { err = "Sender does not have a funding account"; return false; }
    const FundingResolution to = resolve_funding_account(recipient);
    if (!to.exists) { err = "Recipient does not have a funding account"; return false; }

    Message m;
    m.fee_payer = sponsor_;
    m.instructions.push_back(make_token_transfer(from.address, to.address, sender, amount));
    out = std::move(m);
    return true;
}

}
