#include "ledger/token.h"
#include "ledger/programs.h"
#include "serialize.h"
#include "log.h"

namespace mpay {

static const uint8_t TAG_FUNDING = 1;
static const uint8_t TAG_KIND = 2;

std::vector<uint8_t> encode_funding_account(const FundingAccount& f) {
    ByteWriter w;
    w.u8(TAG_FUNDING);
    w.address(f.kind);
    w.address(f.owner);
    w.u64(f.amount);
    return w.take();
}

bool decode_funding_account(const std::vector<uint8_t>& data, FundingAccount& out) {
    ByteReader r(data);
    uint8_t tag = 0;
    if (!r.u8(tag) || tag != TAG_FUNDING) return false;
    if (!r.address(out.kind) || !r.address(out.owner) || !r.u64(out.amount)) return false;
    return r.done();
}

std::vector<uint8_t> encode_token_kind(const TokenKindInfo& k) {
    ByteWriter w;
    w.u8(TAG_KIND);
    w.u8(k.decimals);
    w.u64(k.supply);
    w.str(k.name);
    return w.take();
}

bool decode_token_kind(const std::vector<uint8_t>& data, TokenKindInfo& out) {
    ByteReader r(data);
    uint8_t tag = 0;
    if (!r.u8(tag) || tag != TAG_KIND) return false;
    if (!r.u8(out.decimals) || !r.u64(out.supply) || !r.str(out.name, MAX_SEED_LEN)) return false;
    return r.done();
}

bool token_kind_address(const std::string& name, Address& out, std::string* err) {
    if (name.empty()) {
        if (err) *err = "token kind name is empty";
        return false;
    }
    return derive_program_address({seed_of("kind"), seed_of(name)}, token_program_id(), out, err);
}

Address associated_funding_address(const Address& owner, const Address& kind) {
    Address out;
    // three 32-byte seeds never exceed the derivation limits
    derive_program_address({seed_of(owner), seed_of(token_program_id()), seed_of(kind)},
                           associated_program_id(), out);
    return out;
}

Instruction make_create_associated(const Address& payer, const Address& owner, const Address& kind) {
    Instruction ix;
    ix.program_id = token_program_id();
    ix.accounts = {writable(payer, true), writable(associated_funding_address(owner, kind)),
                   readonly(owner), readonly(kind)};
    ix.data = {uint8_t(TokenIx::CreateAssociated)};
    return ix;
}

Instruction make_token_transfer(const Address& from, const Address& to, const Address& authority, uint64_t amount) {
    Instruction ix;
    ix.program_id = token_program_id();
    ix.accounts = {writable(from), writable(to), readonly(authority, true)};
    ByteWriter w;
    w.u8(uint8_t(TokenIx::Transfer));
    w.u64(amount);
    ix.data = w.take();
    return ix;
}

Instruction make_token_close(const Address& account, const Address& destination, const Address& authority) {
    Instruction ix;
    ix.program_id = token_program_id();
    ix.accounts = {writable(account), writable(destination), readonly(authority, true)};
    ix.data = {uint8_t(TokenIx::Close)};
    return ix;
}

const Address& TokenProgram::id() const { return token_program_id(); }

static bool load_funding(InvokeContext& ctx, const Address& a, FundingAccount& out, ExecError& err) {
    auto rec = ctx.get(a);
    if (!rec || !rec->exists()) return fail(err, TxStatus::AccountNotFound, "funding account " + a.to_base58() + " not found");
    if (rec->owner != token_program_id() || !decode_funding_account(rec->data, out))
        return fail(err, TxStatus::InvalidAccountData, "account " + a.to_base58() + " is not a funding account");
    return true;
}

bool TokenProgram::execute(InvokeContext& ctx, const Instruction& ix, ExecError& err) {
    ByteReader r(ix.data);
    uint8_t tag = 0;
    if (!r.u8(tag)) return fail(err, TxStatus::InvalidArgument, "empty token instruction");
    switch (static_cast<TokenIx>(tag)) {
        case TokenIx::CreateAssociated:
            if (!r.done()) return fail(err, TxStatus::InvalidArgument, "trailing instruction data");
            return create_associated(ctx, ix, err);
        case TokenIx::Transfer: {
            uint64_t amount = 0;
            if (!r.u64(amount) || !r.done()) return fail(err, TxStatus::InvalidArgument, "malformed transfer");
            return transfer(ctx, ix, amount, err);
        }
        case TokenIx::Close:
            if (!r.done()) return fail(err, TxStatus::InvalidArgument, "trailing instruction data");
            return close(ctx, ix, err);
    }
    return fail(err, TxStatus::InvalidArgument, "unknown token instruction " + std::to_string(tag));
}

bool TokenProgram::create_associated(InvokeContext& ctx, const Instruction& ix, ExecError& err) {
    if (ix.accounts.size() != 4) return fail(err, TxStatus::InvalidArgument, "CreateAssociated expects 4 accounts");
    const Address& payer = ix.accounts[0].addr;
    const Address& account = ix.accounts[1].addr;
    const Address& owner = ix.accounts[2].addr;
    const Address& kind = ix.accounts[3].addr;

    if (account != associated_funding_address(owner, kind))
        return fail(err, TxStatus::InvalidArgument, "account is not the associated funding address");

    auto kind_rec = ctx.get(kind);
    TokenKindInfo info;
    if (!kind_rec || kind_rec->owner != token_program_id() || !decode_token_kind(kind_rec->data, info))
        return fail(err, TxStatus::InvalidAccountData, "unknown token kind " + kind.to_base58());

    if (ctx.exists(account)) {
        // idempotent
        FundingAccount existing;
        if (!load_funding(ctx, account, existing, err)) return false;
        if (existing.owner != owner || existing.kind != kind)
            return fail(err, TxStatus::InvalidAccountData, "associated account holds another owner or kind");
        return true;
    }

    FundingAccount f;
    f.kind = kind;
    f.owner = owner;
    if (!ctx.create_account(payer, account, encode_funding_account(f), err)) return false;
    ctx.log("Funding account created: " + account.to_base58() + " for " + owner.to_base58());
    return true;
}

bool TokenProgram::transfer(InvokeContext& ctx, const Instruction& ix, uint64_t amount, ExecError& err) {
    if (ix.accounts.size() != 3) return fail(err, TxStatus::InvalidArgument, "Transfer expects 3 accounts");
    const Address& from_addr = ix.accounts[0].addr;
    const Address& to_addr = ix.accounts[1].addr;
    const Address& authority = ix.accounts[2].addr;

    FundingAccount from, to;
    if (!load_funding(ctx, from_addr, from, err)) return false;
    if (!load_funding(ctx, to_addr, to, err)) return false;
    if (from.owner != authority) return fail(err, TxStatus::InvalidArgument, "authority does not own the source account");
    if (!ctx.is_signer(authority)) return fail(err, TxStatus::MissingSignature, "transfer authority must sign");
    if (from.kind != to.kind) return fail(err, TxStatus::InvalidArgument, "token kind mismatch");
    if (from.amount < amount) return fail(err, TxStatus::InsufficientFunds, "insufficient funds");
    if (from_addr == to_addr) return true;
    if (to.amount + amount < to.amount) return fail(err, TxStatus::InvalidArgument, "amount overflow");

    from.amount -= amount;
    to.amount += amount;
    if (!ctx.write_data(from_addr, encode_funding_account(from), err)) return false;
    return ctx.write_data(to_addr, encode_funding_account(to), err);
}

bool TokenProgram::close(InvokeContext& ctx, const Instruction& ix, ExecError& err) {
    if (ix.accounts.size() != 3) return fail(err, TxStatus::InvalidArgument, "Close expects 3 accounts");
    const Address& account = ix.accounts[0].addr;
    const Address& dest = ix.accounts[1].addr;
    const Address& authority = ix.accounts[2].addr;

    FundingAccount f;
    if (!load_funding(ctx, account, f, err)) return false;
    if (f.owner != authority) return fail(err, TxStatus::InvalidArgument, "authority does not own the account");
    if (!ctx.is_signer(authority)) return fail(err, TxStatus::MissingSignature, "close authority must sign");
    if (f.amount != 0) return fail(err, TxStatus::InvalidArgument, "cannot close an account with a non-zero balance");
    return ctx.close_account(account, dest, err);
}

}
