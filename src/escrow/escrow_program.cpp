#include "escrow/escrow_program.h"
#include "ledger/programs.h"
#include "ledger/token.h"
#include "constants.h"
#include "hex.h"
#include "log.h"
#include "serialize.h"

namespace mpay {

Instruction make_escrow_initialize(const Address& sender, const Address& sponsor,
                                   const Address& token_kind, const InitializeArgs& args) {
    const Address escrow = escrow_address(sender, args.identifier_hash, args.nonce);
    Instruction ix;
    ix.program_id = escrow_program_id();
    ix.accounts = {writable(escrow), writable(custody_address(escrow, token_kind)),
                   writable(associated_funding_address(sender, token_kind)), readonly(token_kind),
                   writable(sender, true), writable(sponsor, true)};
    ByteWriter w;
    w.u8(uint8_t(EscrowIx::Initialize));
    w.u64(args.amount);
    w.fixed(args.identifier_hash);
    w.i64(args.expires_at);
    w.u64(args.nonce);
    ix.data = w.take();
    return ix;
}

static Instruction terminal_ix(EscrowIx tag, const Address& escrow, const Address& custody, const Address& party,
                               const Address& sponsor, const Address& token_kind) {
    Instruction ix;
    ix.program_id = escrow_program_id();
    ix.accounts = {writable(escrow), writable(custody), writable(associated_funding_address(party, token_kind)),
                   readonly(token_kind), writable(party, true), writable(sponsor, true)};
    ix.data = {uint8_t(tag)};
    return ix;
}

Instruction make_escrow_claim(const Address& escrow, const Address& custody, const Address& recipient,
                              const Address& sponsor, const Address& token_kind) {
    return terminal_ix(EscrowIx::Claim, escrow, custody, recipient, sponsor, token_kind);
}

Instruction make_escrow_reclaim(const Address& escrow, const Address& custody, const Address& sender,
                                const Address& sponsor, const Address& token_kind) {
    return terminal_ix(EscrowIx::Reclaim, escrow, custody, sender, sponsor, token_kind);
}

const Address& EscrowProgram::id() const { return escrow_program_id(); }

bool EscrowProgram::execute(InvokeContext& ctx, const Instruction& ix, ExecError& err) {
    ByteReader r(ix.data);
    uint8_t tag = 0;
    if (!r.u8(tag)) return fail_escrow(err, EscrowError::InvalidInstruction);
    if (ix.accounts.size() != 6) return fail_escrow(err, EscrowError::InvalidInstruction);

    switch (static_cast<EscrowIx>(tag)) {
        case EscrowIx::Initialize: {
            InitializeArgs a;
            if (!r.u64(a.amount) || !r.fixed(a.identifier_hash) || !r.i64(a.expires_at) || !r.u64(a.nonce) || !r.done())
                return fail_escrow(err, EscrowError::InvalidInstruction);
            return initialize(ctx, ix, a, err);
        }
        case EscrowIx::Claim:
            if (!r.done()) return fail_escrow(err, EscrowError::InvalidInstruction);
            return claim(ctx, ix, err);
        case EscrowIx::Reclaim:
            if (!r.done()) return fail_escrow(err, EscrowError::InvalidInstruction);
            return reclaim(ctx, ix, err);
    }
    return fail_escrow(err, EscrowError::InvalidInstruction);
}

bool EscrowProgram::initialize(InvokeContext& ctx, const Instruction& ix, const InitializeArgs& args, ExecError& err) {
    const Address& escrow = ix.accounts[0].addr;
    const Address& custody = ix.accounts[1].addr;
    const Address& sender_funding = ix.accounts[2].addr;
    const Address& kind = ix.accounts[3].addr;
    const Address& sender = ix.accounts[4].addr;
    const Address& sponsor = ix.accounts[5].addr;
    const int64_t now = ctx.now();

    if (args.amount == 0) return fail_escrow(err, EscrowError::InvalidAmount);
    if (args.expires_at <= now) return fail_escrow(err, EscrowError::InvalidExpiration);
    if (args.expires_at - now > MPAY_MAX_ESCROW_DURATION_SECS) return fail_escrow(err, EscrowError::ExpirationTooLong);
    if (!ctx.is_signer(sender)) return fail_escrow(err, EscrowError::UnauthorizedSender);
    if (escrow != escrow_address(sender, args.identifier_hash, args.nonce))
        return fail_escrow(err, EscrowError::InvalidEscrowAddress);
    if (custody != custody_address(escrow, kind)) return fail_escrow(err, EscrowError::InvalidCustodyAccount);
    if (ctx.exists(escrow)) return fail(err, TxStatus::AccountInUse, "escrow " + escrow.to_base58() + " already in use");
    if (ctx.exists(custody)) return fail(err, TxStatus::AccountInUse, "custody " + custody.to_base58() + " already in use");

    EscrowAccount e;
    e.sender = sender;
    e.identifier_hash = args.identifier_hash;
    e.recipient = Unclaimed{};
    e.token_kind = kind;
    e.custody = custody;
    e.amount = args.amount;
    e.created_at = now;
    e.expires_at = args.expires_at;
    e.status = EscrowStatus::Active;
    e.nonce = args.nonce;
    if (!ctx.create_account(sponsor, escrow, encode_escrow(e), err)) return false;

    if (!ctx.invoke(make_create_associated(sponsor, escrow, kind), {}, err)) return false;
    if (!ctx.invoke(make_token_transfer(sender_funding, custody, sender, args.amount), {}, err)) return false;

    ctx.log("Escrow created: " + std::to_string(args.amount) + " tokens for identifier hash " +
            to_hex(args.identifier_hash.data(), args.identifier_hash.size()) + ", expires at " +
            std::to_string(args.expires_at));
    return true;
}

// Loads the escrow at accounts[0]; absence or a foreign record reads as "not active".
static bool load_escrow(InvokeContext& ctx, const Address& escrow, EscrowAccount& out, ExecError& err) {
    auto rec = ctx.get(escrow);
    if (!rec || !rec->exists() || rec->owner != escrow_program_id() || !decode_escrow(rec->data, out))
        return fail_escrow(err, EscrowError::EscrowNotActive);
    return true;
}

// Moves the whole custody balance to `dest_funding` and closes custody into `reserve_to`.
static bool drain_custody(InvokeContext& ctx, const EscrowAccount& e, const Address& escrow,
                          const Address& dest_funding, const Address& reserve_to, ExecError& err) {
    auto rec = ctx.get(e.custody);
    FundingAccount custody;
    if (!rec || !decode_funding_account(rec->data, custody))
        return fail_escrow(err, EscrowError::InvalidCustodyAccount);

    const std::vector<SeedList> signer = {escrow_seeds(e.sender, e.identifier_hash, e.nonce)};
    if (!ctx.invoke(make_token_transfer(e.custody, dest_funding, escrow, custody.amount), signer, err)) return false;
    return ctx.invoke(make_token_close(e.custody, reserve_to, escrow), signer, err);
}

bool EscrowProgram::claim(InvokeContext& ctx, const Instruction& ix, ExecError& err) {
    const Address& escrow = ix.accounts[0].addr;
    const Address& custody = ix.accounts[1].addr;
    const Address& recipient_funding = ix.accounts[2].addr;
    const Address& kind = ix.accounts[3].addr;
    const Address& recipient = ix.accounts[4].addr;
    const Address& sponsor = ix.accounts[5].addr;

    EscrowAccount e;
    if (!load_escrow(ctx, escrow, e, err)) return false;
    if (!ctx.is_signer(recipient)) return fail_escrow(err, EscrowError::InvalidRecipient);
    if (e.status != EscrowStatus::Active) return fail_escrow(err, EscrowError::EscrowNotActive);
    if (ctx.now() >= e.expires_at) return fail_escrow(err, EscrowError::EscrowExpired);
    if (custody != e.custody) return fail_escrow(err, EscrowError::InvalidCustodyAccount);
    if (kind != e.token_kind) return fail_escrow(err, EscrowError::InvalidInstruction);
    if (recipient_funding != associated_funding_address(recipient, kind))
        return fail(err, TxStatus::InvalidArgument, "recipient funding account is not the associated address");

    if (!ctx.invoke(make_create_associated(sponsor, recipient, kind), {}, err)) return false;
    if (!drain_custody(ctx, e, escrow, recipient_funding, recipient, err)) return false;

    e.recipient = ClaimedBy{recipient};
    e.status = EscrowStatus::Claimed;
    if (!ctx.write_data(escrow, encode_escrow(e), err)) return false;

    ctx.log("Escrow claimed: " + std::to_string(e.amount) + " tokens by " + recipient.to_base58());
    return true;
}

bool EscrowProgram::reclaim(InvokeContext& ctx, const Instruction& ix, ExecError& err) {
    const Address& escrow = ix.accounts[0].addr;
    const Address& custody = ix.accounts[1].addr;
    const Address& sender_funding = ix.accounts[2].addr;
    const Address& kind = ix.accounts[3].addr;
    const Address& sender = ix.accounts[4].addr;
    const Address& sponsor = ix.accounts[5].addr;

    EscrowAccount e;
    if (!load_escrow(ctx, escrow, e, err)) return false;
    if (sender != e.sender || !ctx.is_signer(sender)) return fail_escrow(err, EscrowError::UnauthorizedSender);
    if (e.status != EscrowStatus::Active) return fail_escrow(err, EscrowError::EscrowNotActive);
    if (ctx.now() < e.expires_at) return fail_escrow(err, EscrowError::EscrowNotExpired);
    if (custody != e.custody) return fail_escrow(err, EscrowError::InvalidCustodyAccount);
    if (kind != e.token_kind) return fail_escrow(err, EscrowError::InvalidInstruction);
    if (sender_funding != associated_funding_address(sender, kind))
        return fail(err, TxStatus::InvalidArgument, "sender funding account is not the associated address");

    if (!ctx.invoke(make_create_associated(sponsor, sender, kind), {}, err)) return false;
    if (!drain_custody(ctx, e, escrow, sender_funding, sender, err)) return false;
    if (!ctx.close_account(escrow, sender, err)) return false;

    ctx.log("Escrow reclaimed: " + std::to_string(e.amount) + " tokens returned to " + sender.to_base58());
    return true;
}

}
