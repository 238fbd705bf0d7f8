#include "escrow/escrow_state.h"
#include "ledger/programs.h"
#include "ledger/token.h"
#include "serialize.h"

namespace mpay {

const char* escrow_status_name(EscrowStatus s) {
    switch (s) {
        case EscrowStatus::Active: return "active";
        case EscrowStatus::Claimed: return "claimed";
        case EscrowStatus::Reclaimed: return "reclaimed";
    }
    return "unknown";
}

std::optional<Address> EscrowAccount::claimed_by() const {
    if (const auto* c = std::get_if<ClaimedBy>(&recipient)) return c->wallet;
    return std::nullopt;
}

const std::array<uint8_t, 8>& escrow_discriminator() {
    static const std::array<uint8_t, 8> disc = [] {
        Hash256 h = sha256(std::string("account:EscrowAccount"));
        std::array<uint8_t, 8> d{};
        for (size_t i = 0; i < d.size(); ++i) d[i] = h[i];
        return d;
    }();
    return disc;
}

std::vector<uint8_t> encode_escrow(const EscrowAccount& e) {
    ByteWriter w;
    w.fixed(escrow_discriminator());
    w.u8(ESCROW_LAYOUT_VERSION);
    w.address(e.sender);
    w.fixed(e.identifier_hash);
    if (auto who = e.claimed_by()) {
        w.u8(1);
        w.address(*who);
    } else {
        w.u8(0);
        w.address(Address{});
    }
    w.address(e.token_kind);
    w.address(e.custody);
    w.u64(e.amount);
    w.i64(e.created_at);
    w.i64(e.expires_at);
    w.u8(static_cast<uint8_t>(e.status));
    w.u64(e.nonce);
    return w.take();
}

static bool bad(std::string* err, const char* why) {
    if (err) *err = why;
    return false;
}

bool decode_escrow(const std::vector<uint8_t>& data, EscrowAccount& out, std::string* err) {
    ByteReader r(data);
    std::array<uint8_t, 8> disc{};
    if (!r.fixed(disc)) return bad(err, "escrow record truncated");
    if (disc != escrow_discriminator()) return bad(err, "not an escrow record");
    uint8_t version = 0;
    if (!r.u8(version)) return bad(err, "escrow record truncated");
    if (version != ESCROW_LAYOUT_VERSION) return bad(err, "unsupported escrow layout version");

    EscrowAccount e;
    uint8_t tag = 0, status = 0;
    Address who;
    if (!r.address(e.sender) || !r.fixed(e.identifier_hash) || !r.u8(tag) || !r.address(who) ||
        !r.address(e.token_kind) || !r.address(e.custody) || !r.u64(e.amount) ||
        !r.i64(e.created_at) || !r.i64(e.expires_at) || !r.u8(status) || !r.u64(e.nonce))
        return bad(err, "escrow record truncated");
    if (!r.done()) return bad(err, "trailing bytes after escrow record");

    if (tag == 0) {
        if (!who.is_zero()) return bad(err, "unclaimed escrow carries a recipient");
        e.recipient = Unclaimed{};
    } else if (tag == 1) {
        e.recipient = ClaimedBy{who};
    } else {
        return bad(err, "bad recipient tag");
    }
    if (status > static_cast<uint8_t>(EscrowStatus::Reclaimed)) return bad(err, "bad escrow status");
    e.status = static_cast<EscrowStatus>(status);
    out = e;
    return true;
}

std::vector<std::vector<uint8_t>> escrow_seeds(const Address& sender, const Hash256& identifier_hash, uint64_t nonce) {
    return {seed_of("escrow"), seed_of(sender),
            std::vector<uint8_t>(identifier_hash.begin(), identifier_hash.end()), seed_of_u64le(nonce)};
}

Address escrow_address(const Address& sender, const Hash256& identifier_hash, uint64_t nonce) {
    Address out;
    // fixed-size seeds never exceed the derivation limits
    derive_program_address(escrow_seeds(sender, identifier_hash, nonce), escrow_program_id(), out);
    return out;
}

Address custody_address(const Address& escrow, const Address& token_kind) {
    return associated_funding_address(escrow, token_kind);
}

}
