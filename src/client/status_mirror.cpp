#include "client/status_mirror.h"
#include "escrow/escrow_state.h"
#include "escrow/identifier.h"
#include "ledger/programs.h"
#include "hex.h"
#include "json.h"
#include "log.h"

#include <algorithm>
#include <filesystem>

namespace mpay {

const char* transfer_status_name(TransferStatus s) {
    switch (s) {
        case TransferStatus::Pending: return "pending";
        case TransferStatus::Claimed: return "claimed";
        case TransferStatus::Reclaimed: return "reclaimed";
        case TransferStatus::Expired: return "expired";
    }
    return "unknown";
}

bool transfer_status_from_name(const std::string& s, TransferStatus& out) {
    if (s == "pending") out = TransferStatus::Pending;
    else if (s == "claimed") out = TransferStatus::Claimed;
    else if (s == "reclaimed") out = TransferStatus::Reclaimed;
    else if (s == "expired") out = TransferStatus::Expired;
    else return false;
    return true;
}

std::string encode_transfer_record(const TransferRecord& r) {
    JObject o;
    o["escrow"] = jstr(r.escrow.to_base58());
    o["sender"] = jstr(r.sender.to_base58());
    o["identifier"] = jstr(r.identifier);
    o["identifier_hash"] = jstr(to_hex(r.identifier_hash.data(), r.identifier_hash.size()));
    o["amount"] = jstr(std::to_string(r.amount));
    o["status"] = jstr(transfer_status_name(r.status));
    o["created_at"] = jstr(std::to_string(r.created_at));
    o["expires_at"] = jstr(std::to_string(r.expires_at));
    if (r.claimed_by) o["claimed_by"] = jstr(r.claimed_by->to_base58());
    o["txid"] = jstr(to_hex(r.txid.data(), r.txid.size()));
    return json_dump(jobj(o));
}

static bool hex32(const std::string& s, Hash256& out) {
    std::vector<uint8_t> b = from_hex(s);
    if (b.size() != out.size()) return false;
    std::copy(b.begin(), b.end(), out.begin());
    return true;
}

static bool to_u64(const std::string& s, uint64_t& out) {
    try {
        size_t used = 0;
        out = std::stoull(s, &used);
        return used == s.size() && !s.empty() && s[0] != '-';
    } catch (const std::exception&) {
        return false;
    }
}

static bool to_i64(const std::string& s, int64_t& out) {
    try {
        size_t used = 0;
        out = std::stoll(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool decode_transfer_record(const std::string& raw, TransferRecord& out) {
    JNode n;
    if (!json_parse(raw, n)) return false;
    std::string escrow, sender, hash, amount, status, created, expires, claimed, txid;
    if (!json_get_string(n, "escrow", escrow) || !json_get_string(n, "sender", sender) ||
        !json_get_string(n, "identifier", out.identifier) || !json_get_string(n, "identifier_hash", hash) ||
        !json_get_string(n, "amount", amount) || !json_get_string(n, "status", status) ||
        !json_get_string(n, "created_at", created) || !json_get_string(n, "expires_at", expires) ||
        !json_get_string(n, "txid", txid))
        return false;
    if (!Address::from_base58(escrow, out.escrow) || !Address::from_base58(sender, out.sender)) return false;
    if (!hex32(hash, out.identifier_hash) || !hex32(txid, out.txid)) return false;
    if (!to_u64(amount, out.amount) || !to_i64(created, out.created_at) || !to_i64(expires, out.expires_at)) return false;
    if (!transfer_status_from_name(status, out.status)) return false;
    out.claimed_by.reset();
    if (json_get_string(n, "claimed_by", claimed)) {
        Address a;
        if (!Address::from_base58(claimed, a)) return false;
        out.claimed_by = a;
    }
    return true;
}

static std::string record_key(const Address& escrow) {
    return "t" + std::string(reinterpret_cast<const char*>(escrow.data()), escrow.size());
}

static std::string wallet_key(const std::string& identifier) {
    return "w" + normalize_identifier(identifier);
}

bool KvStatusMirror::open(const std::string& dir, std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) { err = "cannot create " + dir + ": " + ec.message(); return false; }
    return db_.open(dir, &err);
}

bool KvStatusMirror::upsert(const TransferRecord& r, std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_.put(record_key(r.escrow), encode_transfer_record(r), true, &err)) return false;
    MPAY_LOG_DEBUG(LogCategory::MIRROR, "mirror " + r.escrow.to_base58() + " -> " + transfer_status_name(r.status));
    return true;
}

bool KvStatusMirror::get(const Address& escrow, TransferRecord& out) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::string raw;
    if (!db_.get(record_key(escrow), raw)) return false;
    if (!decode_transfer_record(raw, out)) {
        MPAY_LOG_WARN(LogCategory::MIRROR, "unreadable mirror row for " + escrow.to_base58());
        return false;
    }
    return true;
}

std::vector<TransferRecord> KvStatusMirror::list() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<TransferRecord> out;
    std::string err;
    bool ok = db_.scan_prefix("t", [&](const std::string&, const std::string& v) {
        TransferRecord r;
        if (decode_transfer_record(v, r)) out.push_back(r);
        else MPAY_LOG_WARN(LogCategory::MIRROR, "skipping unreadable mirror row");
        return true;
    }, &err);
    if (!ok) MPAY_LOG_ERROR(LogCategory::MIRROR, "mirror scan failed: " + err);
    return out;
}

bool KvStatusMirror::register_wallet(const std::string& identifier, const Address& wallet, std::string& err) {
    if (!validate_identifier(identifier, err)) return false;
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_.put(wallet_key(identifier), wallet.to_base58(), true, &err)) return false;
    MPAY_LOG_INFO(LogCategory::MIRROR, "registered wallet " + wallet.to_base58() + " for " + normalize_identifier(identifier));
    return true;
}

std::optional<Address> KvStatusMirror::lookup_wallet(const std::string& identifier) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::string raw;
    if (!db_.get(wallet_key(identifier), raw)) return std::nullopt;
    Address a;
    if (!Address::from_base58(raw, a)) return std::nullopt;
    return a;
}

ReconcileReport reconcile_mirror(StatusMirror& mirror, const AccountReader& ledger, int64_t now) {
    ReconcileReport rep;
    for (TransferRecord r : mirror.list()) {
        if (r.terminal()) continue;
        ++rep.examined;

        TransferRecord want = r;
        auto rec = ledger.fetch(r.escrow);
        if (!rec || !rec->exists()) {
            ++rep.missing;
            want.status = TransferStatus::Reclaimed;
        } else {
            EscrowAccount e;
            std::string derr;
            if (rec->owner != escrow_program_id() || !decode_escrow(rec->data, e, &derr)) {
                MPAY_LOG_WARN(LogCategory::MIRROR, "escrow " + r.escrow.to_base58() + " unreadable: " + derr);
                continue;
            }
            if (e.status == EscrowStatus::Claimed) {
                want.status = TransferStatus::Claimed;
                want.claimed_by = e.claimed_by();
            } else if (e.status == EscrowStatus::Reclaimed) {
                want.status = TransferStatus::Reclaimed;
            } else if (now >= e.expires_at) {
                want.status = TransferStatus::Expired;
            } else {
                want.status = TransferStatus::Pending;
            }
        }

        if (want.status == r.status && want.claimed_by == r.claimed_by) continue;
        std::string err;
        if (!mirror.upsert(want, err)) {
            MPAY_LOG_ERROR(LogCategory::MIRROR, "reconcile write failed for " + r.escrow.to_base58() + ": " + err);
            continue;
        }
        ++rep.updated;
        MPAY_LOG_INFO(LogCategory::MIRROR, "reconciled " + r.escrow.to_base58() + ": " +
                      transfer_status_name(r.status) + " -> " + transfer_status_name(want.status));
    }
    return rep;
}

}
