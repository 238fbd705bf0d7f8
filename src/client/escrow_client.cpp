#include "client/escrow_client.h"
#include "client/amount.h"
#include "escrow/escrow_error.h"
#include "escrow/identifier.h"
#include "ledger/programs.h"
#include "log.h"

namespace mpay {

static const int64_t SECONDS_PER_DAY = 24 * 60 * 60;

std::string escrow_status_label(const EscrowAccount& e, int64_t now) {
    switch (e.status) {
        case EscrowStatus::Active: return now >= e.expires_at ? "expired" : "active";
        case EscrowStatus::Claimed: return "claimed";
        case EscrowStatus::Reclaimed: return "reclaimed";
    }
    return "unknown";
}

std::string describe_failure(const TxResult& r) {
    if (r.status == TxStatus::ProgramError) {
        EscrowError e;
        if (escrow_error_from_code(r.program_error, e)) return escrow_error_message(e);
    }
    switch (r.status) {
        case TxStatus::AccountInUse: return "Escrow address already in use";
        case TxStatus::CheckpointExpired: return "Transaction expired before it was submitted";
        case TxStatus::InsufficientFunds: return "Insufficient funds";
        case TxStatus::InsufficientFundsForFee: return "Sponsor cannot cover the network fee";
        default: return r.describe();
    }
}

EscrowClient::EscrowClient(Ledger& ledger, const FeeSponsor& sponsor, const Address& token_kind,
                           const ClientOptions& opts, StatusMirror* mirror, NotificationDispatcher* notifier)
    : ledger_(ledger), sponsor_(sponsor), token_kind_(token_kind), opts_(opts),
      mirror_(mirror), notifier_(notifier),
      resolver_(ledger, opts.max_nonce_probe),
      builder_(ledger, resolver_, token_kind, sponsor.address()) {}

bool EscrowClient::submit_sponsored(const Message& msg, PrincipalSigner& principal, ClientResult& res) {
    std::string err;
    SponsoredAuthorization auth;
    if (!sponsor_.sponsor(msg, principal.address(), auth, err)) {
        res.error = err;
        res.retryable = false;
        return false;
    }

    const unsigned max_resign = opts_.max_resign_attempts ? opts_.max_resign_attempts : 1;
    for (unsigned round = 1;; ++round) {
        if (auth.is_stale(ledger_.slot()) && !sponsor_.refresh(auth, err)) {
            res.error = err;
            return false;
        }
        if (!countersign(auth, principal, err)) {
            res.error = err;
            res.retryable = false;
            return false;
        }
        Transaction tx;
        if (!auth.finalize(ledger_.slot(), tx, err)) {
            // window closed while the principal was signing
            if (auth.is_stale(ledger_.slot()) && round < max_resign) {
                if (!sponsor_.refresh(auth, err)) { res.error = err; return false; }
                continue;
            }
            res.error = err;
            res.retryable = auth.is_stale(ledger_.slot());
            return false;
        }

        res.tx = ledger_.submit(tx);
        if (res.tx.status == TxStatus::CheckpointExpired && round < max_resign) {
            MPAY_LOG_INFO(LogCategory::CLIENT, "checkpoint expired, re-signing (round " + std::to_string(round) + ")");
            if (!sponsor_.refresh(auth, err)) { res.error = err; return false; }
            continue;
        }
        break;
    }

    res.ok = res.tx.ok();
    res.retryable = !res.ok && is_retryable(res.tx);
    if (!res.ok) res.error = describe_failure(res.tx);
    return res.ok;
}

ClientResult EscrowClient::send(const SendRequest& req, PrincipalSigner& principal) {
    ClientResult res;
    res.route = SendRoute::Escrow;

    std::string err;
    if (!validate_identifier(req.identifier, err)) { res.error = err; return res; }
    if (req.amount == 0) { res.error = escrow_error_message(EscrowError::InvalidAmount); return res; }
    if (principal.address() != req.sender) { res.error = "principal does not match the sender"; return res; }

    const Hash256 hash = identifier_hash(req.identifier);
    const unsigned days = req.expiry_days ? req.expiry_days : opts_.default_expiry_days;
    const int64_t created_at = ledger_.now();
    const int64_t expires_at = created_at + (int64_t)days * SECONDS_PER_DAY;

    NonceResolver probe(probe_view(), opts_.max_nonce_probe);
    TransactionBuilder builder(ledger_, probe, token_kind_, sponsor_.address());

    const unsigned max_attempts = opts_.max_create_attempts ? opts_.max_create_attempts : 1;
    uint64_t start = 0;
    for (unsigned attempt = 1; attempt <= max_attempts; ++attempt) {
        res.attempts = attempt;
        res.tx = TxResult();
        uint64_t nonce = 0;
        if (!probe.next_free(req.sender, hash, nonce, err, start)) {
            res.error = err;
            res.retryable = false;
            return res;
        }
        Message msg;
        if (!builder.build_initialize(req.sender, hash, req.amount, expires_at, nonce, msg, res.handle, err)) {
            res.error = err;
            res.retryable = false;
            return res;
        }
        if (submit_sponsored(msg, principal, res)) break;

        // someone else landed on this nonce first
        if (res.tx.status == TxStatus::AccountInUse || res.tx.status == TxStatus::AlreadyProcessed) {
            MPAY_LOG_INFO(LogCategory::CLIENT, "nonce " + std::to_string(res.handle.nonce) +
                          " taken, retrying (attempt " + std::to_string(attempt) + ")");
            start = res.handle.nonce + 1;
            res.retryable = true;
            continue;
        }
        MPAY_LOG_WARN(LogCategory::CLIENT, "escrow send failed: " + res.error);
        return res;
    }
    if (!res.ok) {
        res.error = "no escrow slot could be claimed after " + std::to_string(max_attempts) + " attempts";
        res.retryable = true;
        return res;
    }

    MPAY_LOG_INFO(LogCategory::CLIENT, "escrow " + res.handle.escrow.to_base58() + " holds " +
                  format_amount(req.amount) + " " + opts_.token_name + " for " + normalize_identifier(req.identifier));
    record_created(req, res, created_at);
    return res;
}

void EscrowClient::record_created(const SendRequest& req, const ClientResult& res, int64_t created_at) {
    if (mirror_) {
        TransferRecord r;
        r.escrow = res.handle.escrow;
        r.sender = req.sender;
        r.identifier = normalize_identifier(req.identifier);
        r.identifier_hash = res.handle.identifier_hash;
        r.amount = req.amount;
        r.status = TransferStatus::Pending;
        r.created_at = created_at;
        r.expires_at = res.handle.expires_at;
        r.txid = res.tx.txid;
        std::string err;
        if (!mirror_->upsert(r, err))
            MPAY_LOG_WARN(LogCategory::MIRROR, "escrow created but mirror write failed: " + err);
    }
    if (notifier_) {
        EscrowNotice n;
        n.identifier = normalize_identifier(req.identifier);
        n.escrow = res.handle.escrow;
        n.sender = req.sender;
        n.amount = req.amount;
        n.token = opts_.token_name;
        n.expires_at = res.handle.expires_at;
        std::string err;
        if (!notifier_->notify_escrow_created(n, err))
            MPAY_LOG_WARN(LogCategory::NOTIFY, "escrow created but notification failed: " + err);
    }
}

void EscrowClient::record_terminal(const Address& escrow, TransferStatus status, const std::optional<Address>& who,
                                   const Hash256& txid) {
    if (!mirror_) return;
    TransferRecord r;
    if (!mirror_->get(escrow, r)) {
        MPAY_LOG_DEBUG(LogCategory::MIRROR, "no mirror row for " + escrow.to_base58());
        return;
    }
    r.status = status;
    r.claimed_by = who;
    r.txid = txid;
    std::string err;
    if (!mirror_->upsert(r, err))
        MPAY_LOG_WARN(LogCategory::MIRROR, "ledger updated but mirror write failed: " + err);
}

ClientResult EscrowClient::send_auto(const SendRequest& req, PrincipalSigner& principal) {
    std::optional<Address> wallet;
    if (mirror_) wallet = mirror_->lookup_wallet(req.identifier);
    if (!wallet) return send(req, principal);

    ClientResult res;
    res.route = SendRoute::Direct;
    res.attempts = 1;
    std::string err;
    if (req.amount == 0) { res.error = escrow_error_message(EscrowError::InvalidAmount); return res; }
    if (principal.address() != req.sender) { res.error = "principal does not match the sender"; return res; }

    Message msg;
    if (!builder_.build_direct_transfer(req.sender, *wallet, req.amount, msg, err)) {
        res.error = err;
        return res;
    }
    if (submit_sponsored(msg, principal, res))
        MPAY_LOG_INFO(LogCategory::CLIENT, "sent " + format_amount(req.amount) + " " + opts_.token_name +
                      " directly to " + wallet->to_base58());
    return res;
}

ClientResult EscrowClient::claim(const Address& escrow, PrincipalSigner& recipient) {
    ClientResult res;
    res.attempts = 1;
    std::string err;
    Message msg;
    if (!builder_.build_claim(escrow, recipient.address(), msg, res.handle, err)) {
        res.error = err;
        return res;
    }
    if (!submit_sponsored(msg, recipient, res)) {
        MPAY_LOG_WARN(LogCategory::CLIENT, "claim of " + escrow.to_base58() + " failed: " + res.error);
        return res;
    }
    MPAY_LOG_INFO(LogCategory::CLIENT, "escrow " + escrow.to_base58() + " claimed by " + recipient.address().to_base58());
    record_terminal(escrow, TransferStatus::Claimed, recipient.address(), res.tx.txid);
    return res;
}

ClientResult EscrowClient::reclaim(const Address& escrow, PrincipalSigner& sender) {
    ClientResult res;
    res.attempts = 1;
    std::string err;
    Message msg;
    if (!builder_.build_reclaim(escrow, sender.address(), msg, res.handle, err)) {
        res.error = err;
        return res;
    }
    if (!submit_sponsored(msg, sender, res)) {
        MPAY_LOG_WARN(LogCategory::CLIENT, "reclaim of " + escrow.to_base58() + " failed: " + res.error);
        return res;
    }
    MPAY_LOG_INFO(LogCategory::CLIENT, "escrow " + escrow.to_base58() + " reclaimed by its sender");
    record_terminal(escrow, TransferStatus::Reclaimed, std::nullopt, res.tx.txid);
    return res;
}

std::optional<EscrowAccount> EscrowClient::fetch_escrow(const Address& escrow) const {
    auto rec = ledger_.fetch(escrow);
    if (!rec || !rec->exists() || rec->owner != escrow_program_id()) return std::nullopt;
    EscrowAccount e;
    std::string err;
    if (!decode_escrow(rec->data, e, &err)) {
        MPAY_LOG_WARN(LogCategory::CLIENT, "escrow " + escrow.to_base58() + " unreadable: " + err);
        return std::nullopt;
    }
    return e;
}

std::vector<std::pair<Address, EscrowAccount>> EscrowClient::escrows_for_sender(const Address& sender) const {
    std::vector<std::pair<Address, EscrowAccount>> out;
    for (const auto& kv : ledger_.accounts_owned_by(escrow_program_id())) {
        EscrowAccount e;
        if (!decode_escrow(kv.second.data, e)) continue;
        if (e.sender == sender) out.emplace_back(kv.first, e);
    }
    return out;
}

std::vector<std::pair<Address, EscrowAccount>> EscrowClient::find_by_identifier(const Address& sender,
                                                                               const std::string& identifier) const {
    const Hash256 h = identifier_hash(identifier);
    std::vector<std::pair<Address, EscrowAccount>> out;
    for (auto& kv : escrows_for_sender(sender))
        if (kv.second.identifier_hash == h) out.push_back(std::move(kv));
    return out;
}

std::string EscrowClient::status_label(const Address& escrow, int64_t now) const {
    if (auto e = fetch_escrow(escrow)) return escrow_status_label(*e, now);
    // closed records: only reclaim removes an escrow
    TransferRecord r;
    if (mirror_ && mirror_->get(escrow, r)) return "reclaimed";
    return "unknown";
}

std::vector<TransferRecord> EscrowClient::unclaimed_for(const std::string& identifier) {
    std::vector<TransferRecord> out;
    if (!mirror_) return out;
    const ReconcileReport rep = reconcile_mirror(*mirror_, ledger_, ledger_.now());
    if (rep.updated)
        MPAY_LOG_DEBUG(LogCategory::MIRROR, "reconcile fixed " + std::to_string(rep.updated) + " rows");
    const Hash256 h = identifier_hash(identifier);
    for (const auto& r : mirror_->list())
        if (r.identifier_hash == h && r.status == TransferStatus::Pending) out.push_back(r);
    return out;
}

}
