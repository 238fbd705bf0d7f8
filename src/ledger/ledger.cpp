#include "ledger/ledger.h"
#include "ledger/programs.h"
#include "ledger/token.h"
#include "hex.h"
#include "log.h"
#include "serialize.h"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <set>

namespace mpay {

static const char K_ACCOUNT = 'a';
static const char K_PROCESSED = 's';
static const char K_EXPIRY = 'x';       // x || checkpoint slot (big-endian) || txid
static const std::string K_META = "mstate";

static std::string account_key(const Address& a) {
    return std::string(1, K_ACCOUNT) + std::string(reinterpret_cast<const char*>(a.data()), a.size());
}

static std::string processed_key(const Hash256& txid) {
    return std::string(1, K_PROCESSED) + std::string(reinterpret_cast<const char*>(txid.data()), txid.size());
}

static std::string expiry_key(uint64_t checkpoint_slot, const Hash256& txid) {
    std::string k(1, K_EXPIRY);
    for (int i = 7; i >= 0; --i) k.push_back((char)((checkpoint_slot >> (8 * i)) & 0xff));
    k.append(reinterpret_cast<const char*>(txid.data()), txid.size());
    return k;
}

static uint64_t expiry_key_slot(const std::string& k) {
    uint64_t slot = 0;
    for (size_t i = 1; i < 9 && i < k.size(); ++i) slot = (slot << 8) | (uint8_t)k[i];
    return slot;
}

static Hash256 next_checkpoint_hash(const Hash256& prev, uint64_t slot, int64_t time) {
    ByteWriter w;
    w.fixed(prev);
    w.u64(slot);
    w.i64(time);
    return sha256(w.bytes());
}

Ledger::~Ledger() { close(); }

bool Ledger::open(const std::string& dir, const LedgerOptions& opts, std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (opts.checkpoint_window == 0) { err = "checkpoint_window must be positive"; return false; }
    opts_ = opts;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) { err = "cannot create " + dir + ": " + ec.message(); return false; }
    if (!db_.open(dir, &err)) return false;

    programs_.clear();
    auto token = std::make_shared<TokenProgram>();
    programs_[token->id()] = token;

    checkpoints_.clear();
    std::string raw, gerr;
    if (db_.get(K_META, raw, &gerr)) {
        if (!decode_meta_locked(raw)) { err = "corrupt ledger meta in " + dir; db_.close(); return false; }
        MPAY_LOG_INFO(LogCategory::LEDGER, "opened ledger at slot " + std::to_string(slot_) + ", time " + std::to_string(time_));
        return true;
    }
    if (!gerr.empty()) { err = gerr; db_.close(); return false; }

    // fresh ledger
    time_ = opts_.genesis_time != 0 ? opts_.genesis_time : (int64_t)std::time(nullptr);
    slot_ = 0;
    Hash256 genesis = Sha256Writer().write(std::string("mailpay/genesis")).write(std::to_string(time_)).finalize();
    push_checkpoint_locked(genesis, 0);
    if (!db_.put(K_META, encode_meta_locked(), true, &err)) { db_.close(); return false; }
    MPAY_LOG_INFO(LogCategory::LEDGER, "created ledger in " + dir + " at time " + std::to_string(time_));
    return true;
}

void Ledger::close() {
    std::lock_guard<std::mutex> lk(mtx_);
    db_.close();
    checkpoints_.clear();
}

bool Ledger::is_open() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return db_.is_open();
}

void Ledger::register_program(std::shared_ptr<Program> p) {
    std::lock_guard<std::mutex> lk(mtx_);
    MPAY_LOG_DEBUG(LogCategory::LEDGER, std::string("registered program ") + p->name() + " " + p->id().to_base58());
    programs_[p->id()] = std::move(p);
}

std::string Ledger::encode_meta_locked() const {
    ByteWriter w;
    w.i64(time_);
    w.u64(slot_);
    w.u32((uint32_t)checkpoints_.size());
    for (const auto& c : checkpoints_) {
        w.fixed(c.first);
        w.u64(c.second);
    }
    const auto& b = w.bytes();
    return std::string(b.begin(), b.end());
}

bool Ledger::decode_meta_locked(const std::string& raw) {
    ByteReader r(raw);
    uint32_t n = 0;
    if (!r.i64(time_) || !r.u64(slot_) || !r.u32(n)) return false;
    for (uint32_t i = 0; i < n; ++i) {
        Hash256 h{};
        uint64_t s = 0;
        if (!r.fixed(h) || !r.u64(s)) return false;
        push_checkpoint_locked(h, s);
    }
    return r.done() && !checkpoints_.empty();
}

void Ledger::push_checkpoint_locked(const Hash256& h, uint64_t slot) {
    checkpoints_.emplace_back(h, slot);
    while (checkpoints_.size() > opts_.checkpoint_window) checkpoints_.pop_front();
}

std::optional<AccountRecord> Ledger::load_locked(const Address& addr) const {
    std::string raw, err;
    if (!db_.get(account_key(addr), raw, &err)) {
        if (!err.empty()) MPAY_LOG_ERROR(LogCategory::DB, "account read failed: " + err);
        return std::nullopt;
    }
    AccountRecord rec;
    if (!decode_account(raw, rec)) {
        MPAY_LOG_ERROR(LogCategory::LEDGER, "corrupt account record " + addr.to_base58());
        return std::nullopt;
    }
    return rec;
}

std::optional<AccountRecord> Ledger::fetch(const Address& addr) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return load_locked(addr);
}

std::vector<std::pair<Address, AccountRecord>> Ledger::accounts_owned_by(const Address& program) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::pair<Address, AccountRecord>> out;
    std::string err;
    bool ok = db_.scan_prefix(std::string(1, K_ACCOUNT), [&](const std::string& k, const std::string& v) {
        AccountRecord rec;
        if (k.size() != 1 + Address::size() || !decode_account(v, rec)) return true;
        if (rec.owner == program) out.emplace_back(Address::from_bytes(reinterpret_cast<const uint8_t*>(k.data()) + 1), rec);
        return true;
    }, &err);
    if (!ok) MPAY_LOG_ERROR(LogCategory::DB, "account scan failed: " + err);
    return out;
}

bool Ledger::checkpoint_slot_locked(const Hash256& h, uint64_t& slot) const {
    for (const auto& c : checkpoints_) {
        if (c.first == h) { slot = c.second; return true; }
    }
    return false;
}

bool Ledger::checkpoint_valid_locked(const Hash256& h) const {
    uint64_t slot = 0;
    return checkpoint_slot_locked(h, slot);
}

bool Ledger::checkpoint_valid(const Hash256& h) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return checkpoint_valid_locked(h);
}

Checkpoint Ledger::latest_checkpoint() const {
    std::lock_guard<std::mutex> lk(mtx_);
    Checkpoint c;
    if (checkpoints_.empty()) return c;     // not open: zero hash, never valid
    c.hash = checkpoints_.back().first;
    c.slot = checkpoints_.back().second;
    c.last_valid_slot = c.slot + opts_.checkpoint_window - 1;
    return c;
}

int64_t Ledger::now() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return time_;
}

uint64_t Ledger::slot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return slot_;
}

bool Ledger::advance_time(int64_t secs, std::string& err, uint32_t slots) {
    if (secs < 0) { err = "time cannot move backwards"; return false; }
    if (slots == 0) slots = 1;
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_.is_open()) { err = "ledger not open"; return false; }

    const int64_t old_time = time_;
    const uint64_t old_slot = slot_;
    const auto old_ring = checkpoints_;
    for (uint32_t i = 0; i < slots; ++i) {
        // spread the elapsed time across the new slots; the last one lands on the target
        time_ = old_time + (int64_t)((secs * (int64_t)(i + 1)) / (int64_t)slots);
        ++slot_;
        push_checkpoint_locked(next_checkpoint_hash(checkpoints_.back().first, slot_, time_), slot_);
    }

    // transactions bound to a checkpoint that left the ring can never be replayed
    const uint64_t oldest = checkpoints_.front().second;
    std::vector<std::string> stale;
    const bool scanned = db_.scan_prefix(std::string(1, K_EXPIRY), [&](const std::string& k, const std::string&) {
        if (expiry_key_slot(k) >= oldest) return false;
        stale.push_back(k);
        return true;
    }, &err);

    KVDB::Batch batch(db_);
    for (const auto& k : stale) {
        batch.del(k);
        batch.del(std::string(1, K_PROCESSED) + k.substr(9));
    }
    batch.put(K_META, encode_meta_locked());
    if (!scanned || !batch.commit(true, &err)) {
        time_ = old_time;
        slot_ = old_slot;
        checkpoints_ = old_ring;
        return false;
    }
    if (!stale.empty())
        MPAY_LOG_DEBUG(LogCategory::LEDGER, "pruned " + std::to_string(stale.size()) + " expired transaction ids");
    MPAY_LOG_DEBUG(LogCategory::LEDGER, "clock advanced to " + std::to_string(time_) + ", slot " + std::to_string(slot_));
    return true;
}

bool Ledger::is_processed(const Hash256& txid) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::string raw;
    return db_.get(processed_key(txid), raw);
}

bool Ledger::transaction_logs(const Hash256& txid, std::vector<std::string>& logs) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::string raw;
    if (!db_.get(processed_key(txid), raw)) return false;
    ByteReader r(raw);
    uint64_t slot = 0;
    uint32_t n = 0;
    if (!r.u64(slot) || !r.u32(n)) return false;
    logs.clear();
    for (uint32_t i = 0; i < n; ++i) {
        std::string line;
        if (!r.str(line)) return false;
        logs.push_back(line);
    }
    return true;
}

bool Ledger::verify_signatures_locked(const Transaction& tx, TxResult& res) const {
    const std::vector<Address> required = tx.message.required_signers();
    const Hash256 digest = tx.message.hash();

    if (tx.signatures.size() > required.size()) {
        res.status = TxStatus::InvalidSignature;
        res.message = "more signatures than required signers";
        return false;
    }
    std::set<Address> seen;
    for (size_t i = 0; i < tx.signatures.size(); ++i) {
        Address who = tx.signatures[i].signer();
        if (std::find(required.begin(), required.end(), who) == required.end() || !seen.insert(who).second) {
            res.status = TxStatus::InvalidSignature;
            res.message = "signature from unexpected key " + who.to_base58();
            return false;
        }
        if (i == 0 && who != tx.message.fee_payer) {
            res.status = TxStatus::MissingSignature;
            res.message = "first signature must belong to the fee payer";
            return false;
        }
    }
    for (const auto& a : required) {
        if (!seen.count(a)) {
            res.status = TxStatus::MissingSignature;
            res.message = "missing signature for " + a.to_base58();
            return false;
        }
    }
    for (const auto& s : tx.signatures) {
        if (!crypto::ECDSA::verify_compact(digest.data(), s.pubkey, s.sig)) {
            res.status = TxStatus::InvalidSignature;
            res.message = "signature of " + s.signer().to_base58() + " does not verify";
            return false;
        }
    }
    return true;
}

TxResult Ledger::submit(const Transaction& tx) {
    TxResult res;
    res.txid = tx.txid();
    const Message& msg = tx.message;

    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_.is_open()) {
        res.status = TxStatus::StorageError;
        res.message = "ledger not open";
        return res;
    }

    // 1. shape
    if (msg.instructions.empty() || msg.instructions.size() > MPAY_MAX_INSTRUCTIONS) {
        res.status = TxStatus::MalformedTransaction;
        res.message = "instruction count out of range";
        return res;
    }
    for (const auto& ix : msg.instructions) {
        if (ix.accounts.size() > MPAY_MAX_ACCOUNT_METAS || ix.data.size() > MPAY_MAX_INSTRUCTION_DATA) {
            res.status = TxStatus::MalformedTransaction;
            res.message = "instruction too large";
            return res;
        }
    }

    // 2. freshness
    uint64_t checkpoint_slot = 0;
    if (!checkpoint_slot_locked(msg.checkpoint, checkpoint_slot)) {
        res.status = TxStatus::CheckpointExpired;
        res.message = "checkpoint " + to_hex(msg.checkpoint.data(), 8) + " is outside the window";
        return res;
    }

    // 3. dedupe
    if (tx.signatures.empty()) {
        res.status = TxStatus::MissingSignature;
        res.message = "transaction is unsigned";
        return res;
    }
    {
        std::string raw;
        if (db_.get(processed_key(res.txid), raw)) {
            res.status = TxStatus::AlreadyProcessed;
            res.message = "transaction already processed";
            return res;
        }
    }

    // 4. signatures
    if (!verify_signatures_locked(tx, res)) return res;

    // 5. fee
    StoreView store(*this);
    Overlay overlay(store);
    const uint64_t fee = opts_.fee_per_signature * tx.signatures.size();
    {
        auto payer = overlay.get(msg.fee_payer);
        if (!payer || !payer->exists() || payer->owner != system_program_id() || payer->lamports < fee) {
            res.status = TxStatus::InsufficientFundsForFee;
            res.message = "fee payer cannot cover " + std::to_string(fee) + " lamports";
            return res;
        }
        payer->lamports -= fee;
        overlay.set(msg.fee_payer, *payer);
    }

    // 6. execute against the overlay
    InvokeContext ctx(overlay, programs_, time_, slot_, res.logs);
    for (size_t i = 0; i < msg.instructions.size(); ++i) {
        ExecError e;
        if (!ctx.run(msg.instructions[i], e)) {
            res.status = e.status == TxStatus::OK ? TxStatus::ProgramError : e.status;
            res.program_error = e.code;
            res.message = "instruction " + std::to_string(i) + ": " + e.message;
            MPAY_LOG_DEBUG(LogCategory::LEDGER, "tx " + to_hex(res.txid.data(), 8) + " rejected: " + res.describe());
            return res;
        }
    }

    // 7. commit atomically
    KVDB::Batch batch(db_);
    for (const auto& kv : overlay.changes()) {
        if (kv.second) batch.put(account_key(kv.first), encode_account(*kv.second));
        else batch.del(account_key(kv.first));
    }
    ByteWriter rec;
    rec.u64(slot_);
    rec.u32((uint32_t)res.logs.size());
    for (const auto& l : res.logs) rec.str(l);
    batch.put(processed_key(res.txid), std::string(rec.bytes().begin(), rec.bytes().end()));
    batch.put(expiry_key(checkpoint_slot, res.txid), std::string());

    std::string err;
    if (!batch.commit(true, &err)) {
        MPAY_LOG_ERROR(LogCategory::LEDGER, "commit failed: " + err);
        res.status = TxStatus::StorageError;
        res.message = err;
        return res;
    }
    MPAY_LOG_DEBUG(LogCategory::LEDGER, "tx " + to_hex(res.txid.data(), 8) + " applied, fee " + std::to_string(fee) +
                   ", " + std::to_string(overlay.changes().size()) + " accounts touched");
    return res;
}

bool Ledger::airdrop(const Address& to, uint64_t lamports, std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_.is_open()) { err = "ledger not open"; return false; }
    AccountRecord rec;
    auto cur = load_locked(to);
    if (cur && cur->exists()) rec = *cur;
    else rec.owner = system_program_id();
    if (rec.lamports + lamports < rec.lamports) { err = "lamport overflow"; return false; }
    rec.lamports += lamports;
    if (!db_.put(account_key(to), encode_account(rec), true, &err)) return false;
    MPAY_LOG_INFO(LogCategory::LEDGER, "airdrop " + std::to_string(lamports) + " lamports to " + to.to_base58());
    return true;
}

bool Ledger::mint_to(const Address& owner, const std::string& kind_name, uint64_t amount, std::string& err) {
    Address kind;
    if (!token_kind_address(kind_name, kind, &err)) return false;

    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_.is_open()) { err = "ledger not open"; return false; }

    AccountRecord kind_rec;
    TokenKindInfo info;
    auto cur = load_locked(kind);
    if (cur && cur->exists()) {
        kind_rec = *cur;
        if (kind_rec.owner != token_program_id() || !decode_token_kind(kind_rec.data, info)) {
            err = "account " + kind.to_base58() + " is not a token kind";
            return false;
        }
    } else {
        info.decimals = MPAY_TOKEN_DECIMALS;
        info.name = kind_name;
        kind_rec.owner = token_program_id();
        kind_rec.data = encode_token_kind(info);
        kind_rec.lamports = reserve_for(kind_rec.data.size());
    }

    const Address funding = associated_funding_address(owner, kind);
    AccountRecord fund_rec;
    FundingAccount fa;
    cur = load_locked(funding);
    if (cur && cur->exists()) {
        fund_rec = *cur;
        if (fund_rec.owner != token_program_id() || !decode_funding_account(fund_rec.data, fa)) {
            err = "account " + funding.to_base58() + " is not a funding account";
            return false;
        }
    } else {
        fa.kind = kind;
        fa.owner = owner;
        fund_rec.owner = token_program_id();
        fund_rec.data = encode_funding_account(fa);
        fund_rec.lamports = reserve_for(fund_rec.data.size());
    }

    if (fa.amount + amount < fa.amount || info.supply + amount < info.supply) { err = "amount overflow"; return false; }
    fa.amount += amount;
    info.supply += amount;
    kind_rec.data = encode_token_kind(info);
    fund_rec.data = encode_funding_account(fa);

    KVDB::Batch batch(db_);
    batch.put(account_key(kind), encode_account(kind_rec));
    batch.put(account_key(funding), encode_account(fund_rec));
    if (!batch.commit(true, &err)) return false;
    MPAY_LOG_INFO(LogCategory::LEDGER, "minted " + std::to_string(amount) + " " + kind_name + " to " + owner.to_base58());
    return true;
}

}
