#pragma once
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "constants.h"
#include "hash.h"
#include "kvdb.h"
#include "ledger/account.h"
#include "ledger/program.h"
#include "ledger/transaction.h"

namespace mpay {

struct LedgerOptions {
    uint32_t checkpoint_window{MPAY_CHECKPOINT_WINDOW};
    uint64_t fee_per_signature{MPAY_FEE_PER_SIGNATURE};
    int64_t  genesis_time{0};           // 0 = wall clock at first open
};

struct Checkpoint {
    Hash256 hash{};
    uint64_t slot{0};
    uint64_t last_valid_slot{0};        // last slot at which a message bound to `hash` is accepted
};

// Single-node ledger host: LevelDB-backed account store with atomic,
// all-or-nothing transaction application. Internally synchronized.
class Ledger : public AccountReader {
public:
    Ledger() = default;
    ~Ledger() override;

    bool open(const std::string& dir, const LedgerOptions& opts, std::string& err);
    void close();
    bool is_open() const;

    // Programs other than the built-in token program are registered by the embedder.
    void register_program(std::shared_ptr<Program> p);

    TxResult submit(const Transaction& tx);

    std::optional<AccountRecord> fetch(const Address& addr) const override;
    std::vector<std::pair<Address, AccountRecord>> accounts_owned_by(const Address& program) const;

    // Privileged faucets
    bool airdrop(const Address& to, uint64_t lamports, std::string& err);
    bool mint_to(const Address& owner, const std::string& kind_name, uint64_t amount, std::string& err);

    // Moves the clock forward by `secs`, closing `slots` slots (one checkpoint each)
    bool advance_time(int64_t secs, std::string& err, uint32_t slots = 1);
    int64_t now() const;
    uint64_t slot() const;
    Checkpoint latest_checkpoint() const;
    bool checkpoint_valid(const Hash256& h) const;

    // Replay records are kept while the transaction's checkpoint is in the window
    bool is_processed(const Hash256& txid) const;
    // Program log of a committed transaction; pruned together with its replay record
    bool transaction_logs(const Hash256& txid, std::vector<std::string>& logs) const;

    uint64_t fee_per_signature() const { return opts_.fee_per_signature; }
    uint32_t checkpoint_window() const { return opts_.checkpoint_window; }

private:
    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    // Reads committed state; caller holds mtx_
    class StoreView : public AccountReader {
    public:
        explicit StoreView(const Ledger& l) : l_(l) {}
        std::optional<AccountRecord> fetch(const Address& addr) const override { return l_.load_locked(addr); }
    private:
        const Ledger& l_;
    };

    std::optional<AccountRecord> load_locked(const Address& addr) const;
    bool verify_signatures_locked(const Transaction& tx, TxResult& res) const;
    bool checkpoint_valid_locked(const Hash256& h) const;
    bool checkpoint_slot_locked(const Hash256& h, uint64_t& slot) const;
    void push_checkpoint_locked(const Hash256& h, uint64_t slot);
    std::string encode_meta_locked() const;
    bool decode_meta_locked(const std::string& raw);

    mutable std::mutex mtx_;
    KVDB db_;
    LedgerOptions opts_;
    ProgramMap programs_;
    int64_t time_{0};
    uint64_t slot_{0};
    std::deque<std::pair<Hash256, uint64_t>> checkpoints_;   // oldest first
};

}
