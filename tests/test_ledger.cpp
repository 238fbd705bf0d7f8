#include "test_util.h"

#include "serialize.h"

namespace mpay {
namespace test {

// Exercises host privileges from inside a running program.
//   0: move lamports accounts[0] -> accounts[1]         amount:u64
//   1: call token Transfer on accounts[0..2] without adding signers
//   2: create accounts[1] paid by accounts[0], then rewrite it
class ProbeProgram : public Program {
public:
    const Address& id() const override {
        static const Address a = program_id_from_name("probe");
        return a;
    }
    const char* name() const override { return "probe"; }

    bool execute(InvokeContext& ctx, const Instruction& ix, ExecError& err) override {
        ByteReader r(ix.data);
        uint8_t tag = 0;
        if (!r.u8(tag)) return fail(err, TxStatus::InvalidArgument, "empty");
        if (tag == 0) {
            uint64_t amount = 0;
            if (!r.u64(amount)) return fail(err, TxStatus::InvalidArgument, "amount");
            return ctx.transfer_lamports(ix.accounts[0].addr, ix.accounts[1].addr, amount, err);
        }
        if (tag == 1) {
            Instruction t = make_token_transfer(ix.accounts[0].addr, ix.accounts[1].addr, ix.accounts[2].addr, 1);
            return ctx.invoke(t, {}, err);
        }
        if (tag == 2) {
            if (!ctx.create_account(ix.accounts[0].addr, ix.accounts[1].addr, {1, 2, 3, 4}, err)) return false;
            if (!ctx.write_data(ix.accounts[1].addr, {5, 6, 7, 8}, err)) return false;
            return ctx.write_data(ix.accounts[1].addr, {9}, err);
        }
        return fail(err, TxStatus::InvalidArgument, "tag");
    }
};

static Instruction probe_ix(uint8_t tag, std::vector<AccountMeta> metas, uint64_t amount = 0) {
    Instruction ix;
    ix.program_id = program_id_from_name("probe");
    ix.accounts = std::move(metas);
    ByteWriter w;
    w.u8(tag);
    if (tag == 0) w.u64(amount);
    ix.data = w.take();
    return ix;
}

static bool test_open_and_faucets() {
    TEST_BEGIN("test_open_and_faucets");

    World w;
    TEST_ASSERT(w.setup("mpay_ledger_open"), "setup");
    TEST_ASSERT_EQ(w.ledger.slot(), 0u, "fresh ledger starts at slot 0");
    TEST_ASSERT_EQ(w.ledger.now(), GENESIS_TIME, "genesis time");
    Checkpoint cp = w.ledger.latest_checkpoint();
    TEST_ASSERT_EQ(cp.last_valid_slot, (uint64_t)MPAY_CHECKPOINT_WINDOW - 1, "genesis checkpoint window");
    TEST_ASSERT(w.ledger.checkpoint_valid(cp.hash), "genesis checkpoint valid");

    Ledger idle;
    Checkpoint none = idle.latest_checkpoint();
    TEST_ASSERT(none.hash == Hash256{}, "unopened ledger has no checkpoint");
    TEST_ASSERT_EQ(none.last_valid_slot, 0u, "and no window");
    TEST_ASSERT(!idle.checkpoint_valid(none.hash), "zero hash is never valid");

    TEST_ASSERT_EQ(w.lamports(w.sponsor.address()), SPONSOR_LAMPORTS, "airdrop credited");
    auto rec = w.ledger.fetch(w.sponsor.address());
    TEST_ASSERT(rec && rec->owner == system_program_id(), "airdropped account is system-owned");

    KeyPair alice;
    TEST_ASSERT(w.funded_key(2500000, alice), "mint");
    TEST_ASSERT_EQ(w.balance(alice.address()), 2500000u, "minted balance");
    std::string err;
    TEST_ASSERT(w.ledger.mint_to(alice.address(), "USDC", 500000, err), "mint again");
    TEST_ASSERT_EQ(w.balance(alice.address()), 3000000u, "mint accumulates");

    auto kind = w.ledger.fetch(w.kind);
    TokenKindInfo info;
    TEST_ASSERT(kind && decode_token_kind(kind->data, info), "kind record");
    TEST_ASSERT_EQ(info.supply, 3000000u, "supply tracks mints");
    TEST_ASSERT_EQ(info.decimals, 6, "six decimals");
    TEST_ASSERT_STR(info.name, "USDC", "kind name");

    auto fund = w.ledger.fetch(associated_funding_address(alice.address(), w.kind));
    TEST_ASSERT(fund && fund->owner == token_program_id(), "funding account owned by the token program");
    TEST_ASSERT_EQ(fund->lamports, reserve_for(fund->data.size()), "funding account carries its reserve");

    TEST_END("test_open_and_faucets");
    return true;
}

static bool test_transfer_and_fee() {
    TEST_BEGIN("test_transfer_and_fee");

    World w;
    TEST_ASSERT(w.setup("mpay_ledger_transfer"), "setup");
    KeyPair a, b;
    std::string err;
    TEST_ASSERT(w.funded_key(1000000, a), "a");
    TEST_ASSERT(w.funded_key(0, b), "b");
    TEST_ASSERT(w.ledger.airdrop(a.address(), 100000, err), "fund a's fee account");

    Message m;
    m.fee_payer = a.address();
    m.instructions.push_back(make_token_transfer(associated_funding_address(a.address(), w.kind),
                                                 associated_funding_address(b.address(), w.kind),
                                                 a.address(), 400000));
    Transaction tx = w.sign(m, {&a});
    TxResult r = w.ledger.submit(tx);
    TEST_ASSERT(r.ok(), r.describe().c_str());
    TEST_ASSERT_EQ(w.balance(a.address()), 600000u, "debited");
    TEST_ASSERT_EQ(w.balance(b.address()), 400000u, "credited");
    TEST_ASSERT_EQ(w.lamports(a.address()), 100000u - MPAY_FEE_PER_SIGNATURE, "one signature fee");
    TEST_ASSERT(w.ledger.is_processed(tx.txid()), "recorded as processed");

    r = w.ledger.submit(tx);
    TEST_ASSERT_EQ(r.status, TxStatus::AlreadyProcessed, "replay rejected");
    TEST_ASSERT_EQ(w.balance(b.address()), 400000u, "replay moved nothing");

    // failure is all-or-nothing and costs no fee
    Message big = m;
    big.instructions[0] = make_token_transfer(associated_funding_address(a.address(), w.kind),
                                              associated_funding_address(b.address(), w.kind),
                                              a.address(), 10000000);
    r = w.ledger.submit(w.sign(big, {&a}));
    TEST_ASSERT_EQ(r.status, TxStatus::InsufficientFunds, "overdraft rejected");
    TEST_ASSERT_EQ(w.balance(a.address()), 600000u, "no partial debit");
    TEST_ASSERT_EQ(w.lamports(a.address()), 100000u - MPAY_FEE_PER_SIGNATURE, "no fee on failure");

    KeyPair poor;
    TEST_ASSERT(KeyPair::generate(poor, err), "poor");
    Message pm;
    pm.fee_payer = poor.address();
    pm.instructions.push_back(make_create_associated(poor.address(), poor.address(), w.kind));
    r = w.ledger.submit(w.sign(pm, {&poor}));
    TEST_ASSERT_EQ(r.status, TxStatus::InsufficientFundsForFee, "fee payer without lamports");

    TEST_END("test_transfer_and_fee");
    return true;
}

static bool test_signature_rules() {
    TEST_BEGIN("test_signature_rules");

    World w;
    TEST_ASSERT(w.setup("mpay_ledger_sigs"), "setup");
    KeyPair a, b, c;
    std::string err;
    TEST_ASSERT(w.funded_key(1000, a), "a");
    TEST_ASSERT(w.funded_key(1000, b), "b");
    TEST_ASSERT(KeyPair::generate(c, err), "c");

    // sponsor pays, a authorizes
    Message m;
    m.fee_payer = w.sponsor.address();
    m.instructions.push_back(make_token_transfer(associated_funding_address(a.address(), w.kind),
                                                 associated_funding_address(b.address(), w.kind),
                                                 a.address(), 10));
    TEST_ASSERT(m.required_signers() == (std::vector<Address>{w.sponsor.address(), a.address()}), "signer order");

    TxResult r = w.ledger.submit(w.sign(m, {}));
    TEST_ASSERT_EQ(r.status, TxStatus::MissingSignature, "unsigned");
    r = w.ledger.submit(w.sign(m, {&w.sponsor}));
    TEST_ASSERT_EQ(r.status, TxStatus::MissingSignature, "authority signature missing");
    r = w.ledger.submit(w.sign(m, {&a, &w.sponsor}));
    TEST_ASSERT_EQ(r.status, TxStatus::MissingSignature, "fee payer must sign first");
    r = w.ledger.submit(w.sign(m, {&w.sponsor, &c}));
    TEST_ASSERT_EQ(r.status, TxStatus::InvalidSignature, "unexpected signer");
    r = w.ledger.submit(w.sign(m, {&w.sponsor, &a, &c}));
    TEST_ASSERT_EQ(r.status, TxStatus::InvalidSignature, "extra signature");

    Transaction bad = w.sign(m, {&w.sponsor, &a});
    bad.signatures[1].sig[5] ^= 0x40;
    r = w.ledger.submit(bad);
    TEST_ASSERT_EQ(r.status, TxStatus::InvalidSignature, "corrupted signature");

    Message empty;
    empty.fee_payer = w.sponsor.address();
    r = w.ledger.submit(w.sign(empty, {&w.sponsor}));
    TEST_ASSERT_EQ(r.status, TxStatus::MalformedTransaction, "no instructions");

    r = w.ledger.submit(w.sign(m, {&w.sponsor, &a}));
    TEST_ASSERT(r.ok(), r.describe().c_str());
    TEST_ASSERT_EQ(w.lamports(w.sponsor.address()), SPONSOR_LAMPORTS - 2 * MPAY_FEE_PER_SIGNATURE, "fee per signature");

    TEST_END("test_signature_rules");
    return true;
}

static bool test_checkpoint_window() {
    TEST_BEGIN("test_checkpoint_window");

    World w;
    TEST_ASSERT(w.setup("mpay_ledger_window", 3), "setup");
    KeyPair a, b;
    TEST_ASSERT(w.funded_key(1000, a), "a");
    TEST_ASSERT(w.funded_key(0, b), "b");

    const Checkpoint genesis = w.ledger.latest_checkpoint();
    TEST_ASSERT_EQ(genesis.last_valid_slot, 2u, "window of three slots");

    auto transfer = [&](uint64_t amount) {
        Message m;
        m.fee_payer = w.sponsor.address();
        m.checkpoint = genesis.hash;
        m.instructions.push_back(make_token_transfer(associated_funding_address(a.address(), w.kind),
                                                     associated_funding_address(b.address(), w.kind),
                                                     a.address(), amount));
        return World::sign_bound(m, {&w.sponsor, &a});
    };

    TEST_ASSERT(w.advance(2, 2), "advance two slots");
    TEST_ASSERT(w.ledger.checkpoint_valid(genesis.hash), "still inside the window");
    TxResult r = w.ledger.submit(transfer(1));
    TEST_ASSERT(r.ok(), r.describe().c_str());
    const Hash256 old_txid = r.txid;
    TEST_ASSERT(w.ledger.is_processed(old_txid), "replay record written");

    Message fresh;
    fresh.fee_payer = w.sponsor.address();
    fresh.instructions.push_back(make_token_transfer(associated_funding_address(a.address(), w.kind),
                                                     associated_funding_address(b.address(), w.kind),
                                                     a.address(), 3));
    r = w.ledger.submit(w.sign(fresh, {&w.sponsor, &a}));
    TEST_ASSERT(r.ok(), r.describe().c_str());
    const Hash256 fresh_txid = r.txid;

    TEST_ASSERT(w.advance(1), "advance one more");
    TEST_ASSERT_EQ(w.ledger.slot(), 3u, "slot 3");
    TEST_ASSERT(!w.ledger.checkpoint_valid(genesis.hash), "genesis fell out of the window");
    TEST_ASSERT(!w.ledger.is_processed(old_txid), "replay record dropped with its checkpoint");
    std::vector<std::string> logs;
    TEST_ASSERT(!w.ledger.transaction_logs(old_txid, logs), "logs dropped with it");
    TEST_ASSERT(w.ledger.is_processed(fresh_txid), "record bound to a live checkpoint kept");
    r = w.ledger.submit(transfer(2));
    TEST_ASSERT_EQ(r.status, TxStatus::CheckpointExpired, "stale checkpoint rejected");
    TEST_ASSERT(is_retryable(r), "expiry is retryable");

    Message never;
    never.fee_payer = w.sponsor.address();
    never.instructions.push_back(make_token_transfer(associated_funding_address(a.address(), w.kind),
                                                     associated_funding_address(b.address(), w.kind),
                                                     a.address(), 1));
    never.checkpoint = sha256(std::string("not a checkpoint"));
    r = w.ledger.submit(World::sign_bound(never, {&w.sponsor, &a}));
    TEST_ASSERT_EQ(r.status, TxStatus::CheckpointExpired, "unknown checkpoint rejected");

    const Checkpoint latest = w.ledger.latest_checkpoint();
    TEST_ASSERT(latest.hash != genesis.hash, "new checkpoints per slot");
    TEST_ASSERT_EQ(latest.slot, 3u, "latest slot");
    TEST_ASSERT_EQ(w.ledger.now(), GENESIS_TIME + 3, "clock advanced");

    std::string err;
    TEST_ASSERT(!w.ledger.advance_time(-1, err), "clock never moves backwards");

    TEST_END("test_checkpoint_window");
    return true;
}

static bool test_persistence() {
    TEST_BEGIN("test_persistence");

    World w;
    TEST_ASSERT(w.setup("mpay_ledger_persist"), "setup");
    KeyPair a;
    std::string err;
    TEST_ASSERT(w.funded_key(777, a), "a");
    TEST_ASSERT(w.ledger.airdrop(a.address(), 10000000, err), "a lamports");

    KeyPair b;
    TEST_ASSERT(KeyPair::generate(b, err), "b");
    Message m;
    m.fee_payer = a.address();
    m.instructions.push_back(make_create_associated(a.address(), b.address(), w.kind));
    Transaction tx = w.sign(m, {&a});
    TEST_ASSERT(w.ledger.submit(tx).ok(), "create associated");
    TEST_ASSERT(w.advance(60, 4), "advance");
    const Checkpoint before = w.ledger.latest_checkpoint();

    w.ledger.close();
    LedgerOptions opts;
    opts.genesis_time = 1;   // ignored for an existing ledger
    TEST_ASSERT(w.ledger.open(w.dir + "/ledger", opts, err), "reopen");
    TEST_ASSERT_EQ(w.ledger.slot(), 4u, "slot survives restart");
    TEST_ASSERT_EQ(w.ledger.now(), GENESIS_TIME + 60, "time survives restart");
    TEST_ASSERT(w.ledger.latest_checkpoint().hash == before.hash, "checkpoint ring survives restart");
    TEST_ASSERT_EQ(w.balance(a.address()), 777u, "accounts survive restart");
    TEST_ASSERT(w.ledger.is_processed(tx.txid()), "processed set survives restart");

    std::vector<std::string> logs;
    TEST_ASSERT(w.ledger.transaction_logs(tx.txid(), logs), "logs stored");
    TEST_ASSERT_EQ(logs.size(), 1u, "one log line");
    TEST_ASSERT(logs[0].rfind("Funding account created:", 0) == 0, "token program log");

    auto owned = w.ledger.accounts_owned_by(token_program_id());
    TEST_ASSERT_EQ(owned.size(), 3u, "kind plus two funding accounts");

    TEST_END("test_persistence");
    return true;
}

static bool test_program_privileges() {
    TEST_BEGIN("test_program_privileges");

    World w;
    TEST_ASSERT(w.setup("mpay_ledger_priv"), "setup");
    w.ledger.register_program(std::make_shared<ProbeProgram>());
    KeyPair a, b;
    std::string err;
    TEST_ASSERT(w.funded_key(100, a), "a");
    TEST_ASSERT(w.funded_key(0, b), "b");
    TEST_ASSERT(w.ledger.airdrop(a.address(), 1000000, err), "a lamports");

    // signing key accounts may be debited by any program
    Message m;
    m.fee_payer = w.sponsor.address();
    m.instructions.push_back(probe_ix(0, {writable(a.address(), true), writable(b.address())}, 1234));
    TxResult r = w.ledger.submit(w.sign(m, {&w.sponsor, &a}));
    TEST_ASSERT(r.ok(), r.describe().c_str());
    TEST_ASSERT_EQ(w.lamports(b.address()), 1234u, "credit creates a system account");
    TEST_ASSERT_EQ(w.lamports(a.address()), 1000000u - 1234u, "debit");

    // ... but not without their signature
    m.instructions[0] = probe_ix(0, {writable(b.address()), writable(a.address())}, 1);
    r = w.ledger.submit(w.sign(m, {&w.sponsor}));
    TEST_ASSERT_EQ(r.status, TxStatus::InvalidArgument, "debit of a non-signer");

    // read-only accounts stay untouched
    m.instructions[0] = probe_ix(0, {readonly(a.address(), true), writable(b.address())}, 1);
    r = w.ledger.submit(w.sign(m, {&w.sponsor, &a}));
    TEST_ASSERT_EQ(r.status, TxStatus::InvalidArgument, "debit of a read-only account");

    // a callee never gains a signer the caller did not have
    m.instructions[0] = probe_ix(1, {writable(associated_funding_address(a.address(), w.kind)),
                                     writable(associated_funding_address(b.address(), w.kind)),
                                     readonly(a.address())});
    r = w.ledger.submit(w.sign(m, {&w.sponsor}));
    TEST_ASSERT_EQ(r.status, TxStatus::MissingSignature, "signer escalation");
    TEST_ASSERT_EQ(w.balance(a.address()), 100u, "nothing moved");

    // created accounts have a fixed size
    KeyPair fresh;
    TEST_ASSERT(KeyPair::generate(fresh, err), "fresh");
    m.instructions[0] = probe_ix(2, {writable(a.address(), true), writable(fresh.address())});
    r = w.ledger.submit(w.sign(m, {&w.sponsor, &a}));
    TEST_ASSERT_EQ(r.status, TxStatus::InvalidAccountData, "resize rejected");
    TEST_ASSERT(!w.ledger.fetch(fresh.address()), "failed instruction leaves no account");

    Instruction unknown;
    unknown.program_id = program_id_from_name("nobody");
    unknown.accounts = {readonly(a.address())};
    m.instructions[0] = unknown;
    r = w.ledger.submit(w.sign(m, {&w.sponsor}));
    TEST_ASSERT_EQ(r.status, TxStatus::UnknownProgram, "unknown program");

    TEST_END("test_program_privileges");
    return true;
}

}  // namespace test
}  // namespace mpay

int main() {
    using namespace mpay::test;
    mpay::log_init(mpay::LogLevel::WARN);
    bool all_passed = true;
    all_passed &= test_open_and_faucets();
    all_passed &= test_transfer_and_fee();
    all_passed &= test_signature_rules();
    all_passed &= test_checkpoint_window();
    all_passed &= test_persistence();
    all_passed &= test_program_privileges();
    return report_results("ledger", all_passed);
}
