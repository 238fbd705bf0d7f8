// =============================================================================
// TEST UTILITIES
// =============================================================================
// Assertion counters, temp directories and a ready-made ledger fixture shared
// by the standalone test programs.
// =============================================================================

#pragma once

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

#include "escrow/escrow_program.h"
#include "ledger/ledger.h"
#include "ledger/programs.h"
#include "ledger/token.h"
#include "keys.h"
#include "log.h"

#include <unistd.h>

namespace mpay {
namespace test {

static int g_tests_run = 0;
static int g_tests_passed = 0;
static int g_tests_failed = 0;

inline bool test_assert_check(bool cond, const char* msg, const char* func, int line) {
    g_tests_run++;
    if (!cond) {
        fprintf(stderr, "FAIL: %s (line %d): %s\n", func, line, msg);
        g_tests_failed++;
    } else {
        g_tests_passed++;
    }
    return cond;
}

#define TEST_ASSERT(cond, msg) do { \
    if (!mpay::test::test_assert_check((cond), (msg), __func__, __LINE__)) return false; \
} while (false)

#define TEST_ASSERT_EQ(actual, expected, msg) do { \
    mpay::test::g_tests_run++; \
    auto _a = (actual); \
    auto _e = (expected); \
    if (_a != _e) { \
        fprintf(stderr, "FAIL: %s (line %d): %s (expected %lld, got %lld)\n", \
            __func__, __LINE__, (msg), (long long)(_e), (long long)(_a)); \
        mpay::test::g_tests_failed++; \
        return false; \
    } \
    mpay::test::g_tests_passed++; \
} while (false)

#define TEST_ASSERT_STR(actual, expected, msg) do { \
    mpay::test::g_tests_run++; \
    std::string _a = (actual); \
    std::string _e = (expected); \
    if (_a != _e) { \
        fprintf(stderr, "FAIL: %s (line %d): %s (expected \"%s\", got \"%s\")\n", \
            __func__, __LINE__, (msg), _e.c_str(), _a.c_str()); \
        mpay::test::g_tests_failed++; \
        return false; \
    } \
    mpay::test::g_tests_passed++; \
} while (false)

#define TEST_BEGIN(name) \
    fprintf(stderr, "Running: %s...\n", name); \
    auto test_start = std::chrono::steady_clock::now();

#define TEST_END(name) \
    auto test_end = std::chrono::steady_clock::now(); \
    auto test_ms = std::chrono::duration_cast<std::chrono::milliseconds>(test_end - test_start).count(); \
    fprintf(stderr, "  PASS: %s (%lldms)\n", name, (long long)test_ms);

inline int report_results(const char* suite, bool all_passed) {
    fprintf(stderr, "\n============================================================\n");
    fprintf(stderr, "  %s\n", suite);
    fprintf(stderr, "  Assertions run:    %d\n", g_tests_run);
    fprintf(stderr, "  Assertions passed: %d\n", g_tests_passed);
    fprintf(stderr, "  Assertions failed: %d\n", g_tests_failed);
    fprintf(stderr, "  Result:            %s\n", all_passed ? "ALL PASSED" : "SOME FAILED");
    fprintf(stderr, "============================================================\n\n");
    return all_passed ? 0 : 1;
}

inline std::string make_temp_dir(const std::string& prefix) {
    std::string base = "/tmp/" + prefix + "_XXXXXX";
    std::vector<char> buf(base.begin(), base.end());
    buf.push_back('\0');
    char* result = mkdtemp(buf.data());
    if (!result) {
        std::string dir = "/tmp/" + prefix + "_fallback";
        std::filesystem::create_directories(dir);
        return dir;
    }
    return std::string(result);
}

inline void cleanup_temp_dir(const std::string& dir) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

static const int64_t GENESIS_TIME = 1700000000;
static const uint64_t SPONSOR_LAMPORTS = 1000000000000ull;

// A fresh ledger with the escrow program registered, a funded sponsor key and
// the default token kind address.
struct World {
    std::string dir;
    Ledger ledger;
    KeyPair sponsor;
    Address kind;
    std::string kind_name = "USDC";

    ~World() {
        ledger.close();
        if (!dir.empty()) cleanup_temp_dir(dir);
    }

    bool setup(const std::string& name, uint32_t window = MPAY_CHECKPOINT_WINDOW) {
        std::string err;
        dir = make_temp_dir(name);
        LedgerOptions opts;
        opts.checkpoint_window = window;
        opts.genesis_time = GENESIS_TIME;
        if (!ledger.open(dir + "/ledger", opts, err)) { fprintf(stderr, "ledger open: %s\n", err.c_str()); return false; }
        ledger.register_program(std::make_shared<EscrowProgram>());
        if (!KeyPair::generate(sponsor, err)) return false;
        if (!ledger.airdrop(sponsor.address(), SPONSOR_LAMPORTS, err)) return false;
        return token_kind_address(kind_name, kind, &err);
    }

    // New key holding `tokens` of the default kind (a funding account is created even for 0)
    bool funded_key(uint64_t tokens, KeyPair& out) {
        std::string err;
        if (!KeyPair::generate(out, err)) return false;
        return ledger.mint_to(out.address(), kind_name, tokens, err);
    }

    uint64_t balance(const Address& owner) const {
        auto rec = ledger.fetch(associated_funding_address(owner, kind));
        FundingAccount fa;
        if (!rec || !decode_funding_account(rec->data, fa)) return 0;
        return fa.amount;
    }

    uint64_t lamports(const Address& a) const {
        auto rec = ledger.fetch(a);
        return rec ? rec->lamports : 0;
    }

    bool advance(int64_t secs, uint32_t slots = 1) {
        std::string err;
        return ledger.advance_time(secs, err, slots);
    }

    // Binds `m` to the latest checkpoint and signs it with `keys`, in order
    Transaction sign(Message m, std::initializer_list<const KeyPair*> keys) const {
        m.checkpoint = ledger.latest_checkpoint().hash;
        return sign_bound(m, keys);
    }

    static Transaction sign_bound(const Message& m, std::initializer_list<const KeyPair*> keys) {
        Transaction tx;
        tx.message = m;
        const Hash256 h = m.hash();
        for (const KeyPair* k : keys) {
            TxSignature s;
            s.pubkey = k->pubkey();
            if (k->sign(h, s.sig)) tx.signatures.push_back(s);
        }
        return tx;
    }
};

}  // namespace test
}  // namespace mpay
