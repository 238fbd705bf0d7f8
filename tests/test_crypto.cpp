#include "test_util.h"

#include "address.h"
#include "base58.h"
#include "hash.h"
#include "hex.h"
#include "keys.h"

#include <fstream>

namespace mpay {
namespace test {

static bool test_sha256_vectors() {
    TEST_BEGIN("test_sha256_vectors");

    Hash256 h = sha256(std::string("abc"));
    TEST_ASSERT_STR(to_hex(h.data(), h.size()),
                    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "sha256(abc)");

    Hash256 e = sha256(std::string());
    TEST_ASSERT_STR(to_hex(e.data(), e.size()),
                    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "sha256 of empty input");

    // incremental writer agrees with the one-shot digest
    Hash256 w = Sha256Writer().write(std::string("a")).write(std::string("bc")).finalize();
    TEST_ASSERT(w == h, "streamed digest matches");

    TEST_END("test_sha256_vectors");
    return true;
}

static bool test_base58_and_hex() {
    TEST_BEGIN("test_base58_and_hex");

    const std::string hello = "hello world";
    TEST_ASSERT_STR(base58_encode(std::vector<uint8_t>(hello.begin(), hello.end())), "StV1DL6CwTryKyV", "base58 vector");
    TEST_ASSERT_STR(base58_encode(std::vector<uint8_t>{0, 0, 1}), "112", "leading zeros map to '1'");

    std::vector<uint8_t> raw;
    TEST_ASSERT(base58_decode("112", raw), "decode");
    TEST_ASSERT(raw == (std::vector<uint8_t>{0, 0, 1}), "decoded bytes");
    TEST_ASSERT(!base58_decode("0OIl", raw), "characters outside the alphabet are rejected");

    TEST_ASSERT(from_hex("0aFf") == (std::vector<uint8_t>{0x0a, 0xff}), "hex decode is case-insensitive");
    TEST_ASSERT(from_hex("abc").empty(), "odd length rejected");
    TEST_ASSERT(from_hex("zz").empty(), "non-hex rejected");

    Address a = program_id_from_name("escrow");
    Address b;
    TEST_ASSERT(Address::from_base58(a.to_base58(), b), "address parses back");
    TEST_ASSERT(a == b, "address text form is lossless");
    TEST_ASSERT(!Address::from_base58("2", b), "short input is not an address");

    TEST_END("test_base58_and_hex");
    return true;
}

static bool test_keys_and_signatures() {
    TEST_BEGIN("test_keys_and_signatures");

    std::string err;
    KeyPair k;
    TEST_ASSERT(KeyPair::generate(k, err), "generate");
    TEST_ASSERT(k.valid(), "key has private material");
    TEST_ASSERT(k.address() == key_address(k.pubkey()), "address derives from the public key");

    Hash256 digest = sha256(std::string("mailpay test message"));
    crypto::Sig64 sig{};
    TEST_ASSERT(k.sign(digest, sig), "sign");
    TEST_ASSERT(crypto::ECDSA::verify_compact(digest.data(), k.pubkey(), sig), "signature verifies");

    Hash256 other = digest;
    other[0] ^= 1;
    TEST_ASSERT(!crypto::ECDSA::verify_compact(other.data(), k.pubkey(), sig), "tampered digest fails");

    KeyPair k2;
    TEST_ASSERT(KeyPair::generate(k2, err), "second key");
    TEST_ASSERT(!crypto::ECDSA::verify_compact(digest.data(), k2.pubkey(), sig), "foreign key fails");
    TEST_ASSERT(k.address() != k2.address(), "distinct keys, distinct addresses");

    KeyPair bad;
    TEST_ASSERT(!KeyPair::from_private(std::vector<uint8_t>(32, 0), bad, err), "zero scalar is not a key");

    TEST_END("test_keys_and_signatures");
    return true;
}

static bool test_key_files() {
    TEST_BEGIN("test_key_files");

    const std::string dir = make_temp_dir("mpay_keys");
    std::string err;
    KeyPair k;
    TEST_ASSERT(KeyPair::generate(k, err), "generate");
    const std::string path = dir + "/alice.key";
    TEST_ASSERT(save_key_file(path, k, err), "save");

    KeyPair loaded;
    TEST_ASSERT(load_key_file(path, loaded, err), "load");
    TEST_ASSERT(loaded.address() == k.address(), "same identity after reload");

    // address line that does not belong to the key
    KeyPair other;
    TEST_ASSERT(KeyPair::generate(other, err), "generate other");
    {
        std::ofstream f(dir + "/mixed.key");
        f << "priv=" << k.private_hex() << "\n";
        f << "address=" << other.address().to_base58() << "\n";
    }
    TEST_ASSERT(!load_key_file(dir + "/mixed.key", loaded, err), "mismatched address rejected");

    {
        std::ofstream f(dir + "/empty.key");
        f << "# nothing here\n";
    }
    TEST_ASSERT(!load_key_file(dir + "/empty.key", loaded, err), "missing priv rejected");
    TEST_ASSERT(!load_key_file(dir + "/absent.key", loaded, err), "absent file rejected");

    cleanup_temp_dir(dir);
    TEST_END("test_key_files");
    return true;
}

static bool test_program_addresses() {
    TEST_BEGIN("test_program_addresses");

    const Address prog = program_id_from_name("escrow");
    const Address other_prog = program_id_from_name("token");
    TEST_ASSERT(prog != other_prog, "program ids differ by name");

    Address a1, a2, a3;
    TEST_ASSERT(derive_program_address({seed_of("escrow"), seed_of_u64le(7)}, prog, a1), "derive");
    TEST_ASSERT(derive_program_address({seed_of("escrow"), seed_of_u64le(7)}, prog, a2), "derive again");
    TEST_ASSERT(a1 == a2, "derivation is deterministic");
    TEST_ASSERT(derive_program_address({seed_of("escrow"), seed_of_u64le(7)}, other_prog, a3), "derive elsewhere");
    TEST_ASSERT(a1 != a3, "derivation depends on the program");
    TEST_ASSERT(derive_program_address({seed_of("escrow"), seed_of_u64le(8)}, prog, a3), "derive other nonce");
    TEST_ASSERT(a1 != a3, "derivation depends on every seed");

    std::vector<uint8_t> le = seed_of_u64le(0x0102);
    TEST_ASSERT(le == (std::vector<uint8_t>{0x02, 0x01, 0, 0, 0, 0, 0, 0}), "u64 seeds are little-endian");

    std::string err;
    std::vector<std::vector<uint8_t>> many(MAX_SEEDS + 1, seed_of("x"));
    TEST_ASSERT(!derive_program_address(many, prog, a3, &err), "too many seeds rejected");
    TEST_ASSERT(!derive_program_address({std::vector<uint8_t>(MAX_SEED_LEN + 1, 1)}, prog, a3, &err),
                "oversized seed rejected");
    TEST_ASSERT(derive_program_address({std::vector<uint8_t>(MAX_SEED_LEN, 1)}, prog, a3, &err),
                "32-byte seed accepted");

    TEST_END("test_program_addresses");
    return true;
}

}  // namespace test
}  // namespace mpay

int main() {
    using namespace mpay::test;
    mpay::log_init(mpay::LogLevel::WARN);
    bool all_passed = true;
    all_passed &= test_sha256_vectors();
    all_passed &= test_base58_and_hex();
    all_passed &= test_keys_and_signatures();
    all_passed &= test_key_files();
    all_passed &= test_program_addresses();
    return report_results("crypto / address", all_passed);
}
