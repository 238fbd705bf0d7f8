#include "test_util.h"

#include "client/amount.h"
#include "config.h"
#include "escrow/identifier.h"
#include "json.h"

#include <fstream>

namespace mpay {
namespace test {

static bool test_amounts() {
    TEST_BEGIN("test_amounts");

    TEST_ASSERT_STR(format_amount(1234567), "1.234567", "six decimals");
    TEST_ASSERT_STR(format_amount(0), "0.000000", "zero keeps its decimals");
    TEST_ASSERT_STR(format_amount(5000000), "5.000000", "whole amount");
    TEST_ASSERT_STR(format_amount(1), "0.000001", "smallest unit");

    uint64_t v = 0;
    std::string err;
    TEST_ASSERT(parse_amount("12", v, err) && v == 12000000u, "whole");
    TEST_ASSERT(parse_amount("12.5", v, err) && v == 12500000u, "fraction");
    TEST_ASSERT(parse_amount(".5", v, err) && v == 500000u, "leading dot");
    TEST_ASSERT(parse_amount("1.", v, err) && v == 1000000u, "trailing dot");
    TEST_ASSERT(parse_amount("0.000001", v, err) && v == 1u, "one unit");
    TEST_ASSERT(parse_amount("18446744073709.551615", v, err) && v == 18446744073709551615ull, "largest amount");

    TEST_ASSERT(!parse_amount("", v, err), "empty");
    TEST_ASSERT(!parse_amount(".", v, err), "lone dot");
    TEST_ASSERT(!parse_amount("-1", v, err), "negative");
    TEST_ASSERT(!parse_amount("+1", v, err), "explicit sign");
    TEST_ASSERT(!parse_amount("1e5", v, err), "exponent");
    TEST_ASSERT(!parse_amount("1.0000001", v, err), "seven decimals");
    TEST_ASSERT(!parse_amount("1.2.3", v, err), "two dots");
    TEST_ASSERT(!parse_amount("18446744073709.551616", v, err), "overflow by one unit");
    TEST_ASSERT(!parse_amount("99999999999999999999", v, err), "overflow of the whole part");

    TEST_END("test_amounts");
    return true;
}

static bool test_identifiers() {
    TEST_BEGIN("test_identifiers");

    TEST_ASSERT_STR(normalize_identifier("  Alice@Example.COM\t"), "alice@example.com", "trim and lowercase");
    TEST_ASSERT(identifier_hash("Alice@Example.com") == identifier_hash(" alice@example.com "), "same hash");
    TEST_ASSERT(identifier_hash("alice@example.com") == sha256(std::string("alice@example.com")), "hash of the normal form");
    TEST_ASSERT(identifier_hash("alice@example.com") != identifier_hash("alice@example.org"), "distinct identifiers");

    std::string err;
    TEST_ASSERT(validate_identifier("bob@example.com", err), "plain address");
    TEST_ASSERT(!validate_identifier("", err), "empty");
    TEST_ASSERT_STR(err, "Recipient identifier is required", "message");
    TEST_ASSERT(!validate_identifier("bob", err), "no at-sign");
    TEST_ASSERT(!validate_identifier("@example.com", err), "no local part");
    TEST_ASSERT(!validate_identifier("bob@", err), "no domain");
    TEST_ASSERT(!validate_identifier("bob@@example.com", err), "two at-signs");
    TEST_ASSERT(!validate_identifier("bob smith@example.com", err), "inner whitespace");

    TEST_END("test_identifiers");
    return true;
}

static bool test_config_file() {
    TEST_BEGIN("test_config_file");

    const std::string dir = make_temp_dir("mpay_config");
    const std::string path = dir + "/mailpay.conf";
    {
        std::ofstream f(path);
        f << "# operator settings\n";
        f << "// also a comment\n";
        f << "datadir = /var/lib/mailpay\n";
        f << "TOKEN_KIND=EURC\n";
        f << "sponsor_key=/etc/mailpay/sponsor.key\n";
        f << "sponsor_enabled=no\n";
        f << "default_expiry_days=14\n";
        f << "max_create_attempts=9\n";
        f << "checkpoint_window=20\n";
        f << "fee_per_signature=7000\n";
        f << "max_nonce_probe=-3\n";
        f << "notify_outbox=/var/spool/mailpay/outbox.jsonl\n";
        f << "log_level=debug\n";
        f << "colour=blue\n";
        f << "no equals sign here\n";
    }

    Config c;
    TEST_ASSERT(load_config(path, c), "load");
    TEST_ASSERT_STR(c.datadir, "/var/lib/mailpay", "datadir");
    TEST_ASSERT_STR(c.token_kind, "EURC", "keys are case-insensitive");
    TEST_ASSERT_STR(c.sponsor_key, "/etc/mailpay/sponsor.key", "sponsor key");
    TEST_ASSERT(!c.sponsor_enabled, "sponsoring switched off");
    TEST_ASSERT_EQ(c.default_expiry_days, 14u, "expiry days");
    TEST_ASSERT_EQ(c.max_create_attempts, 9u, "create attempts");
    TEST_ASSERT_EQ(c.checkpoint_window, 20u, "window");
    TEST_ASSERT_EQ(c.fee_per_signature, 7000u, "fee");
    TEST_ASSERT_EQ(c.max_nonce_probe, MPAY_MAX_NONCE_PROBE, "bad number keeps the default");
    TEST_ASSERT_EQ(c.max_resign_attempts, MPAY_MAX_RESIGN_ATTEMPTS, "unset keeps the default");
    TEST_ASSERT_STR(c.notify_outbox, "/var/spool/mailpay/outbox.jsonl", "outbox");
    TEST_ASSERT_STR(c.log_level, "debug", "log level");

    LogLevel level = LogLevel::INFO;
    TEST_ASSERT(log_level_from_string(c.log_level, level) && level == LogLevel::DEBUG, "log level parses");
    TEST_ASSERT(!log_level_from_string("chatty", level), "unknown log level");

    Config missing;
    TEST_ASSERT(!load_config(dir + "/absent.conf", missing), "absent file");
    TEST_ASSERT_STR(missing.token_kind, "USDC", "defaults untouched");

    cleanup_temp_dir(dir);
    TEST_END("test_config_file");
    return true;
}

static bool test_json() {
    TEST_BEGIN("test_json");

    JNode n;
    TEST_ASSERT(json_parse("{\"a\": \"x\\\"y\\u0041\", \"n\": 1700000000, \"neg\": -2, \"list\": [true, null, 1.5e2]}", n),
                "parse");
    std::string s;
    uint64_t u = 0;
    TEST_ASSERT(json_get_string(n, "a", s), "string member");
    TEST_ASSERT_STR(s, "x\"yA", "escapes decoded");
    TEST_ASSERT(json_get_u64(n, "n", u) && u == 1700000000u, "integer member");
    TEST_ASSERT(!json_get_u64(n, "neg", u), "negative is not u64");
    TEST_ASSERT(!json_get_u64(n, "a", u), "string is not a number");
    TEST_ASSERT(!json_get_string(n, "missing", s), "absent member");

    JObject o;
    o["text"] = jstr("line\nbreak\ttab");
    o["num"] = jnum(42);
    o["flag"] = jbool(true);
    const std::string dumped = json_dump(jobj(o));
    TEST_ASSERT_STR(dumped, "{\"flag\":true,\"num\":42,\"text\":\"line\\nbreak\\ttab\"}", "compact rendering");
    JNode back;
    TEST_ASSERT(json_parse(dumped, back) && json_get_string(back, "text", s) && s == "line\nbreak\ttab", "reparse");

    TEST_ASSERT(!json_parse("{\"a\":1", n), "unterminated object");
    TEST_ASSERT(!json_parse("[1,]", n), "trailing comma");
    TEST_ASSERT(!json_parse("{} x", n), "trailing garbage");
    TEST_ASSERT(!json_parse(std::string(100, '[') + std::string(100, ']'), n), "nesting limit");
    TEST_ASSERT(json_parse(std::string(10, '[') + std::string(10, ']'), n), "modest nesting");

    TEST_END("test_json");
    return true;
}

}  // namespace test
}  // namespace mpay

int main() {
    using namespace mpay::test;
    mpay::log_init(mpay::LogLevel::FATAL);
    bool all_passed = true;
    all_passed &= test_amounts();
    all_passed &= test_identifiers();
    all_passed &= test_config_file();
    all_passed &= test_json();
    return report_results("config / amounts / identifiers", all_passed);
}
