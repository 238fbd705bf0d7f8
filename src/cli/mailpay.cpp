// mailpay: operator tool over a local ledger data directory

#include "client/amount.h"
#include "client/escrow_client.h"
#include "client/notifier.h"
#include "client/sponsor.h"
#include "client/status_mirror.h"
#include "escrow/escrow_program.h"
#include "escrow/identifier.h"
#include "ledger/ledger.h"
#include "ledger/token.h"
#include "config.h"
#include "hex.h"
#include "keys.h"
#include "log.h"

#include <cstring>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace mpay;

namespace {

struct Args {
    std::string command;
    std::map<std::string, std::string> opts;   // --key=value and --key value
    bool has(const std::string& k) const { return opts.count(k) != 0; }
    std::string get(const std::string& k, const std::string& def = "") const {
        auto it = opts.find(k);
        return it == opts.end() ? def : it->second;
    }
};

void usage() {
    std::cout << "mailpay - email-addressed escrow payments\n\n";
    std::cout << "Usage: mailpay [--conf=FILE] [--datadir=DIR] [--log-level=LEVEL] <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  keygen    --out=FILE                         Create a key file\n";
    std::cout << "  airdrop   --to=ADDR|--key=FILE --lamports=N  Credit native lamports\n";
    std::cout << "  mint      --to=ADDR|--key=FILE --amount=X    Mint tokens to an owner\n";
    std::cout << "  send      --key=FILE --to=EMAIL --amount=X [--days=N] [--auto]\n";
    std::cout << "  claim     --key=FILE --escrow=ADDR\n";
    std::cout << "  reclaim   --key=FILE --escrow=ADDR\n";
    std::cout << "  show      --escrow=ADDR\n";
    std::cout << "  list      --sender=ADDR|--key=FILE [--to=EMAIL]\n";
    std::cout << "  balance   --address=ADDR|--key=FILE\n";
    std::cout << "  register  --to=EMAIL --address=ADDR|--key=FILE\n";
    std::cout << "  unclaimed --to=EMAIL\n";
    std::cout << "  advance   --seconds=N [--slots=N]            Move the ledger clock\n";
    std::cout << "  reconcile                                    Repair the status mirror\n";
}

bool parse_args(int argc, char** argv, Args& out, std::string& err) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help") { out.command = "help"; continue; }
        if (a.rfind("--", 0) == 0) {
            std::string k = a.substr(2), v;
            auto eq = k.find('=');
            if (eq != std::string::npos) {
                v = k.substr(eq + 1);
                k = k.substr(0, eq);
            } else if (i + 1 < argc && std::strncmp(argv[i + 1], "--", 2) != 0) {
                v = argv[++i];
            } else {
                v = "1";
            }
            out.opts[k] = v;
            continue;
        }
        if (!out.command.empty()) { err = "unexpected argument '" + a + "'"; return false; }
        out.command = a;
    }
    return true;
}

bool parse_u64(const std::string& s, uint64_t& out) {
    try {
        size_t used = 0;
        out = std::stoull(s, &used);
        return used == s.size() && !s.empty() && s[0] != '-';
    } catch (const std::exception&) {
        return false;
    }
}

int fail(const std::string& msg) {
    std::cerr << "error: " << msg << "\n";
    return 1;
}

// The host process: config, ledger, sponsor, mirror and client wired together
class Node {
public:
    bool open(const Config& cfg, std::string& err) {
        cfg_ = cfg;
        if (!token_kind_address(cfg_.token_kind, token_kind_, &err)) return false;

        LedgerOptions lo;
        lo.checkpoint_window = cfg_.checkpoint_window;
        lo.fee_per_signature = cfg_.fee_per_signature;
        if (!ledger_.open(cfg_.datadir + "/ledger", lo, err)) return false;
        ledger_.register_program(std::make_shared<EscrowProgram>());

        if (!mirror_.open(cfg_.datadir + "/mirror", err)) return false;
        if (!cfg_.notify_outbox.empty()) notifier_ = std::make_unique<OutboxNotifier>(cfg_.notify_outbox);
        else notifier_ = std::make_unique<NullNotifier>();

        const std::string sponsor_path = cfg_.sponsor_key.empty() ? cfg_.datadir + "/sponsor.key" : cfg_.sponsor_key;
        if (!std::filesystem::exists(sponsor_path)) {
            if (!KeyPair::generate(sponsor_key_, err) || !save_key_file(sponsor_path, sponsor_key_, err)) return false;
            log_info(LogCategory::SPONSOR, "created sponsor key " + sponsor_path + " (" +
                     sponsor_key_.address().to_base58() + "); fund it with airdrop");
        } else if (!load_key_file(sponsor_path, sponsor_key_, err)) {
            return false;
        }

        SponsorPolicy policy;
        policy.enabled = cfg_.sponsor_enabled;
        sponsor_ = std::make_unique<FeeSponsor>(sponsor_key_, ledger_, policy);

        ClientOptions co;
        co.max_nonce_probe = cfg_.max_nonce_probe;
        co.max_create_attempts = cfg_.max_create_attempts;
        co.max_resign_attempts = cfg_.max_resign_attempts;
        co.default_expiry_days = cfg_.default_expiry_days;
        co.token_name = cfg_.token_kind;
        client_ = std::make_unique<EscrowClient>(ledger_, *sponsor_, token_kind_, co, &mirror_, notifier_.get());
        return true;
    }

    Ledger& ledger() { return ledger_; }
    KvStatusMirror& mirror() { return mirror_; }
    EscrowClient& client() { return *client_; }
    const Address& token_kind() const { return token_kind_; }
    const Config& config() const { return cfg_; }

private:
    Config cfg_;
    Address token_kind_;
    Ledger ledger_;
    KvStatusMirror mirror_;
    std::unique_ptr<NotificationDispatcher> notifier_;
    KeyPair sponsor_key_;
    std::unique_ptr<FeeSponsor> sponsor_;
    std::unique_ptr<EscrowClient> client_;
};

// --to / --address / --sender as an address, or the address of --key
bool address_arg(const Args& a, const char* name, Address& out, std::string& err) {
    if (a.has(name)) {
        if (!Address::from_base58(a.get(name), out)) { err = std::string("bad address in --") + name; return false; }
        return true;
    }
    if (a.has("key")) {
        KeyPair k;
        if (!load_key_file(a.get("key"), k, err)) return false;
        out = k.address();
        return true;
    }
    err = std::string("--") + name + " or --key is required";
    return false;
}

bool key_arg(const Args& a, KeyPair& out, std::string& err) {
    if (!a.has("key")) { err = "--key is required"; return false; }
    return load_key_file(a.get("key"), out, err);
}

void print_escrow(const Address& addr, const EscrowAccount& e, int64_t now) {
    std::cout << "escrow      " << addr.to_base58() << "\n";
    std::cout << "  status    " << escrow_status_label(e, now) << "\n";
    std::cout << "  sender    " << e.sender.to_base58() << "\n";
    std::cout << "  amount    " << format_amount(e.amount) << "\n";
    std::cout << "  nonce     " << e.nonce << "\n";
    std::cout << "  id hash   " << to_hex(e.identifier_hash.data(), e.identifier_hash.size()) << "\n";
    std::cout << "  custody   " << e.custody.to_base58() << "\n";
    std::cout << "  created   " << e.created_at << "\n";
    std::cout << "  expires   " << e.expires_at << "\n";
    if (auto who = e.claimed_by()) std::cout << "  claimed   " << who->to_base58() << "\n";
}

int report(const ClientResult& r, const std::string& what) {
    if (r.ok) {
        std::cout << what << " ok, tx " << to_hex(r.tx.txid.data(), r.tx.txid.size()) << "\n";
        for (const auto& l : r.tx.logs) std::cout << "  log: " << l << "\n";
        return 0;
    }
    std::cerr << what << " failed (" << (r.retryable ? "retryable" : "final") << "): " << r.error << "\n";
    return r.retryable ? 3 : 2;
}

int cmd_keygen(const Args& a) {
    if (!a.has("out")) return fail("--out is required");
    if (std::filesystem::exists(a.get("out"))) return fail(a.get("out") + " already exists");
    KeyPair k;
    std::string err;
    if (!KeyPair::generate(k, err) || !save_key_file(a.get("out"), k, err)) return fail(err);
    std::cout << k.address().to_base58() << "\n";
    return 0;
}

int cmd_airdrop(Node& n, const Args& a) {
    Address to;
    uint64_t lamports = 0;
    std::string err;
    if (!address_arg(a, "to", to, err)) return fail(err);
    if (!parse_u64(a.get("lamports"), lamports) || lamports == 0) return fail("--lamports must be a positive integer");
    if (!n.ledger().airdrop(to, lamports, err)) return fail(err);
    std::cout << "airdropped " << lamports << " lamports to " << to.to_base58() << "\n";
    return 0;
}

int cmd_mint(Node& n, const Args& a) {
    Address to;
    uint64_t amount = 0;
    std::string err;
    if (!address_arg(a, "to", to, err)) return fail(err);
    if (!parse_amount(a.get("amount"), amount, err)) return fail(err);
    if (!n.ledger().mint_to(to, n.config().token_kind, amount, err)) return fail(err);
    std::cout << "minted " << format_amount(amount) << " " << n.config().token_kind << " to " << to.to_base58() << "\n";
    return 0;
}

int cmd_send(Node& n, const Args& a) {
    KeyPair k;
    std::string err;
    if (!key_arg(a, k, err)) return fail(err);
    SendRequest req;
    req.sender = k.address();
    req.identifier = a.get("to");
    if (!parse_amount(a.get("amount"), req.amount, err)) return fail(err);
    if (a.has("days")) {
        uint64_t d = 0;
        if (!parse_u64(a.get("days"), d) || d == 0 || d > 30) return fail("--days must be between 1 and 30");
        req.expiry_days = (unsigned)d;
    }
    KeyPrincipal principal(k);
    ClientResult r = a.has("auto") ? n.client().send_auto(req, principal) : n.client().send(req, principal);
    if (r.ok && r.route == SendRoute::Escrow)
        std::cout << "escrow " << r.handle.escrow.to_base58() << " (nonce " << r.handle.nonce
                  << ", expires " << r.handle.expires_at << ")\n";
    return report(r, r.route == SendRoute::Direct ? "direct transfer" : "send");
}

int cmd_claim(Node& n, const Args& a, bool reclaim) {
    KeyPair k;
    Address escrow;
    std::string err;
    if (!key_arg(a, k, err)) return fail(err);
    if (!Address::from_base58(a.get("escrow"), escrow)) return fail("--escrow must be an address");
    KeyPrincipal principal(k);
    if (reclaim) return report(n.client().reclaim(escrow, principal), "reclaim");
    return report(n.client().claim(escrow, principal), "claim");
}

int cmd_show(Node& n, const Args& a) {
    Address escrow;
    if (!Address::from_base58(a.get("escrow"), escrow)) return fail("--escrow must be an address");
    auto e = n.client().fetch_escrow(escrow);
    if (!e) {
        std::cout << "escrow " << escrow.to_base58() << ": " << n.client().status_label(escrow, n.ledger().now()) << "\n";
        return 0;
    }
    print_escrow(escrow, *e, n.ledger().now());
    return 0;
}

int cmd_list(Node& n, const Args& a) {
    Address sender;
    std::string err;
    if (!address_arg(a, "sender", sender, err)) return fail(err);
    auto rows = a.has("to") ? n.client().find_by_identifier(sender, a.get("to")) : n.client().escrows_for_sender(sender);
    const int64_t now = n.ledger().now();
    for (const auto& kv : rows) print_escrow(kv.first, kv.second, now);
    std::cout << rows.size() << " escrow(s)\n";
    return 0;
}

int cmd_balance(Node& n, const Args& a) {
    Address who;
    std::string err;
    if (!address_arg(a, "address", who, err)) return fail(err);
    auto native = n.ledger().fetch(who);
    std::cout << "address   " << who.to_base58() << "\n";
    std::cout << "lamports  " << (native ? native->lamports : 0) << "\n";
    FundingResolution f = n.client().builder().resolve_funding_account(who);
    FundingAccount fa;
    auto rec = n.ledger().fetch(f.address);
    if (f.exists && rec && decode_funding_account(rec->data, fa))
        std::cout << n.config().token_kind << "      " << format_amount(fa.amount) << " (" << f.address.to_base58() << ")\n";
    else
        std::cout << n.config().token_kind << "      no funding account\n";
    return 0;
}

int cmd_register(Node& n, const Args& a) {
    Address wallet;
    std::string err;
    if (!address_arg(a, "address", wallet, err)) return fail(err);
    if (!n.mirror().register_wallet(a.get("to"), wallet, err)) return fail(err);
    std::cout << normalize_identifier(a.get("to")) << " -> " << wallet.to_base58() << "\n";
    return 0;
}

int cmd_unclaimed(Node& n, const Args& a) {
    std::string err;
    if (!validate_identifier(a.get("to"), err)) return fail(err);
    auto rows = n.client().unclaimed_for(a.get("to"));
    for (const auto& r : rows)
        std::cout << r.escrow.to_base58() << "  " << format_amount(r.amount) << "  from " << r.sender.to_base58()
                  << "  expires " << r.expires_at << "\n";
    std::cout << rows.size() << " unclaimed\n";
    return 0;
}

int cmd_advance(Node& n, const Args& a) {
    uint64_t secs = 0, slots = 1;
    if (!parse_u64(a.get("seconds"), secs)) return fail("--seconds must be a non-negative integer");
    if (a.has("slots") && (!parse_u64(a.get("slots"), slots) || slots == 0 || slots > 100000))
        return fail("--slots must be between 1 and 100000");
    std::string err;
    if (!n.ledger().advance_time((int64_t)secs, err, (uint32_t)slots)) return fail(err);
    std::cout << "time " << n.ledger().now() << ", slot " << n.ledger().slot() << "\n";
    return 0;
}

int cmd_reconcile(Node& n) {
    ReconcileReport rep = reconcile_mirror(n.mirror(), n.ledger(), n.ledger().now());
    std::cout << "examined " << rep.examined << ", updated " << rep.updated << ", missing " << rep.missing << "\n";
    return 0;
}

}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);

    Args args;
    std::string err;
    if (!parse_args(argc, argv, args, err)) { usage(); return fail(err); }
    if (args.command.empty() || args.command == "help") { usage(); return args.command.empty() ? 1 : 0; }

    Config cfg;
    const std::string datadir_flag = args.get("datadir");
    std::string conf = args.get("conf");
    if (conf.empty()) conf = (datadir_flag.empty() ? std::string("mailpay-data") : datadir_flag) + "/mailpay.conf";
    if (!load_config(conf, cfg) && args.has("conf")) return fail("cannot read config " + conf);
    if (!datadir_flag.empty()) cfg.datadir = datadir_flag;
    if (cfg.datadir.empty()) cfg.datadir = "mailpay-data";
    if (args.has("log-level")) cfg.log_level = args.get("log-level");

    LogLevel level = LogLevel::INFO;
    if (!log_level_from_string(cfg.log_level, level)) return fail("unknown log level '" + cfg.log_level + "'");
    log_init(level, static_cast<uint32_t>(LogCategory::ALL), cfg.log_file);

    if (args.command == "keygen") { int rc = cmd_keygen(args); log_shutdown(); return rc; }

    std::error_code ec;
    std::filesystem::create_directories(cfg.datadir, ec);
    if (ec) return fail("cannot create " + cfg.datadir + ": " + ec.message());

    Node node;
    if (!node.open(cfg, err)) { log_shutdown(); return fail(err); }

    int rc = 0;
    const std::string& c = args.command;
    if (c == "airdrop") rc = cmd_airdrop(node, args);
    else if (c == "mint") rc = cmd_mint(node, args);
    else if (c == "send") rc = cmd_send(node, args);
    else if (c == "claim") rc = cmd_claim(node, args, false);
    else if (c == "reclaim") rc = cmd_claim(node, args, true);
    else if (c == "show") rc = cmd_show(node, args);
    else if (c == "list") rc = cmd_list(node, args);
    else if (c == "balance") rc = cmd_balance(node, args);
    else if (c == "register") rc = cmd_register(node, args);
    else if (c == "unclaimed") rc = cmd_unclaimed(node, args);
    else if (c == "advance") rc = cmd_advance(node, args);
    else if (c == "reconcile") rc = cmd_reconcile(node);
    else { usage(); rc = fail("unknown command '" + c + "'"); }

    log_shutdown();
    return rc;
}
