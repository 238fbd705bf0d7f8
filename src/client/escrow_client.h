#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "constants.h"
#include "client/notifier.h"
#include "client/sponsor.h"
#include "client/status_mirror.h"
#include "client/tx_builder.h"
#include "escrow/escrow_state.h"
#include "ledger/ledger.h"

namespace mpay {

struct ClientOptions {
    unsigned max_nonce_probe{MPAY_MAX_NONCE_PROBE};
    unsigned max_create_attempts{MPAY_MAX_CREATE_ATTEMPTS};
    unsigned max_resign_attempts{MPAY_MAX_RESIGN_ATTEMPTS};
    unsigned default_expiry_days{MPAY_DEFAULT_EXPIRY_DAYS};
    std::string token_name{"USDC"};
};

struct SendRequest {
    Address sender;
    std::string identifier;
    uint64_t amount{0};
    unsigned expiry_days{0};     // 0 = ClientOptions::default_expiry_days
};

enum class SendRoute { Escrow, Direct };

// Outcome of a client operation. `retryable` tells the end user whether trying
// again may help (races, stale checkpoints) or not (validation, authorization, state).
struct ClientResult {
    bool ok{false};
    bool retryable{false};
    std::string error;
    TxResult tx;                 // last ledger answer, if anything was submitted
    EscrowHandle handle;
    SendRoute route{SendRoute::Escrow};
    unsigned attempts{0};
};

// Drives builder, resolver, sponsor and principal for each escrow operation and
// keeps the status mirror and the notifier informed.
class EscrowClient {
public:
    EscrowClient(Ledger& ledger, const FeeSponsor& sponsor, const Address& token_kind,
                 const ClientOptions& opts = ClientOptions(),
                 StatusMirror* mirror = nullptr, NotificationDispatcher* notifier = nullptr);

    // Reads used for nonce probing; defaults to the ledger itself
    void set_probe_view(const AccountReader* view) { probe_view_ = view; }

    ClientResult send(const SendRequest& req, PrincipalSigner& principal);
    // Direct transfer when the identifier has a registered wallet, escrow otherwise
    ClientResult send_auto(const SendRequest& req, PrincipalSigner& principal);
    ClientResult claim(const Address& escrow, PrincipalSigner& recipient);
    ClientResult reclaim(const Address& escrow, PrincipalSigner& sender);

    std::optional<EscrowAccount> fetch_escrow(const Address& escrow) const;
    std::vector<std::pair<Address, EscrowAccount>> escrows_for_sender(const Address& sender) const;
    std::vector<std::pair<Address, EscrowAccount>> find_by_identifier(const Address& sender,
                                                                      const std::string& identifier) const;
    // "active", "expired", "claimed" or "reclaimed"; "unknown" for an address never seen
    std::string status_label(const Address& escrow, int64_t now) const;
    // Pending mirror rows for `identifier`, after reconciling the mirror
    std::vector<TransferRecord> unclaimed_for(const std::string& identifier);

    const TransactionBuilder& builder() const { return builder_; }

private:
    const AccountReader& probe_view() const { return probe_view_ ? *probe_view_ : ledger_; }
    bool submit_sponsored(const Message& msg, PrincipalSigner& principal, ClientResult& res);
    void record_created(const SendRequest& req, const ClientResult& res, int64_t created_at);
    void record_terminal(const Address& escrow, TransferStatus status, const std::optional<Address>& who,
                         const Hash256& txid);

    Ledger& ledger_;
    const FeeSponsor& sponsor_;
    Address token_kind_;
    ClientOptions opts_;
    StatusMirror* mirror_;
    NotificationDispatcher* notifier_;
    const AccountReader* probe_view_{nullptr};
    NonceResolver resolver_;
    TransactionBuilder builder_;
};

std::string escrow_status_label(const EscrowAccount& e, int64_t now);
// User-facing text for a failed transaction
std::string describe_failure(const TxResult& r);

}
