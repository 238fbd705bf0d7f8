#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "address.h"
#include "hash.h"
#include "kvdb.h"
#include "ledger/account.h"

namespace mpay {

enum class TransferStatus : uint8_t {
    Pending   = 0,
    Claimed   = 1,
    Reclaimed = 2,
    Expired   = 3,
};

const char* transfer_status_name(TransferStatus s);
bool transfer_status_from_name(const std::string& s, TransferStatus& out);

// Off-ledger view of one escrow, for notifications and display only
struct TransferRecord {
    Address escrow;
    Address sender;
    std::string identifier;
    Hash256 identifier_hash{};
    uint64_t amount{0};
    TransferStatus status{TransferStatus::Pending};
    int64_t created_at{0};
    int64_t expires_at{0};
    std::optional<Address> claimed_by;
    Hash256 txid{};

    bool terminal() const { return status == TransferStatus::Claimed || status == TransferStatus::Reclaimed; }
};

std::string encode_transfer_record(const TransferRecord& r);
bool decode_transfer_record(const std::string& raw, TransferRecord& out);

// Non-authoritative cache of escrow state plus the identifier -> wallet registry.
class StatusMirror {
public:
    virtual ~StatusMirror() = default;

    virtual bool upsert(const TransferRecord& r, std::string& err) = 0;
    virtual bool get(const Address& escrow, TransferRecord& out) const = 0;
    virtual std::vector<TransferRecord> list() const = 0;

    virtual bool register_wallet(const std::string& identifier, const Address& wallet, std::string& err) = 0;
    virtual std::optional<Address> lookup_wallet(const std::string& identifier) const = 0;
};

// StatusMirror on its own LevelDB directory; records are stored as JSON
class KvStatusMirror : public StatusMirror {
public:
    bool open(const std::string& dir, std::string& err);

    bool upsert(const TransferRecord& r, std::string& err) override;
    bool get(const Address& escrow, TransferRecord& out) const override;
    std::vector<TransferRecord> list() const override;

    bool register_wallet(const std::string& identifier, const Address& wallet, std::string& err) override;
    std::optional<Address> lookup_wallet(const std::string& identifier) const override;

private:
    mutable std::mutex mtx_;
    KVDB db_;
};

struct ReconcileReport {
    size_t examined{0};
    size_t updated{0};
    size_t missing{0};     // escrow record gone from the ledger
};

// Brings every non-terminal mirror row in line with the ledger's escrow record.
ReconcileReport reconcile_mirror(StatusMirror& mirror, const AccountReader& ledger, int64_t now);

}
