#pragma once
#include <cstdint>
#include <mutex>
#include <string>

#include "address.h"

namespace mpay {

// What the recipient is told about funds waiting for them
struct EscrowNotice {
    std::string identifier;
    Address escrow;
    Address sender;
    uint64_t amount{0};
    std::string token;
    int64_t expires_at{0};
};

// Best-effort delivery; the caller logs failures and carries on.
class NotificationDispatcher {
public:
    virtual ~NotificationDispatcher() = default;
    virtual bool notify_escrow_created(const EscrowNotice& n, std::string& err) = 0;
};

// Appends one JSON object per line to a spool file read by an external mailer
class OutboxNotifier : public NotificationDispatcher {
public:
    explicit OutboxNotifier(std::string path) : path_(std::move(path)) {}
    bool notify_escrow_created(const EscrowNotice& n, std::string& err) override;
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mtx_;
};

class NullNotifier : public NotificationDispatcher {
public:
    bool notify_escrow_created(const EscrowNotice&, std::string&) override { return true; }
};

}
