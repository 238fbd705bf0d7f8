#include "client/notifier.h"
#include "client/amount.h"
#include "json.h"
#include "log.h"

#include <fstream>

namespace mpay {

// amount and expires_at are written as decimal strings
bool OutboxNotifier::notify_escrow_created(const EscrowNotice& n, std::string& err) {
    JObject o;
    o["type"] = jstr("escrow_created");
    o["to"] = jstr(n.identifier);
    o["escrow"] = jstr(n.escrow.to_base58());
    o["sender"] = jstr(n.sender.to_base58());
    o["amount"] = jstr(std::to_string(n.amount));
    o["display_amount"] = jstr(format_amount(n.amount) + " " + n.token);
    o["expires_at"] = jstr(std::to_string(n.expires_at));
    const std::string line = json_dump(jobj(o));

    std::lock_guard<std::mutex> lk(mtx_);
    std::ofstream f(path_, std::ios::out | std::ios::app);
    if (!f.is_open()) { err = "cannot open outbox " + path_; return false; }
    f << line << "\n";
    f.flush();
    if (!f) { err = "write failed: " + path_; return false; }
    MPAY_LOG_DEBUG(LogCategory::NOTIFY, "queued notice for " + n.identifier);
    return true;
}

}
