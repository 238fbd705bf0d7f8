#include "client/nonce_resolver.h"
#include "escrow/escrow_state.h"
#include "log.h"

namespace mpay {

Address NonceResolver::derive(const Address& sender, const Hash256& identifier_hash, uint64_t nonce) const {
    return escrow_address(sender, identifier_hash, nonce);
}

bool NonceResolver::resolve(const Address& sender, const Hash256& identifier_hash, uint64_t& nonce,
                            std::string& err, uint64_t start) const {
    for (unsigned i = 0; i < max_probe_; ++i) {
        const uint64_t candidate = start + i;
        if (candidate < start) break;
        auto rec = reader_.fetch(derive(sender, identifier_hash, candidate));
        if (!rec || !rec->exists()) {
            nonce = candidate;
            MPAY_LOG_TRACE(LogCategory::CLIENT, "nonce " + std::to_string(candidate) + " free after " +
                           std::to_string(i + 1) + " probes");
            return true;
        }
    }
    err = "no free escrow slot within " + std::to_string(max_probe_) + " nonces of " + std::to_string(start);
    return false;
}

bool NonceResolver::next_free(const Address& sender, const Hash256& identifier_hash, uint64_t& nonce,
                              std::string& err, uint64_t start) const {
    if (max_probe_ == 0) { err = "nonce probing is disabled (max_nonce_probe=0)"; return false; }
    for (uint64_t window = start;; window += max_probe_) {
        if (resolve(sender, identifier_hash, nonce, err, window)) return true;
        MPAY_LOG_DEBUG(LogCategory::CLIENT, err + ", moving on");
        if (window + max_probe_ < window) break;
    }
    err = "nonce space exhausted";
    return false;
}

}
