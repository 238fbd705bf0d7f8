#pragma once
#include <string>
#include <cstdint>

#include "constants.h"

namespace mpay {

struct Config {
    std::string datadir;                     // ledger + mirror root; empty = ./mailpay-data
    std::string token_kind = "USDC";         // default fungible asset name

    // === Fee sponsorship ===
    std::string sponsor_key;                 // key file of the sponsor identity
    bool        sponsor_enabled = true;

    // === Escrow client ===
    unsigned    default_expiry_days = MPAY_DEFAULT_EXPIRY_DAYS;
    unsigned    max_nonce_probe = MPAY_MAX_NONCE_PROBE;
    unsigned    max_create_attempts = MPAY_MAX_CREATE_ATTEMPTS;
    unsigned    max_resign_attempts = MPAY_MAX_RESIGN_ATTEMPTS;

    // === Ledger host ===
    unsigned    checkpoint_window = MPAY_CHECKPOINT_WINDOW;
    uint64_t    fee_per_signature = MPAY_FEE_PER_SIGNATURE;  // lamports

    // === Collaborators ===
    std::string notify_outbox;               // JSON-lines spool; empty = notifications off

    // === Logging ===
    std::string log_level = "info";
    std::string log_file;
};

// Simple key=value loader. Unknown keys are ignored. Returns false if file not found.
bool load_config(const std::string& path, Config& out);

}
