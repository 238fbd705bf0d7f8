#pragma once
#include <cstdint>
#include <cstddef>

// =============================================================================
// MAILPAY CONSTANTS
// =============================================================================

// === LEDGER HOST ===
#ifndef MPAY_CHECKPOINT_WINDOW
#define MPAY_CHECKPOINT_WINDOW 150u          // checkpoints a message may reference
#endif
#ifndef MPAY_FEE_PER_SIGNATURE
#define MPAY_FEE_PER_SIGNATURE 5000ull       // lamports
#endif
#ifndef MPAY_RESERVE_OVERHEAD_BYTES
#define MPAY_RESERVE_OVERHEAD_BYTES 128u
#endif
#ifndef MPAY_RESERVE_LAMPORTS_PER_BYTE
#define MPAY_RESERVE_LAMPORTS_PER_BYTE 6960ull
#endif
#ifndef MPAY_MAX_INSTRUCTIONS
#define MPAY_MAX_INSTRUCTIONS 8u
#endif
#ifndef MPAY_MAX_ACCOUNT_METAS
#define MPAY_MAX_ACCOUNT_METAS 32u
#endif
#ifndef MPAY_MAX_INSTRUCTION_DATA
#define MPAY_MAX_INSTRUCTION_DATA 1024u
#endif
#ifndef MPAY_MAX_INVOKE_DEPTH
#define MPAY_MAX_INVOKE_DEPTH 4
#endif

// === ESCROW ===
#ifndef MPAY_MAX_ESCROW_DURATION_SECS
#define MPAY_MAX_ESCROW_DURATION_SECS (30ll * 24 * 60 * 60)   // 30 days
#endif
#ifndef MPAY_TOKEN_DECIMALS
#define MPAY_TOKEN_DECIMALS 6
#endif

// === CLIENT ===
#ifndef MPAY_DEFAULT_EXPIRY_DAYS
#define MPAY_DEFAULT_EXPIRY_DAYS 7u
#endif
#ifndef MPAY_MAX_NONCE_PROBE
#define MPAY_MAX_NONCE_PROBE 64u
#endif
#ifndef MPAY_MAX_CREATE_ATTEMPTS
#define MPAY_MAX_CREATE_ATTEMPTS 5u
#endif
#ifndef MPAY_MAX_RESIGN_ATTEMPTS
#define MPAY_MAX_RESIGN_ATTEMPTS 3u
#endif
#ifndef MPAY_SECONDS_PER_SLOT
#define MPAY_SECONDS_PER_SLOT 1
#endif
