#pragma once
#include <cstdint>

#include "ledger/program.h"

namespace mpay {

// Stable program error codes of the escrow program
enum class EscrowError : uint32_t {
    InvalidAmount = 6000,
    InvalidExpiration,
    ExpirationTooLong,
    EscrowNotActive,
    EscrowExpired,
    EscrowNotExpired,
    InvalidRecipient,
    UnauthorizedSender,
    InvalidEscrowAddress,
    InvalidCustodyAccount,
    InvalidInstruction,
};

const char* escrow_error_name(EscrowError e);
const char* escrow_error_message(EscrowError e);
bool escrow_error_from_code(uint32_t code, EscrowError& out);

inline uint32_t code_of(EscrowError e) { return static_cast<uint32_t>(e); }

inline bool fail_escrow(ExecError& err, EscrowError e) {
    return fail_program(err, code_of(e), escrow_error_message(e));
}

// True when `r` failed with escrow program error `e`
bool is_escrow_error(const TxResult& r, EscrowError e);

}
