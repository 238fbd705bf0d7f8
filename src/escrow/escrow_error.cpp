#include "escrow/escrow_error.h"

namespace mpay {

const char* escrow_error_name(EscrowError e) {
    switch (e) {
        case EscrowError::InvalidAmount: return "InvalidAmount";
        case EscrowError::InvalidExpiration: return "InvalidExpiration";
        case EscrowError::ExpirationTooLong: return "ExpirationTooLong";
        case EscrowError::EscrowNotActive: return "EscrowNotActive";
        case EscrowError::EscrowExpired: return "EscrowExpired";
        case EscrowError::EscrowNotExpired: return "EscrowNotExpired";
        case EscrowError::InvalidRecipient: return "InvalidRecipient";
        case EscrowError::UnauthorizedSender: return "UnauthorizedSender";
        case EscrowError::InvalidEscrowAddress: return "InvalidEscrowAddress";
        case EscrowError::InvalidCustodyAccount: return "InvalidCustodyAccount";
        case EscrowError::InvalidInstruction: return "InvalidInstruction";
    }
    return "Unknown";
}

const char* escrow_error_message(EscrowError e) {
    switch (e) {
        case EscrowError::InvalidAmount: return "Invalid amount: must be greater than 0";
        case EscrowError::InvalidExpiration: return "Invalid expiration: must be in the future";
        case EscrowError::ExpirationTooLong: return "Expiration too long: maximum 30 days";
        case EscrowError::EscrowNotActive: return "Escrow is not active";
        case EscrowError::EscrowExpired: return "Escrow has expired";
        case EscrowError::EscrowNotExpired: return "Escrow has not expired yet";
        case EscrowError::InvalidRecipient: return "Invalid recipient";
        case EscrowError::UnauthorizedSender: return "Unauthorized sender";
        case EscrowError::InvalidEscrowAddress: return "Escrow address does not match its seeds";
        case EscrowError::InvalidCustodyAccount: return "Custody account does not belong to this escrow";
        case EscrowError::InvalidInstruction: return "Invalid escrow instruction";
    }
    return "Unknown escrow error";
}

bool escrow_error_from_code(uint32_t code, EscrowError& out) {
    if (code < code_of(EscrowError::InvalidAmount) || code > code_of(EscrowError::InvalidInstruction)) return false;
    out = static_cast<EscrowError>(code);
    return true;
}

bool is_escrow_error(const TxResult& r, EscrowError e) {
    return r.status == TxStatus::ProgramError && r.program_error == code_of(e);
}

}
