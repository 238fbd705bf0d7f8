#include "ledger/transaction.h"
#include "serialize.h"

#include <algorithm>

namespace mpay {

std::vector<uint8_t> Message::serialize() const {
    ByteWriter w;
    w.address(fee_payer);
    w.fixed(checkpoint);
    w.u8(static_cast<uint8_t>(instructions.size()));
    for (const auto& ix : instructions) {
        w.address(ix.program_id);
        w.u8(static_cast<uint8_t>(ix.accounts.size()));
        for (const auto& m : ix.accounts) {
            w.address(m.addr);
            w.u8(uint8_t((m.is_signer ? 1 : 0) | (m.is_writable ? 2 : 0)));
        }
        w.var(ix.data);
    }
    return w.take();
}

Hash256 Message::hash() const {
    return Sha256Writer().write(std::string("mailpay/message")).write(serialize()).finalize();
}

std::vector<Address> Message::required_signers() const {
    std::vector<Address> out;
    out.push_back(fee_payer);
    for (const auto& ix : instructions) {
        for (const auto& m : ix.accounts) {
            if (!m.is_signer) continue;
            if (std::find(out.begin(), out.end(), m.addr) == out.end()) out.push_back(m.addr);
        }
    }
    return out;
}

Hash256 Transaction::txid() const {
    if (signatures.empty()) return Hash256{};
    return sha256(signatures[0].sig.data(), signatures[0].sig.size());
}

const char* tx_status_name(TxStatus s) {
    switch (s) {
        case TxStatus::OK: return "OK";
        case TxStatus::AccountInUse: return "AccountInUse";
        case TxStatus::AccountNotFound: return "AccountNotFound";
        case TxStatus::CheckpointExpired: return "CheckpointExpired";
        case TxStatus::AlreadyProcessed: return "AlreadyProcessed";
        case TxStatus::MissingSignature: return "MissingSignature";
        case TxStatus::InvalidSignature: return "InvalidSignature";
        case TxStatus::InsufficientFundsForFee: return "InsufficientFundsForFee";
        case TxStatus::InsufficientFunds: return "InsufficientFunds";
        case TxStatus::InvalidAccountData: return "InvalidAccountData";
        case TxStatus::InvalidArgument: return "InvalidArgument";
        case TxStatus::MalformedTransaction: return "MalformedTransaction";
        case TxStatus::ProgramError: return "ProgramError";
        case TxStatus::UnknownProgram: return "UnknownProgram";
        case TxStatus::StorageError: return "StorageError";
    }
    return "Unknown";
}

std::string TxResult::describe() const {
    std::string s = tx_status_name(status);
    if (status == TxStatus::ProgramError) s += " " + std::to_string(program_error);
    if (!message.empty()) s += ": " + message;
    return s;
}

bool is_retryable(const TxResult& r) {
    switch (r.status) {
        case TxStatus::AccountInUse:
        case TxStatus::CheckpointExpired:
        case TxStatus::InsufficientFundsForFee:
        case TxStatus::StorageError:
            return true;
        default:
            return false;
    }
}

}
