#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "address.h"
#include "hash.h"
#include "crypto/ecdsa_iface.h"

namespace mpay {

struct AccountMeta {
    Address addr;
    bool is_signer{false};
    bool is_writable{false};
};

inline AccountMeta writable(const Address& a, bool signer = false) { return AccountMeta{a, signer, true}; }
inline AccountMeta readonly(const Address& a, bool signer = false) { return AccountMeta{a, signer, false}; }

struct Instruction {
    Address program_id;
    std::vector<AccountMeta> accounts;
    std::vector<uint8_t> data;
};

// The signed payload. `checkpoint` is the freshness token: a recent checkpoint hash.
struct Message {
    Address fee_payer;
    Hash256 checkpoint{};
    std::vector<Instruction> instructions;

    std::vector<uint8_t> serialize() const;
    Hash256 hash() const;
    // Fee payer first, then every signer meta in order of appearance, without duplicates
    std::vector<Address> required_signers() const;
};

struct TxSignature {
    crypto::PubKey33 pubkey{};
    crypto::Sig64 sig{};

    Address signer() const { return key_address(pubkey); }
};

struct Transaction {
    Message message;
    std::vector<TxSignature> signatures;   // signatures[0] belongs to the fee payer

    // SHA-256 of the fee payer's signature; zero when unsigned
    Hash256 txid() const;
};

enum class TxStatus : uint8_t {
    OK = 0,
    AccountInUse,
    AccountNotFound,
    CheckpointExpired,
    AlreadyProcessed,
    MissingSignature,
    InvalidSignature,
    InsufficientFundsForFee,
    InsufficientFunds,
    InvalidAccountData,
    InvalidArgument,
    MalformedTransaction,
    ProgramError,
    UnknownProgram,
    StorageError,
};

const char* tx_status_name(TxStatus s);

struct TxResult {
    TxStatus status{TxStatus::OK};
    uint32_t program_error{0};     // set when status == ProgramError
    std::string message;
    std::vector<std::string> logs;
    Hash256 txid{};

    bool ok() const { return status == TxStatus::OK; }
    std::string describe() const;
};

// Races and infrastructure hiccups: rebuild inputs and resubmit.
bool is_retryable(const TxResult& r);

}
