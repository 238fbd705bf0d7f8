#pragma once
#include <cstdint>

#include "escrow/escrow_error.h"
#include "escrow/escrow_state.h"
#include "ledger/program.h"

namespace mpay {

enum class EscrowIx : uint8_t {
    Initialize = 0,   // amount:u64 identifier_hash[32] expires_at:i64 nonce:u64
    Claim      = 1,
    Reclaim    = 2,
};

struct InitializeArgs {
    uint64_t amount{0};
    Hash256 identifier_hash{};
    int64_t expires_at{0};
    uint64_t nonce{0};
};

// Account lists:
//   initialize: [escrow w, custody w, sender_funding w, token_kind r, sender s w, sponsor s w]
//   claim:      [escrow w, custody w, recipient_funding w, token_kind r, recipient s w, sponsor s w]
//   reclaim:    [escrow w, custody w, sender_funding w, token_kind r, sender s w, sponsor s w]
Instruction make_escrow_initialize(const Address& sender, const Address& sponsor,
                                   const Address& token_kind, const InitializeArgs& args);
Instruction make_escrow_claim(const Address& escrow, const Address& custody, const Address& recipient,
                              const Address& sponsor, const Address& token_kind);
Instruction make_escrow_reclaim(const Address& escrow, const Address& custody, const Address& sender,
                                const Address& sponsor, const Address& token_kind);

// Holds value for a recipient known only by an identifier hash until it is
// claimed, or until the sender takes it back after expiry.
class EscrowProgram : public Program {
public:
    const Address& id() const override;
    const char* name() const override { return "escrow"; }
    bool execute(InvokeContext& ctx, const Instruction& ix, ExecError& err) override;

private:
    bool initialize(InvokeContext& ctx, const Instruction& ix, const InitializeArgs& args, ExecError& err);
    bool claim(InvokeContext& ctx, const Instruction& ix, ExecError& err);
    bool reclaim(InvokeContext& ctx, const Instruction& ix, ExecError& err);
};

}
