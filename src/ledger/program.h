#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "ledger/account.h"
#include "ledger/transaction.h"

namespace mpay {

// Why an instruction failed. `code` is only meaningful for TxStatus::ProgramError.
struct ExecError {
    TxStatus status{TxStatus::OK};
    uint32_t code{0};
    std::string message;
};

inline bool fail(ExecError& err, TxStatus s, const std::string& msg) {
    err.status = s;
    err.code = 0;
    err.message = msg;
    return false;
}

inline bool fail_program(ExecError& err, uint32_t code, const std::string& msg) {
    err.status = TxStatus::ProgramError;
    err.code = code;
    err.message = msg;
    return false;
}

class InvokeContext;

// An on-ledger program. execute() either succeeds or returns false with `err`
// set; partial effects of a failed instruction are discarded by the host.
class Program {
public:
    virtual ~Program() = default;
    virtual const Address& id() const = 0;
    virtual const char* name() const = 0;
    virtual bool execute(InvokeContext& ctx, const Instruction& ix, ExecError& err) = 0;
};

using ProgramMap = std::map<Address, std::shared_ptr<Program>>;

// Committed accounts plus the uncommitted changes of one transaction
class Overlay {
public:
    explicit Overlay(const AccountReader& base) : base_(base) {}

    std::optional<AccountRecord> get(const Address& a) const;
    // A record that no longer exists() is recorded as a deletion
    void set(const Address& a, const AccountRecord& rec);
    void erase(const Address& a);

    const std::map<Address, std::optional<AccountRecord>>& changes() const { return changes_; }

private:
    const AccountReader& base_;
    std::map<Address, std::optional<AccountRecord>> changes_;
};

using SeedList = std::vector<std::vector<uint8_t>>;

// Host services offered to a running program. Every mutation is checked
// against the privileges of the current call frame.
class InvokeContext {
public:
    InvokeContext(Overlay& state, const ProgramMap& programs, int64_t now, uint64_t slot,
                  std::vector<std::string>& logs);

    int64_t now() const { return now_; }
    uint64_t slot() const { return slot_; }
    const Address& program_id() const;

    std::optional<AccountRecord> get(const Address& a) const { return state_.get(a); }
    bool exists(const Address& a) const;
    bool is_signer(const Address& a) const;
    bool is_writable(const Address& a) const;

    // New account owned by the calling program; `payer` (a signing key account) funds its reserve.
    bool create_account(const Address& payer, const Address& addr,
                        const std::vector<uint8_t>& data, ExecError& err);
    // Replace the data of an account owned by the calling program. The size is fixed at creation.
    bool write_data(const Address& addr, const std::vector<uint8_t>& data, ExecError& err);
    bool transfer_lamports(const Address& from, const Address& to, uint64_t amount, ExecError& err);
    // Remove an account owned by the calling program, moving its lamports to `dest`.
    bool close_account(const Address& addr, const Address& dest, ExecError& err);

    // Cross-program call. Each seed list in `signer_seeds` derives an address under the
    // calling program that counts as a signer for the callee.
    bool invoke(const Instruction& ix, const std::vector<SeedList>& signer_seeds, ExecError& err);

    void log(const std::string& line);

    // Entry point for one top-level instruction of a verified transaction
    bool run(const Instruction& ix, ExecError& err);

private:
    struct Frame {
        Address program;
        std::set<Address> signers;
        std::set<Address> writable;
    };

    bool dispatch(const Instruction& ix, Frame frame, ExecError& err);
    bool debit(const Address& from, uint64_t amount, ExecError& err);
    bool credit(const Address& to, uint64_t amount, ExecError& err);

    Overlay& state_;
    const ProgramMap& programs_;
    int64_t now_;
    uint64_t slot_;
    std::vector<std::string>& logs_;
    std::vector<Frame> frames_;
};

}
