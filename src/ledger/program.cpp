#include "ledger/program.h"
#include "ledger/programs.h"
#include "constants.h"
#include "log.h"

namespace mpay {

std::optional<AccountRecord> Overlay::get(const Address& a) const {
    auto it = changes_.find(a);
    if (it != changes_.end()) return it->second;
    return base_.fetch(a);
}

void Overlay::set(const Address& a, const AccountRecord& rec) {
    if (rec.exists()) changes_[a] = rec;
    else changes_[a] = std::nullopt;
}

void Overlay::erase(const Address& a) {
    changes_[a] = std::nullopt;
}

InvokeContext::InvokeContext(Overlay& state, const ProgramMap& programs, int64_t now, uint64_t slot,
                             std::vector<std::string>& logs)
    : state_(state), programs_(programs), now_(now), slot_(slot), logs_(logs) {}

const Address& InvokeContext::program_id() const {
    static const Address none;
    return frames_.empty() ? none : frames_.back().program;
}

bool InvokeContext::exists(const Address& a) const {
    auto rec = state_.get(a);
    return rec && rec->exists();
}

bool InvokeContext::is_signer(const Address& a) const {
    return !frames_.empty() && frames_.back().signers.count(a) != 0;
}

bool InvokeContext::is_writable(const Address& a) const {
    return !frames_.empty() && frames_.back().writable.count(a) != 0;
}

void InvokeContext::log(const std::string& line) {
    logs_.push_back(line);
}

bool InvokeContext::debit(const Address& from, uint64_t amount, ExecError& err) {
    if (!is_writable(from)) return fail(err, TxStatus::InvalidArgument, "account " + from.to_base58() + " is not writable");
    auto rec = state_.get(from);
    if (!rec || !rec->exists()) return fail(err, TxStatus::AccountNotFound, "account " + from.to_base58() + " not found");
    bool owned = rec->owner == program_id();
    bool signing_key = rec->owner == system_program_id() && rec->data.empty() && is_signer(from);
    if (!owned && !signing_key)
        return fail(err, TxStatus::InvalidArgument, "program may not debit " + from.to_base58());
    if (rec->lamports < amount)
        return fail(err, TxStatus::InsufficientFunds, "insufficient lamports in " + from.to_base58());
    rec->lamports -= amount;
    state_.set(from, *rec);
    return true;
}

bool InvokeContext::credit(const Address& to, uint64_t amount, ExecError& err) {
    if (!is_writable(to)) return fail(err, TxStatus::InvalidArgument, "account " + to.to_base58() + " is not writable");
    auto rec = state_.get(to);
    AccountRecord r;
    if (rec && rec->exists()) r = *rec;
    else r.owner = system_program_id();
    if (r.lamports + amount < r.lamports) return fail(err, TxStatus::InvalidArgument, "lamport overflow");
    r.lamports += amount;
    state_.set(to, r);
    return true;
}

bool InvokeContext::create_account(const Address& payer, const Address& addr,
                                   const std::vector<uint8_t>& data, ExecError& err) {
    if (data.empty()) return fail(err, TxStatus::InvalidArgument, "account data must not be empty");
    if (!is_writable(addr)) return fail(err, TxStatus::InvalidArgument, "new account " + addr.to_base58() + " is not writable");
    if (!is_signer(payer)) return fail(err, TxStatus::MissingSignature, "reserve payer " + payer.to_base58() + " must sign");
    if (exists(addr)) return fail(err, TxStatus::AccountInUse, "account " + addr.to_base58() + " already in use");

    const uint64_t reserve = reserve_for(data.size());
    if (!debit(payer, reserve, err)) return false;

    AccountRecord rec;
    rec.owner = program_id();
    rec.lamports = reserve;
    rec.data = data;
    state_.set(addr, rec);
    return true;
}

bool InvokeContext::write_data(const Address& addr, const std::vector<uint8_t>& data, ExecError& err) {
    if (!is_writable(addr)) return fail(err, TxStatus::InvalidArgument, "account " + addr.to_base58() + " is not writable");
    auto rec = state_.get(addr);
    if (!rec || !rec->exists()) return fail(err, TxStatus::AccountNotFound, "account " + addr.to_base58() + " not found");
    if (rec->owner != program_id()) return fail(err, TxStatus::InvalidAccountData, "account " + addr.to_base58() + " not owned by caller");
    if (rec->data.size() != data.size()) return fail(err, TxStatus::InvalidAccountData, "account data size is fixed");
    rec->data = data;
    state_.set(addr, *rec);
    return true;
}

bool InvokeContext::transfer_lamports(const Address& from, const Address& to, uint64_t amount, ExecError& err) {
    if (amount == 0) return true;
    if (!debit(from, amount, err)) return false;
    return credit(to, amount, err);
}

bool InvokeContext::close_account(const Address& addr, const Address& dest, ExecError& err) {
    if (addr == dest) return fail(err, TxStatus::InvalidArgument, "cannot close an account into itself");
    if (!is_writable(addr)) return fail(err, TxStatus::InvalidArgument, "account " + addr.to_base58() + " is not writable");
    auto rec = state_.get(addr);
    if (!rec || !rec->exists()) return fail(err, TxStatus::AccountNotFound, "account " + addr.to_base58() + " not found");
    if (rec->owner != program_id()) return fail(err, TxStatus::InvalidAccountData, "account " + addr.to_base58() + " not owned by caller");
    const uint64_t lamports = rec->lamports;
    state_.erase(addr);
    return credit(dest, lamports, err);
}

bool InvokeContext::dispatch(const Instruction& ix, Frame frame, ExecError& err) {
    auto it = programs_.find(ix.program_id);
    if (it == programs_.end())
        return fail(err, TxStatus::UnknownProgram, "unknown program " + ix.program_id.to_base58());
    frames_.push_back(std::move(frame));
    bool ok = it->second->execute(*this, ix, err);
    frames_.pop_back();
    return ok;
}

bool InvokeContext::run(const Instruction& ix, ExecError& err) {
    Frame f;
    f.program = ix.program_id;
    for (const auto& m : ix.accounts) {
        if (m.is_signer) f.signers.insert(m.addr);
        if (m.is_writable) f.writable.insert(m.addr);
    }
    return dispatch(ix, std::move(f), err);
}

bool InvokeContext::invoke(const Instruction& ix, const std::vector<SeedList>& signer_seeds, ExecError& err) {
    if (frames_.empty()) return fail(err, TxStatus::InvalidArgument, "invoke outside of a program");
    if ((int)frames_.size() >= MPAY_MAX_INVOKE_DEPTH)
        return fail(err, TxStatus::InvalidArgument, "call depth exceeded");

    const Frame& caller = frames_.back();
    std::set<Address> derived;
    for (const auto& seeds : signer_seeds) {
        Address a;
        std::string derr;
        if (!derive_program_address(seeds, caller.program, a, &derr))
            return fail(err, TxStatus::InvalidArgument, "bad signer seeds: " + derr);
        derived.insert(a);
    }

    Frame f;
    f.program = ix.program_id;
    for (const auto& m : ix.accounts) {
        if (m.is_signer) {
            if (!caller.signers.count(m.addr) && !derived.count(m.addr))
                return fail(err, TxStatus::MissingSignature, "signer privilege escalated for " + m.addr.to_base58());
            f.signers.insert(m.addr);
        }
        if (m.is_writable) {
            if (!caller.writable.count(m.addr))
                return fail(err, TxStatus::InvalidArgument, "writable privilege escalated for " + m.addr.to_base58());
            f.writable.insert(m.addr);
        }
    }
    MPAY_LOG_TRACE(LogCategory::LEDGER, "invoke " + ix.program_id.to_base58() + " depth " + std::to_string(frames_.size()));
    return dispatch(ix, std::move(f), err);
}

}
