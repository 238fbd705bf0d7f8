#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "address.h"
#include "ledger/program.h"

namespace mpay {

// Balance of one fungible asset held by one owner
struct FundingAccount {
    Address kind;
    Address owner;
    uint64_t amount{0};
};

// Description of a fungible asset, stored at token_kind_address(name)
struct TokenKindInfo {
    uint8_t decimals{0};
    uint64_t supply{0};
    std::string name;
};

std::vector<uint8_t> encode_funding_account(const FundingAccount& f);
bool decode_funding_account(const std::vector<uint8_t>& data, FundingAccount& out);
std::vector<uint8_t> encode_token_kind(const TokenKindInfo& k);
bool decode_token_kind(const std::vector<uint8_t>& data, TokenKindInfo& out);

// Address of the asset called `name` (at most 32 bytes)
bool token_kind_address(const std::string& name, Address& out, std::string* err = nullptr);
// Associated funding account of (owner, kind)
Address associated_funding_address(const Address& owner, const Address& kind);

enum class TokenIx : uint8_t {
    CreateAssociated = 0,   // [payer s w, account w, owner r, kind r]
    Transfer         = 1,   // [from w, to w, authority s] amount:u64
    Close            = 2,   // [account w, destination w, authority s]
};

Instruction make_create_associated(const Address& payer, const Address& owner, const Address& kind);
Instruction make_token_transfer(const Address& from, const Address& to, const Address& authority, uint64_t amount);
Instruction make_token_close(const Address& account, const Address& destination, const Address& authority);

// The funding-account program
class TokenProgram : public Program {
public:
    const Address& id() const override;
    const char* name() const override { return "token"; }
    bool execute(InvokeContext& ctx, const Instruction& ix, ExecError& err) override;

private:
    bool create_associated(InvokeContext& ctx, const Instruction& ix, ExecError& err);
    bool transfer(InvokeContext& ctx, const Instruction& ix, uint64_t amount, ExecError& err);
    bool close(InvokeContext& ctx, const Instruction& ix, ExecError& err);
};

}
