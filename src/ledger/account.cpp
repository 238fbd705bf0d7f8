#include "ledger/account.h"
#include "constants.h"
#include "serialize.h"

namespace mpay {

std::string encode_account(const AccountRecord& a) {
    ByteWriter w;
    w.address(a.owner);
    w.u64(a.lamports);
    w.var(a.data);
    const auto& b = w.bytes();
    return std::string(b.begin(), b.end());
}

bool decode_account(const std::string& raw, AccountRecord& out) {
    ByteReader r(raw);
    if (!r.address(out.owner)) return false;
    if (!r.u64(out.lamports)) return false;
    if (!r.var(out.data)) return false;
    return r.done();
}

uint64_t reserve_for(size_t data_len) {
    return (uint64_t(MPAY_RESERVE_OVERHEAD_BYTES) + uint64_t(data_len)) * MPAY_RESERVE_LAMPORTS_PER_BYTE;
}

}
