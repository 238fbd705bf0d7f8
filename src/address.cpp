#include "address.h"
#include "base58.h"
#include "hash.h"

#include <cstring>

namespace mpay {

static const char PDA_MARKER[] = "ProgramDerivedAddress";

bool Address::is_zero() const {
    for (uint8_t b : bytes) if (b) return false;
    return true;
}

std::string Address::to_base58() const {
    return base58_encode(bytes.data(), bytes.size());
}

bool Address::from_base58(const std::string& s, Address& out) {
    std::vector<uint8_t> raw;
    if (!base58_decode(s, raw) || raw.size() != out.bytes.size()) return false;
    std::memcpy(out.bytes.data(), raw.data(), raw.size());
    return true;
}

Address Address::from_bytes(const uint8_t* p) {
    Address a;
    std::memcpy(a.bytes.data(), p, a.bytes.size());
    return a;
}

size_t AddressHasher::operator()(const Address& a) const noexcept {
    // Addresses are hash outputs already; the first word is uniform enough
    size_t h = 0;
    std::memcpy(&h, a.bytes.data(), sizeof(h));
    return h;
}

Address key_address(const crypto::PubKey33& pub) {
    Address a;
    a.bytes = Sha256Writer().write(std::string("mailpay/key")).write(pub).finalize();
    return a;
}

Address program_id_from_name(const std::string& name) {
    Address a;
    a.bytes = sha256("mailpay/program/" + name);
    return a;
}

bool derive_program_address(const std::vector<std::vector<uint8_t>>& seeds,
                            const Address& program,
                            Address& out,
                            std::string* err) {
    if (seeds.size() > MAX_SEEDS) {
        if (err) *err = "too many seeds";
        return false;
    }
    Sha256Writer w;
    for (const auto& s : seeds) {
        if (s.size() > MAX_SEED_LEN) {
            if (err) *err = "seed longer than 32 bytes";
            return false;
        }
        w.write(s);
    }
    w.write(program.bytes);
    w.write(reinterpret_cast<const uint8_t*>(PDA_MARKER), sizeof(PDA_MARKER) - 1);
    out.bytes = w.finalize();
    return true;
}

std::vector<uint8_t> seed_of(const Address& a) {
    return std::vector<uint8_t>(a.bytes.begin(), a.bytes.end());
}

std::vector<uint8_t> seed_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::vector<uint8_t> seed_of_u64le(uint64_t v) {
    std::vector<uint8_t> out(8);
    for (int i = 0; i < 8; ++i) out[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xff);
    return out;
}

}
