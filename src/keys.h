#pragma once
#include <string>
#include <vector>
#include <cstdint>

#include "address.h"
#include "hash.h"
#include "crypto/ecdsa_iface.h"

namespace mpay {

// A signing identity: secp256k1 private key, its compressed public key, and
// the ledger address derived from it. The private key is wiped on destruction.
class KeyPair {
public:
    KeyPair() = default;
    ~KeyPair();
    KeyPair(const KeyPair& o);
    KeyPair& operator=(const KeyPair& o);

    static bool generate(KeyPair& out, std::string& err);
    static bool from_private(const std::vector<uint8_t>& priv32, KeyPair& out, std::string& err);

    bool valid() const { return priv_.size() == 32; }
    const Address& address() const { return address_; }
    const crypto::PubKey33& pubkey() const { return pub_; }

    bool sign(const Hash256& digest, crypto::Sig64& out) const;
    std::string private_hex() const;

private:
    void wipe();

    std::vector<uint8_t> priv_;
    crypto::PubKey33 pub_{};
    Address address_;
};

// Key file: key=value lines "priv=<hex>", "pub=<hex>", "address=<base58>".
// On load the address is recomputed and must match if present.
bool save_key_file(const std::string& path, const KeyPair& key, std::string& err);
bool load_key_file(const std::string& path, KeyPair& out, std::string& err);

}
