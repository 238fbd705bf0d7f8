#include "keys.h"
#include "hex.h"
#include "log.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace mpay {

KeyPair::~KeyPair() { wipe(); }

KeyPair::KeyPair(const KeyPair& o) : priv_(o.priv_), pub_(o.pub_), address_(o.address_) {}

KeyPair& KeyPair::operator=(const KeyPair& o) {
    if (this != &o) {
        wipe();
        priv_ = o.priv_;
        pub_ = o.pub_;
        address_ = o.address_;
    }
    return *this;
}

void KeyPair::wipe() {
    if (!priv_.empty()) {
        volatile uint8_t* p = priv_.data();
        for (size_t i = 0; i < priv_.size(); ++i) p[i] = 0;
        priv_.clear();
    }
}

bool KeyPair::generate(KeyPair& out, std::string& err) {
    std::vector<uint8_t> priv;
    if (!crypto::ECDSA::generate_priv(priv)) { err = "key generation failed (rng)"; return false; }
    bool ok = from_private(priv, out, err);
    std::fill(priv.begin(), priv.end(), 0);
    return ok;
}

bool KeyPair::from_private(const std::vector<uint8_t>& priv32, KeyPair& out, std::string& err) {
    crypto::PubKey33 pub{};
    if (!crypto::ECDSA::derive_pub(priv32, pub)) { err = "invalid private key"; return false; }
    out.wipe();
    out.priv_ = priv32;
    out.pub_ = pub;
    out.address_ = key_address(pub);
    return true;
}

bool KeyPair::sign(const Hash256& digest, crypto::Sig64& out) const {
    if (!valid()) return false;
    return crypto::ECDSA::sign_compact(digest.data(), priv_, out);
}

std::string KeyPair::private_hex() const {
    return to_hex(priv_);
}

static inline std::string trim(const std::string& s){
    auto a = s.find_first_not_of(" \t\r\n");
    if(a==std::string::npos) return "";
    auto b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b-a+1);
}

bool save_key_file(const std::string& path, const KeyPair& key, std::string& err) {
    if (!key.valid()) { err = "no key material"; return false; }
    const std::string tmp = path + ".tmp";
    {
        std::ofstream f(tmp, std::ios::out | std::ios::trunc);
        if (!f.is_open()) { err = "cannot write " + tmp; return false; }
        f << "priv=" << key.private_hex() << "\n";
        f << "pub=" << to_hex(key.pubkey().data(), key.pubkey().size()) << "\n";
        f << "address=" << key.address().to_base58() << "\n";
        f.flush();
        if (!f) { err = "write failed: " + tmp; return false; }
    }
    ::chmod(tmp.c_str(), 0600);
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        ::unlink(tmp.c_str());
        err = "rename failed: " + path;
        return false;
    }
    return true;
}

bool load_key_file(const std::string& path, KeyPair& out, std::string& err) {
    std::ifstream f(path);
    if (!f.is_open()) { err = "cannot open key file " + path; return false; }

    std::string priv_hex, addr_b58, line;
    while (std::getline(f, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string k = trim(line.substr(0, eq));
        std::string v = trim(line.substr(eq + 1));
        if (k == "priv") priv_hex = v;
        else if (k == "address") addr_b58 = v;
    }

    std::vector<uint8_t> priv = from_hex(priv_hex);
    if (priv.size() != 32) { err = "key file " + path + " has no valid priv= line"; return false; }
    bool ok = KeyPair::from_private(priv, out, err);
    std::fill(priv.begin(), priv.end(), 0);
    if (!ok) return false;

    if (!addr_b58.empty() && addr_b58 != out.address().to_base58()) {
        err = "key file " + path + ": address does not match private key";
        return false;
    }
    MPAY_LOG_DEBUG(LogCategory::GENERAL, "loaded key " + out.address().to_base58() + " from " + path);
    return true;
}

}
