#include "hash.h"

#include <openssl/evp.h>
#include <stdexcept>

namespace mpay {

Sha256Writer::Sha256Writer() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

Sha256Writer::~Sha256Writer() {
    EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
}

Sha256Writer& Sha256Writer::write(const uint8_t* p, size_t n) {
    if (n == 0) return *this;
    if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), p, n) != 1)
        throw std::runtime_error("EVP_DigestUpdate failed");
    return *this;
}

Hash256 Sha256Writer::finalize() {
    Hash256 out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), out.data(), &len) != 1 || len != out.size())
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    return out;
}

Hash256 sha256(const uint8_t* p, size_t n) {
    Hash256 out{};
    unsigned int len = 0;
    if (EVP_Digest(p, n, out.data(), &len, EVP_sha256(), nullptr) != 1 || len != out.size())
        throw std::runtime_error("EVP_Digest(sha256) failed");
    return out;
}

Hash256 sha256(const std::vector<uint8_t>& data) { return sha256(data.data(), data.size()); }

Hash256 sha256(const std::string& data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

} // namespace mpay
