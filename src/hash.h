#pragma once
#include <array>
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace mpay {

using Hash256 = std::array<uint8_t, 32>;

// Streaming SHA-256 (OpenSSL EVP underneath)
class Sha256Writer {
public:
    Sha256Writer();
    ~Sha256Writer();
    Sha256Writer(const Sha256Writer&) = delete;
    Sha256Writer& operator=(const Sha256Writer&) = delete;

    Sha256Writer& write(const uint8_t* p, size_t n);
    Sha256Writer& write(const std::vector<uint8_t>& v) { return write(v.data(), v.size()); }
    Sha256Writer& write(const std::string& s) { return write(reinterpret_cast<const uint8_t*>(s.data()), s.size()); }
    template <size_t N>
    Sha256Writer& write(const std::array<uint8_t, N>& a) { return write(a.data(), a.size()); }

    Hash256 finalize();

private:
    void* ctx_;   // EVP_MD_CTX*
};

Hash256 sha256(const uint8_t* p, size_t n);
Hash256 sha256(const std::vector<uint8_t>& data);
Hash256 sha256(const std::string& data);

} // namespace mpay
