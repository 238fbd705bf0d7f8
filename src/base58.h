#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace mpay {
std::string base58_encode(const uint8_t* p, size_t n);
std::string base58_encode(const std::vector<uint8_t>& in);
// Rejects characters outside the alphabet
bool base58_decode(const std::string& s, std::vector<uint8_t>& out);
}
