#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace mpay {
// Empty vector on odd length or non-hex characters
std::vector<uint8_t> from_hex(const std::string& hex);
std::string to_hex(const uint8_t* p, size_t n);
std::string to_hex(const std::vector<uint8_t>& v);
}
