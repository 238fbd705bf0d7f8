#pragma once
#include <cstdint>
#include <string>

namespace mpay {

// Token amounts: base units with 6 decimals. format_amount(1234567) == "1.234567"
std::string format_amount(uint64_t base_units);
// Accepts "12", "12.5", ".5", "0.000001"; rejects signs, exponents, more than 6 decimals, overflow
bool parse_amount(const std::string& s, uint64_t& out, std::string& err);

}
