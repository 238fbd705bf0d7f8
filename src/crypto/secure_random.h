#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace mpay {

// Fills `out` from the OS CSPRNG (getrandom, falling back to /dev/urandom)
bool secure_random(uint8_t* out, size_t len, std::string* err = nullptr);

}
