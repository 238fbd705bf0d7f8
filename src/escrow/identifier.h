#pragma once
#include <string>

#include "hash.h"

namespace mpay {

// Trimmed, lowercased form of a recipient identifier (an email address)
std::string normalize_identifier(const std::string& identifier);

// SHA-256 of the normalized identifier; the only form stored on the ledger
Hash256 identifier_hash(const std::string& identifier);

// Non-empty and shaped like an address: local@domain
bool validate_identifier(const std::string& identifier, std::string& err);

}
