#pragma once
#include "address.h"

namespace mpay {

// Well-known program ids (see program_id_from_name)
const Address& system_program_id();        // owner of plain key accounts
const Address& token_program_id();         // funding accounts
const Address& associated_program_id();    // derivation namespace of associated funding accounts
const Address& escrow_program_id();

}
