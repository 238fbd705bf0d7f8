#include "ledger/programs.h"

namespace mpay {

const Address& system_program_id() {
    static const Address id = program_id_from_name("system");
    return id;
}

const Address& token_program_id() {
    static const Address id = program_id_from_name("token");
    return id;
}

const Address& associated_program_id() {
    static const Address id = program_id_from_name("associated-token");
    return id;
}

const Address& escrow_program_id() {
    static const Address id = program_id_from_name("escrow");
    return id;
}

}
