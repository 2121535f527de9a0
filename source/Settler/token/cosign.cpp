#include <Settler/token/cosign.hpp>

namespace Settler {

    cosign::cosign (const Bitcoin::address &owner, const Bitcoin::pubkey &approver) :
        Owner {owner.digest ()}, Approver {approver} {}

    Bitcoin::program lock_program (const cosign &c) {
        using namespace Gigamonkey::Bitcoin;
        return program {
            OP_DUP, OP_HASH160, push_data (bytes (c.Owner)), OP_EQUALVERIFY,
            OP_CHECKSIGVERIFY, push_data (bytes (c.Approver)), OP_CHECKSIG};
    }

    bytes lock (const cosign &c) {
        return Bitcoin::compile (lock_program (c));
    }

    bytes unlock (const bytes &owner_signature, const Bitcoin::pubkey &owner) {
        return Bitcoin::compile (Bitcoin::program {
            Bitcoin::push_data (owner_signature),
            Bitcoin::push_data (bytes (owner))});
    }

}
