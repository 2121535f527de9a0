#ifndef SETTLER_TOKEN_COSIGN
#define SETTLER_TOKEN_COSIGN

#include <Settler/types.hpp>

namespace Settler {

    // An output that can only be spent with signatures from both its owner
    // and the token's approver.
    //
    //   lock:   OP_DUP OP_HASH160 <owner pkh> OP_EQUALVERIFY OP_CHECKSIGVERIFY <approver> OP_CHECKSIG
    //   unlock: <approver sig> <owner sig> <owner pubkey>
    //
    // The owner provides the last two pushes and the cosigner prepends its own.
    struct cosign {
        digest160 Owner;
        Bitcoin::pubkey Approver;

        cosign (const digest160 &owner, const Bitcoin::pubkey &approver) : Owner {owner}, Approver {approver} {}
        cosign (const Bitcoin::address &owner, const Bitcoin::pubkey &approver);
    };

    Bitcoin::program lock_program (const cosign &);

    bytes lock (const cosign &);

    // the owner's part of the unlocking script.
    bytes unlock (const bytes &owner_signature, const Bitcoin::pubkey &owner);

    // size of the owner's unlocking script with a maximum size signature and a compressed key.
    constexpr uint64 owner_unlock_expected_size = 1 + 73 + 1 + 33;

}

#endif
