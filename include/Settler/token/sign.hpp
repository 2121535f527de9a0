#ifndef SETTLER_TOKEN_SIGN
#define SETTLER_TOKEN_SIGN

#include <Settler/token/assemble.hpp>

namespace Settler {

    // other inputs may be added to a transfer after we sign it.
    const Bitcoin::sighash::directive transfer_directive =
        Bitcoin::sighash::directive (Bitcoin::sighash::all | Bitcoin::sighash::anyone_can_pay | Bitcoin::sighash::fork_id);

    // everything needed to sign one input.
    struct signature_request {
        Bitcoin::TXID PrevTXID;
        uint32 OutputIndex;
        uint32 InputIndex;
        Bitcoin::address Owner;

        // locking script and value of the output being spent.
        bytes Script;
        Bitcoin::satoshi Satoshis;

        Bitcoin::sighash::directive Sighash;

        signature_request (const Bitcoin::TXID &prev, uint32 output_index, uint32 input_index,
            const Bitcoin::address &owner, const bytes &script, Bitcoin::satoshi sats,
            Bitcoin::sighash::directive sighash_type = transfer_directive) :
            PrevTXID {prev}, OutputIndex {output_index}, InputIndex {input_index}, Owner {owner},
            Script {script}, Satoshis {sats}, Sighash {sighash_type} {}

        explicit signature_request (const JSON &);
        explicit operator JSON () const;
    };

    struct signature_response {
        uint32 InputIndex;

        // DER signature followed by the sighash byte.
        bytes Signature;
        Bitcoin::pubkey Pubkey;
        Bitcoin::sighash::directive Sighash;

        explicit operator JSON () const;
    };

    // one request per input, in input order.
    list<signature_request> signature_requests (const assembled_transaction &);

    // what the signature for the given input commits to.
    // throws exception {failure::signing_failed} if the request does not
    // address an input of the tx or uses a directive other than ours.
    Bitcoin::sighash::document document (const assembled_transaction &, const signature_request &);

    digest256 signature_hash (const assembled_transaction &, const signature_request &);

    // throws exception {failure::signing_failed}.
    signature_response sign (const assembled_transaction &, const signature_request &, const Bitcoin::secret &);

    list<signature_response> sign (const assembled_transaction &, list<signature_request>, const Bitcoin::secret &);

    // put <signature> <pubkey> into the input that each response addresses.
    // Throws exception {failure::signing_failed} if a response addresses an
    // input that doesn't exist or that already has an unlocking script, or
    // if any input is left unsigned.
    assembled_transaction apply_signatures (assembled_transaction, list<signature_response>);

}

#endif
