#include <Settler/token/sign.hpp>
#include <Settler/error.hpp>

namespace Settler {

    signature_request::signature_request (const JSON &j) :
        PrevTXID {read_TXID (std::string (j.at ("prevTxid")))},
        OutputIndex {uint32 (j.at ("outputIndex"))},
        InputIndex {uint32 (j.at ("inputIndex"))},
        Owner {std::string (j.at ("address"))},
        Script {},
        Satoshis {int64 (j.at ("satoshis"))},
        Sighash {Bitcoin::sighash::directive (uint32 (j.at ("sigHashType")))} {
        maybe<bytes> script = encoding::hex::read (std::string (j.at ("script")));
        if (!bool (script)) throw data::exception {} << "invalid script in signature request";
        Script = *script;
    }

    signature_request::operator JSON () const {
        return JSON {
            {"prevTxid", write_TXID (PrevTXID)},
            {"outputIndex", OutputIndex},
            {"inputIndex", InputIndex},
            {"address", std::string (Owner)},
            {"script", encoding::hex::write (Script)},
            {"satoshis", int64 (Satoshis)},
            {"sigHashType", uint32 (Sighash)}};
    }

    signature_response::operator JSON () const {
        return JSON {
            {"inputIndex", InputIndex},
            {"sig", encoding::hex::write (Signature)},
            {"pubKey", encoding::hex::write (bytes (Pubkey))},
            {"sigHashType", uint32 (Sighash)}};
    }

    list<signature_request> signature_requests (const assembled_transaction &tx) {
        list<signature_request> requests;
        uint32 index = 0;
        for (const assembled_transaction::input &in : tx.Inputs) {
            requests <<= signature_request {in.Source.Outpoint.Digest, uint32 (in.Source.Outpoint.Index), index,
                in.Source.Owner, in.Prevout.Script, in.Prevout.Value};
            index++;
        }

        return requests;
    }

    Bitcoin::sighash::document document (const assembled_transaction &tx, const signature_request &r) {
        if (r.InputIndex >= tx.Inputs.size ()) throw exception {failure::signing_failed,
            string::write ("no input ", r.InputIndex, " to sign")};

        if (r.Sighash != transfer_directive) throw exception {failure::signing_failed,
            string::write ("unsupported sighash type ", uint32 (r.Sighash))};

        return Bitcoin::sighash::document {Bitcoin::incomplete::transaction (tx), r.InputIndex, r.Satoshis, r.Script};
    }

    digest256 signature_hash (const assembled_transaction &tx, const signature_request &r) {
        return Bitcoin::signature::hash (document (tx, r), r.Sighash);
    }

    signature_response sign (const assembled_transaction &tx, const signature_request &r, const Bitcoin::secret &key) {
        if (!key.valid ()) throw exception {failure::signing_failed, "invalid signing key"};

        Bitcoin::pubkey pubkey = key.to_public ();
        if (key.address ().digest () != r.Owner.digest ()) throw exception {failure::signing_failed,
            string::write ("key does not belong to ", r.Owner, " which owns input ", r.InputIndex)};

        // RFC 6979 nonces, so the same input always gets the same signature.
        Bitcoin::signature sig = key.sign (document (tx, r), r.Sighash);

        return signature_response {r.InputIndex, bytes (sig), pubkey, r.Sighash};
    }

    list<signature_response> sign (const assembled_transaction &tx, list<signature_request> requests, const Bitcoin::secret &key) {
        list<signature_response> responses;
        for (const signature_request &r : requests) responses <<= sign (tx, r, key);
        return responses;
    }

    assembled_transaction apply_signatures (assembled_transaction tx, list<signature_response> responses) {
        for (const signature_response &r : responses) {
            if (r.InputIndex >= tx.Inputs.size ()) throw exception {failure::signing_failed,
                string::write ("signature addresses input ", r.InputIndex, " but the tx has ", tx.Inputs.size (), " inputs")};

            assembled_transaction::input &in = tx.Inputs[r.InputIndex];
            if (in.unlocked ()) throw exception {failure::signing_failed,
                string::write ("input ", r.InputIndex, " is already signed")};

            in.Script = unlock (r.Signature, r.Pubkey);
        }

        if (!tx.complete ()) throw exception {failure::signing_failed, "not every input was signed"};

        return tx;
    }

}
