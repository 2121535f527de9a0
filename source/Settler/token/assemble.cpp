#include <Settler/token/assemble.hpp>
#include <Settler/error.hpp>

namespace Settler {

    bool assembled_transaction::complete () const {
        for (const input &in : Inputs) if (!in.unlocked ()) return false;
        return true;
    }

    assembled_transaction::operator Bitcoin::transaction () const {
        list<Bitcoin::input> inputs;
        for (const input &in : Inputs) inputs <<= Bitcoin::input (in);

        list<Bitcoin::output> outputs;
        for (const Bitcoin::output &out : Outputs) outputs <<= out;

        return Bitcoin::transaction {Version, inputs, outputs, LockTime};
    }

    assembled_transaction::operator extended_transaction () const {
        list<Gigamonkey::extended::input> inputs;
        for (const input &in : Inputs) inputs <<= Gigamonkey::extended::input (in);

        list<Bitcoin::output> outputs;
        for (const Bitcoin::output &out : Outputs) outputs <<= out;

        return extended_transaction {Version, inputs, outputs, LockTime};
    }

    assembled_transaction::operator Bitcoin::incomplete::transaction () const {
        list<Bitcoin::incomplete::input> inputs;
        for (const input &in : Inputs) inputs <<= Bitcoin::incomplete::input (in);

        list<Bitcoin::output> outputs;
        for (const Bitcoin::output &out : Outputs) outputs <<= out;

        return Bitcoin::incomplete::transaction {Version, inputs, outputs, LockTime};
    }

    bytes assembled_transaction::write () const {
        return bytes (Bitcoin::transaction (*this));
    }

    Bitcoin::output token_output (const Bitcoin::address &owner, atomic_amount amount, const token_config &config) {
        return Bitcoin::output {Bitcoin::satoshi {1},
            inscribe (token_record {config.TokenID, amount}, lock_program (cosign {owner, config.Approver}))};
    }

    namespace {
        // the output of the ancestor that the funding source refers to.
        Bitcoin::output prevout (const funding_source &source, ancestor_fetcher &ancestors) {
            Bitcoin::transaction ancestor = ancestors.fetch (source.Outpoint.Digest);

            if (ancestor.id () != source.Outpoint.Digest) throw exception {failure::ancestor_fetch_failed,
                string::write ("ancestor tx does not match ", write_TXID (source.Outpoint.Digest))};

            uint32 index = source.Outpoint.Index;
            if (index >= data::size (ancestor.Outputs)) throw exception {failure::ancestor_fetch_failed,
                string::write ("ancestor ", write_TXID (source.Outpoint.Digest), " has no output ", source.Outpoint.Index)};

            return ancestor.Outputs[index];
        }
    }

    assembled_transaction assemble (const selected &s, list<payment> payments, const token_config &config, ancestor_fetcher &ancestors) {
        assembled_transaction tx {};

        // one at a time, in the order the sources were selected.
        for (const funding_source &source : s.Selected)
            tx.Inputs.push_back (assembled_transaction::input {source, prevout (source, ancestors)});

        for (const payment &p : payments) tx.Outputs.push_back (token_output (p.Address, p.Amount, config));

        if (s.Fee > 0) tx.Outputs.push_back (token_output (config.FeeAddress, s.Fee, config));

        if (s.Change > 0) tx.Outputs.push_back (token_output (s.ChangeAddress, s.Change, config));

        return tx;
    }

}
