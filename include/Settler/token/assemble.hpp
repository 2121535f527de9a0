#ifndef SETTLER_TOKEN_ASSEMBLE
#define SETTLER_TOKEN_ASSEMBLE

#include <Settler/token/select.hpp>
#include <Settler/token/request.hpp>
#include <Settler/token/cosign.hpp>
#include <Settler/token/inscription.hpp>

namespace Settler {

    // retrieves the transactions that created the outputs we spend.
    struct ancestor_fetcher {
        // throws exception {failure::ancestor_not_found} if the
        // service does not know the tx and exception
        // {failure::ancestor_fetch_failed} for any other problem.
        virtual Bitcoin::transaction fetch (const Bitcoin::TXID &) = 0;
        virtual ~ancestor_fetcher () {}
    };

    // a transaction whose inputs may not be signed yet.
    struct assembled_transaction {

        struct input {
            funding_source Source;

            // the output being spent, taken from the ancestor tx.
            Bitcoin::output Prevout;

            // empty until signed.
            bytes Script;

            uint32_little Sequence;

            input (const funding_source &source, const Bitcoin::output &prevout) :
                Source {source}, Prevout {prevout}, Script {}, Sequence {Bitcoin::input::Finalized} {}

            bool unlocked () const {
                return Script.size () != 0;
            }

            explicit operator Bitcoin::input () const {
                return Bitcoin::input {Source.Outpoint, Script, Sequence};
            }

            explicit operator Gigamonkey::extended::input () const {
                return Gigamonkey::extended::input {Prevout, Bitcoin::input (*this)};
            }

            explicit operator Bitcoin::incomplete::input () const {
                return Bitcoin::incomplete::input {Source.Outpoint, Sequence};
            }
        };

        int32_little Version;
        cross<input> Inputs;
        cross<Bitcoin::output> Outputs;
        uint32_little LockTime;

        assembled_transaction () : Version {1}, Inputs {}, Outputs {}, LockTime {0} {}

        // every input has an unlocking script.
        bool complete () const;

        explicit operator Bitcoin::transaction () const;

        // the extended format includes the value and script of every
        // output being spent.
        explicit operator extended_transaction () const;

        // what gets signed. Unlocking scripts are left out.
        explicit operator Bitcoin::incomplete::transaction () const;

        // serialized in the standard format.
        bytes write () const;
    };

    // a one-satoshi output carrying an amount of the token, spendable by
    // the owner together with the approver.
    Bitcoin::output token_output (const Bitcoin::address &owner, atomic_amount, const token_config &);

    // Outputs are written in this order, which the indexer relies on:
    //   one per payment in request order, then
    //   the fee (if the fee is not zero), then
    //   the change (if there is any).
    assembled_transaction assemble (const selected &, list<payment>, const token_config &, ancestor_fetcher &);

}

#endif
