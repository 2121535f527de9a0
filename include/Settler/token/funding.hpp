#ifndef SETTLER_TOKEN_FUNDING
#define SETTLER_TOKEN_FUNDING

#include <Settler/types.hpp>

namespace Settler {

    // the token operation that created an output.
    enum class operation {
        invalid,
        transfer,
        burn,
        deploy_mint
    };

    // case insensitive.
    operation read_operation (const std::string &);

    std::ostream &operator << (std::ostream &, operation);

    // a spendable output carrying a balance of the token.
    struct funding_source {
        Bitcoin::outpoint Outpoint;

        // the first owner listed by the indexer.
        Bitcoin::address Owner;

        atomic_amount Amount;
        operation Operation;

        // the indexer's ranking. Sources are used in the order the
        // indexer returns them.
        double Score;

        Bitcoin::satoshi Satoshis;

        // locking script of the output, if the indexer provided it.
        bytes Script;

        funding_source ();
        funding_source (const Bitcoin::outpoint &op, const Bitcoin::address &owner, atomic_amount amount,
            operation o = operation::transfer, double score = 0, Bitcoin::satoshi sats = 1, const bytes &script = {}) :
            Outpoint {op}, Owner {owner}, Amount {amount}, Operation {o}, Score {score}, Satoshis {sats}, Script {script} {}

        // the format returned by the token indexer.
        explicit funding_source (const JSON &);
        explicit operator JSON () const;

        bool valid () const {
            return Owner.valid () && Amount > 0 && Operation != operation::invalid;
        }

        bool operator == (const funding_source &f) const {
            return Outpoint == f.Outpoint && Owner == f.Owner && Amount == f.Amount && Operation == f.Operation;
        }
    };

    std::ostream &operator << (std::ostream &, const funding_source &);

    using funding_filter = list<operation>;

    // transfer and deploy+mint outputs can be spent in a transfer.
    funding_filter inline default_funding_filter () {
        return funding_filter {operation::transfer, operation::deploy_mint};
    }

    // keep the sources whose operation is in the filter, in their
    // original order. An empty filter keeps everything.
    list<funding_source> filter_funding (list<funding_source>, const funding_filter &);

    atomic_amount total_amount (list<funding_source>);

    // the balance of an address. Only transfer outputs are counted.
    struct balance {
        atomic_amount Amount;
        double Decimal;
    };

    balance balance_of (list<funding_source>, uint32 decimals);

}

#endif
