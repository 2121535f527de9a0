#include <Settler/token/funding.hpp>
#include <Settler/token/amount.hpp>
#include <data/encoding/base64.hpp>

namespace Settler {

    operation read_operation (const std::string &x) {
        std::string op = data::to_lower (x);
        if (op == "transfer") return operation::transfer;
        if (op == "burn") return operation::burn;
        if (op == "deploy+mint") return operation::deploy_mint;
        return operation::invalid;
    }

    std::ostream &operator << (std::ostream &o, operation x) {
        switch (x) {
            case operation::transfer: return o << "transfer";
            case operation::burn: return o << "burn";
            case operation::deploy_mint: return o << "deploy+mint";
            default: return o << "invalid";
        }
    }

    funding_source::funding_source () :
        Outpoint {}, Owner {}, Amount {0}, Operation {operation::invalid}, Score {0}, Satoshis {0}, Script {} {}

    funding_source::funding_source (const JSON &j) : funding_source {} {
        if (!j.is_object ()) throw data::exception {} << "invalid funding source format";

        Outpoint = Bitcoin::outpoint {read_TXID (std::string (j.at ("txid"))), uint32 (j.at ("vout"))};

        const JSON &owners = j.at ("owners");
        if (!owners.is_array () || owners.size () == 0) throw data::exception {} << "funding source has no owner";
        Owner = Bitcoin::address {std::string (owners[0])};

        const JSON &token = j.at ("data").at ("bsv21");
        Amount = int64 (token.at ("amt"));
        Operation = read_operation (std::string (token.at ("op")));

        if (j.contains ("score") && j["score"].is_number ()) Score = double (j["score"]);
        if (j.contains ("satoshis")) Satoshis = Bitcoin::satoshi {int64 (j["satoshis"])};

        if (j.contains ("script") && j["script"].is_string ()) {
            maybe<bytes> script = encoding::base64::read (std::string (j["script"]));
            if (bool (script)) Script = *script;
        }
    }

    funding_source::operator JSON () const {
        std::stringstream op;
        op << Operation;

        JSON::object_t j;
        j["txid"] = write_TXID (Outpoint.Digest);
        j["vout"] = uint32 (Outpoint.Index);
        j["owners"] = JSON::array_t {static_cast<const std::string &> (Owner)};
        j["data"] = JSON {{"bsv21", JSON {{"amt", Amount}, {"op", op.str ()}}}};
        j["score"] = Score;
        j["satoshis"] = int64 (Satoshis);
        if (Script.size () != 0) j["script"] = encoding::base64::write (Script);
        return j;
    }

    std::ostream &operator << (std::ostream &o, const funding_source &f) {
        return o << "funding_source {" << f.Outpoint << ", " << f.Owner << ", " << f.Amount << ", " << f.Operation << "}";
    }

    list<funding_source> filter_funding (list<funding_source> sources, const funding_filter &ops) {
        if (data::size (ops) == 0) return sources;
        list<funding_source> kept;
        for (const funding_source &f : sources)
            for (const operation &o : ops) if (f.Operation == o) {
                kept <<= f;
                break;
            }
        return kept;
    }

    atomic_amount total_amount (list<funding_source> sources) {
        return data::fold ([] (atomic_amount sum, const funding_source &f) -> atomic_amount {
            return sum + f.Amount;
        }, atomic_amount {0}, sources);
    }

    balance balance_of (list<funding_source> sources, uint32 decimals) {
        atomic_amount amount = total_amount (filter_funding (sources, {operation::transfer}));
        return balance {amount, to_decimal (amount, decimals)};
    }

}
