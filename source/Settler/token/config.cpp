#include <Settler/token/config.hpp>

namespace Settler {

    namespace {
        const JSON &field (const JSON &j, const char *name) {
            auto x = j.find (name);
            if (x == j.end ()) throw data::exception {} << "token config is missing field " << name;
            return *x;
        }

        fee_tier read_fee_tier (const JSON &j) {
            if (!j.is_object ()) throw data::exception {} << "invalid fee tier format";
            return fee_tier {int64 (field (j, "min")), int64 (field (j, "max")), int64 (field (j, "fee"))};
        }
    }

    token_config::token_config (const JSON &j) : token_config {} {
        if (!j.is_object ()) throw data::exception {} << "invalid token config format";

        Approver = Bitcoin::pubkey {std::string (field (j, "approver"))};
        FeeAddress = Bitcoin::address {std::string (field (j, "feeAddress"))};
        BurnAddress = Bitcoin::address {std::string (field (j, "burnAddress"))};
        MintAddress = Bitcoin::address {std::string (field (j, "mintAddress"))};

        const JSON &fees = field (j, "fees");
        if (!fees.is_array ()) throw data::exception {} << "invalid fee schedule format";
        for (const JSON &tier : fees) Fees <<= read_fee_tier (tier);

        Decimals = uint32 (field (j, "decimals"));
        TokenID = std::string (field (j, "tokenId"));

        if (!valid ()) throw data::exception {} << "invalid token config " << j;
    }

    token_config::operator JSON () const {
        JSON::array_t fees;
        fees.resize (Fees.size ());
        int index = 0;
        for (const fee_tier &t : Fees) fees[index++] = JSON {{"min", t.Min}, {"max", t.Max}, {"fee", t.Fee}};

        JSON::object_t j;
        j["approver"] = string (Approver);
        j["feeAddress"] = static_cast<const std::string &> (FeeAddress);
        j["burnAddress"] = static_cast<const std::string &> (BurnAddress);
        j["mintAddress"] = static_cast<const std::string &> (MintAddress);
        j["fees"] = fees;
        j["decimals"] = Decimals;
        j["tokenId"] = static_cast<const std::string &> (TokenID);
        return j;
    }

    bool token_config::valid () const {
        return Approver.valid () && FeeAddress.valid () && BurnAddress.valid () && TokenID != "";
    }

    maybe<atomic_amount> token_config::fee (atomic_amount total) const {
        for (const fee_tier &t : Fees) if (t.contains (total)) return t.Fee;
        return {};
    }

    std::ostream &operator << (std::ostream &o, const token_config &c) {
        o << "token " << c.TokenID << " {decimals: " << c.Decimals << ", approver: " << c.Approver <<
            ", fee address: " << c.FeeAddress << ", burn address: " << c.BurnAddress << ", fees: [";
        bool first = true;
        for (const fee_tier &t : c.Fees) {
            if (!first) o << ", ";
            o << "[" << t.Min << ", " << t.Max << "]: " << t.Fee;
            first = false;
        }
        return o << "]}";
    }

}
