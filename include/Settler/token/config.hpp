#ifndef SETTLER_TOKEN_CONFIG
#define SETTLER_TOKEN_CONFIG

#include <Settler/types.hpp>

namespace Settler {

    // a fee charged for transfers whose total is within [Min, Max].
    struct fee_tier {
        atomic_amount Min;
        atomic_amount Max;
        atomic_amount Fee;

        bool contains (atomic_amount x) const {
            return x >= Min && x <= Max;
        }

        bool operator == (const fee_tier &t) const {
            return Min == t.Min && Max == t.Max && Fee == t.Fee;
        }
    };

    // network-wide parameters of the token. Fetched again for every operation.
    struct token_config {
        // public key of the cosigner that must approve every transfer.
        Bitcoin::pubkey Approver;

        Bitcoin::address FeeAddress;
        Bitcoin::address BurnAddress;
        Bitcoin::address MintAddress;

        list<fee_tier> Fees;

        uint32 Decimals;

        string TokenID;

        token_config () : Approver {}, FeeAddress {}, BurnAddress {}, MintAddress {}, Fees {}, Decimals {0}, TokenID {} {}
        token_config (const Bitcoin::pubkey &approver,
            const Bitcoin::address &fee_address,
            const Bitcoin::address &burn_address,
            const Bitcoin::address &mint_address,
            list<fee_tier> fees, uint32 decimals, const string &token_id) :
            Approver {approver}, FeeAddress {fee_address}, BurnAddress {burn_address}, MintAddress {mint_address},
            Fees {fees}, Decimals {decimals}, TokenID {token_id} {}

        // throws data::exception if the format is wrong.
        explicit token_config (const JSON &);
        explicit operator JSON () const;

        bool valid () const;

        // the fee for a transfer of a given total, if a tier covers it.
        // The schedule is not checked for gaps or overlaps; the first
        // tier that contains the amount wins.
        maybe<atomic_amount> fee (atomic_amount total) const;
    };

    std::ostream &operator << (std::ostream &, const token_config &);

}

#endif
