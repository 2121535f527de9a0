#ifndef SETTLER_TOKEN_REQUEST
#define SETTLER_TOKEN_REQUEST

#include <Settler/token/config.hpp>

namespace Settler {

    // someone to be paid an amount of the token, in decimal units.
    struct recipient {
        Bitcoin::address Address;
        double Amount;
    };

    // recipients are paid in the order given.
    using transfer_request = list<recipient>;

    // a recipient with the amount converted to atomic units.
    struct payment {
        Bitcoin::address Address;
        atomic_amount Amount;

        bool operator == (const payment &p) const {
            return Address == p.Address && Amount == p.Amount;
        }
    };

    std::ostream &operator << (std::ostream &, const payment &);

    // convert a request to atomic units, rounding each recipient's amount once.
    // Throws exception {failure::invalid_request} if the request is empty or if
    // any amount or address is invalid.
    list<payment> read_payments (const transfer_request &, uint32 decimals);

    // the amount that the recipients receive, not counting fees.
    atomic_amount total (list<payment>);

    // is any of the payments a burn?
    bool burns (list<payment>, const Bitcoin::address &burn_address);

}

#endif
