#ifndef SETTLER_TOKEN_SELECT
#define SETTLER_TOKEN_SELECT

#include <Settler/token/funding.hpp>
#include <Settler/token/config.hpp>

namespace Settler {

    struct selected {
        // sources to be spent, in the order they were consumed.
        list<funding_source> Selected;

        // sources that were not needed.
        list<funding_source> Rest;

        atomic_amount Target;
        atomic_amount Fee;
        atomic_amount Change;

        // change goes back to the owner of the first source consumed.
        Bitcoin::address ChangeAddress;

        atomic_amount spent () const {
            return total_amount (Selected);
        }
    };

    // the fee for sending a total of target. Burns are free. Throws
    // exception {failure::fee_schedule_gap} if no tier contains the target.
    atomic_amount transfer_fee (atomic_amount target, list<fee_tier>, bool burn);

    // select funding sources sufficient for target plus the fee. Sources are
    // consumed in the order given until they cover the total; nothing is done
    // to minimize the number of inputs.
    selected select_funding (list<funding_source>, atomic_amount target, list<fee_tier>, bool burn);

}

#endif
