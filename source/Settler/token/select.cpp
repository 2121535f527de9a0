#include <Settler/token/select.hpp>
#include <Settler/error.hpp>

namespace Settler {

    atomic_amount transfer_fee (atomic_amount target, list<fee_tier> tiers, bool burn) {
        if (burn) return 0;
        for (const fee_tier &t : tiers) if (t.contains (target)) return t.Fee;
        throw exception {failure::fee_schedule_gap, string::write ("no fee tier covers a transfer of ", target)};
    }

    selected select_funding (list<funding_source> available, atomic_amount target, list<fee_tier> tiers, bool burn) {

        if (target <= 0) throw exception {failure::invalid_request, string::write ("invalid amount to send: ", target)};

        atomic_amount fee = transfer_fee (target, tiers, burn);
        atomic_amount required = target + fee;

        list<funding_source> consumed;
        atomic_amount spent = 0;

        while (spent < required) {
            if (data::size (available) == 0) throw exception {failure::insufficient_funds,
                string::write ("insufficient token balance: ", spent, " < ", required)};

            funding_source next = available.first ();
            consumed <<= next;
            spent += next.Amount;
            available = available.rest ();
        }

        return selected {consumed, available, target, fee, spent - required, consumed.first ().Owner};
    }

}
