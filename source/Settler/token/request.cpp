#include <Settler/token/request.hpp>
#include <Settler/token/amount.hpp>
#include <Settler/error.hpp>

namespace Settler {

    list<payment> read_payments (const transfer_request &r, uint32 decimals) {
        if (data::size (r) == 0) throw exception {failure::invalid_request, "no recipients"};

        list<payment> p;
        for (const recipient &x : r) {
            if (!x.Address.valid ())
                throw exception {failure::invalid_request, string::write ("invalid address ", x.Address)};

            if (!(x.Amount > 0))
                throw exception {failure::invalid_request, string::write ("amount must be positive for ", x.Address)};

            atomic_amount a = to_atomic (x.Amount, decimals);
            if (a <= 0) throw exception {failure::invalid_request,
                string::write ("amount ", x.Amount, " to ", x.Address, " is less than the smallest unit of the token")};

            p <<= payment {x.Address, a};
        }

        return p;
    }

    atomic_amount total (list<payment> p) {
        return data::fold ([] (atomic_amount sum, const payment &x) -> atomic_amount {
            return sum + x.Amount;
        }, atomic_amount {0}, p);
    }

    bool burns (list<payment> p, const Bitcoin::address &burn_address) {
        for (const payment &x : p) if (x.Address == burn_address) return true;
        return false;
    }

    std::ostream &operator << (std::ostream &o, const payment &p) {
        return o << "payment {" << p.Address << ", " << p.Amount << "}";
    }

}
