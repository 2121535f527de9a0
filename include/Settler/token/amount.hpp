#ifndef SETTLER_TOKEN_AMOUNT
#define SETTLER_TOKEN_AMOUNT

#include <Settler/types.hpp>

namespace Settler {

    // atomic = round (decimal * 10^decimals)
    atomic_amount to_atomic (double decimal, uint32 decimals);

    double to_decimal (atomic_amount, uint32 decimals);

    // write an atomic amount with exactly as many digits after
    // the point as the token has decimals.
    std::string write_decimal (atomic_amount, uint32 decimals);

    // read a decimal amount as typed by a user.
    maybe<double> read_decimal (const std::string &);

}

#endif
