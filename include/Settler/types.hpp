#ifndef SETTLER_TYPES
#define SETTLER_TYPES

#include <data/tools.hpp>
#include <data/math.hpp>
#include <data/numbers.hpp>
#include <data/net/JSON.hpp>
#include <data/io/exception.hpp>
#include <Gigamonkey.hpp>

namespace Settler {
    using namespace data;
    namespace Bitcoin = Gigamonkey::Bitcoin;
    namespace secp256k1 = Gigamonkey::secp256k1;
    using digest256 = Gigamonkey::digest256;
    using digest160 = Gigamonkey::digest160;
    using extended_transaction = Gigamonkey::extended::transaction;

    // an amount of the token in its smallest indivisible unit.
    using atomic_amount = int64;

    // txids as they are written by the indexing services, which is
    // the usual reversed hex without a 0x prefix.
    std::string write_TXID (const Bitcoin::TXID &);
    Bitcoin::TXID read_TXID (const std::string &);

    std::string inline write_TXID (const Bitcoin::TXID &txid) {
        std::stringstream ss;
        ss << txid;
        return ss.str ().substr (2);
    }

    Bitcoin::TXID inline read_TXID (const std::string &x) {
        return Bitcoin::TXID {std::string {"0x"} + x};
    }
}

#endif
