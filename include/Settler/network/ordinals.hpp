#ifndef SETTLER_NETWORK_ORDINALS
#define SETTLER_NETWORK_ORDINALS

#include <data/net/HTTP_client.hpp>
#include <gigamonkey/pay/BEEF.hpp>
#include <Settler/token/assemble.hpp>
#include <Settler/network/broadcast.hpp>
#include <Settler/network/token_service.hpp>

namespace Settler {

    // the ordinals indexer, which serves transactions in BEEF
    // format and broadcasts to the network.
    struct ordinals final : ancestor_fetcher, broadcaster, net::HTTP::client_blocking {

        ordinals (ptr<net::HTTP::SSL> ssl, const endpoints &e) :
            net::HTTP::client_blocking {ssl, net::HTTP::REST {e.Scheme, e.OrdinalsHost}, tools::rate_limiter {3, 1}} {}

        Bitcoin::transaction fetch (const Bitcoin::TXID &) final override;

        broadcast_result broadcast (const bytes &tx) final override;

        // find a transaction in BEEF or atomic BEEF. Returns an
        // invalid tx if it is not there.
        static Bitcoin::transaction read_BEEF (const bytes &, const Bitcoin::TXID &);

        // 404 means the service doesn't know the tx.
        static exception fetch_error (const Bitcoin::TXID &, uint32 status, const std::string &body);
    };

}

#endif
