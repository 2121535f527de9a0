#ifndef SETTLER_NETWORK_TOKEN_SERVICE
#define SETTLER_NETWORK_TOKEN_SERVICE

#include <data/net/HTTP_client.hpp>
#include <Settler/token/config.hpp>
#include <Settler/token/funding.hpp>
#include <Settler/token/sign.hpp>
#include <Settler/settle/status.hpp>
#include <Settler/error.hpp>

namespace Settler {

    // where the remote services are and how to authenticate with them.
    struct endpoints {
        std::string Scheme {"https"};
        std::string TokenAPIHost {"proxy-api.mnee.net"};
        std::string OrdinalsHost {"ordinals.1sat.app"};
        std::string APIToken {};
    };

    // v1 returns the finalized tx; v2 returns a ticket.
    enum class settlement_mode {
        synchronous,
        ticket
    };

    std::ostream &operator << (std::ostream &, settlement_mode);

    // what the cosigner gives back.
    struct cosigned {
        // the finalized transaction (synchronous mode).
        maybe<bytes> Transaction;

        // the ticket to poll (ticket mode).
        maybe<std::string> TicketID;
    };

    // the token's indexer and cosigner.
    struct token_service {

        // throws exception {failure::config_unavailable}.
        virtual token_config config () = 0;

        // every token output owned by the address, as returned by the indexer.
        // Throws exception {failure::index_unavailable}.
        virtual list<funding_source> unspent (const Bitcoin::address &) = 0;

        // throws exception {failure::cosign_rejected} or exception {failure::cosign_unavailable}.
        virtual cosigned cosign (const bytes &signed_tx, list<signature_request>, settlement_mode) = 0;

        // throws exception {failure::status_unavailable}.
        virtual transfer_status status (const std::string &ticket) = 0;

        list<funding_source> funding_sources (const Bitcoin::address &a, const funding_filter &f = default_funding_filter ()) {
            return filter_funding (unspent (a), f);
        }

        virtual ~token_service () {}
    };

    // the token's http API.
    struct token_API final : token_service, net::HTTP::client_blocking {
        std::string APIToken;

        token_API (ptr<net::HTTP::SSL> ssl, const endpoints &e) :
            net::HTTP::client_blocking {ssl, net::HTTP::REST {e.Scheme, e.TokenAPIHost}, tools::rate_limiter {3, 1}},
            APIToken {e.APIToken} {}

        token_config config () final override;
        list<funding_source> unspent (const Bitcoin::address &) final override;
        cosigned cosign (const bytes &signed_tx, list<signature_request>, settlement_mode) final override;
        transfer_status status (const std::string &ticket) final override;

        // classify an error response from the cosigner.
        static exception cosign_error (uint32 status, const std::string &body);

        // an unsuccessful response to a read of config, funding sources or ticket status.
        static exception fetch_error (failure, const std::string &what, uint32 status, const std::string &body);

    private:
        std::string auth () const;
    };

}

#endif
