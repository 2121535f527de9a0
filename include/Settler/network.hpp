#ifndef SETTLER_NETWORK
#define SETTLER_NETWORK

#include <Settler/network/token_service.hpp>
#include <Settler/network/ordinals.hpp>

namespace Settler {

    // everything remote that a transfer talks to.
    struct network {
        net::asio::io_context IO;
        ptr<net::HTTP::SSL> SSL;
        token_API Token;
        ordinals Ordinals;

        network (const endpoints &e) : IO {}, SSL {std::make_shared<net::HTTP::SSL> (net::HTTP::SSL::tlsv12_client)},
            Token {SSL, e}, Ordinals {SSL, e} {
            SSL->set_default_verify_paths ();
            SSL->set_verify_mode (net::asio::ssl::verify_peer);
        }
    };

}

#endif
