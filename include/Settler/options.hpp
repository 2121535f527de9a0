#ifndef SETTLER_OPTIONS
#define SETTLER_OPTIONS

#include <data/io/arg_parser.hpp>
#include <Settler/network/token_service.hpp>
#include <Settler/token/request.hpp>
#include <Settler/settle/poll.hpp>

namespace Settler {

    using arg_parser = data::io::arg_parser;

    // every option can be given on the command line as --name=value
    // or in the environment as SETTLER_NAME.
    struct options : arg_parser {
        options (arg_parser &&ap) : arg_parser {ap} {}

        // --scheme, --token_api, --ordinals_api, --api_token
        Settler::endpoints endpoints () const;

        // --wif
        maybe<Bitcoin::secret> key () const;

        // --address; if absent, the address of the key.
        maybe<Bitcoin::address> address () const;

        // --to and --amount for a single recipient or
        // --recipients=<address>:<amount>,... for many.
        // Throws exception {failure::invalid_request}.
        transfer_request recipients () const;

        // --sync for the v1 synchronous transfer. Otherwise a ticket.
        settlement_mode mode () const;

        // --ticket
        maybe<std::string> ticket () const;

        // --poll_attempts, --poll_interval (seconds)
        poll_options polling () const;

    private:
        maybe<std::string> read (const std::string &name) const;
    };

}

#endif
