#ifndef SETTLER_NETWORK_BROADCAST
#define SETTLER_NETWORK_BROADCAST

#include <Settler/types.hpp>

namespace Settler {

    struct broadcast_result {
        enum result {
            SUCCESS,
            ERROR_UNKNOWN,
            ERROR_NETWORK_CONNECTION_FAIL,
            ERROR_INVALID
        };

        result Error;

        // http status and body of the response, if there was one.
        uint32 Status;
        std::string Description;

        broadcast_result (result e, uint32 status = 0, const std::string &description = ""):
            Error {e}, Status {status}, Description {description} {}
        broadcast_result (): Error {SUCCESS}, Status {200}, Description {} {}

        // broadcast_result is equivalent to true when the
        // operation succeeds.
        operator bool () const {
            return Error == SUCCESS;
        }

        bool error () const {
            return Error != SUCCESS;
        }

        bool success () const {
            return Error == SUCCESS;
        }
    };

    std::ostream &operator << (std::ostream &, broadcast_result);

    struct broadcaster {
        // standard format.
        virtual broadcast_result broadcast (const bytes &tx) = 0;
        virtual ~broadcaster () {}
    };

}

#endif
