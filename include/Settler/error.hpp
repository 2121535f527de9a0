#ifndef SETTLER_ERROR
#define SETTLER_ERROR

#include <data/io/exception.hpp>
#include <Settler/types.hpp>

namespace Settler {

    // every way that a transfer can fail. The numeric value
    // is also the exit code of the program.
    enum class failure : int {
        none = 0,
        unexpected = 1,
        config_unavailable = 10,
        index_unavailable = 11,
        invalid_request = 12,
        insufficient_funds = 13,
        fee_schedule_gap = 14,
        ancestor_not_found = 15,
        ancestor_fetch_failed = 16,
        signing_failed = 17,
        cosign_rejected = 18,
        cosign_unavailable = 19,
        broadcast_failed = 20,
        status_unavailable = 21,
        settlement_timeout = 22,
        cancelled = 23
    };

    // why the cosigner refused to sign.
    enum class rejection {
        none,
        frozen,     // the sending address is frozen.
        denylisted, // a receiving address is blacklisted.
        blocked,    // frozen or blacklisted, but the cosigner did not say which.
        paused,     // the cosigner is paused by the administrator.
        other
    };

    std::ostream &operator << (std::ostream &, failure);
    std::ostream &operator << (std::ostream &, rejection);

    // a message that tells the user what to do about a rejection.
    std::string rejection_message (rejection, const std::string &detail = "");

    struct exception : data::exception {
        failure Kind;
        rejection Reason;

        // the error that caused this one, such as an http response.
        std::string Cause;

        exception (failure f, const std::string &message, const std::string &cause = "", rejection r = rejection::none);

        bool rejected () const {
            return Kind == failure::cosign_rejected;
        }
    };

    // what the program reports when it exits.
    struct error {
        int Code;
        maybe<std::string> Message;
        error () : Code {0}, Message {} {}
        error (int code) : Code {code}, Message {} {}
        error (int code, const std::string &err): Code {code}, Message {err} {}
        error (const std::string &err): Code {1}, Message {err} {}
    };

}

#endif
