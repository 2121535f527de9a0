#include <Settler/error.hpp>

namespace Settler {

    exception::exception (failure f, const std::string &message, const std::string &cause, rejection r):
        data::exception {static_cast<int> (f)}, Kind {f}, Reason {r}, Cause {cause} {
        *this << message;
        if (cause != "") *this << "; " << cause;
    }

    std::string rejection_message (rejection r, const std::string &detail) {
        switch (r) {
            case rejection::frozen: return "Your address is currently frozen and cannot send tokens";
            case rejection::denylisted: return "The recipient address is blacklisted and cannot receive tokens";
            case rejection::blocked: return "Transaction blocked: Address is either frozen or blacklisted";
            case rejection::paused: return "Token transfers are currently paused by the administrator";
            case rejection::other: return detail == "" ? "Transaction rejected by the cosigner" : detail;
            default: return detail;
        }
    }

    std::ostream &operator << (std::ostream &o, failure f) {
        switch (f) {
            case failure::none: return o << "none";
            case failure::unexpected: return o << "unexpected error";
            case failure::config_unavailable: return o << "config unavailable";
            case failure::index_unavailable: return o << "index unavailable";
            case failure::invalid_request: return o << "invalid request";
            case failure::insufficient_funds: return o << "insufficient funds";
            case failure::fee_schedule_gap: return o << "fee schedule gap";
            case failure::ancestor_not_found: return o << "ancestor not found";
            case failure::ancestor_fetch_failed: return o << "ancestor fetch failed";
            case failure::signing_failed: return o << "signing failed";
            case failure::cosign_rejected: return o << "cosign rejected";
            case failure::cosign_unavailable: return o << "cosign unavailable";
            case failure::broadcast_failed: return o << "broadcast failed";
            case failure::status_unavailable: return o << "status unavailable";
            case failure::settlement_timeout: return o << "settlement timeout";
            case failure::cancelled: return o << "cancelled";
            default: return o << "invalid failure";
        }
    }

    std::ostream &operator << (std::ostream &o, rejection r) {
        switch (r) {
            case rejection::none: return o << "none";
            case rejection::frozen: return o << "frozen";
            case rejection::denylisted: return o << "denylisted";
            case rejection::blocked: return o << "blocked";
            case rejection::paused: return o << "paused";
            case rejection::other: return o << "other";
            default: return o << "invalid rejection";
        }
    }

}
