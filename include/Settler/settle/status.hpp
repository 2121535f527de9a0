#ifndef SETTLER_SETTLE_STATUS
#define SETTLER_SETTLE_STATUS

#include <Settler/types.hpp>

namespace Settler {

    // states of an asynchronous transfer. A transfer starts out
    // broadcasting and then moves to one of the others, never back.
    enum class state {
        none,
        broadcasting,
        success,
        mined,
        failed
    };

    // case insensitive. Returns none for anything unrecognized.
    state read_state (const std::string &);

    std::ostream &operator << (std::ostream &, state);

    bool inline terminal (state x) {
        return x == state::success || x == state::mined || x == state::failed;
    }

    // what the cosigner says about a ticket.
    struct transfer_status {
        std::string TicketID;
        state Status;

        maybe<Bitcoin::TXID> TXID;
        maybe<std::string> TxHex;

        // given by the service when something went wrong.
        maybe<std::string> Errors;
        maybe<std::string> ActionRequested;

        std::string CreatedAt;
        std::string UpdatedAt;

        transfer_status () : TicketID {}, Status {state::none}, TXID {}, TxHex {}, Errors {}, ActionRequested {}, CreatedAt {}, UpdatedAt {} {}
        transfer_status (const std::string &ticket, state st) :
            TicketID {ticket}, Status {st}, TXID {}, TxHex {}, Errors {}, ActionRequested {}, CreatedAt {}, UpdatedAt {} {}

        // throws data::exception if the format is wrong.
        explicit transfer_status (const JSON &);
        explicit operator JSON () const;

        bool valid () const {
            return TicketID != "" && Status != state::none;
        }
    };

    std::ostream &operator << (std::ostream &, const transfer_status &);

}

#endif
