#ifndef SETTLER_SETTLE_SETTLEMENT
#define SETTLER_SETTLE_SETTLEMENT

#include <Settler/network/broadcast.hpp>
#include <Settler/settle/poll.hpp>

namespace Settler {

    // a transaction that was accepted by the network.
    struct settled {
        Bitcoin::TXID TXID;

        // hex
        std::string RawTx;
    };

    // gets a cosigned transaction to the network and watches it there.
    struct settlement {
        token_service &Service;
        broadcaster &Broadcaster;

        settlement (token_service &s, broadcaster &b) : Service {s}, Broadcaster {b} {}

        // broadcast the transaction finalized by the cosigner.
        // Throws exception {failure::broadcast_failed}.
        settled broadcast (const bytes &finalized);

        // hand the signed transaction to the cosigner, which
        // broadcasts it itself. Returns a ticket.
        std::string submit (const bytes &signed_tx, list<signature_request>);

        transfer_status status (const std::string &ticket) {
            return Service.status (ticket);
        }

        transfer_status poll (const std::string &ticket, status_callback on_change = nullptr,
            const std::atomic<bool> *cancel = nullptr, const poll_options &options = {}, sleeper sleep = wait_interval) {
            return poll_status (Service, ticket, on_change, cancel, options, sleep);
        }
    };

}

#endif
