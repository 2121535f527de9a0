#include <Settler/settle/settlement.hpp>

namespace Settler {

    settled settlement::broadcast (const bytes &finalized) {
        Bitcoin::transaction tx {finalized};
        if (!tx.valid ()) throw exception {failure::broadcast_failed, "cosigner returned an invalid transaction"};

        broadcast_result result = Broadcaster.broadcast (finalized);
        if (!result) throw exception {failure::broadcast_failed,
            string::write ("could not broadcast ", write_TXID (tx.id ())), string::write (result)};

        return settled {tx.id (), encoding::hex::write (finalized)};
    }

    std::string settlement::submit (const bytes &signed_tx, list<signature_request> requests) {
        cosigned response = Service.cosign (signed_tx, requests, settlement_mode::ticket);
        if (!bool (response.TicketID)) throw exception {failure::cosign_unavailable, "cosigner did not return a ticket"};
        return *response.TicketID;
    }

}
