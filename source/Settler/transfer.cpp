#include <Settler/transfer.hpp>

namespace Settler {

    std::ostream &operator << (std::ostream &o, const transfer_outcome &x) {
        if (bool (x.TXID)) return o << "transfer " << write_TXID (*x.TXID) << " broadcast";
        if (bool (x.TicketID)) return o << "transfer submitted with ticket " << *x.TicketID;
        return o << "transfer failed (" << x.Error << "): " << x.Message;
    }

    std::shared_ptr<std::mutex> address_locks::operator [] (const Bitcoin::address &a) {
        std::lock_guard<std::mutex> lock (Mutex);
        prune ();
        std::weak_ptr<std::mutex> &entry = Locks[std::string (a)];
        std::shared_ptr<std::mutex> m = entry.lock ();
        if (m == nullptr) {
            m = std::make_shared<std::mutex> ();
            entry = m;
        }
        return m;
    }

    size_t address_locks::size () {
        std::lock_guard<std::mutex> lock (Mutex);
        prune ();
        return Locks.size ();
    }

    void address_locks::prune () {
        for (auto i = Locks.begin (); i != Locks.end ();)
            if (i->second.expired ()) i = Locks.erase (i);
            else i++;
    }

    void engine::log (const std::string &x) const {
        if (Log != nullptr) *Log << x << std::endl;
    }

    void validate (const transfer_request &request) {
        // decimals don't matter here; an amount that is too small
        // for the token is caught once we have the config.
        if (data::size (request) == 0) throw exception {failure::invalid_request, "no recipients"};
        for (const recipient &r : request) {
            if (!r.Address.valid ()) throw exception {failure::invalid_request, "invalid recipient address"};
            if (!(r.Amount > 0)) throw exception {failure::invalid_request,
                string::write ("invalid amount ", r.Amount, " for ", r.Address)};
        }
    }

    transfer_outcome engine::transfer (const Bitcoin::address &from, const Bitcoin::secret &key,
        const transfer_request &request, settlement_mode mode) {
        try {
            validate (request);

            if (!from.valid ()) throw exception {failure::invalid_request, "invalid sending address"};
            if (!key.valid () || key.address ().digest () != from.digest ())
                throw exception {failure::signing_failed, string::write ("key does not belong to ", from)};

            token_config config = Service.config ();
            list<payment> payments = read_payments (request, config.Decimals);

            // held until the cosigner has the transaction.
            std::shared_ptr<std::mutex> address_mutex = Locks[from];
            std::unique_lock<std::mutex> lock (*address_mutex);

            log ("fetching funding sources...");
            list<funding_source> sources = Service.funding_sources (from);

            selected selection = select_funding (sources, total (payments), config.Fees, burns (payments, config.BurnAddress));

            log (string::write ("spending ", data::size (selection.Selected), " outputs; fee ",
                selection.Fee, "; change ", selection.Change));

            assembled_transaction tx = assemble (selection, payments, config, Ancestors);

            list<signature_request> requests = signature_requests (tx);
            assembled_transaction signed_tx;
            try {
                signed_tx = apply_signatures (tx, sign (tx, requests, key));
            } catch (const exception &) {
                throw;
            } catch (const std::exception &e) {
                throw exception {failure::signing_failed, "could not sign transfer", e.what ()};
            }

            log ("getting signatures...");
            settlement settle {Service, Broadcaster};

            if (mode == settlement_mode::ticket) {
                std::string ticket = settle.submit (signed_tx.write (), requests);
                lock.unlock ();
                log (string::write ("submitted with ticket ", ticket));
                return transfer_outcome::ticket (ticket);
            }

            cosigned finalized = Service.cosign (signed_tx.write (), requests, settlement_mode::synchronous);
            lock.unlock ();

            if (!bool (finalized.Transaction)) throw exception {failure::cosign_unavailable, "cosigner did not return a transaction"};

            log ("broadcasting transaction...");
            settled result = settle.broadcast (*finalized.Transaction);
            return transfer_outcome::synchronous (result.TXID, result.RawTx);

        } catch (const exception &e) {
            log (string::write ("transfer failed: ", e.what ()));
            return transfer_outcome::failed (e);
        } catch (const std::exception &e) {
            log (string::write ("transfer failed: ", e.what ()));
            return transfer_outcome::failed (exception {failure::unexpected, "transfer failed", e.what ()});
        }
    }

}
