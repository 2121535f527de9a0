#ifndef SETTLER_TRANSFER
#define SETTLER_TRANSFER

#include <Settler/token/request.hpp>
#include <Settler/token/select.hpp>
#include <Settler/token/assemble.hpp>
#include <Settler/token/sign.hpp>
#include <Settler/settle/settlement.hpp>
#include <mutex>
#include <map>

namespace Settler {

    // exactly one of these is true:
    //   TXID and RawTx are set (synchronous),
    //   TicketID is set (ticket),
    //   Error is not none.
    struct transfer_outcome {
        maybe<Bitcoin::TXID> TXID;
        maybe<std::string> RawTx;
        maybe<std::string> TicketID;

        failure Error;
        rejection Reason;
        std::string Message;

        static transfer_outcome synchronous (const Bitcoin::TXID &txid, const std::string &raw) {
            transfer_outcome o {};
            o.TXID = txid;
            o.RawTx = raw;
            return o;
        }

        static transfer_outcome ticket (const std::string &id) {
            transfer_outcome o {};
            o.TicketID = id;
            return o;
        }

        static transfer_outcome failed (const exception &e) {
            transfer_outcome o {};
            o.Error = e.Kind;
            o.Reason = e.Reason;
            o.Message = e.what ();
            return o;
        }

        // the failure as an exception, for callers that throw.
        exception error () const {
            return exception {Error, Message, "", Reason};
        }

        transfer_outcome () : TXID {}, RawTx {}, TicketID {}, Error {failure::none}, Reason {rejection::none}, Message {} {}

        operator bool () const {
            return Error == failure::none;
        }
    };

    std::ostream &operator << (std::ostream &, const transfer_outcome &);

    // one mutex per sending address, so that two transfers from
    // the same address do not select the same funding sources.
    // An entry lasts as long as someone holds its mutex.
    struct address_locks {
        std::shared_ptr<std::mutex> operator [] (const Bitcoin::address &);

        // addresses with a mutex in use.
        size_t size ();

    private:
        std::mutex Mutex;
        std::map<std::string, std::weak_ptr<std::mutex>> Locks;

        void prune ();
    };

    struct engine {
        token_service &Service;
        ancestor_fetcher &Ancestors;
        broadcaster &Broadcaster;
        address_locks &Locks;

        // progress is written here if it is not null.
        std::ostream *Log;

        engine (token_service &s, ancestor_fetcher &a, broadcaster &b, address_locks &l, std::ostream *log = nullptr) :
            Service {s}, Ancestors {a}, Broadcaster {b}, Locks {l}, Log {log} {}

        // pay the recipients from the address, which must be the address of the key.
        // Every failure of the transfer is reported in the outcome rather than thrown.
        transfer_outcome transfer (const Bitcoin::address &from, const Bitcoin::secret &key,
            const transfer_request &, settlement_mode = settlement_mode::synchronous);

    private:
        void log (const std::string &) const;
    };

    // checks that can be made before anything is fetched.
    // Throws exception {failure::invalid_request}.
    void validate (const transfer_request &);

}

#endif
