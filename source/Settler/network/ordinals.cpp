#include <Settler/network/ordinals.hpp>

namespace Settler {

    std::ostream &operator << (std::ostream &o, broadcast_result r) {
        switch (r.Error) {
            case broadcast_result::SUCCESS: return o << "success";
            case broadcast_result::ERROR_NETWORK_CONNECTION_FAIL: o << "could not connect to the network"; break;
            case broadcast_result::ERROR_INVALID: o << "invalid transaction"; break;
            case broadcast_result::ERROR_UNKNOWN: o << "unknown"; break;
            default: return o << "invalid error";
        }

        if (r.Status != 0) o << "; status " << r.Status;
        if (r.Description != "") o << "; " << r.Description;
        return o;
    }

    Bitcoin::transaction ordinals::read_BEEF (const bytes &b, const Bitcoin::TXID &txid) {
        // atomic BEEF is BEEF preceded by 01010101 and the txid it is about.
        bytes_view beef = b;
        if (b.size () >= 36 && b[0] == 0x01 && b[1] == 0x01 && b[2] == 0x01 && b[3] == 0x01)
            beef = bytes_view {b.data () + 36, b.size () - 36};

        Gigamonkey::BEEF proof {bytes (beef)};
        if (proof.valid ()) {
            for (const auto &tx : proof.Transactions)
                if (tx.Transaction.id () == txid) return tx.Transaction;
            return Bitcoin::transaction {};
        }

        // some services give the plain tx.
        Bitcoin::transaction tx {b};
        if (tx.valid () && tx.id () == txid) return tx;

        return Bitcoin::transaction {};
    }

    exception ordinals::fetch_error (const Bitcoin::TXID &txid, uint32 status, const std::string &body) {
        if (status == 404) return exception {failure::ancestor_not_found,
            string::write ("ancestor ", write_TXID (txid), " not found")};

        return exception {failure::ancestor_fetch_failed,
            string::write ("could not fetch ancestor ", write_TXID (txid)),
            string::write ("status = ", status, "; body = \"", body, "\"")};
    }

    Bitcoin::transaction ordinals::fetch (const Bitcoin::TXID &txid) {
        net::HTTP::response response;
        try {
            response = (*this) (this->REST.GET (string::write ("/v5/tx/", write_TXID (txid), "/beef")));
        } catch (const std::exception &e) {
            throw exception {failure::ancestor_fetch_failed,
                string::write ("could not fetch ancestor ", write_TXID (txid)), e.what ()};
        }

        uint32 code = static_cast<uint32> (response.Status);
        if (code != 200) throw fetch_error (txid, code, response.Body);

        Bitcoin::transaction tx = read_BEEF (bytes (data::string (response.Body)), txid);
        if (!tx.valid ()) throw exception {failure::ancestor_fetch_failed,
            string::write ("could not read ancestor ", write_TXID (txid), " from BEEF")};

        return tx;
    }

    broadcast_result ordinals::broadcast (const bytes &tx) {
        net::HTTP::response response;
        try {
            response = (*this) (net::HTTP::request (this->REST (net::HTTP::request::make {}.method (net::HTTP::method::post).
                path ("/v5/tx").body (tx))));
        } catch (const std::exception &e) {
            return broadcast_result {broadcast_result::ERROR_NETWORK_CONNECTION_FAIL, 0, e.what ()};
        }

        uint32 code = static_cast<uint32> (response.Status);
        if (code == 200) return broadcast_result {};
        if (code >= 400 && code < 500) return broadcast_result {broadcast_result::ERROR_INVALID, code, response.Body};
        return broadcast_result {broadcast_result::ERROR_UNKNOWN, code, response.Body};
    }

}
