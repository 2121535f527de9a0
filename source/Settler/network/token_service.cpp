#include <Settler/network/token_service.hpp>
#include <data/encoding/base64.hpp>

namespace Settler {

    std::ostream &operator << (std::ostream &o, settlement_mode m) {
        switch (m) {
            case settlement_mode::synchronous: return o << "synchronous";
            case settlement_mode::ticket: return o << "ticket";
            default: return o << "invalid";
        }
    }

    std::string token_API::auth () const {
        return string::write ("auth_token=", APIToken);
    }

    namespace {

        std::string describe (uint32 status, const std::string &body) {
            return string::write ("status = ", status, "; body = \"", body, "\"");
        }

        // the message field of an error body, or the body itself.
        std::string error_message (const std::string &body) {
            try {
                JSON j = JSON::parse (body);
                if (j.is_object () && j.contains ("message") && j["message"].is_string ()) return std::string (j["message"]);
            } catch (const JSON::exception &) {}
            return body;
        }

        bool contains (const std::string &x, const std::string &pattern) {
            return x.find (pattern) != std::string::npos;
        }

    }

    token_config token_API::config () {
        net::HTTP::response response;
        try {
            response = (*this) (this->REST.GET ("/v1/config", {entry<data::UTF8, data::UTF8> {"auth_token", APIToken}}));
        } catch (const std::exception &e) {
            throw exception {failure::config_unavailable, "could not reach the token service", e.what ()};
        }

        uint32 code = static_cast<uint32> (response.Status);
        if (code != 200) throw fetch_error (failure::config_unavailable, "could not retrieve token config", code, response.Body);

        try {
            token_config c {JSON::parse (response.Body)};
            if (!c.valid ()) throw data::exception {} << "invalid token config";
            return c;
        } catch (const std::exception &e) {
            throw exception {failure::config_unavailable, "could not read token config", e.what ()};
        }
    }

    list<funding_source> token_API::unspent (const Bitcoin::address &addr) {
        net::HTTP::response response;
        try {
            response = (*this) (net::HTTP::request (this->REST (net::HTTP::request::make {}.method (net::HTTP::method::post).
                path ("/v1/utxos").query (auth ()).body (JSON::array ({std::string (addr)})))));
        } catch (const std::exception &e) {
            throw exception {failure::index_unavailable, "could not reach the token indexer", e.what ()};
        }

        uint32 code = static_cast<uint32> (response.Status);
        if (code != 200) throw fetch_error (failure::index_unavailable,
            string::write ("could not retrieve funding sources for ", addr), code, response.Body);

        try {
            JSON info = JSON::parse (response.Body);
            if (!info.is_array ()) throw data::exception {} << "expected array";

            list<funding_source> sources;
            for (const JSON &item : info) {
                funding_source f {item};
                // operations we don't know about can't be spent by us.
                if (f.Operation == operation::invalid) continue;
                if (!f.valid ()) throw data::exception {} << "invalid funding source " << item.dump ();
                sources <<= f;
            }

            return sources;
        } catch (const std::exception &e) {
            throw exception {failure::index_unavailable, "could not read funding sources", e.what ()};
        }
    }

    exception token_API::cosign_error (uint32 status, const std::string &body) {
        std::string message = error_message (body);

        if (status == 423) {
            if (contains (message, "frozen"))
                return exception {failure::cosign_rejected, rejection_message (rejection::frozen), message, rejection::frozen};
            if (contains (message, "blacklisted"))
                return exception {failure::cosign_rejected, rejection_message (rejection::denylisted), message, rejection::denylisted};
            return exception {failure::cosign_rejected, rejection_message (rejection::blocked), message, rejection::blocked};
        }

        if (status == 503 && contains (message, "cosigner is paused"))
            return exception {failure::cosign_rejected, rejection_message (rejection::paused), message, rejection::paused};

        if (status >= 500)
            return exception {failure::cosign_unavailable, "Service temporarily unavailable", describe (status, body)};

        // the server's message is shown as it is.
        exception other {failure::cosign_rejected, rejection_message (rejection::other, message), "", rejection::other};
        other.Cause = describe (status, body);
        return other;
    }

    exception token_API::fetch_error (failure kind, const std::string &what, uint32 status, const std::string &body) {
        return exception {kind, what, describe (status, body)};
    }

    cosigned token_API::cosign (const bytes &tx, list<signature_request> requests, settlement_mode mode) {
        JSON sig_requests = JSON::array ();
        for (const signature_request &r : requests) sig_requests.push_back (JSON (r));

        net::HTTP::response response;
        try {
            response = (*this) (net::HTTP::request (this->REST (net::HTTP::request::make {}.method (net::HTTP::method::post).
                path (mode == settlement_mode::synchronous ? "/v1/transfer" : "/v2/transfer").query (auth ()).body (JSON {
                    {"rawtx", encoding::base64::write (tx)},
                    {"sigRequests", sig_requests}}))));
        } catch (const std::exception &e) {
            throw exception {failure::cosign_unavailable, "could not reach the cosigner", e.what ()};
        }

        uint32 code = static_cast<uint32> (response.Status);
        if (code < 200 || code >= 300) throw cosign_error (code, response.Body);

        JSON info;
        try {
            info = JSON::parse (response.Body);
        } catch (const JSON::exception &e) {
            throw exception {failure::cosign_unavailable, "could not read cosigner response", e.what ()};
        }

        cosigned result {};
        if (mode == settlement_mode::synchronous) {
            if (!info.is_object () || !info.contains ("rawtx") || !info["rawtx"].is_string ())
                throw exception {failure::cosign_unavailable, "cosigner did not return a transaction", response.Body};

            maybe<bytes> finalized = encoding::base64::read (std::string (info["rawtx"]));
            if (!bool (finalized)) throw exception {failure::cosign_unavailable,
                "cosigner returned a transaction that is not base 64", response.Body};

            result.Transaction = *finalized;
        } else {
            if (!info.is_object () || !info.contains ("ticketId") || !info["ticketId"].is_string ())
                throw exception {failure::cosign_unavailable, "cosigner did not return a ticket", response.Body};

            result.TicketID = std::string (info["ticketId"]);
        }

        return result;
    }

    transfer_status token_API::status (const std::string &ticket) {
        net::HTTP::response response;
        try {
            response = (*this) (this->REST.GET ("/v1/ticket", {
                entry<data::UTF8, data::UTF8> {"ticketID", ticket},
                entry<data::UTF8, data::UTF8> {"auth_token", APIToken}}));
        } catch (const std::exception &e) {
            throw exception {failure::status_unavailable, "could not reach the token service", e.what ()};
        }

        uint32 code = static_cast<uint32> (response.Status);
        if (code != 200) throw fetch_error (failure::status_unavailable,
            string::write ("could not retrieve status of ticket ", ticket), code, response.Body);

        try {
            return transfer_status {JSON::parse (response.Body)};
        } catch (const std::exception &e) {
            throw exception {failure::status_unavailable, "could not read ticket status", e.what ()};
        }
    }

}
