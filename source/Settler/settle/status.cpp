#include <Settler/settle/status.hpp>

namespace Settler {

    state read_state (const std::string &x) {
        std::string lower = data::to_lower (x);
        if (lower == "broadcasting") return state::broadcasting;
        if (lower == "success") return state::success;
        if (lower == "mined") return state::mined;
        if (lower == "failed") return state::failed;
        return state::none;
    }

    std::ostream &operator << (std::ostream &o, state x) {
        switch (x) {
            case state::none: return o << "NONE";
            case state::broadcasting: return o << "BROADCASTING";
            case state::success: return o << "SUCCESS";
            case state::mined: return o << "MINED";
            case state::failed: return o << "FAILED";
            default: return o << "INVALID";
        }
    }

    namespace {
        maybe<std::string> read_optional_string (const JSON &j, const char *key) {
            if (!j.contains (key) || j[key].is_null ()) return {};
            if (j[key].is_string ()) return std::string (j[key]);
            // errors are sometimes given as a list.
            return j[key].dump ();
        }
    }

    transfer_status::transfer_status (const JSON &j) : transfer_status {} {
        if (!j.is_object ()) throw data::exception {} << "transfer status must be an object";

        TicketID = std::string (j.at ("id"));
        Status = read_state (std::string (j.at ("status")));
        if (Status == state::none) throw data::exception {} << "unknown transfer status " << j.at ("status");

        maybe<std::string> txid = read_optional_string (j, "tx_id");
        if (bool (txid) && *txid != "") {
            Bitcoin::TXID id = read_TXID (*txid);
            if (!id.valid ()) throw data::exception {} << "invalid txid " << *txid;
            TXID = id;
        }

        TxHex = read_optional_string (j, "tx_hex");
        Errors = read_optional_string (j, "errors");
        ActionRequested = read_optional_string (j, "action_requested");

        maybe<std::string> created = read_optional_string (j, "createdAt");
        if (bool (created)) CreatedAt = *created;

        maybe<std::string> updated = read_optional_string (j, "updatedAt");
        if (bool (updated)) UpdatedAt = *updated;
    }

    transfer_status::operator JSON () const {
        JSON j {
            {"id", TicketID},
            {"status", string::write (Status)},
            {"createdAt", CreatedAt},
            {"updatedAt", UpdatedAt}};

        j["tx_id"] = bool (TXID) ? JSON (write_TXID (*TXID)) : JSON (nullptr);
        j["tx_hex"] = bool (TxHex) ? JSON (*TxHex) : JSON (nullptr);
        j["errors"] = bool (Errors) ? JSON (*Errors) : JSON (nullptr);
        j["action_requested"] = bool (ActionRequested) ? JSON (*ActionRequested) : JSON (nullptr);
        return j;
    }

    std::ostream &operator << (std::ostream &o, const transfer_status &s) {
        o << "ticket " << s.TicketID << ": " << s.Status;
        if (bool (s.TXID)) o << "; txid " << write_TXID (*s.TXID);
        if (bool (s.Errors)) o << "; errors: " << *s.Errors;
        if (bool (s.ActionRequested)) o << "; action requested: " << *s.ActionRequested;
        return o;
    }

}
