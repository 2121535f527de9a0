#include <Settler/token/inscription.hpp>

namespace Settler {

    namespace {
        bytes to_bytes (const std::string &x) {
            return bytes (data::string (x));
        }

        std::string to_string (const bytes &b) {
            return std::string (b.begin (), b.end ());
        }
    }

    string token_record::write () const {
        std::stringstream ss;
        ss << "{\"p\":" << JSON (static_cast<const std::string &> (Protocol)).dump () <<
            ",\"op\":" << JSON (static_cast<const std::string &> (Operation)).dump () <<
            ",\"id\":" << JSON (static_cast<const std::string &> (TokenID)).dump () <<
            ",\"amt\":\"" << Amount << "\"}";
        return string {ss.str ()};
    }

    maybe<token_record> token_record::read (const string &x) {
        JSON j = JSON::parse (static_cast<const std::string &> (x), nullptr, false);
        if (j.is_discarded () || !j.is_object ()) return {};
        if (!j.contains ("p") || !j.contains ("op") || !j.contains ("id") || !j.contains ("amt")) return {};

        const JSON &amt = j["amt"];
        atomic_amount amount;
        if (amt.is_number_integer ()) amount = int64 (amt);
        else if (amt.is_string ()) {
            try {
                amount = std::stoll (std::string (amt));
            } catch (const std::logic_error &) {
                return {};
            }
        } else return {};

        return token_record {std::string (j["p"]), std::string (j["op"]), std::string (j["id"]), amount};
    }

    std::ostream &operator << (std::ostream &o, const token_record &r) {
        return o << r.write ();
    }

    bytes inscribe (const token_record &r, Bitcoin::program locking_script) {
        using namespace Gigamonkey::Bitcoin;
        program envelope {
            OP_FALSE, OP_IF, push_data (to_bytes ("ord")),
            OP_1, push_data (to_bytes (token_content_type)),
            OP_FALSE, push_data (to_bytes (r.write ())),
            OP_ENDIF};
        return compile (envelope + locking_script);
    }

    maybe<inscription> read_inscription (const bytes &script) {
        using namespace Gigamonkey::Bitcoin;
        program p = decompile (script);

        if (data::size (p) < 4 || p[0].Op != OP_FALSE || p[1].Op != OP_IF || p[2].data () != to_bytes ("ord")) return {};
        p = p.rest ().rest ().rest ();

        inscription x {};
        while (true) {
            if (data::size (p) == 0) return {};
            if (p.first ().Op == OP_ENDIF) break;
            if (data::size (p) < 2) return {};

            op tag = p.first ().Op;
            bytes value = p.rest ().first ().data ();
            if (tag == OP_1) x.ContentType = to_string (value);
            else if (tag == OP_FALSE) x.Data = value;

            p = p.rest ().rest ();
        }

        x.Script = compile (p.rest ());
        return x;
    }

    maybe<token_record> read_token_record (const bytes &script) {
        maybe<inscription> x = read_inscription (script);
        if (!bool (x) || x->ContentType != token_content_type) return {};
        return token_record::read (to_string (x->Data));
    }

}
