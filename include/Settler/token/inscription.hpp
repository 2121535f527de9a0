#ifndef SETTLER_TOKEN_INSCRIPTION
#define SETTLER_TOKEN_INSCRIPTION

#include <Settler/types.hpp>

namespace Settler {

    // the token state carried by an output.
    struct token_record {
        string Protocol;
        string Operation;
        string TokenID;
        atomic_amount Amount;

        token_record (const string &token_id, atomic_amount amount) :
            Protocol {"bsv-20"}, Operation {"transfer"}, TokenID {token_id}, Amount {amount} {}

        token_record (const string &protocol, const string &op, const string &token_id, atomic_amount amount) :
            Protocol {protocol}, Operation {op}, TokenID {token_id}, Amount {amount} {}

        // {"p":"bsv-20","op":"transfer","id":"<token id>","amt":"<amount>"}
        // The indexer expects the keys in this order.
        string write () const;

        static maybe<token_record> read (const string &);

        bool operator == (const token_record &r) const {
            return Protocol == r.Protocol && Operation == r.Operation && TokenID == r.TokenID && Amount == r.Amount;
        }
    };

    std::ostream &operator << (std::ostream &, const token_record &);

    constexpr const char *token_content_type = "application/bsv-20";

    // an ordinal inscription followed by the script that locks it.
    //   OP_0 OP_IF "ord" OP_1 <content type> OP_0 <data> OP_ENDIF <locking script>
    struct inscription {
        string ContentType;
        bytes Data;
        bytes Script;
    };

    bytes inscribe (const token_record &, Bitcoin::program locking_script);

    maybe<inscription> read_inscription (const bytes &script);

    // the token record in a script, if it has one.
    maybe<token_record> read_token_record (const bytes &script);

}

#endif
