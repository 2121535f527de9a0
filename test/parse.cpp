#include <Settler/network/token_service.hpp>
#include <Settler/network/ordinals.hpp>
#include "fakes.hpp"

namespace Settler {

    TEST (Parse, Config) {
        token_config expected = test::config ();
        JSON j = JSON::parse (string::write (R"({
            "approver": ")", expected.Approver, R"(",
            "feeAddress": ")", expected.FeeAddress, R"(",
            "burnAddress": ")", expected.BurnAddress, R"(",
            "mintAddress": ")", expected.MintAddress, R"(",
            "fees": [{"min": 0, "max": 1000000, "fee": 1000}, {"min": 1000001, "max": 9000000000000000, "fee": 2000}],
            "decimals": 5,
            "tokenId": "ae59f3b8_0"
        })"));

        token_config c {j};
        EXPECT_TRUE (c.valid ());
        EXPECT_EQ (c.Approver, expected.Approver);
        EXPECT_EQ (c.FeeAddress, expected.FeeAddress);
        EXPECT_EQ (c.BurnAddress, expected.BurnAddress);
        EXPECT_EQ (c.Fees, expected.Fees);
        EXPECT_EQ (c.Decimals, 5);
        EXPECT_EQ (c.TokenID, "ae59f3b8_0");

        EXPECT_EQ (c.fee (1000000), maybe<atomic_amount> {1000});
        EXPECT_EQ (c.fee (1000001), maybe<atomic_amount> {2000});
        EXPECT_FALSE (bool (c.fee (-1)));

        EXPECT_EQ (JSON (token_config {JSON (c)}), JSON (c));

        j.erase ("approver");
        EXPECT_THROW (token_config {j}, data::exception);
    }

    TEST (Parse, FundingSource) {
        Bitcoin::address owner = test::address (30);
        JSON j = JSON::parse (string::write (R"({
            "txid": ")", write_TXID (test::txid (7)), R"(",
            "vout": 2,
            "owners": [")", owner, R"(", ")", test::address (31), R"("],
            "data": {"bsv21": {"amt": 150000, "op": "TRANSFER", "id": "ae59f3b8_0"}},
            "score": 12.5,
            "satoshis": 1,
            "script": "dqkU"
        })"));

        funding_source f {j};
        EXPECT_TRUE (f.valid ());
        EXPECT_EQ (f.Outpoint, (Bitcoin::outpoint {test::txid (7), 2}));
        EXPECT_EQ (f.Owner, owner);
        EXPECT_EQ (f.Amount, 150000);
        EXPECT_EQ (f.Operation, operation::transfer);
        EXPECT_DOUBLE_EQ (f.Score, 12.5);
        EXPECT_EQ (f.Script, (bytes {0x76, 0xa9, 0x14}));

        EXPECT_EQ (funding_source {JSON (f)}, f);

        EXPECT_EQ (read_operation ("deploy+mint"), operation::deploy_mint);
        EXPECT_EQ (read_operation ("Burn"), operation::burn);
        EXPECT_EQ (read_operation ("mint"), operation::invalid);
    }

    TEST (Parse, Status) {
        JSON j = JSON::parse (string::write (R"({
            "id": "abc",
            "tx_id": ")", write_TXID (test::txid (9)), R"(",
            "tx_hex": "0100",
            "action_requested": null,
            "status": "MINED",
            "createdAt": "2025-01-01T00:00:00Z",
            "updatedAt": "2025-01-01T00:01:00Z",
            "errors": null
        })"));

        transfer_status st {j};
        EXPECT_TRUE (st.valid ());
        EXPECT_EQ (st.TicketID, "abc");
        EXPECT_EQ (st.Status, state::mined);
        EXPECT_TRUE (terminal (st.Status));
        ASSERT_TRUE (bool (st.TXID));
        EXPECT_EQ (*st.TXID, test::txid (9));
        EXPECT_FALSE (bool (st.Errors));
        EXPECT_EQ (st.UpdatedAt, "2025-01-01T00:01:00Z");

        JSON failed = j;
        failed["status"] = "failed";
        failed["errors"] = "insufficient fee";
        transfer_status f {failed};
        EXPECT_EQ (f.Status, state::failed);
        ASSERT_TRUE (bool (f.Errors));
        EXPECT_EQ (*f.Errors, "insufficient fee");

        EXPECT_FALSE (terminal (state::broadcasting));

        JSON unknown = j;
        unknown["status"] = "LOST";
        EXPECT_THROW (transfer_status {unknown}, data::exception);
    }

    struct classified {
        failure Kind;
        rejection Reason;
        std::string Message;
    };

    classified classify (uint32 status, const std::string &body) {
        exception e = token_API::cosign_error (status, body);
        return classified {e.Kind, e.Reason, e.what ()};
    }

    TEST (Parse, CosignErrors) {
        classified frozen = classify (423, R"({"message": "address is frozen"})");
        EXPECT_EQ (frozen.Kind, failure::cosign_rejected);
        EXPECT_EQ (frozen.Reason, rejection::frozen);
        EXPECT_EQ (frozen.Message.find ("Your address is currently frozen and cannot send tokens"), 0);

        classified denied = classify (423, R"({"message": "recipient is blacklisted"})");
        EXPECT_EQ (denied.Reason, rejection::denylisted);
        EXPECT_EQ (denied.Message.find ("The recipient address is blacklisted and cannot receive tokens"), 0);

        EXPECT_EQ (classify (423, R"({"message": "no"})").Reason, rejection::blocked);

        classified paused = classify (503, R"({"message": "cosigner is paused"})");
        EXPECT_EQ (paused.Kind, failure::cosign_rejected);
        EXPECT_EQ (paused.Reason, rejection::paused);
        EXPECT_EQ (paused.Message.find ("Token transfers are currently paused by the administrator"), 0);

        EXPECT_EQ (classify (503, "down for maintenance").Kind, failure::cosign_unavailable);
        EXPECT_EQ (classify (502, R"({"message": "cosigner is paused"})").Kind, failure::cosign_unavailable);

        classified other = classify (400, R"({"message": "Invalid transaction format"})");
        EXPECT_EQ (other.Kind, failure::cosign_rejected);
        EXPECT_EQ (other.Reason, rejection::other);
        EXPECT_EQ (other.Message, "Invalid transaction format");

        // the http status stays attached.
        EXPECT_EQ (token_API::cosign_error (400, R"({"message": "Invalid transaction format"})").Cause,
            R"(status = 400; body = "{"message": "Invalid transaction format"}")");

        // each reason tells the user something different.
        EXPECT_NE (rejection_message (rejection::frozen), rejection_message (rejection::paused));
        EXPECT_NE (rejection_message (rejection::frozen), rejection_message (rejection::denylisted));
    }

    TEST (Parse, BEEF) {
        token_config c = test::config ();
        Bitcoin::transaction tx = test::ancestor (3, test::address (3), {42}, c);

        // plain transactions are accepted too.
        EXPECT_EQ (ordinals::read_BEEF (bytes (tx), tx.id ()), tx);
        EXPECT_FALSE (ordinals::read_BEEF (bytes (tx), test::txid (1)).valid ());
        EXPECT_FALSE (ordinals::read_BEEF (bytes {0x01, 0x01, 0x01}, tx.id ()).valid ());
    }

    TEST (Parse, FetchErrors) {
        EXPECT_EQ (ordinals::fetch_error (test::txid (1), 404, "").Kind, failure::ancestor_not_found);
        EXPECT_EQ (ordinals::fetch_error (test::txid (1), 500, "").Kind, failure::ancestor_fetch_failed);
        EXPECT_EQ (ordinals::fetch_error (test::txid (1), 403, "").Kind, failure::ancestor_fetch_failed);

        exception unavailable = token_API::fetch_error (failure::config_unavailable, "could not retrieve token config", 500, "oops");
        EXPECT_EQ (unavailable.Kind, failure::config_unavailable);
        EXPECT_EQ (unavailable.Cause, R"(status = 500; body = "oops")");

        EXPECT_EQ (token_API::fetch_error (failure::index_unavailable, "", 404, "").Kind, failure::index_unavailable);
        EXPECT_EQ (token_API::fetch_error (failure::status_unavailable, "", 401, "").Kind, failure::status_unavailable);
    }

}
