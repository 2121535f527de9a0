#include <Settler/transfer.hpp>
#include <thread>
#include "fakes.hpp"

namespace Settler {

    struct transferring : ::testing::Test {
        test::fake_service Service;
        test::fake_ancestors Ancestors;
        test::fake_broadcaster Broadcaster;
        address_locks Locks;
        std::stringstream Log;

        Bitcoin::secret Key {test::key (20)};
        Bitcoin::address From {Key.address ()};
        Bitcoin::address To {test::address (21)};

        engine Engine {Service, Ancestors, Broadcaster, Locks, &Log};

        void fund (list<atomic_amount> amounts, uint32 n = 1) {
            Service.Unspent = Service.Unspent +
                Ancestors.add_sources (test::ancestor (n, From, amounts, Service.Config), From, amounts);
        }
    };

    TEST_F (transferring, TenTokens) {
        Service.Config.Fees = {fee_tier {0, 2000000, 1000}};
        fund ({600000, 500000});

        transfer_outcome outcome = Engine.transfer (From, Key, {recipient {To, 10.00000}}, settlement_mode::synchronous);
        ASSERT_TRUE (bool (outcome)) << outcome;
        ASSERT_TRUE (bool (outcome.TXID));
        ASSERT_TRUE (bool (outcome.RawTx));
        EXPECT_FALSE (bool (outcome.TicketID));

        ASSERT_EQ (data::size (Broadcaster.Broadcast), 1);
        bytes broadcast = Broadcaster.Broadcast.first ();
        EXPECT_EQ (*outcome.RawTx, encoding::hex::write (broadcast));

        Bitcoin::transaction tx {broadcast};
        ASSERT_TRUE (tx.valid ());
        EXPECT_EQ (*outcome.TXID, tx.id ());
        EXPECT_EQ (data::size (tx.Inputs), 2);
        ASSERT_EQ (data::size (tx.Outputs), 3);

        list<atomic_amount> amounts;
        for (const Bitcoin::output &o : tx.Outputs) {
            maybe<token_record> r = read_token_record (o.Script);
            ASSERT_TRUE (bool (r));
            amounts <<= r->Amount;
        }

        EXPECT_EQ (amounts, (list<atomic_amount> {1000000, 1000, 99000}));

        // the cosigner was given a signature request for every input.
        ASSERT_EQ (data::size (Service.Requests), 1);
        EXPECT_EQ (data::size (Service.Requests.first ()), 2);

        EXPECT_NE (Log.str ().find ("fetching funding sources..."), std::string::npos);
        EXPECT_NE (Log.str ().find ("broadcasting transaction..."), std::string::npos);
    }

    TEST_F (transferring, Ticket) {
        fund ({600000, 500000});

        transfer_outcome outcome = Engine.transfer (From, Key, {recipient {To, 1}}, settlement_mode::ticket);
        ASSERT_TRUE (bool (outcome)) << outcome;
        ASSERT_TRUE (bool (outcome.TicketID));
        EXPECT_EQ (*outcome.TicketID, "ticket-1");
        EXPECT_FALSE (bool (outcome.TXID));

        // the cosigner broadcasts it.
        EXPECT_EQ (data::size (Broadcaster.Broadcast), 0);
        EXPECT_EQ (data::size (Service.Cosigned), 1);
    }

    TEST_F (transferring, InsufficientFunds) {
        fund ({600000, 500000});

        transfer_outcome outcome = Engine.transfer (From, Key, {recipient {To, 20}}, settlement_mode::synchronous);
        EXPECT_FALSE (bool (outcome));
        EXPECT_EQ (outcome.Error, failure::insufficient_funds);
        EXPECT_FALSE (bool (outcome.TXID));
        EXPECT_FALSE (bool (outcome.TicketID));

        EXPECT_EQ (Service.UnspentCalls, 1);
        EXPECT_EQ (Ancestors.Calls, 0);
        EXPECT_EQ (data::size (Service.Cosigned), 0);
        EXPECT_EQ (data::size (Broadcaster.Broadcast), 0);
    }

    TEST_F (transferring, Frozen) {
        fund ({600000, 500000});
        Service.CosignError = exception {failure::cosign_rejected,
            rejection_message (rejection::frozen), "address is frozen", rejection::frozen};

        transfer_outcome outcome = Engine.transfer (From, Key, {recipient {To, 1}}, settlement_mode::synchronous);
        EXPECT_FALSE (bool (outcome));
        EXPECT_EQ (outcome.Error, failure::cosign_rejected);
        EXPECT_EQ (outcome.Reason, rejection::frozen);
        EXPECT_NE (outcome.Message.find ("frozen"), std::string::npos);

        exception e = outcome.error ();
        EXPECT_TRUE (e.rejected ());
        EXPECT_EQ (e.Reason, rejection::frozen);
        EXPECT_EQ (e.Code, int (failure::cosign_rejected));
        EXPECT_EQ (std::string (e.what ()), outcome.Message);

        EXPECT_EQ (data::size (Service.Cosigned), 1);
        EXPECT_EQ (data::size (Broadcaster.Broadcast), 0);
    }

    TEST_F (transferring, InvalidRequestBeforeNetwork) {
        fund ({600000});

        EXPECT_EQ (Engine.transfer (From, Key, {}).Error, failure::invalid_request);
        EXPECT_EQ (Engine.transfer (From, Key, {recipient {To, 0}}).Error, failure::invalid_request);
        EXPECT_EQ (Engine.transfer (From, Key, {recipient {To, -5}}).Error, failure::invalid_request);
        EXPECT_EQ (Engine.transfer (From, Key, {recipient {Bitcoin::address {"x"}, 1}}).Error, failure::invalid_request);

        EXPECT_EQ (Service.ConfigCalls, 0);
        EXPECT_EQ (Service.UnspentCalls, 0);
    }

    TEST_F (transferring, WrongKey) {
        fund ({600000});
        EXPECT_EQ (Engine.transfer (From, test::key (22), {recipient {To, 1}}).Error, failure::signing_failed);
        EXPECT_EQ (Service.UnspentCalls, 0);
    }

    TEST_F (transferring, TooSmall) {
        fund ({600000});
        // smaller than the smallest unit of a token with five decimals.
        EXPECT_EQ (Engine.transfer (From, Key, {recipient {To, 0.000001}}).Error, failure::invalid_request);
        EXPECT_EQ (Service.UnspentCalls, 0);
    }

    TEST_F (transferring, BroadcastFailed) {
        fund ({600000});
        Broadcaster.Result = broadcast_result {broadcast_result::ERROR_NETWORK_CONNECTION_FAIL};
        EXPECT_EQ (Engine.transfer (From, Key, {recipient {To, 1}}).Error, failure::broadcast_failed);
    }

    TEST_F (transferring, Burn) {
        fund ({600000});
        transfer_outcome outcome = Engine.transfer (From, Key, {recipient {Service.Config.BurnAddress, 6}});
        ASSERT_TRUE (bool (outcome)) << outcome;

        Bitcoin::transaction tx {Broadcaster.Broadcast.first ()};
        EXPECT_EQ (data::size (tx.Outputs), 1);
    }

    struct broken_ancestors final : ancestor_fetcher {
        Bitcoin::transaction fetch (const Bitcoin::TXID &) final override {
            throw data::exception {} << "disk on fire";
        }
    };

    TEST_F (transferring, CollaboratorThrowsSomethingElse) {
        fund ({600000});
        broken_ancestors broken;
        engine e {Service, broken, Broadcaster, Locks, &Log};

        transfer_outcome outcome;
        EXPECT_NO_THROW (outcome = e.transfer (From, Key, {recipient {To, 1}}));
        EXPECT_EQ (outcome.Error, failure::unexpected);
        EXPECT_NE (outcome.Message.find ("disk on fire"), std::string::npos);
        EXPECT_EQ (data::size (Service.Cosigned), 0);

        // the address is not left locked.
        EXPECT_TRUE (bool (Engine.transfer (From, Key, {recipient {To, 1}})));
    }

    TEST (AddressLocks, SameAddressSameMutex) {
        address_locks locks;
        EXPECT_EQ (locks[test::address (1)], locks[test::address (1)]);
        EXPECT_NE (locks[test::address (1)], locks[test::address (2)]);
    }

    TEST (AddressLocks, ReleasedWhenUnused) {
        address_locks locks;
        {
            std::shared_ptr<std::mutex> a = locks[test::address (1)];
            std::shared_ptr<std::mutex> b = locks[test::address (2)];
            EXPECT_EQ (locks.size (), 2);
            EXPECT_EQ (locks[test::address (1)], a);
        }
        EXPECT_EQ (locks.size (), 0);
    }

    TEST (AddressLocks, HeldAddressWaits) {
        address_locks locks;

        // while one transfer holds an address, another must wait.
        std::shared_ptr<std::mutex> m = locks[test::address (1)];
        std::unique_lock<std::mutex> held (*m);
        bool acquired = true;
        std::thread other ([&] () {
            acquired = locks[test::address (1)]->try_lock ();
        });
        other.join ();
        EXPECT_FALSE (acquired);
    }

}
