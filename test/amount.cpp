#include <Settler/token/amount.hpp>
#include <Settler/token/request.hpp>
#include <Settler/error.hpp>
#include "fakes.hpp"

namespace Settler {

    TEST (Amount, ToAtomic) {
        EXPECT_EQ (to_atomic (10, 5), 1000000);
        EXPECT_EQ (to_atomic (0.00001, 5), 1);
        EXPECT_EQ (to_atomic (1.23456, 5), 123456);
        EXPECT_EQ (to_atomic (0.000004, 5), 0);
        EXPECT_EQ (to_atomic (0.000005, 5), 1);
        EXPECT_EQ (to_atomic (7, 0), 7);
    }

    TEST (Amount, RoundTrip) {
        for (double d : {0.00001, 0.1, 0.3, 1.23456, 10.0, 99.99999, 123456.78901, 0.000015})
            for (uint32 n : {0u, 2u, 5u, 8u}) {
                atomic_amount a = to_atomic (d, n);
                EXPECT_EQ (to_atomic (to_decimal (a, n), n), a) << d << " with " << n << " decimals";
            }
    }

    TEST (Amount, WriteDecimal) {
        EXPECT_EQ (write_decimal (1000000, 5), "10.00000");
        EXPECT_EQ (write_decimal (99000, 5), "0.99000");
        EXPECT_EQ (write_decimal (1, 5), "0.00001");
        EXPECT_EQ (write_decimal (0, 5), "0.00000");
        EXPECT_EQ (write_decimal (-150, 2), "-1.50");
        EXPECT_EQ (write_decimal (42, 0), "42");
    }

    TEST (Amount, ReadDecimal) {
        EXPECT_EQ (read_decimal ("10"), maybe<double> {10.0});
        EXPECT_EQ (read_decimal ("0.5"), maybe<double> {0.5});
        EXPECT_FALSE (bool (read_decimal ("")));
        EXPECT_FALSE (bool (read_decimal ("ten")));
        EXPECT_FALSE (bool (read_decimal ("1.5x")));
    }

    TEST (Amount, ReadPayments) {
        auto A = test::address (10);
        auto B = test::address (11);

        list<payment> p = read_payments (transfer_request {recipient {A, 1.5}, recipient {B, 0.00001}}, 5);
        EXPECT_EQ (p, (list<payment> {payment {A, 150000}, payment {B, 1}}));
        EXPECT_EQ (total (p), 150001);

        auto invalid = [] (const transfer_request &r) {
            try {
                read_payments (r, 5);
            } catch (const exception &e) {
                return e.Kind == failure::invalid_request;
            }
            return false;
        };

        EXPECT_TRUE (invalid (transfer_request {}));
        EXPECT_TRUE (invalid (transfer_request {recipient {A, 0}}));
        EXPECT_TRUE (invalid (transfer_request {recipient {A, -1}}));
        EXPECT_TRUE (invalid (transfer_request {recipient {A, 0.000001}}));
        EXPECT_TRUE (invalid (transfer_request {recipient {Bitcoin::address {"not an address"}, 1}}));
    }

    TEST (Amount, Burns) {
        token_config c = test::config ();
        EXPECT_TRUE (burns ({payment {test::address (10), 5}, payment {c.BurnAddress, 5}}, c.BurnAddress));
        EXPECT_FALSE (burns ({payment {test::address (10), 5}}, c.BurnAddress));
    }

}
