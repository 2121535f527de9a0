#include <Settler/settle/poll.hpp>

namespace Settler {

    void wait_interval (std::chrono::milliseconds interval) {
        net::asio::io_context io {};
        net::asio::steady_timer {io, interval}.wait ();
    }

    namespace {
        void check_cancel (const std::atomic<bool> *cancel, const std::string &ticket) {
            if (cancel != nullptr && cancel->load ())
                throw exception {failure::cancelled, string::write ("stopped polling ticket ", ticket), ticket};
        }
    }

    transfer_status poll_status (token_service &service, const std::string &ticket,
        status_callback on_change, const std::atomic<bool> *cancel, const poll_options &options, sleeper sleep) {

        state last = state::none;

        for (uint32 attempt = 1; attempt <= options.MaxAttempts; attempt++) {
            check_cancel (cancel, ticket);

            transfer_status current = service.status (ticket);

            if (current.Status != last) {
                last = current.Status;
                if (on_change) on_change (current);
            }

            if (current.Status != state::broadcasting) return current;

            if (attempt == options.MaxAttempts) break;

            check_cancel (cancel, ticket);
            sleep (options.Interval);
        }

        throw exception {failure::settlement_timeout,
            string::write ("ticket ", ticket, " is still broadcasting after ", options.MaxAttempts, " attempts"), ticket};
    }

}
