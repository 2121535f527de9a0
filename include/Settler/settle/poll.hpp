#ifndef SETTLER_SETTLE_POLL
#define SETTLER_SETTLE_POLL

#include <Settler/network/token_service.hpp>
#include <atomic>
#include <chrono>

namespace Settler {

    struct poll_options {
        uint32 MaxAttempts {60};
        std::chrono::milliseconds Interval {5000};
    };

    using sleeper = function<void (std::chrono::milliseconds)>;

    // blocks the current thread.
    void wait_interval (std::chrono::milliseconds);

    using status_callback = function<void (const transfer_status &)>;

    // Read the status of a ticket until it is no longer broadcasting.
    // The callback is called whenever the status differs from the last
    // one seen. At most MaxAttempts reads are made, with Interval
    // between them. FAILED is returned, not thrown.
    //
    // Throws exception {failure::settlement_timeout} if the ticket is still
    // broadcasting after the last read, exception {failure::cancelled} if
    // cancel is set, and exception {failure::status_unavailable} if a read fails.
    transfer_status poll_status (token_service &, const std::string &ticket,
        status_callback on_change = nullptr,
        const std::atomic<bool> *cancel = nullptr,
        const poll_options & = {},
        sleeper sleep = wait_interval);

}

#endif
