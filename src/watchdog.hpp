#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>

namespace stream_keeper {

/// Single-shot idle timer.  If not refreshed within the timeout it invokes
/// the fire handler once; the owner reacts by cancelling the active session.
///
/// All members must be called from the io_context's thread.
class IdleWatchdog {
public:
    using FireHandler = std::function<void()>;

    IdleWatchdog(boost::asio::io_context& ioc, FireHandler onFire);

    IdleWatchdog(const IdleWatchdog&)            = delete;
    IdleWatchdog& operator=(const IdleWatchdog&) = delete;

    /// Schedule a firing after @p timeout.  Replaces any pending firing.
    void arm(std::chrono::milliseconds timeout);

    /// Cancel the pending firing and schedule a new one.
    void refresh(std::chrono::milliseconds timeout);

    /// Cancel the pending firing without rescheduling.
    void disarm();

    bool armed() const { return mArmed; }

private:
    boost::asio::steady_timer mTimer;
    FireHandler               mOnFire;
    bool                      mArmed      = false;
    std::uint64_t             mGeneration = 0;
};

} // namespace stream_keeper
