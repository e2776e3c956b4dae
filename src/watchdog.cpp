#include "watchdog.hpp"

#include <boost/asio/error.hpp>

namespace stream_keeper {

IdleWatchdog::IdleWatchdog(boost::asio::io_context& ioc, FireHandler onFire)
    : mTimer(ioc)
    , mOnFire(std::move(onFire)) {}

void IdleWatchdog::arm(std::chrono::milliseconds timeout) {
    // expires_after() cancels the previous wait; the generation check drops
    // a completion that was already queued before the cancel took effect.
    const auto generation = ++mGeneration;
    mArmed = true;
    mTimer.expires_after(timeout);
    mTimer.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        if (generation != mGeneration || !mArmed) return;
        mArmed = false;
        if (mOnFire) mOnFire();
    });
}

void IdleWatchdog::refresh(std::chrono::milliseconds timeout) {
    arm(timeout);
}

void IdleWatchdog::disarm() {
    ++mGeneration;
    mArmed = false;
    mTimer.cancel();
}

} // namespace stream_keeper
