#pragma once

#include "backoff.hpp"
#include "models.hpp"
#include "stream_session.hpp"
#include "termination.hpp"
#include "watchdog.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace stream_keeper {

/// Raised by ConnectionSupervisor::run() when a termination is classified
/// as fatal (unclassified HTTP status or unrecoverable transport error).
class FatalStreamError : public std::runtime_error {
public:
    FatalStreamError(const std::string& what, TerminationCause cause)
        : std::runtime_error(what), mCause(std::move(cause)) {}

    const TerminationCause& cause() const { return mCause; }

private:
    TerminationCause mCause;
};

/// Keeps one streaming connection alive: connects, reads records, watches
/// for idleness, classifies every termination and reconnects with the
/// backoff appropriate to the cause.
///
/// Single-threaded: every state transition runs on the io_context passed
/// to the constructor.  Only stop() may be called from another thread.
/// The supervisor must outlive the io_context's run().
class ConnectionSupervisor {
public:
    enum class State {
        Idle,         // constructed, not started
        Connecting,   // request issued, waiting for the status line
        Streaming,    // 200 received, reading chunks
        Waiting,      // terminated, reconnect delay pending
        Stopped       // fatal or stop() requested
    };

    struct Options {
        std::chrono::milliseconds idleTimeout{90'000};
        BackoffLimits             limits{};
        bool                      verbose = false;
    };

    struct Stats {
        int    connectAttempts     = 0;
        int    recordsReceived     = 0;
        int    keepalivesReceived  = 0;
        int    selfTimeouts        = 0;
        int    networkTimeouts     = 0;
        int    notModified         = 0;
        int    rateLimited         = 0;
        int    serverErrors        = 0;
        int    sessionsClosed      = 0;
        double totalBackoffSeconds = 0.0;
    };

    using RecordSink       = std::function<void(const StreamRecord&)>;
    using DecisionObserver = std::function<void(const TerminationCause&,
                                                const BackoffDecision&)>;
    using StopHandler      = std::function<void()>;

    ConnectionSupervisor(boost::asio::io_context& ioc,
                         SessionFactory factory,
                         RecordSink sink,
                         Options options);

    ConnectionSupervisor(const ConnectionSupervisor&)            = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    /// Begin the first connect attempt (asynchronously).
    void start();

    /// Request a stop.  Thread-safe; takes effect on the io_context.
    void stop();

    /// start(), then run the io_context until the supervisor stops.
    /// @throws FatalStreamError if the stream ended on a fatal cause.
    void run();

    /// Invoked after every termination with the cause and the decision.
    void setDecisionObserver(DecisionObserver observer) { mObserver = std::move(observer); }

    /// Invoked once when the supervisor reaches Stopped.
    void setStopHandler(StopHandler handler) { mOnStopped = std::move(handler); }

    State        state()   const { return mState; }
    BackoffState backoff() const { return mBackoff; }
    Stats        getStats() const { return mStats; }

    /// Set when the supervisor stopped on a fatal cause.
    bool failed() const { return mFatal; }
    const TerminationCause& lastCause() const { return mLastCause; }

private:
    boost::asio::io_context&       mIoc;
    SessionFactory                 mFactory;
    RecordSink                     mSink;
    Options                        mOptions;
    DecisionObserver               mObserver;
    StopHandler                    mOnStopped;

    State                          mState = State::Idle;
    BackoffState                   mBackoff{0};
    Stats                          mStats{};

    std::shared_ptr<StreamSession> mSession;
    std::uint64_t                  mSessionGeneration = 0;
    IdleWatchdog                   mWatchdog;
    boost::asio::steady_timer      mReconnectTimer;

    bool                           mFatal = false;
    TerminationCause               mLastCause;

    void connect();
    void onResponse(unsigned int status);
    void onChunk(const std::string& chunk);
    void onClosed(const boost::system::error_code& ec);
    void onWatchdogFired();

    void terminate(const TerminationCause& cause);
    void endSession();
    void scheduleReconnect(std::chrono::milliseconds delay);
    void finish();
    void count(const TerminationCause& cause);
    void log(const std::string& message) const;
};

const char* toString(ConnectionSupervisor::State state);

} // namespace stream_keeper
