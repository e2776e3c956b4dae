#include "supervisor.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <iomanip>
#include <iostream>
#include <sstream>

namespace net = boost::asio;

namespace stream_keeper {

namespace {

std::string formatSeconds(std::chrono::milliseconds d) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << (d.count() / 1000.0) << "s";
    return out.str();
}

} // namespace

const char* toString(ConnectionSupervisor::State state) {
    using State = ConnectionSupervisor::State;
    switch (state) {
        case State::Idle:       return "Idle";
        case State::Connecting: return "Connecting";
        case State::Streaming:  return "Streaming";
        case State::Waiting:    return "Waiting";
        case State::Stopped:    return "Stopped";
    }
    return "Unknown";
}

ConnectionSupervisor::ConnectionSupervisor(net::io_context& ioc,
                                           SessionFactory factory,
                                           RecordSink sink,
                                           Options options)
    : mIoc(ioc)
    , mFactory(std::move(factory))
    , mSink(std::move(sink))
    , mOptions(options)
    , mWatchdog(ioc, [this] { onWatchdogFired(); })
    , mReconnectTimer(ioc) {}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

void ConnectionSupervisor::start() {
    net::post(mIoc, [this] {
        if (mState == State::Idle) connect();
    });
}

void ConnectionSupervisor::stop() {
    net::post(mIoc, [this] {
        if (mState == State::Stopped) return;
        log("stop requested");
        endSession();
        finish();
    });
}

void ConnectionSupervisor::run() {
    if (mIoc.stopped()) {
        mIoc.restart();
    }
    start();
    mIoc.run();

    if (mFatal) {
        throw FatalStreamError("stream stopped on " + describe(mLastCause), mLastCause);
    }
}

// ---------------------------------------------------------------------------
// Connecting
// ---------------------------------------------------------------------------

void ConnectionSupervisor::connect() {
    mState = State::Connecting;
    ++mStats.connectAttempts;

    log("connecting (attempt " + std::to_string(mStats.connectAttempts) + ")");

    try {
        mSession = mFactory();
    } catch (const std::exception& e) {
        terminate(TerminationCause::fatalTransport(e.what()));
        return;
    }
    if (!mSession) {
        terminate(TerminationCause::fatalTransport("session factory returned no session"));
        return;
    }

    // Armed before the request goes out so a stalled connect is caught too.
    mWatchdog.arm(mOptions.idleTimeout);

    const auto generation = ++mSessionGeneration;

    StreamSession::Handlers handlers;
    handlers.onResponse = [this, generation](unsigned int status) {
        if (generation == mSessionGeneration) onResponse(status);
    };
    handlers.onChunk = [this, generation](const std::string& chunk) {
        if (generation == mSessionGeneration) onChunk(chunk);
    };
    handlers.onClosed = [this, generation](const boost::system::error_code& ec) {
        if (generation == mSessionGeneration) onClosed(ec);
    };
    mSession->start(std::move(handlers));
}

void ConnectionSupervisor::onResponse(unsigned int status) {
    if (mState != State::Connecting) return;

    if (classifyStatus(status) == StatusCategory::Ok) {
        mState = State::Streaming;
        log("200 response, streaming");
        return;
    }
    terminate(TerminationCause::status(status));
}

// ---------------------------------------------------------------------------
// Streaming
// ---------------------------------------------------------------------------

void ConnectionSupervisor::onChunk(const std::string& chunk) {
    if (mState != State::Streaming) return;

    // Any chunk, record or keepalive, proves the connection is alive.
    mBackoff = BackoffState{0};
    mWatchdog.refresh(mOptions.idleTimeout);

    auto record = parseStreamRecord(chunk);
    if (!record) {
        ++mStats.keepalivesReceived;
        if (mOptions.verbose) log("heartbeat received");
        return;
    }

    ++mStats.recordsReceived;
    if (!mSink) return;
    try {
        mSink(*record);
    } catch (const std::exception& e) {
        std::cerr << isoTimestamp() << " [Supervisor] sink failed on record "
                  << record->id << ": " << e.what() << "\n";
    }
}

void ConnectionSupervisor::onClosed(const boost::system::error_code& ec) {
    if (mState != State::Connecting && mState != State::Streaming) return;

    if (!ec) {
        terminate(TerminationCause::networkTimeout("stream ended"));
    } else {
        terminate(classifyTransportError(ec));
    }
}

void ConnectionSupervisor::onWatchdogFired() {
    if (!mSession) return;
    if (mState != State::Connecting && mState != State::Streaming) return;

    log("no data for " + formatSeconds(mOptions.idleTimeout) + ", aborting connection");
    // Teardown cancels the session; its late onClosed is dropped.
    terminate(TerminationCause::selfTimeout());
}

// ---------------------------------------------------------------------------
// Terminated: classify, decide, reconnect or stop
// ---------------------------------------------------------------------------

void ConnectionSupervisor::terminate(const TerminationCause& cause) {
    endSession();

    mLastCause = cause;
    count(cause);

    const auto decision = computeBackoff(cause, mBackoff, mOptions.limits);
    if (mObserver) mObserver(cause, decision);

    if (decision.fatal) {
        mFatal = true;
        log(describe(cause) + ", fatal, not reconnecting");
        finish();
        return;
    }

    mBackoff = decision.next;
    log(describe(cause) + ", reconnecting in " + formatSeconds(decision.delay));
    scheduleReconnect(decision.delay);
}

void ConnectionSupervisor::endSession() {
    if (!mSession) return;

    mWatchdog.disarm();
    ++mSessionGeneration;   // drop late callbacks from this session

    auto session = std::move(mSession);
    mSession.reset();
    session->cancel();
    ++mStats.sessionsClosed;
}

void ConnectionSupervisor::scheduleReconnect(std::chrono::milliseconds delay) {
    mState = State::Waiting;
    mStats.totalBackoffSeconds += delay.count() / 1000.0;

    mReconnectTimer.expires_after(delay);
    mReconnectTimer.async_wait([this](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted) return;
        if (mState != State::Waiting) return;
        connect();
    });
}

void ConnectionSupervisor::finish() {
    if (mState == State::Stopped) return;

    mState = State::Stopped;
    mWatchdog.disarm();
    mReconnectTimer.cancel();
    log("stopped");

    if (mOnStopped) mOnStopped();
}

void ConnectionSupervisor::count(const TerminationCause& cause) {
    using Kind = TerminationCause::Kind;

    switch (cause.kind) {
        case Kind::SelfTimeout:    ++mStats.selfTimeouts;    return;
        case Kind::NetworkTimeout: ++mStats.networkTimeouts; return;
        case Kind::FatalTransport: return;
        case Kind::HttpStatus:     break;
    }
    switch (classifyStatus(cause.httpStatus)) {
        case StatusCategory::NotModified: ++mStats.notModified;  break;
        case StatusCategory::RateLimited: ++mStats.rateLimited;  break;
        case StatusCategory::ServerError: ++mStats.serverErrors; break;
        case StatusCategory::Ok:
        case StatusCategory::Unclassified:
            break;
    }
}

void ConnectionSupervisor::log(const std::string& message) const {
    std::cerr << isoTimestamp() << " [Supervisor] " << message << "\n";
}

} // namespace stream_keeper
