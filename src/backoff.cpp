#include "backoff.hpp"

#include <algorithm>

namespace stream_keeper {

namespace {

BackoffDecision reconnectAfter(BackoffState next) {
    BackoffDecision d;
    d.delay = next;
    d.next  = next;
    return d;
}

BackoffState doubling(BackoffState current,
                      std::chrono::milliseconds start,
                      std::chrono::milliseconds ceiling) {
    if (current.count() <= 0) {
        return start;
    }
    return std::min(current * 2, ceiling);
}

} // namespace

BackoffDecision computeBackoff(const TerminationCause& cause,
                               BackoffState current,
                               const BackoffLimits& limits) {
    using Kind = TerminationCause::Kind;

    current = std::max(current, BackoffState{0});

    switch (cause.kind) {
        case Kind::SelfTimeout:
            return reconnectAfter(BackoffState{0});

        case Kind::NetworkTimeout:
            return reconnectAfter(std::min(current + limits.networkStep, limits.networkMax));

        case Kind::FatalTransport:
            break;

        case Kind::HttpStatus:
            switch (classifyStatus(cause.httpStatus)) {
                case StatusCategory::NotModified:
                    return reconnectAfter(limits.notModified);
                case StatusCategory::RateLimited:
                    return reconnectAfter(
                        doubling(current, limits.rateLimitStart, limits.rateLimitMax));
                case StatusCategory::ServerError:
                    return reconnectAfter(
                        doubling(current, limits.serverStart, limits.serverMax));
                case StatusCategory::Ok:
                case StatusCategory::Unclassified:
                    break;
            }
            break;
    }

    BackoffDecision fatal;
    fatal.fatal = true;
    fatal.next  = current;
    return fatal;
}

} // namespace stream_keeper
