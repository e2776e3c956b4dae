#pragma once

#include "termination.hpp"

#include <chrono>

namespace stream_keeper {

/// Accumulated reconnect delay.  Zero means "stream is healthy".
using BackoffState = std::chrono::milliseconds;

/// Starting values, steps and ceilings of the per-category growth laws.
struct BackoffLimits {
    std::chrono::milliseconds networkStep    {250};
    std::chrono::milliseconds networkMax     {16'000};
    std::chrono::milliseconds notModified    {60'000};
    std::chrono::milliseconds rateLimitStart {60'000};
    std::chrono::milliseconds rateLimitMax   {960'000};
    std::chrono::milliseconds serverStart    {5'000};
    std::chrono::milliseconds serverMax      {320'000};
};

/// Output of the reconnect decision.
struct BackoffDecision {
    bool                      fatal = false;   // stop, do not reconnect
    std::chrono::milliseconds delay{0};        // wait before reconnecting
    BackoffState              next{0};         // state to carry forward
};

/// Pure reconnect policy: (cause, current state) -> decision.
///
///   SelfTimeout      -> reset to 0, reconnect now
///   NetworkTimeout   -> +networkStep, capped at networkMax
///   HTTP 304         -> fixed notModified
///   HTTP 420 / 429   -> rateLimitStart, then doubling, capped at rateLimitMax
///   HTTP 5xx         -> serverStart, then doubling, capped at serverMax
///   anything else    -> fatal (state unchanged)
BackoffDecision computeBackoff(const TerminationCause& cause,
                               BackoffState current,
                               const BackoffLimits& limits = BackoffLimits{});

} // namespace stream_keeper
