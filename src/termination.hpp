#pragma once

#include <boost/system/error_code.hpp>
#include <string>

namespace stream_keeper {

/// Why a streaming connection ended.  Produced once per connection and
/// consumed once by the reconnect decision.
struct TerminationCause {
    enum class Kind {
        SelfTimeout,      // idle watchdog fired
        NetworkTimeout,   // transient transport failure
        FatalTransport,   // unrecoverable transport failure
        HttpStatus        // server answered with a non-200 status
    };

    Kind         kind       = Kind::FatalTransport;
    unsigned int httpStatus = 0;    // valid when kind == HttpStatus
    std::string  detail;            // error message, for logging only

    static TerminationCause selfTimeout();
    static TerminationCause networkTimeout(std::string detail = "");
    static TerminationCause fatalTransport(std::string detail = "");
    static TerminationCause status(unsigned int code);
};

/// How the supervisor treats an HTTP status.
enum class StatusCategory {
    Ok,             // 200
    NotModified,    // 304
    RateLimited,    // 420, 429
    ServerError,    // 500, 502, 503, 504
    Unclassified    // everything else (fatal)
};

StatusCategory classifyStatus(unsigned int status);

/// Map a transport error to NetworkTimeout (transient) or FatalTransport.
TerminationCause classifyTransportError(const boost::system::error_code& ec);

/// One-line description for log output, e.g. "HTTP 429 (rate limited)".
std::string describe(const TerminationCause& cause);

} // namespace stream_keeper
