#include "termination.hpp"

#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>

#ifdef STREAM_KEEPER_HAS_SSL
#include <boost/asio/ssl/error.hpp>
#endif

namespace stream_keeper {

namespace asio_error = boost::asio::error;
namespace beast      = boost::beast;

TerminationCause TerminationCause::selfTimeout() {
    TerminationCause c;
    c.kind = Kind::SelfTimeout;
    return c;
}

TerminationCause TerminationCause::networkTimeout(std::string detail) {
    TerminationCause c;
    c.kind   = Kind::NetworkTimeout;
    c.detail = std::move(detail);
    return c;
}

TerminationCause TerminationCause::fatalTransport(std::string detail) {
    TerminationCause c;
    c.kind   = Kind::FatalTransport;
    c.detail = std::move(detail);
    return c;
}

TerminationCause TerminationCause::status(unsigned int code) {
    TerminationCause c;
    c.kind       = Kind::HttpStatus;
    c.httpStatus = code;
    return c;
}

StatusCategory classifyStatus(unsigned int status) {
    switch (status) {
        case 200:
            return StatusCategory::Ok;
        case 304:
            return StatusCategory::NotModified;
        case 420:
        case 429:
            return StatusCategory::RateLimited;
        case 500:
        case 502:
        case 503:
        case 504:
            return StatusCategory::ServerError;
        default:
            return StatusCategory::Unclassified;
    }
}

TerminationCause classifyTransportError(const boost::system::error_code& ec) {
    bool transient =
        ec == asio_error::timed_out ||
        ec == beast::error::timeout ||
        ec == asio_error::connection_reset ||
        ec == asio_error::connection_aborted ||
        ec == asio_error::eof ||
        ec == asio_error::broken_pipe ||
        ec == asio_error::network_down ||
        ec == asio_error::network_reset ||
        ec == asio_error::network_unreachable ||
        ec == asio_error::host_unreachable ||
        ec == asio_error::try_again ||
        ec == asio_error::message_size ||
        ec == beast::http::error::end_of_stream ||
        ec == beast::http::error::partial_message;

#ifdef STREAM_KEEPER_HAS_SSL
    // Peer dropped the TLS connection without close_notify.
    transient = transient || ec == boost::asio::ssl::error::stream_truncated;
#endif

    if (transient) {
        return TerminationCause::networkTimeout(ec.message());
    }
    return TerminationCause::fatalTransport(ec.message());
}

std::string describe(const TerminationCause& cause) {
    using Kind = TerminationCause::Kind;

    switch (cause.kind) {
        case Kind::SelfTimeout:
            return "self-induced idle timeout";
        case Kind::NetworkTimeout:
            return "network timeout" +
                   (cause.detail.empty() ? std::string() : " (" + cause.detail + ")");
        case Kind::FatalTransport:
            return "fatal transport error" +
                   (cause.detail.empty() ? std::string() : " (" + cause.detail + ")");
        case Kind::HttpStatus:
            break;
    }

    std::string text = "HTTP " + std::to_string(cause.httpStatus);
    switch (classifyStatus(cause.httpStatus)) {
        case StatusCategory::NotModified:  return text + " (not modified)";
        case StatusCategory::RateLimited:  return text + " (rate limited)";
        case StatusCategory::ServerError:  return text + " (server error)";
        case StatusCategory::Unclassified: return text + " (unclassified)";
        case StatusCategory::Ok:           break;
    }
    return text;
}

} // namespace stream_keeper
