#include "http_client.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef STREAM_KEEPER_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace stream_keeper {

namespace {

http::request<http::string_body>
buildRequest(const HttpClient::Request& request,
             const std::string& host,
             const std::string& target)
{
    const auto verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " + request.method);
    }

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "stream_keeper/1.0");
    if (!request.contentType.empty()) {
        req.set(http::field::content_type, request.contentType);
    }
    if (!request.authorization.empty()) {
        req.set(http::field::authorization, request.authorization);
    }
    req.body() = request.body;
    req.prepare_payload();
    return req;
}

HttpClient::Response toResponse(const http::response<http::string_body>& res) {
    HttpClient::Response response;
    response.httpStatus = res.result_int();
    response.reason     = std::string(res.reason());
    response.body       = res.body();
    return response;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HttpClient::HttpClient(const std::string& endpoint, int timeoutMs)
    : mEndpoint(endpoint)
    , mTimeoutMs(timeoutMs)
{
    auto parts = parseUrl(endpoint);
    mHost   = parts.host;
    mPort   = parts.port;
    mTarget = parts.target;
    mUseSsl = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef STREAM_KEEPER_HAS_SSL
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpClient::Response HttpClient::send(const Request& request)
{
    if (mVerbose) {
        std::cerr << "[HttpClient] " << request.method << " " << mHost << ":"
                  << mPort << mTarget << "\n";
    }

    try {
        return mUseSsl ? doHttpsRequest(request) : doHttpRequest(request);
    } catch (const boost::system::system_error& e) {
        throw std::runtime_error(std::string("HTTP request to ") + mEndpoint +
                                 " failed: " + e.what());
    }
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpClient::Response HttpClient::doHttpRequest(const Request& request)
{
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(mHost, mPort);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.connect(results);

    auto req = buildRequest(request, mHost, mTarget);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTP " << res.result_int() << "\n";
    }

    // Graceful shutdown (non-critical errors are swallowed).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return toResponse(res);
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpClient::Response HttpClient::doHttpsRequest(const Request& request)
{
#ifdef STREAM_KEEPER_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);
    ctx.set_verify_callback(ssl::host_name_verification(mHost));

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname");
    }

    auto const results = resolver.resolve(mHost, mPort);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto req = buildRequest(request, mHost, mTarget);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTPS " << res.result_int() << "\n";
    }

    beast::error_code ec;
    stream.shutdown(ec);

    return toResponse(res);
#else
    (void)request;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace stream_keeper
