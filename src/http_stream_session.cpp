#include "http_stream_session.hpp"
#include "line_framer.hpp"
#include "util.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#ifdef STREAM_KEEPER_HAS_SSL
#include <boost/asio/ssl.hpp>
#include <boost/beast/ssl.hpp>
#endif

#include <array>
#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace stream_keeper {

namespace {

// ---------------------------------------------------------------------------
// Beast session, plain or TLS depending on Stream
// ---------------------------------------------------------------------------

template <class Stream>
class BeastStreamSession
    : public StreamSession
    , public std::enable_shared_from_this<BeastStreamSession<Stream>> {
public:
    static constexpr bool kUsesTls = !std::is_same<Stream, beast::tcp_stream>::value;

    /// @param contextOwner  keeps the TLS context alive while handlers are queued
    template <class... StreamArgs>
    BeastStreamSession(net::io_context& ioc,
                       UrlParts url,
                       std::string bearerToken,
                       bool verbose,
                       std::shared_ptr<void> contextOwner,
                       StreamArgs&&... streamArgs)
        : mResolver(ioc)
        , mStream(std::forward<StreamArgs>(streamArgs)...)
        , mUrl(std::move(url))
        , mBearerToken(std::move(bearerToken))
        , mVerbose(verbose)
        , mContextOwner(std::move(contextOwner))
    {
        mParser.body_limit((std::numeric_limits<std::uint64_t>::max)());
    }

    void start(Handlers handlers) override {
        mHandlers = std::move(handlers);

        if (mVerbose) {
            std::cerr << "[Session] GET " << mUrl.scheme << "://" << mUrl.host
                      << ":" << mUrl.port << mUrl.target << "\n";
        }

        mResolver.async_resolve(
            mUrl.host, mUrl.port,
            beast::bind_front_handler(&BeastStreamSession::onResolve,
                                      this->shared_from_this()));
    }

    void cancel() override {
        if (mCancelled || mClosed) return;
        mCancelled = true;

        mResolver.cancel();
        beast::error_code ec;
        beast::get_lowest_layer(mStream).socket().close(ec);
    }

private:
    net::ip::tcp::resolver                   mResolver;
    Stream                                   mStream;
    UrlParts                                 mUrl;
    std::string                              mBearerToken;
    bool                                     mVerbose;
    std::shared_ptr<void>                    mContextOwner;

    Handlers                                 mHandlers;
    http::request<http::empty_body>          mRequest;
    beast::flat_buffer                       mBuffer;
    http::response_parser<http::buffer_body> mParser;
    std::array<char, 16 * 1024>              mBody{};
    LineFramer                               mFramer;

    bool mCancelled = false;
    bool mClosed    = false;

    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec || mCancelled) return fail(ec);

        beast::get_lowest_layer(mStream).async_connect(
            results,
            beast::bind_front_handler(&BeastStreamSession::onConnect,
                                      this->shared_from_this()));
    }

    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec || mCancelled) return fail(ec);

        if constexpr (kUsesTls) {
#ifdef STREAM_KEEPER_HAS_SSL
            // SNI hostname.
            if (!SSL_set_tlsext_host_name(mStream.native_handle(), mUrl.host.c_str())) {
                return fail(beast::error_code(static_cast<int>(::ERR_get_error()),
                                              net::error::get_ssl_category()));
            }
            mStream.async_handshake(
                net::ssl::stream_base::client,
                beast::bind_front_handler(&BeastStreamSession::onHandshake,
                                          this->shared_from_this()));
#endif
        } else {
            sendRequest();
        }
    }

    void onHandshake(beast::error_code ec) {
        if (ec || mCancelled) return fail(ec);
        sendRequest();
    }

    void sendRequest() {
        mRequest.method(http::verb::get);
        mRequest.target(mUrl.target);
        mRequest.version(11);
        mRequest.set(http::field::host, mUrl.host);
        mRequest.set(http::field::user_agent, "stream_keeper/1.0");
        mRequest.set(http::field::authorization, "Bearer " + mBearerToken);
        mRequest.prepare_payload();

        http::async_write(
            mStream, mRequest,
            beast::bind_front_handler(&BeastStreamSession::onWrite,
                                      this->shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec || mCancelled) return fail(ec);

        http::async_read_header(
            mStream, mBuffer, mParser,
            beast::bind_front_handler(&BeastStreamSession::onHeader,
                                      this->shared_from_this()));
    }

    void onHeader(beast::error_code ec, std::size_t) {
        if (ec || mCancelled) return fail(ec);

        const unsigned int status = mParser.get().result_int();
        if (mVerbose) {
            std::cerr << "[Session] HTTP " << status << "\n";
        }
        if (mHandlers.onResponse) mHandlers.onResponse(status);

        // Non-200: the owner classifies the status and cancels us.
        if (status != 200 || mCancelled) return;

        readBody();
    }

    void readBody() {
        mParser.get().body().data = mBody.data();
        mParser.get().body().size = mBody.size();

        http::async_read_some(
            mStream, mBuffer, mParser,
            beast::bind_front_handler(&BeastStreamSession::onRead,
                                      this->shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        // The body buffer filling up is not an error.
        if (ec == http::error::need_buffer) ec = {};
        if (ec || mCancelled) return fail(ec);

        const std::size_t produced = mBody.size() - mParser.get().body().size;
        for (const auto& line : mFramer.feed(mBody.data(), produced)) {
            if (mCancelled) break;
            if (mHandlers.onChunk) mHandlers.onChunk(line);
        }
        if (mCancelled) return fail(ec);

        if (mFramer.overflowed()) {
            return fail(net::error::message_size);
        }
        if (mParser.is_done()) {
            return fail(http::error::end_of_stream);
        }
        readBody();
    }

    /// Report the end of the session exactly once.
    void fail(beast::error_code ec) {
        if (mClosed) return;
        mClosed = true;

        // Whatever the pending operation reported, a cancelled session
        // ends with operation_aborted.
        if (mCancelled) {
            ec = net::error::operation_aborted;
        } else {
            beast::error_code ignored;
            beast::get_lowest_layer(mStream).socket().close(ignored);
        }

        if (mVerbose) {
            std::cerr << "[Session] closed: " << ec.message() << "\n";
        }
        if (mHandlers.onClosed) mHandlers.onClosed(ec);
    }
};

} // namespace

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

SessionFactory makeHttpSessionFactory(net::io_context& ioc,
                                      const std::string& streamUrl,
                                      const std::string& bearerToken,
                                      bool verbose)
{
    const auto url = parseUrl(streamUrl);

    if (url.scheme == "https") {
#ifdef STREAM_KEEPER_HAS_SSL
        namespace ssl = net::ssl;

        auto ctx = std::make_shared<ssl::context>(ssl::context::tlsv12_client);
        ctx->set_default_verify_paths();
        ctx->set_verify_mode(ssl::verify_peer);
        ctx->set_verify_callback(ssl::host_name_verification(url.host));

        using TlsSession = BeastStreamSession<beast::ssl_stream<beast::tcp_stream>>;
        return [&ioc, url, bearerToken, verbose, ctx]() -> std::shared_ptr<StreamSession> {
            return std::make_shared<TlsSession>(ioc, url, bearerToken, verbose,
                                                ctx, ioc, *ctx);
        };
#else
        throw std::runtime_error(
            "HTTPS stream endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }

    using PlainSession = BeastStreamSession<beast::tcp_stream>;
    return [&ioc, url, bearerToken, verbose]() -> std::shared_ptr<StreamSession> {
        return std::make_shared<PlainSession>(ioc, url, bearerToken, verbose,
                                              nullptr, ioc);
    };
}

} // namespace stream_keeper
