/// @file test_integration.cpp
/// Integration tests: the Beast streaming session, HttpClient, token and
/// rules calls against an in-process loopback HTTP server.
///
/// The server accepts connections one at a time on 127.0.0.1 and hands each
/// to the next scripted handler, so every test is self-contained.

#include "auth.hpp"
#include "http_client.hpp"
#include "http_stream_session.hpp"
#include "mapping.hpp"
#include "rules.hpp"
#include "supervisor.hpp"
#include "util.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace stream_keeper;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

// ---------------------------------------------------------------------------
// Loopback server
// ---------------------------------------------------------------------------

using ServerRequest = http::request<http::string_body>;
using Handler       = std::function<void(tcp::socket&, const ServerRequest&)>;

class LoopbackServer {
public:
    /// Connection i is served by handlers[i]; the last handler repeats.
    explicit LoopbackServer(std::vector<Handler> handlers)
        : mAcceptor(mIoc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
        , mHandlers(std::move(handlers))
    {
        mPort   = mAcceptor.local_endpoint().port();
        mThread = std::thread([this] { serve(); });
    }

    ~LoopbackServer() {
        mStopping = true;
        // Unblock accept() with a throwaway connection.
        try {
            net::io_context ioc;
            tcp::socket s(ioc);
            s.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), mPort));
        } catch (const std::exception& e) {
            std::fprintf(stderr, "[LoopbackServer] wake-up connect failed: %s\n", e.what());
        }
        mThread.join();
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(mPort) + path;
    }

    std::vector<ServerRequest> requests() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mRequests;
    }

private:
    net::io_context             mIoc;
    tcp::acceptor               mAcceptor;
    std::vector<Handler>        mHandlers;
    unsigned short              mPort = 0;
    std::thread                 mThread;
    std::atomic<bool>           mStopping{false};
    mutable std::mutex          mMutex;
    std::vector<ServerRequest>  mRequests;

    void serve() {
        for (std::size_t n = 0;; ++n) {
            tcp::socket socket(mIoc);
            beast::error_code ec;
            mAcceptor.accept(socket, ec);
            if (ec || mStopping) return;

            beast::flat_buffer buffer;
            ServerRequest req;
            http::read(socket, buffer, req, ec);
            if (ec) continue;
            {
                std::lock_guard<std::mutex> lock(mMutex);
                mRequests.push_back(req);
            }

            const auto& handler = mHandlers[std::min(n, mHandlers.size() - 1)];
            try {
                handler(socket, req);
            } catch (const boost::system::system_error&) {
                // Client went away mid-response.
            }
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
    }
};

// ---------------------------------------------------------------------------
// Response helpers
// ---------------------------------------------------------------------------

static void writeRaw(tcp::socket& s, const std::string& bytes) {
    net::write(s, net::buffer(bytes));
}

static Handler respondJson(unsigned int status, json body) {
    return [status, body](tcp::socket& s, const ServerRequest&) {
        http::response<http::string_body> res{static_cast<http::status>(status), 11};
        res.set(http::field::content_type, "application/json");
        res.body() = body.dump();
        res.prepare_payload();
        http::write(s, res);
    };
}

static Handler respondStatus(unsigned int status) {
    return [status](tcp::socket& s, const ServerRequest&) {
        writeRaw(s, "HTTP/1.1 " + std::to_string(status) +
                    " Scripted\r\nContent-Length: 0\r\n\r\n");
    };
}

static void writeStreamHead(tcp::socket& s) {
    writeRaw(s, "HTTP/1.1 200 OK\r\n"
                "Content-Type: application/json\r\n"
                "Transfer-Encoding: chunked\r\n\r\n");
}

static void writeChunk(tcp::socket& s, const std::string& data) {
    char size[16];
    std::snprintf(size, sizeof(size), "%zx\r\n", data.size());
    writeRaw(s, size + data + "\r\n");
}

/// Block until the client closes its end.
static void waitForClientClose(tcp::socket& s) {
    char byte;
    beast::error_code ec;
    while (!ec) {
        s.read_some(net::buffer(&byte, 1), ec);
    }
}

/// 200, then the given chunks, then either hold the connection open or end
/// the chunked body.
static Handler stream(std::vector<std::string> chunks, bool holdOpen = true) {
    return [chunks, holdOpen](tcp::socket& s, const ServerRequest&) {
        writeStreamHead(s);
        for (const auto& c : chunks) {
            writeChunk(s, c);
            std::this_thread::sleep_for(5ms);
        }
        if (holdOpen) {
            waitForClientClose(s);
        } else {
            writeRaw(s, "0\r\n\r\n");
        }
    };
}

static const std::string kRecordLine =
    R"({"data":{"id":"99","text":"Hello\n@world #tag"},"matching_rules":[{"id":"5","tag":"t"}]})"
    "\r\n";

// ---------------------------------------------------------------------------
// Supervisor harness over the real session
// ---------------------------------------------------------------------------

struct StreamRun {
    std::vector<StreamRecord> records;
    std::vector<std::pair<TerminationCause, BackoffDecision>> decisions;
    ConnectionSupervisor::Stats stats;
    bool fatal = false;
    TerminationCause fatalCause;
};

static StreamRun runStream(const std::string& url,
                           ConnectionSupervisor::Options options,
                           std::size_t stopAfterRecords = 1) {
    StreamRun result;
    net::io_context ioc;

    std::unique_ptr<ConnectionSupervisor> supervisor;
    supervisor = std::make_unique<ConnectionSupervisor>(
        ioc,
        makeHttpSessionFactory(ioc, url, "test-token"),
        [&](const StreamRecord& record) {
            result.records.push_back(record);
            if (result.records.size() == stopAfterRecords) supervisor->stop();
        },
        options);
    supervisor->setDecisionObserver(
        [&](const TerminationCause& cause, const BackoffDecision& decision) {
            result.decisions.emplace_back(cause, decision);
        });

    try {
        supervisor->run();
    } catch (const FatalStreamError& e) {
        result.fatal      = true;
        result.fatalCause = e.cause();
    }
    result.stats = supervisor->getStats();
    return result;
}

static ConnectionSupervisor::Options testOptions() {
    ConnectionSupervisor::Options o;
    o.idleTimeout = 3000ms;
    return o;
}

// ============================================================================
// Streaming session
// ============================================================================

TEST(StreamIntegration, RecordsSplitAcrossChunksAreReassembled) {
    LoopbackServer server({stream({"\r\n",
                                   R"({"data":{"text":"split)",
                                   " record\"}}\r\n\r\n",
                                   kRecordLine})});

    auto run = runStream(server.url("/stream?format=compact"), testOptions(), 2);

    ASSERT_FALSE(run.fatal);
    ASSERT_EQ(run.records.size(), 2u);
    EXPECT_EQ(run.records[0].text, "split record");
    EXPECT_EQ(run.records[1].text, "Hello  world  tag");
    EXPECT_EQ(run.records[1].id, "99");
    ASSERT_EQ(run.records[1].matchingRules.size(), 1u);
    EXPECT_EQ(run.records[1].matchingRules[0].tag, "t");
    EXPECT_EQ(run.stats.keepalivesReceived, 2);
    EXPECT_EQ(run.stats.connectAttempts, 1);

    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method(), http::verb::get);
    EXPECT_EQ(requests[0].target(), "/stream?format=compact");
    EXPECT_EQ(requests[0][http::field::authorization], "Bearer test-token");
}

TEST(StreamIntegration, UnclassifiedStatusStopsWithoutReconnect) {
    LoopbackServer server({respondStatus(451)});

    auto run = runStream(server.url("/stream"), testOptions());

    EXPECT_TRUE(run.fatal);
    EXPECT_EQ(run.fatalCause.kind, TerminationCause::Kind::HttpStatus);
    EXPECT_EQ(run.fatalCause.httpStatus, 451u);
    EXPECT_EQ(run.stats.connectAttempts, 1);
    EXPECT_EQ(server.requests().size(), 1u);
}

TEST(StreamIntegration, ServerErrorThenRecovery) {
    LoopbackServer server({respondStatus(503), respondStatus(429), stream({kRecordLine})});

    auto options = testOptions();
    options.limits.serverStart    = 20ms;
    options.limits.rateLimitStart = 30ms;
    auto run = runStream(server.url("/stream"), options);

    ASSERT_FALSE(run.fatal);
    ASSERT_EQ(run.decisions.size(), 2u);
    EXPECT_EQ(run.decisions[0].second.delay, 20ms);
    // Prior state is 20 ms, so the rate-limit law doubles it.
    EXPECT_EQ(run.decisions[1].second.delay, 40ms);
    EXPECT_EQ(run.records.size(), 1u);
    EXPECT_EQ(run.stats.connectAttempts, 3);
}

TEST(StreamIntegration, IdleConnectionIsAbortedAndReopened) {
    LoopbackServer server({stream({"\r\n"}), stream({kRecordLine})});

    auto options = testOptions();
    options.idleTimeout = 200ms;
    auto run = runStream(server.url("/stream"), options);

    ASSERT_FALSE(run.fatal);
    ASSERT_EQ(run.decisions.size(), 1u);
    EXPECT_EQ(run.decisions[0].first.kind, TerminationCause::Kind::SelfTimeout);
    EXPECT_EQ(run.decisions[0].second.delay, 0ms);
    EXPECT_EQ(run.records.size(), 1u);
    EXPECT_EQ(server.requests().size(), 2u);
}

TEST(StreamIntegration, ServerEndingTheBodyIsANetworkTimeout) {
    LoopbackServer server({stream({"\r\n"}, /*holdOpen=*/false), stream({kRecordLine})});

    auto run = runStream(server.url("/stream"), testOptions());

    ASSERT_FALSE(run.fatal);
    ASSERT_EQ(run.decisions.size(), 1u);
    EXPECT_EQ(run.decisions[0].first.kind, TerminationCause::Kind::NetworkTimeout);
    EXPECT_EQ(run.decisions[0].second.delay, 250ms);
    EXPECT_EQ(run.records.size(), 1u);
}

TEST(StreamIntegration, RunawayLineIsANetworkTimeout) {
    // Exactly the framer limit, then two more bytes with no newline.
    std::vector<std::string> runaway(16, std::string(64 * 1024, 'x'));
    runaway.push_back("xx");
    LoopbackServer server({stream(runaway), stream({kRecordLine})});

    auto run = runStream(server.url("/stream"), testOptions());

    ASSERT_FALSE(run.fatal);
    ASSERT_EQ(run.decisions.size(), 1u);
    EXPECT_EQ(run.decisions[0].first.kind, TerminationCause::Kind::NetworkTimeout);
    EXPECT_EQ(run.decisions[0].second.delay, 250ms);
    EXPECT_EQ(run.records.size(), 1u);
    EXPECT_EQ(server.requests().size(), 2u);
}

TEST(StreamIntegration, ConnectionRefusedIsFatal) {
    // Grab a free port, then release it so nothing is listening.
    unsigned short port = 0;
    {
        net::io_context ioc;
        tcp::acceptor scratch(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = scratch.local_endpoint().port();
    }

    auto run = runStream("http://127.0.0.1:" + std::to_string(port) + "/stream", testOptions());

    EXPECT_TRUE(run.fatal);
    EXPECT_EQ(run.fatalCause.kind, TerminationCause::Kind::FatalTransport);
    EXPECT_EQ(run.stats.connectAttempts, 1);
}

// ============================================================================
// Token exchange
// ============================================================================

TEST(AuthIntegration, FetchesBearerToken) {
    LoopbackServer server({respondJson(200, {{"token_type", "bearer"},
                                             {"access_token", "AAAA-token"}})});
    HttpClient client(server.url("/oauth2/token"), 2000);

    EXPECT_EQ(fetchBearerToken(client, "key", "secret"), "AAAA-token");

    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method(), http::verb::post);
    EXPECT_EQ(requests[0][http::field::authorization], "Basic a2V5OnNlY3JldA==");
    EXPECT_EQ(requests[0][http::field::content_type],
              "application/x-www-form-urlencoded;charset=UTF-8");
    EXPECT_EQ(requests[0].body(), "grant_type=client_credentials");
}

TEST(AuthIntegration, RejectedCredentialsThrow) {
    LoopbackServer server({respondJson(403, {{"errors", json::array()}})});
    HttpClient client(server.url("/oauth2/token"), 2000);

    EXPECT_THROW(fetchBearerToken(client, "key", "wrong"), std::runtime_error);
}

TEST(AuthIntegration, MissingCredentialsThrowBeforeAnyRequest) {
    LoopbackServer server({respondStatus(500)});
    HttpClient client(server.url("/oauth2/token"), 2000);

    EXPECT_THROW(fetchBearerToken(client, "", "secret"), std::runtime_error);
    EXPECT_TRUE(server.requests().empty());
}

// ============================================================================
// Rules
// ============================================================================

TEST(RulesIntegration, ClearListsThenDeletesAll) {
    LoopbackServer server({
        respondJson(200, {{"data", json::array({{{"id", "1"}, {"value", "a"}},
                                                {{"id", "2"}, {"value", "b"}}})}}),
        respondJson(200, {{"meta", {{"summary", {{"deleted", 2}, {"not_deleted", 0}}}}}})
    });
    HttpClient client(server.url("/rules"), 2000);
    RulesClient rules(client, "tok");

    EXPECT_EQ(rules.clearRules(), 2);

    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].method(), http::verb::get);
    EXPECT_EQ(requests[0][http::field::authorization], "Bearer tok");
    EXPECT_EQ(requests[1].method(), http::verb::post);
    EXPECT_EQ(json::parse(requests[1].body()), buildDeleteRulesBody({"1", "2"}));
}

TEST(RulesIntegration, ClearWithNoRulesSkipsDelete) {
    LoopbackServer server({respondJson(200, {{"meta", {{"sent", "now"}}}})});
    HttpClient client(server.url("/rules"), 2000);
    RulesClient rules(client, "tok");

    EXPECT_EQ(rules.clearRules(), 0);
    EXPECT_EQ(server.requests().size(), 1u);
}

TEST(RulesIntegration, AddRulesReturnsCreatedCount) {
    LoopbackServer server({respondJson(201, {{"meta", {{"summary", {{"created", 1}}}}}})});
    HttpClient client(server.url("/rules"), 2000);
    RulesClient rules(client, "tok");

    std::vector<FilterRule> wanted = {{"", "from:nasa -is:retweet", "space"}};
    EXPECT_EQ(rules.addRules(wanted), 1);

    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0][http::field::content_type], "application/json");
    EXPECT_EQ(json::parse(requests[0].body()), buildAddRulesBody(wanted));
}

TEST(RulesIntegration, ErrorStatusThrows) {
    LoopbackServer server({respondStatus(401)});
    HttpClient client(server.url("/rules"), 2000);
    RulesClient rules(client, "tok");

    EXPECT_THROW(rules.listRules(), std::runtime_error);
}

TEST(HttpClientIntegration, UnreachableEndpointThrows) {
    unsigned short port = 0;
    {
        net::io_context ioc;
        tcp::acceptor scratch(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = scratch.local_endpoint().port();
    }
    HttpClient client("http://127.0.0.1:" + std::to_string(port) + "/rules", 1000);

    EXPECT_THROW(client.send({}), std::runtime_error);
}
