#pragma once

#include <string>

namespace stream_keeper {

/// Blocking request/response HTTP client built on Boost.Beast.
/// Used for the one-shot exchanges (token, rules) before streaming starts.
class HttpClient {
public:
    struct Request {
        std::string method = "GET";     // GET, POST, ...
        std::string contentType;        // omitted when empty
        std::string authorization;      // full header value, omitted when empty
        std::string body;
    };

    struct Response {
        unsigned int httpStatus = 0;
        std::string  reason;
        std::string  body;

        bool ok() const { return httpStatus >= 200 && httpStatus < 300; }
    };

    /// @param endpoint   Full URL, e.g. "https://api.twitter.com/oauth2/token"
    /// @param timeoutMs  Per-operation timeout in milliseconds
    explicit HttpClient(const std::string& endpoint, int timeoutMs = 5000);

    /// Send one request to the endpoint.
    /// @throws std::runtime_error on network / timeout errors.
    Response send(const Request& request);

    const std::string& endpoint() const { return mEndpoint; }

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mEndpoint;
    std::string mHost;
    std::string mPort;
    std::string mTarget;
    int         mTimeoutMs;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    Response doHttpRequest(const Request& request);
    Response doHttpsRequest(const Request& request);
};

} // namespace stream_keeper
