#include "auth.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace stream_keeper {

std::string basicCredentials(const std::string& consumerKey,
                             const std::string& consumerSecret) {
    return "Basic " + base64Encode(urlEncode(consumerKey) + ":" +
                                   urlEncode(consumerSecret));
}

std::string fetchBearerToken(HttpClient& client,
                             const std::string& consumerKey,
                             const std::string& consumerSecret) {
    std::cerr << isoTimestamp() << " [Auth] requesting bearer token\n";

    if (consumerKey.empty() || consumerSecret.empty()) {
        throw std::runtime_error("Consumer key and secret are required");
    }

    HttpClient::Request req;
    req.method        = "POST";
    req.contentType   = "application/x-www-form-urlencoded;charset=UTF-8";
    req.authorization = basicCredentials(consumerKey, consumerSecret);
    req.body          = "grant_type=client_credentials";

    const auto resp = client.send(req);
    if (!resp.ok()) {
        throw std::runtime_error("Token request failed, response status: " +
                                 std::to_string(resp.httpStatus));
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(
            std::string("Failed to parse token response: ") + e.what());
    }
    return parseAccessToken(body);
}

} // namespace stream_keeper
