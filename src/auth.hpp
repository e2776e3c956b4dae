#pragma once

#include "http_client.hpp"

#include <string>

namespace stream_keeper {

/// Exchange an application key/secret for an app-only bearer token
/// (OAuth2 client-credentials grant).  No retry: any failure is fatal.
/// @throws std::runtime_error on transport errors, non-2xx status, or a
///         response without access_token.
std::string fetchBearerToken(HttpClient& client,
                             const std::string& consumerKey,
                             const std::string& consumerSecret);

/// "Basic " + base64(urlEncode(key) + ":" + urlEncode(secret))
std::string basicCredentials(const std::string& consumerKey,
                             const std::string& consumerSecret);

} // namespace stream_keeper
