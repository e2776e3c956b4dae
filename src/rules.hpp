#pragma once

#include "http_client.hpp"
#include "models.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace stream_keeper {

/// Request/response client for the server-side filter rules endpoint.
/// Each call is a single exchange with no retry.  Any non-2xx status,
/// transport error, or malformed response throws std::runtime_error.
class RulesClient {
public:
    RulesClient(HttpClient& client, std::string bearerToken, bool verbose = false);

    /// Rules currently installed on the server.
    std::vector<FilterRule> listRules();

    /// Ids of the rules currently installed on the server.
    std::vector<std::string> listRuleIds();

    /// @return number of rules the server reports as deleted
    int deleteRules(const std::vector<std::string>& ids);

    /// @return number of rules the server reports as created
    int addRules(const std::vector<FilterRule>& rules);

    /// Delete every installed rule.  @return number deleted (0 if none).
    int clearRules();

private:
    HttpClient& mClient;
    std::string mBearerToken;
    bool        mVerbose;

    nlohmann::json call(const std::string& method, const std::string& body);
};

} // namespace stream_keeper
