#include "rules.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>

namespace stream_keeper {

RulesClient::RulesClient(HttpClient& client, std::string bearerToken, bool verbose)
    : mClient(client)
    , mBearerToken(std::move(bearerToken))
    , mVerbose(verbose) {}

std::vector<FilterRule> RulesClient::listRules() {
    if (mVerbose) {
        std::cerr << isoTimestamp() << " [Rules] listRules()\n";
    }
    return parseRuleList(call("GET", ""));
}

std::vector<std::string> RulesClient::listRuleIds() {
    std::vector<std::string> ids;
    for (const auto& rule : listRules()) {
        ids.push_back(rule.id);
    }
    return ids;
}

int RulesClient::deleteRules(const std::vector<std::string>& ids) {
    if (mVerbose) {
        std::cerr << isoTimestamp() << " [Rules] deleteRules(" << ids.size() << ")\n";
    }
    const auto resp = call("POST", buildDeleteRulesBody(ids).dump());
    return parseSummaryCount(resp, "deleted");
}

int RulesClient::addRules(const std::vector<FilterRule>& rules) {
    if (mVerbose) {
        std::cerr << isoTimestamp() << " [Rules] addRules(" << rules.size() << ")\n";
    }
    const auto resp = call("POST", buildAddRulesBody(rules).dump());
    return parseSummaryCount(resp, "created");
}

int RulesClient::clearRules() {
    const auto ids = listRuleIds();
    if (ids.empty()) {
        return 0;
    }
    return deleteRules(ids);
}

nlohmann::json RulesClient::call(const std::string& method, const std::string& body) {
    HttpClient::Request req;
    req.method        = method;
    req.authorization = "Bearer " + mBearerToken;
    if (!body.empty()) {
        req.contentType = "application/json";
        req.body        = body;
    }

    const auto resp = mClient.send(req);
    if (!resp.ok()) {
        std::cerr << isoTimestamp() << " [Rules] " << method << " failed, response status: "
                  << resp.httpStatus << " " << resp.reason << "\n";
        throw std::runtime_error("response status: " + std::to_string(resp.httpStatus) +
                                 " " + resp.reason);
    }

    try {
        return nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(
            std::string("Failed to parse rules response: ") + e.what());
    }
}

} // namespace stream_keeper
