#include "mapping.hpp"
#include "util.hpp"

#include <stdexcept>

namespace stream_keeper {

std::optional<StreamRecord> parseStreamRecord(const std::string& line) {
    // Non-throwing parse: keepalives are expected, not exceptional.
    const auto json = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }

    auto dataIt = json.find("data");
    if (dataIt == json.end() || !dataIt->is_object()) {
        return std::nullopt;
    }
    const auto& data = *dataIt;

    auto textIt = data.find("text");
    if (textIt == data.end() || !textIt->is_string()) {
        return std::nullopt;
    }

    StreamRecord record;
    record.text = sanitizeText(textIt->get<std::string>());

    auto stringField = [&data](const char* key) -> std::string {
        auto it = data.find(key);
        return (it != data.end() && it->is_string()) ? it->get<std::string>() : "";
    };
    record.id        = stringField("id");
    record.authorId  = stringField("author_id");
    record.createdAt = stringField("created_at");

    auto rulesIt = json.find("matching_rules");
    if (rulesIt != json.end() && rulesIt->is_array()) {
        for (const auto& rule : *rulesIt) {
            if (!rule.is_object()) continue;
            MatchingRule m;
            if (rule.contains("id")) {
                // Rule ids arrive either as strings or as numbers.
                m.id = rule["id"].is_string() ? rule["id"].get<std::string>()
                                              : rule["id"].dump();
            }
            auto tagIt = rule.find("tag");
            if (tagIt != rule.end() && tagIt->is_string()) {
                m.tag = tagIt->get<std::string>();
            }
            record.matchingRules.push_back(std::move(m));
        }
    }
    return record;
}

std::vector<FilterRule> parseRuleList(const nlohmann::json& responseBody) {
    std::vector<FilterRule> rules;

    if (!responseBody.is_object() || !responseBody.contains("data")) {
        return rules;
    }

    const auto& data = responseBody["data"];
    if (!data.is_array()) {
        throw std::runtime_error("Rules response 'data' is not an array");
    }

    try {
        for (const auto& node : data) {
            FilterRule r;
            r.id    = node.value("id", "");
            r.value = node.value("value", "");
            r.tag   = node.value("tag", "");
            rules.push_back(std::move(r));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed rule in response: ") + e.what());
    }
    return rules;
}

int parseSummaryCount(const nlohmann::json& responseBody, const std::string& field) {
    try {
        const auto& summary = responseBody.at("meta").at("summary");
        const auto& count   = summary.at(field);
        if (!count.is_number_integer()) {
            throw std::runtime_error("meta.summary." + field + " is not an integer");
        }
        return count.get<int>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Response missing meta.summary." + field +
                                 ": " + e.what());
    }
}

std::string parseAccessToken(const nlohmann::json& responseBody) {
    if (!responseBody.is_object() || !responseBody.contains("access_token") ||
        !responseBody["access_token"].is_string()) {
        throw std::runtime_error("Token response missing 'access_token'");
    }
    auto token = responseBody["access_token"].get<std::string>();
    if (token.empty()) {
        throw std::runtime_error("Token response has empty 'access_token'");
    }
    return token;
}

nlohmann::json buildAddRulesBody(const std::vector<FilterRule>& rules) {
    nlohmann::json add = nlohmann::json::array();
    for (const auto& r : rules) {
        nlohmann::json node;
        node["value"] = r.value;
        if (!r.tag.empty()) {
            node["tag"] = r.tag;
        }
        add.push_back(std::move(node));
    }
    return {{"add", add}};
}

nlohmann::json buildDeleteRulesBody(const std::vector<std::string>& ids) {
    return {{"delete", {{"ids", ids}}}};
}

} // namespace stream_keeper
