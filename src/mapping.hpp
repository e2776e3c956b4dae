#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace stream_keeper {

/// Decode one line of the stream body.
/// Returns std::nullopt when the line is not a record (keepalive / noise):
/// anything that is not a JSON object carrying a string at data.text.
std::optional<StreamRecord> parseStreamRecord(const std::string& line);

/// Map the `data` array of a rules listing into FilterRule structs.
/// A response without `data` means "no rules" and yields an empty vector.
/// Throws std::runtime_error if `data` is present but not an array.
std::vector<FilterRule> parseRuleList(const nlohmann::json& responseBody);

/// Read meta.summary.<field> (e.g. "created", "deleted").
/// Throws std::runtime_error if the field is missing or not an integer.
int parseSummaryCount(const nlohmann::json& responseBody, const std::string& field);

/// Extract access_token from an OAuth2 client-credentials response.
/// Throws std::runtime_error if it is missing or empty.
std::string parseAccessToken(const nlohmann::json& responseBody);

/// {"add": [{"value": ..., "tag": ...}, ...]}  (tag omitted when empty)
nlohmann::json buildAddRulesBody(const std::vector<FilterRule>& rules);

/// {"delete": {"ids": [...]}}
nlohmann::json buildDeleteRulesBody(const std::vector<std::string>& ids);

} // namespace stream_keeper
