#pragma once

#include <string>
#include <vector>

namespace stream_keeper {

/// A filter rule that matched a record (id + optional tag).
struct MatchingRule {
    std::string id;
    std::string tag;
};

/// One decoded record from the stream.  `text` is already sanitized for display.
struct StreamRecord {
    std::string id;
    std::string text;
    std::string authorId;
    std::string createdAt;   // ISO-8601, as sent by the server
    std::vector<MatchingRule> matchingRules;
};

/// Server-side filter rule.  `id` is empty for rules that have not been created yet.
struct FilterRule {
    std::string id;
    std::string value;       // rule expression, e.g. "from:nasa -is:retweet"
    std::string tag;
};

} // namespace stream_keeper
