#pragma once

#include "models.hpp"

#include <string>
#include <vector>

namespace stream_keeper {

struct Config {
    std::string authUrl   = "https://api.twitter.com/oauth2/token";
    std::string rulesUrl  = "https://api.twitter.com/labs/1/tweets/stream/filter/rules";
    std::string streamUrl = "https://api.twitter.com/labs/1/tweets/stream/filter?format=compact";

    std::string consumerKey;      // CONSUMER_KEY
    std::string consumerSecret;   // CONSUMER_SECRET
    std::string bearerToken;      // BEARER_TOKEN, skips the token exchange when set

    std::vector<FilterRule> rules;
    bool clearExistingRules = true;

    int  idleTimeoutSeconds = 90;
    int  timeoutMs          = 5000;
    bool verbose            = false;
    bool showHelp           = false;
};

/// Parse command-line options on top of environment defaults.
/// @throws std::invalid_argument on an unknown option or a bad value.
Config parseArgs(int argc, char* argv[]);

void printUsage();

} // namespace stream_keeper
