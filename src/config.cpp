#include "config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace stream_keeper {

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

int parsePositiveInt(const std::string& option, const std::string& value) {
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size() || parsed <= 0) {
        throw std::invalid_argument(option + " expects a positive number, got '" + value + "'");
    }
    return parsed;
}

} // namespace

void printUsage() {
    std::cout
        << "Usage: stream_keeper [options]\n\n"
        << "Options:\n"
        << "  --stream-url URL      Filtered stream endpoint\n"
        << "  --rules-url URL       Filter rules endpoint\n"
        << "  --auth-url URL        OAuth2 token endpoint\n"
        << "  --rule EXPR           Rule to install at startup (repeatable)\n"
        << "  --rule-tag TAG        Tag for the preceding --rule\n"
        << "  --keep-rules          Do not delete existing rules first\n"
        << "  --idle-timeout-s N    Abort and reconnect after N idle seconds "
           "(default: 90)\n"
        << "  --timeout-ms N        Timeout for token/rules requests     "
           "(default: 5000)\n"
        << "  --verbose             Enable verbose diagnostics\n"
        << "  --help, -h            Show this message\n\n"
        << "Environment:\n"
        << "  CONSUMER_KEY, CONSUMER_SECRET   application credentials\n"
        << "  BEARER_TOKEN                    use this token instead of fetching one\n";
}

Config parseArgs(int argc, char* argv[]) {
    Config cfg;
    cfg.consumerKey    = envOr("CONSUMER_KEY", "");
    cfg.consumerSecret = envOr("CONSUMER_SECRET", "");
    cfg.bearerToken    = envOr("BEARER_TOKEN", "");

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "--stream-url" && hasValue) {
            cfg.streamUrl = argv[++i];
        } else if (arg == "--rules-url" && hasValue) {
            cfg.rulesUrl = argv[++i];
        } else if (arg == "--auth-url" && hasValue) {
            cfg.authUrl = argv[++i];
        } else if (arg == "--rule" && hasValue) {
            FilterRule rule;
            rule.value = argv[++i];
            if (rule.value.empty()) {
                throw std::invalid_argument("--rule expects a non-empty expression");
            }
            cfg.rules.push_back(std::move(rule));
        } else if (arg == "--rule-tag" && hasValue) {
            if (cfg.rules.empty()) {
                throw std::invalid_argument("--rule-tag must follow a --rule");
            }
            cfg.rules.back().tag = argv[++i];
        } else if (arg == "--keep-rules") {
            cfg.clearExistingRules = false;
        } else if (arg == "--idle-timeout-s" && hasValue) {
            cfg.idleTimeoutSeconds = parsePositiveInt(arg, argv[++i]);
        } else if (arg == "--timeout-ms" && hasValue) {
            cfg.timeoutMs = parsePositiveInt(arg, argv[++i]);
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            cfg.showHelp = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return cfg;
}

} // namespace stream_keeper
