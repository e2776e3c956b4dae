#include "auth.hpp"
#include "config.hpp"
#include "http_client.hpp"
#include "http_stream_session.hpp"
#include "rules.hpp"
#include "supervisor.hpp"
#include "util.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

using namespace stream_keeper;

static std::string obtainToken(const Config& cfg) {
    if (!cfg.bearerToken.empty()) {
        return cfg.bearerToken;
    }
    HttpClient authClient(cfg.authUrl, cfg.timeoutMs);
    authClient.setVerbose(cfg.verbose);
    return fetchBearerToken(authClient, cfg.consumerKey, cfg.consumerSecret);
}

static void provisionRules(const Config& cfg, const std::string& token) {
    HttpClient rulesHttp(cfg.rulesUrl, cfg.timeoutMs);
    rulesHttp.setVerbose(cfg.verbose);
    RulesClient rules(rulesHttp, token, cfg.verbose);

    if (cfg.clearExistingRules) {
        const int deleted = rules.clearRules();
        std::cout << isoTimestamp() << " number of rules deleted: " << deleted << "\n";
    }
    if (!cfg.rules.empty()) {
        const int added = rules.addRules(cfg.rules);
        std::cout << isoTimestamp() << " number of rules added: " << added << "\n";
    }
}

static void printSummary(const ConnectionSupervisor::Stats& stats) {
    std::cout
        << "\n=== Summary Report ===\n"
        << "Connect attempts:    " << stats.connectAttempts    << "\n"
        << "Records received:    " << stats.recordsReceived    << "\n"
        << "Keepalives:          " << stats.keepalivesReceived << "\n"
        << "Self timeouts:       " << stats.selfTimeouts       << "\n"
        << "Network timeouts:    " << stats.networkTimeouts    << "\n"
        << "HTTP 304:            " << stats.notModified        << "\n"
        << "Rate limited:        " << stats.rateLimited        << "\n"
        << "Server errors:       " << stats.serverErrors       << "\n"
        << "Total backoff (s):   " << std::fixed << std::setprecision(2)
                                   << stats.totalBackoffSeconds << "\n"
        << "======================\n";
}

int main(int argc, char* argv[]) {
    Config cfg;
    try {
        cfg = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n";
        printUsage();
        return 1;
    }
    if (cfg.showHelp) {
        printUsage();
        return 0;
    }

    try {
        std::cout
            << "=== stream_keeper ===\n"
            << "Stream:        " << cfg.streamUrl          << "\n"
            << "Rules:         " << cfg.rules.size()       << "\n"
            << "Idle timeout:  " << cfg.idleTimeoutSeconds << " s\n"
            << "Verbose:       " << (cfg.verbose ? "yes" : "no") << "\n"
            << "=====================\n\n";

        const std::string token = obtainToken(cfg);
        provisionRules(cfg, token);

        boost::asio::io_context ioc;

        ConnectionSupervisor::Options options;
        options.idleTimeout = std::chrono::seconds(cfg.idleTimeoutSeconds);
        options.verbose     = cfg.verbose;

        ConnectionSupervisor supervisor(
            ioc,
            makeHttpSessionFactory(ioc, cfg.streamUrl, token, cfg.verbose),
            [](const StreamRecord& record) {
                std::cout << isoTimestamp() << " record: " << record.text << std::endl;
            },
            options);

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&supervisor](const boost::system::error_code& ec, int) {
            if (!ec) supervisor.stop();
        });
        supervisor.setStopHandler([&signals] {
            boost::system::error_code ignored;
            signals.cancel(ignored);
        });

        supervisor.run();

        printSummary(supervisor.getStats());
        return 0;

    } catch (const FatalStreamError& e) {
        std::cerr << isoTimestamp() << " Fatal stream error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << isoTimestamp() << " Fatal error: " << e.what() << "\n";
        return 1;
    }
}
