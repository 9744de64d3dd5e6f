#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "rate_limiter.hpp"
#include "retry_policy.hpp"
#include "sharepoint_client.hpp"
#include "traversal.hpp"
#include "util.hpp"

#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace spo_sweep;

namespace {

std::atomic<bool> gCancelRequested{false};

void onInterrupt(int) {
    gCancelRequested.store(true);
}

void printSummary(const Config& cfg,
                  const TraversalController::Stats& stats,
                  const RetryPolicy::Stats& retries,
                  const RateLimiter& pacer)
{
    const char* unit = cfg.mode == SweepMode::LabelReset ? "lists" : "items";

    std::cout
        << "\n=== Summary Report ===\n"
        << "Sites processed:     " << stats.sitesProcessed << "/"
                                   << stats.sitesTotal        << "\n"
        << "Sites failed:        " << stats.sitesFailed       << "\n"
        << "Lists processed:     " << stats.listsProcessed    << "\n"
        << "Lists failed:        " << stats.listsFailed       << "\n";
    if (cfg.mode == SweepMode::RecordUnlock) {
        std::cout
            << "Items inspected:     " << stats.itemsInspected << "\n"
            << "Items failed:        " << stats.itemsFailed    << "\n";
    }
    std::cout
        << "Qualifying " << unit << ":    " << stats.qualifyingFound << "\n";
    if (!cfg.reportOnly) {
        std::cout
            << "Changed " << unit << ":       " << stats.itemsActedOn << "\n";
    }
    if (stats.partialMutations > 0) {
        std::cout
            << "PARTIAL changes:     " << stats.partialMutations
            << "  (label removed, not reapplied - see log)\n";
    }
    std::cout
        << "Throttle retries:    " << retries.totalRetries   << "\n"
        << "Retries exhausted:   " << retries.totalExhausted << "\n"
        << "Backoff wait (s):    " << std::fixed << std::setprecision(2)
                                   << retries.totalWait.count() / 1000.0 << "\n"
        << "Pacing wait (s):     " << std::fixed << std::setprecision(2)
                                   << pacer.totalPauseSeconds() << "\n";
    if (stats.cancelled) {
        std::cout << "Run was cancelled before completion.\n";
    }
    std::cout << "======================\n";
}

} // namespace

int main(int argc, char* argv[]) {
    Config cfg;
    try {
        cfg = parseArgs(argc, argv);
        if (cfg.showHelp) {
            printUsage();
            return 0;
        }
        validate(cfg);
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n";
        printUsage();
        return 1;
    }

    try {
        for (const auto& file : cfg.ignoreFiles) {
            for (auto& title : readLinesFile(file)) {
                cfg.ignoreLists.insert(std::move(title));
            }
        }
        const auto sites = readLinesFile(cfg.sitesFile);

        Logger log;
        log.addSink(std::make_shared<ConsoleLogSink>(cfg.verbose));
        if (!cfg.logFile.empty()) {
            log.addSink(std::make_shared<FileLogSink>(cfg.logFile));
        }

        std::cout
            << "=== spo_sweep ===\n"
            << "Mode:         " << sweepModeName(cfg.mode)
                                << (cfg.reportOnly ? " (report only)" : " (apply)") << "\n"
            << "Sites:        " << sites.size() << " from " << cfg.sitesFile << "\n"
            << "Target label: " << (cfg.targetLabel.empty() ? "(any)" : cfg.targetLabel) << "\n"
            << "Max attempts: " << cfg.maxAttempts << "\n"
            << "Base delay:   " << cfg.baseDelay.count() << " ms\n"
            << "Pacing:       " << cfg.pacing.betweenItems.count() << " / "
                                << cfg.pacing.betweenLists.count() << " / "
                                << cfg.pacing.betweenSites.count()
                                << " ms (item / list / site)\n"
            << "=================\n\n";

        if (cfg.accessToken.empty()) {
            log.warn("[Main] No access token given; requests will be anonymous");
        }

        SharePointClient client(cfg.timeoutMs, cfg.pageSize);
        client.setVerbose(cfg.verbose);
        RetryPolicy retry(log);
        RateLimiter pacer(log);
        TraversalController controller(client, retry, pacer, log, cfg);

        std::signal(SIGINT, onInterrupt);
        controller.setCancellationFlag(&gCancelRequested);

        controller.run(sites);

        const auto stats = controller.getStats();
        printSummary(cfg, stats, retry.getStats(), pacer);

        if (stats.cancelled) return 130;
        if (cfg.failOnError && controller.hadFailures()) return 2;
        return 0;

    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
