#include "backup_api.hpp"
#include "notification.hpp"
#include "selection_prompt.hpp"
#include "site_discovery.hpp"
#include <format>
#include <print>
#include <utility>

std::expected<RunSummary, BackupError> BackupAPI::runInteractive(const SiteVaultConfig& config,
                                                                 const fs::path& destination,
                                                                 std::istream& in,
                                                                 std::ostream& out,
                                                                 BackupOrchestrator::Clock clock) {
    if (auto deps = checkDependencies(config); !deps) {
        config.logError(deps.error().message);
        return std::unexpected(deps.error());
    }

    config.logMessage(std::format("Available sites in {}:", config.sitesRoot));
    auto sites = SiteDiscovery(config.sitesRoot, config.configMarker).discover();
    if (!sites) {
        config.logError(sites.error().message);
        return std::unexpected(sites.error());
    }

    auto selection = SelectionPrompt(in, out).select(*sites);
    if (!selection) {
        RunSummary summary;
        summary.destination = destination;
        summary.cancelled = true;
        return summary;
    }

    auto orchestrator = BackupOrchestrator::withDefaultStages(config, std::move(clock));
    auto summary = orchestrator.run(*selection, destination);
    if (!summary) {
        return std::unexpected(summary.error());
    }

    if (config.telegram.enabled()) {
        TelegramNotificationStrategy notifier(config.telegram);
        if (auto sent = notifier.notify(formatRunSummary(*summary)); !sent) {
            config.logError(sent.error());
        }
    }
    return summary;
}

std::expected<std::size_t, BackupError> BackupAPI::fetchBackups(RemoteFetchStrategy& strategy,
                                                                const std::string& remoteDir,
                                                                const fs::path& localDir) {
    auto copied = strategy.fetch(remoteDir, localDir);
    if (copied) {
        std::println("Fetched {} file(s) into {}", *copied, localDir.string());
    }
    return copied;
}

int BackupAPI::exitCodeFor(BackupErrorCode code) {
    switch (code) {
        case BackupErrorCode::MissingDependency: return kExitMissingDependency;
        case BackupErrorCode::NoSitesFound: return kExitNoSites;
        default: return kExitConfigError;
    }
}
