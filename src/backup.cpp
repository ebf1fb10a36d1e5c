#include "backup.hpp"
#include "artifact.hpp"
#include "config_extractor.hpp"
#include "config_snapshot.hpp"
#include "database_backup.hpp"
#include "file_backup.hpp"
#include "process_runner.hpp"
#include <format>
#include <utility>
#include <signal.h>

volatile std::sig_atomic_t gShutdownFlag = 0;

namespace {

void signalHandler(int /*sig*/) {
    gShutdownFlag = 1;
}

} // namespace

void installSignalHandlers() {
    struct sigaction sa;
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

AggregateStatus classifyOutcome(const StageOutcome& archive,
                                const StageOutcome& database,
                                const StageOutcome& configSnapshot) {
    if (archive.ok() && database.ok() && configSnapshot.ok()) {
        return AggregateStatus::CompleteSuccess;
    }
    if (archive.ok()) {
        return AggregateStatus::PartialFilesOk;
    }
    if (database.ok()) {
        return AggregateStatus::PartialDatabaseOk;
    }
    return AggregateStatus::TotalFailure;
}

const char* describe(AggregateStatus status) {
    switch (status) {
        case AggregateStatus::CompleteSuccess: return "complete success";
        case AggregateStatus::PartialFilesOk: return "partial: files ok, database/config failed";
        case AggregateStatus::PartialDatabaseOk: return "partial: database ok, files failed";
        case AggregateStatus::TotalFailure: return "total failure";
    }
    return "unknown";
}

std::expected<void, BackupError> checkDependencies(const SiteVaultConfig& config) {
    if (!findExecutable(config.mysqldump)) {
        return std::unexpected(BackupError{BackupErrorCode::MissingDependency,
                                           std::format("Required tool not found: {}", config.mysqldump)});
    }
    return {};
}

BackupOrchestrator::BackupOrchestrator(const SiteVaultConfig& config,
                                       std::unique_ptr<BackupStage> archiveStage,
                                       std::unique_ptr<BackupStage> databaseStage,
                                       std::unique_ptr<BackupStage> snapshotStage,
                                       Clock clock)
    : config(config),
      archiveStage(std::move(archiveStage)),
      databaseStage(std::move(databaseStage)),
      snapshotStage(std::move(snapshotStage)),
      clock(std::move(clock)) {}

BackupOrchestrator BackupOrchestrator::withDefaultStages(const SiteVaultConfig& config, Clock clock) {
    return BackupOrchestrator(
        config,
        std::make_unique<ArchiveStage>(config, std::make_unique<TarGzFileBackupStrategy>(config.excludeExtensions, config.archiveTimeout)),
        std::make_unique<DatabaseDumpStage>(config, std::make_unique<LineConfigExtractor>(),
                                            std::make_unique<MySQLBackupStrategy>(config.mysqldump, config.dumpTimeout)),
        std::make_unique<ConfigSnapshotStage>(config),
        std::move(clock));
}

std::expected<void, BackupError> BackupOrchestrator::prepareDestination(const fs::path& destination) const {
    std::error_code ec;
    if (fs::is_directory(destination, ec)) {
        return {};
    }
    if (fs::exists(destination, ec)) {
        return std::unexpected(BackupError{BackupErrorCode::DestinationUnavailable,
                                           std::format("Backup destination is not a directory: {}", destination.string())});
    }
    if (!fs::create_directories(destination, ec) && ec) {
        return std::unexpected(BackupError{BackupErrorCode::DestinationUnavailable,
                                           std::format("Failed to create backup directory {}: {}", destination.string(), ec.message())});
    }
    config.logMessage(std::format("Created backup directory: {}", destination.string()));
    return {};
}

StageOutcome BackupOrchestrator::runStage(BackupStage& stage, const Site& site, const BackupContext& context) {
    try {
        return stage.run(site, context);
    } catch (const std::exception& e) {
        auto errorMsg = std::format("{} failed for {}: {}", stage.name(), site.id, e.what());
        config.logError(errorMsg);
        return StageOutcome::failure(errorMsg);
    }
}

SiteBackupResult BackupOrchestrator::backupSite(const Site& site, const fs::path& destination) {
    SiteBackupResult result;
    result.siteId = site.id;
    config.logMessage(std::format("Starting backup for {}", site.id));

    BackupContext context{destination, formatTimestamp(clock())};

    result.archive = runStage(*archiveStage, site, context);
    result.state = SiteBackupState::FilesystemDone;

    result.database = runStage(*databaseStage, site, context);
    result.state = SiteBackupState::DatabaseDone;

    result.configSnapshot = runStage(*snapshotStage, site, context);
    result.state = SiteBackupState::ConfigSnapshotDone;

    result.status = classifyOutcome(result.archive, result.database, result.configSnapshot);
    auto summary = std::format("Backup for {}: {}", site.id, describe(result.status));
    if (result.status == AggregateStatus::CompleteSuccess) {
        config.logMessage(summary);
    } else {
        config.logError(summary);
    }
    result.state = SiteBackupState::Reported;
    return result;
}

std::expected<RunSummary, BackupError> BackupOrchestrator::run(const std::vector<Site>& sites, const fs::path& destination) {
    auto prepared = prepareDestination(destination);
    if (!prepared) {
        config.logError(prepared.error().message);
        return std::unexpected(prepared.error());
    }

    RunSummary summary;
    summary.destination = destination;
    for (const auto& site : sites) {
        if (gShutdownFlag) {
            summary.interrupted = true;
            config.logError(std::format("Backup interrupted by signal, {} site(s) not attempted",
                                        sites.size() - summary.results.size()));
            break;
        }
        summary.results.push_back(backupSite(site, destination));
    }

    config.logMessage(std::format("Backup completed. All backups are stored in {}", destination.string()));
    return summary;
}
