/**
 * @file backup.hpp
 * @brief Per-site backup orchestration for SiteVault.
 *
 * For every selected site the orchestrator runs the filesystem, database and config
 * snapshot stages in that order. A failed stage never skips the following ones, and a
 * failed site never stops the remaining sites. After the three stages the site's
 * outcome is classified:
 * 1. all three succeeded: complete success;
 * 2. archive succeeded: partial, files ok, database/config failed;
 * 3. database succeeded: partial, database ok, files failed;
 * 4. otherwise: total failure.
 */

#ifndef BACKUP_HPP
#define BACKUP_HPP

#include <chrono>
#include <csignal>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "backup_stage.hpp"
#include "backup_types.hpp"
#include "sitevault_config.hpp"

/**
 * @brief Raised by SIGINT/SIGTERM; checked by long-running stages and the site loop.
 */
extern volatile std::sig_atomic_t gShutdownFlag;

/**
 * @brief Installs SIGINT/SIGTERM handlers that raise gShutdownFlag.
 *
 * Handlers are installed without SA_RESTART so a blocked prompt read returns.
 */
void installSignalHandlers();

/**
 * @brief Classifies three stage outcomes with the fixed precedence described above.
 */
AggregateStatus classifyOutcome(const StageOutcome& archive,
                                const StageOutcome& database,
                                const StageOutcome& configSnapshot);

/**
 * @brief Human-readable text of an aggregate status (e.g. "complete success").
 */
const char* describe(AggregateStatus status);

/**
 * @brief Checks that the external tools a run needs are installed.
 *
 * @return std::expected<void, BackupError> Success, or MissingDependency naming the tool.
 */
std::expected<void, BackupError> checkDependencies(const SiteVaultConfig& config);

/**
 * @brief Main backup orchestration class.
 */
class BackupOrchestrator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @brief Constructs an orchestrator from explicit stages.
     *
     * @param config Configuration used for logging.
     * @param archiveStage Filesystem stage.
     * @param databaseStage Database stage.
     * @param snapshotStage Config snapshot stage.
     * @param clock Source of artifact timestamps.
     */
    BackupOrchestrator(const SiteVaultConfig& config,
                       std::unique_ptr<BackupStage> archiveStage,
                       std::unique_ptr<BackupStage> databaseStage,
                       std::unique_ptr<BackupStage> snapshotStage,
                       Clock clock = [] { return std::chrono::system_clock::now(); });

    /**
     * @brief Creates an orchestrator with the production stages for @p config.
     */
    static BackupOrchestrator withDefaultStages(const SiteVaultConfig& config, Clock clock = [] { return std::chrono::system_clock::now(); });

    /**
     * @brief Creates the destination directory if it does not exist yet.
     *
     * Called once per run, before the first site.
     *
     * @return std::expected<void, BackupError> Success, or DestinationUnavailable.
     */
    std::expected<void, BackupError> prepareDestination(const fs::path& destination) const;

    /**
     * @brief Runs all three stages for one site and classifies the result.
     *
     * Never throws: an exception escaping a stage becomes that stage's Failure.
     */
    SiteBackupResult backupSite(const Site& site, const fs::path& destination);

    /**
     * @brief Prepares the destination and backs up every site in order.
     *
     * @return std::expected<RunSummary, BackupError> One result per attempted site, or
     *         DestinationUnavailable. Stops early only when gShutdownFlag is raised.
     */
    std::expected<RunSummary, BackupError> run(const std::vector<Site>& sites, const fs::path& destination);

private:
    StageOutcome runStage(BackupStage& stage, const Site& site, const BackupContext& context);

    const SiteVaultConfig& config;
    std::unique_ptr<BackupStage> archiveStage;
    std::unique_ptr<BackupStage> databaseStage;
    std::unique_ptr<BackupStage> snapshotStage;
    Clock clock;
};

#endif // BACKUP_HPP
