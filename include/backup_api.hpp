/**
 * @file backup_api.hpp
 * @brief High-level entry points of the SiteVault tools.
 *
 * Ties together the dependency check, site discovery, the selection prompt and the
 * orchestrator for `sitevault`, and the remote pull for `sitevault-fetch`.
 */

#ifndef BACKUP_API_HPP
#define BACKUP_API_HPP

#include <cstddef>
#include <expected>
#include <iosfwd>
#include <string>
#include "backup.hpp"
#include "backup_types.hpp"
#include "remote_transfer.hpp"
#include "sitevault_config.hpp"

/**
 * @brief API for running SiteVault.
 */
class BackupAPI {
public:
    static constexpr int kExitSuccess = 0;
    static constexpr int kExitConfigError = 1;
    static constexpr int kExitMissingDependency = 2;
    static constexpr int kExitNoSites = 3;

    /**
     * @brief Runs one interactive backup.
     *
     * Checks dependencies, discovers sites below config.sitesRoot, asks the operator
     * which to back up, backs them up into @p destination and sends the optional
     * Telegram summary.
     *
     * @param config Loaded configuration.
     * @param destination Backup destination directory.
     * @param in Operator input.
     * @param out Prompt output.
     * @param clock Source of artifact timestamps.
     * @return std::expected<RunSummary, BackupError> The run summary (cancelled when the
     *         operator quit), or MissingDependency / NoSitesFound / DestinationUnavailable.
     */
    static std::expected<RunSummary, BackupError> runInteractive(const SiteVaultConfig& config,
                                                                 const fs::path& destination,
                                                                 std::istream& in,
                                                                 std::ostream& out,
                                                                 BackupOrchestrator::Clock clock = [] { return std::chrono::system_clock::now(); });

    /**
     * @brief Pulls the contents of a remote backup directory into @p localDir.
     *
     * @param strategy Transfer implementation.
     * @param remoteDir Remote directory.
     * @param localDir Local target directory.
     * @return std::expected<std::size_t, BackupError> Number of files copied, or TransferFailed.
     */
    static std::expected<std::size_t, BackupError> fetchBackups(RemoteFetchStrategy& strategy,
                                                                const std::string& remoteDir,
                                                                const fs::path& localDir);

    /**
     * @brief Process exit code for a fatal error.
     */
    static int exitCodeFor(BackupErrorCode code);
};

#endif // BACKUP_API_HPP
