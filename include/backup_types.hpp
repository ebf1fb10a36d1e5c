/**
 * @file backup_types.hpp
 * @brief Core value types shared by the SiteVault discovery, stages and orchestrator.
 *
 * Sites, credentials, stage outcomes and per-site results are plain values. They are
 * created during a run, passed by value or const reference, and never persisted.
 */

#ifndef BACKUP_TYPES_HPP
#define BACKUP_TYPES_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief One discovered application installation.
 */
struct Site {
    std::string id;                      ///< Directory name of the installation (e.g. "blog").
    fs::path installPath;                ///< Absolute path of the installation directory.
    std::optional<fs::path> configPath;  ///< Configuration file, when the marker is present.
};

/**
 * @brief Connection parameters recovered from a site's configuration file.
 *
 * Lives only for the duration of one dump invocation.
 */
struct DatabaseCredentials {
    std::string name;      ///< Database name.
    std::string user;      ///< Database user.
    std::string password;  ///< Password, empty when the configuration has none.
    std::string host;      ///< Host, "localhost" when the configuration has none.
};

enum class BackupErrorCode {
    NoSitesFound,
    ConfigMissing,
    CredentialsIncomplete,
    MissingDependency,
    DestinationUnavailable,
    ProcessFailed,
    Timeout,
    EmptyOutput,
    TransferFailed
};

/**
 * @brief Typed error carried in std::expected results.
 */
struct BackupError {
    BackupErrorCode code;
    std::string message;
};

/**
 * @brief Returns a stable name for an error code (e.g. "ConfigMissing").
 */
const char* toString(BackupErrorCode code);

enum class ArtifactKind {
    Archive,
    DatabaseDump,
    ConfigSnapshot
};

/**
 * @brief A file produced by a stage on the backup destination.
 */
struct BackupArtifact {
    fs::path path;          ///< Location on the destination.
    ArtifactKind kind;      ///< Which stage produced it.
    std::string timestamp;  ///< Timestamp embedded in the file name.
};

enum class StageStatus {
    Success,
    Failure
};

/**
 * @brief Result of one stage invocation for one site.
 */
struct StageOutcome {
    StageStatus status = StageStatus::Failure;
    std::string message;
    std::optional<BackupArtifact> artifact;

    bool ok() const { return status == StageStatus::Success; }

    static StageOutcome success(std::string message, BackupArtifact artifact);
    static StageOutcome failure(std::string message);
};

/**
 * @brief Progress of a site through the orchestrator.
 */
enum class SiteBackupState {
    Pending,
    FilesystemDone,
    DatabaseDone,
    ConfigSnapshotDone,
    Reported
};

/**
 * @brief Four-way classification of a site's three stage outcomes.
 */
enum class AggregateStatus {
    CompleteSuccess,
    PartialFilesOk,
    PartialDatabaseOk,
    TotalFailure
};

/**
 * @brief Outcome of all stages for one site.
 */
struct SiteBackupResult {
    std::string siteId;
    SiteBackupState state = SiteBackupState::Pending;
    StageOutcome archive;
    StageOutcome database;
    StageOutcome configSnapshot;
    AggregateStatus status = AggregateStatus::TotalFailure;

    /**
     * @brief Artifacts produced for this site, in stage order.
     */
    std::vector<BackupArtifact> artifacts() const;
};

/**
 * @brief Per-site parameters handed to every stage.
 */
struct BackupContext {
    fs::path destination;   ///< Backup destination directory (already created).
    std::string timestamp;  ///< Timestamp embedded in every artifact name of this site.
};

/**
 * @brief Result of a whole interactive run.
 */
struct RunSummary {
    fs::path destination;
    std::vector<SiteBackupResult> results;
    bool cancelled = false;     ///< Operator chose "quit" at the prompt.
    bool interrupted = false;   ///< A signal stopped the run before every site was attempted.
};

#endif // BACKUP_TYPES_HPP
