/**
 * @file file_backup.hpp
 * @brief Filesystem archive stage for SiteVault.
 *
 * Produces one tar.gz archive per site. Entries are stored under the site's directory
 * name, so extracting the archive recreates that directory.
 *
 * @note Requires libarchive for tar.gz writing and verification.
 */

#ifndef FILE_BACKUP_HPP
#define FILE_BACKUP_HPP

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <vector>
#include "backup_stage.hpp"
#include "sitevault_config.hpp"

struct archive;

/**
 * @brief Interface for file backup strategies.
 */
class FileBackupStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~FileBackupStrategy() = default;

    /**
     * @brief Archives a directory tree into a single output file.
     *
     * @param sourceDir Directory to archive; its name becomes the archive's top-level entry.
     * @param outputFile Path for the output archive. Must not exist; an existing file
     *        is an error and is left untouched.
     * @return std::expected<void, std::string> Success or an error message. On error
     *         no output the strategy created is left behind.
     */
    virtual std::expected<void, std::string> execute(const fs::path& sourceDir,
                                                     const fs::path& outputFile) = 0;
};

/**
 * @brief Tar.gz file backup strategy built on libarchive.
 *
 * Stores directories, regular files and symlinks with their permissions and
 * modification times. Sockets, FIFOs and device nodes are skipped. The written
 * archive is read back once to verify it.
 */
class TarGzFileBackupStrategy : public FileBackupStrategy {
public:
    /**
     * @brief Constructs a tar.gz backup strategy.
     *
     * @param excludeExtensions File extensions to exclude (e.g., {".tmp", ".log"}).
     * @param timeout Maximum time for writing one archive.
     */
    TarGzFileBackupStrategy(std::vector<std::string> excludeExtensions, std::chrono::seconds timeout);

    /**
     * @brief Writes and verifies a tar.gz archive of @p sourceDir.
     *
     * @note Stops with an error when the timeout elapses or gShutdownFlag is raised.
     */
    std::expected<void, std::string> execute(const fs::path& sourceDir,
                                             const fs::path& outputFile) override;

    /**
     * @brief Verifies the integrity of a tar.gz archive.
     *
     * Reads every header and skips every data block.
     *
     * @param archiveFile Path to the archive.
     * @return std::expected<std::size_t, std::string> Number of entries, or an error message.
     */
    static std::expected<std::size_t, std::string> verify(const fs::path& archiveFile);

private:
    std::vector<std::string> excludeExtensions; ///< File extensions to exclude.
    std::chrono::seconds timeout;               ///< Limit for one archive.

    /**
     * @brief Counts the entries that will be archived, for progress reporting.
     */
    std::size_t countEntries(const fs::path& sourceDir) const;

    /**
     * @brief Whether a file is left out because of its extension.
     */
    bool isExcluded(const fs::path& path) const;

    /**
     * @brief Adds one filesystem entry to the archive.
     *
     * @param a Open archive.
     * @param path Entry on disk.
     * @param entryName Name inside the archive.
     * @return std::expected<bool, std::string> True when written, false when skipped.
     */
    std::expected<bool, std::string> addEntry(struct archive* a,
                                              const fs::path& path,
                                              const std::string& entryName) const;
};

/**
 * @brief Stage producing `<site>_<timestamp>.tar.gz`.
 *
 * Refuses directories that no longer exist or no longer carry the site's
 * configuration marker. Any partially written archive is removed on failure.
 */
class ArchiveStage : public BackupStage {
public:
    /**
     * @brief Constructs the stage.
     *
     * @param config Configuration used for logging and the site marker name.
     * @param strategy Archive writer.
     */
    ArchiveStage(const SiteVaultConfig& config, std::unique_ptr<FileBackupStrategy> strategy);

    std::string name() const override;
    StageOutcome run(const Site& site, const BackupContext& context) override;

private:
    const SiteVaultConfig& config;
    std::unique_ptr<FileBackupStrategy> strategy;
};

#endif // FILE_BACKUP_HPP
