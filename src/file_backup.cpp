/**
 * @file file_backup.cpp
 * @brief Tar.gz archive stage implementation for SiteVault.
 *
 * Walks the site tree with std::filesystem and streams entries through libarchive.
 * Stops early on timeout or signal. The archive file is created exclusively and
 * removed again by the strategy whenever it does not complete.
 */

#include "file_backup.hpp"
#include "artifact.hpp"
#include <algorithm>
#include <archive.h>
#include <archive_entry.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <fstream>
#include <print>
#include <utility>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

extern volatile std::sig_atomic_t gShutdownFlag;

namespace {

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

// Removes a file this process created unless the write was committed.
class PartialOutput {
public:
    explicit PartialOutput(fs::path path) : path(std::move(path)) {}
    ~PartialOutput() {
        if (!committed) {
            removeQuietly(path);
        }
    }
    PartialOutput(const PartialOutput&) = delete;
    PartialOutput& operator=(const PartialOutput&) = delete;

    void commit() { committed = true; }

private:
    fs::path path;
    bool committed = false;
};

} // namespace

TarGzFileBackupStrategy::TarGzFileBackupStrategy(std::vector<std::string> excludeExtensions, std::chrono::seconds timeout)
    : excludeExtensions(std::move(excludeExtensions)), timeout(timeout) {}

bool TarGzFileBackupStrategy::isExcluded(const fs::path& path) const {
    auto ext = path.extension().string();
    return !ext.empty() && std::ranges::find(excludeExtensions, ext) != excludeExtensions.end();
}

std::size_t TarGzFileBackupStrategy::countEntries(const fs::path& sourceDir) const {
    std::size_t count = 1;
    std::error_code ec;
    auto it = fs::recursive_directory_iterator(sourceDir, ec);
    for (auto end = fs::recursive_directory_iterator(); !ec && it != end; it.increment(ec)) {
        auto status = it->symlink_status(ec);
        if (ec) break;
        if (fs::is_regular_file(status) && isExcluded(it->path())) continue;
        if (fs::is_regular_file(status) || fs::is_directory(status) || fs::is_symlink(status)) {
            ++count;
        }
    }
    return count;
}

std::expected<bool, std::string> TarGzFileBackupStrategy::addEntry(struct archive* a,
                                                                   const fs::path& path,
                                                                   const std::string& entryName) const {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return std::unexpected(std::format("Failed to stat {} (error: {})", path.string(), strerror(errno)));
    }
    bool isDirectory = S_ISDIR(st.st_mode);
    bool isRegular = S_ISREG(st.st_mode);
    bool isSymlink = S_ISLNK(st.st_mode);
    if (!isDirectory && !isRegular && !isSymlink) {
        return false;
    }
    if (isRegular && isExcluded(path)) {
        return false;
    }

    std::ifstream file;
    if (isRegular) {
        file.open(path, std::ios::binary);
        if (!file) {
            return std::unexpected(std::format("Failed to open file: {} (error: {})", path.string(), strerror(errno)));
        }
    }

    struct archive_entry* ae = archive_entry_new();
    archive_entry_copy_stat(ae, &st);
    archive_entry_set_pathname(ae, entryName.c_str());
    if (isSymlink) {
        std::error_code ec;
        auto target = fs::read_symlink(path, ec);
        if (ec) {
            archive_entry_free(ae);
            return std::unexpected(std::format("Failed to read symlink {}: {}", path.string(), ec.message()));
        }
        archive_entry_set_symlink(ae, target.c_str());
    }

    if (archive_write_header(a, ae) < ARCHIVE_WARN) {
        std::string errorMsg = std::format("Failed to write header for {}: {}", entryName, archive_error_string(a));
        archive_entry_free(ae);
        return std::unexpected(errorMsg);
    }
    archive_entry_free(ae);

    if (isRegular) {
        char buf[8192];
        while (file) {
            file.read(buf, sizeof(buf));
            auto count = file.gcount();
            if (count > 0 && archive_write_data(a, buf, static_cast<size_t>(count)) < 0) {
                return std::unexpected(std::format("Failed to write data for {}: {}", entryName, archive_error_string(a)));
            }
        }
        if (file.bad()) {
            return std::unexpected(std::format("Failed to read file: {}", path.string()));
        }
    }
    return true;
}

std::expected<void, std::string> TarGzFileBackupStrategy::execute(const fs::path& sourceDir,
                                                                  const fs::path& outputFile) {
    fs::path root = sourceDir.lexically_normal();
    if (!root.has_filename()) {
        root = root.parent_path();
    }
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return std::unexpected(std::format("Directory {} not found", root.string()));
    }
    std::string rootName = root.filename().string();
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::println("Counting files...");
    std::size_t totalEntries = countEntries(root);

    int fd = open(outputFile.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        return std::unexpected(std::format("Failed to create archive file: {} (error: {})", outputFile.string(), strerror(errno)));
    }
    PartialOutput partial(outputFile);

    struct archive* a = archive_write_new();
    archive_write_add_filter_gzip(a);
    archive_write_set_format_pax_restricted(a);
    if (archive_write_open_fd(a, fd) != ARCHIVE_OK) {
        std::string errorMsg = std::format("Failed to open archive file: {} (error: {})", outputFile.string(), archive_error_string(a));
        archive_write_free(a);
        close(fd);
        return std::unexpected(errorMsg);
    }

    std::string failure;
    std::size_t processedEntries = 0;
    auto added = addEntry(a, root, rootName);
    if (!added) {
        failure = added.error();
    } else {
        ++processedEntries;
    }

    auto it = fs::recursive_directory_iterator(root, ec);
    if (failure.empty() && ec) {
        failure = std::format("Failed to access directory {}: {}", root.string(), ec.message());
    }
    for (auto end = fs::recursive_directory_iterator(); failure.empty() && it != end;) {
        if (gShutdownFlag) {
            failure = "Backup interrupted by signal";
            break;
        }
        if (std::chrono::steady_clock::now() > deadline) {
            failure = std::format("Archiving timed out after {} seconds", timeout.count());
            break;
        }

        std::string entryName = std::format("{}/{}", rootName, it->path().lexically_relative(root).generic_string());
        auto result = addEntry(a, it->path(), entryName);
        if (!result) {
            failure = result.error();
            break;
        }
        if (*result) {
            ++processedEntries;
            float progress = std::min(static_cast<float>(processedEntries) / totalEntries * 100, 100.0f);
            std::print("\rProgress: {:.2f}% ({}/{} entries)", progress, processedEntries, totalEntries);
        }

        it.increment(ec);
        if (ec) {
            failure = std::format("Failed to access {}: {}", root.string(), ec.message());
        }
    }

    if (!failure.empty()) {
        archive_write_fail(a);
        archive_write_free(a);
        close(fd);
        std::println("");
        return std::unexpected(failure);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        std::string errorMsg = std::format("Failed to finish archive {}: {}", outputFile.string(), archive_error_string(a));
        archive_write_free(a);
        close(fd);
        return std::unexpected(errorMsg);
    }
    archive_write_free(a);
    if (close(fd) != 0) {
        return std::unexpected(std::format("Failed to finish archive {} (error: {})", outputFile.string(), strerror(errno)));
    }
    std::println("\nFile backup completed.");

    auto verified = verify(outputFile);
    if (!verified) {
        return std::unexpected(std::format("Backup verification failed: {}", verified.error()));
    }
    if (*verified != processedEntries) {
        return std::unexpected(std::format("Backup verification failed: expected {} entries, found {}", processedEntries, *verified));
    }
    partial.commit();
    return {};
}

std::expected<std::size_t, std::string> TarGzFileBackupStrategy::verify(const fs::path& archiveFile) {
    struct archive* a = archive_read_new();
    archive_read_support_filter_gzip(a);
    archive_read_support_format_tar(a);
    if (archive_read_open_filename(a, archiveFile.c_str(), 10240) != ARCHIVE_OK) {
        std::string errorMsg = std::format("Failed to open archive for verification: {} (error: {})", archiveFile.string(), archive_error_string(a));
        archive_read_free(a);
        return std::unexpected(errorMsg);
    }

    struct archive_entry* entry;
    std::size_t entries = 0;
    int rc;
    while ((rc = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        if (archive_read_data_skip(a) != ARCHIVE_OK) {
            rc = ARCHIVE_FATAL;
            break;
        }
        ++entries;
    }

    std::string errorMsg = rc == ARCHIVE_EOF ? std::string() : std::format("Corrupt archive {}: {}", archiveFile.string(),
                                                                           archive_error_string(a) ? archive_error_string(a) : "unknown error");
    archive_read_close(a);
    archive_read_free(a);
    if (!errorMsg.empty()) {
        return std::unexpected(errorMsg);
    }
    return entries;
}

ArchiveStage::ArchiveStage(const SiteVaultConfig& config, std::unique_ptr<FileBackupStrategy> strategy)
    : config(config), strategy(std::move(strategy)) {}

std::string ArchiveStage::name() const {
    return "Filesystem backup";
}

StageOutcome ArchiveStage::run(const Site& site, const BackupContext& context) {
    config.logMessage(std::format("Starting filesystem backup for {} ({})", site.id, site.installPath.string()));

    std::error_code ec;
    if (!fs::is_directory(site.installPath, ec)) {
        auto errorMsg = std::format("Filesystem backup failed for {}: directory {} not found", site.id, site.installPath.string());
        config.logError(errorMsg);
        return StageOutcome::failure(errorMsg);
    }
    fs::path marker = site.configPath.value_or(site.installPath / config.configMarker);
    if (!fs::exists(marker, ec)) {
        auto errorMsg = std::format("Filesystem backup failed for {}: not a recognized installation ({} missing)", site.id, marker.string());
        config.logError(errorMsg);
        return StageOutcome::failure(errorMsg);
    }

    fs::path outputFile = artifactPath(context.destination, ArtifactKind::Archive, site.id, context.timestamp);
    std::expected<void, std::string> result;
    try {
        result = strategy->execute(site.installPath, outputFile);
    } catch (const std::exception& e) {
        result = std::unexpected(std::string(e.what()));
    }
    if (!result) {
        auto errorMsg = std::format("Filesystem backup failed for {}: {}", site.id, result.error());
        config.logError(errorMsg);
        return StageOutcome::failure(errorMsg);
    }

    auto size = fs::file_size(outputFile, ec);
    auto successMsg = std::format("Filesystem backup successful: {} ({})", outputFile.string(), humanReadableSize(ec ? 0 : size));
    config.logMessage(successMsg);
    return StageOutcome::success(successMsg, BackupArtifact{outputFile, ArtifactKind::Archive, context.timestamp});
}
