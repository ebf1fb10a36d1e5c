#include "database_backup.hpp"
#include "artifact.hpp"
#include "process_runner.hpp"
#include <format>
#include <fstream>
#include <utility>
#include <zlib.h>

namespace {

std::string firstLine(const std::string& text) {
    auto end = text.find('\n');
    return text.substr(0, end);
}

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

MySQLBackupStrategy::MySQLBackupStrategy(std::string mysqldump, std::chrono::seconds timeout)
    : mysqldump(std::move(mysqldump)), timeout(timeout) {}

std::vector<std::string> MySQLBackupStrategy::buildArguments(const std::string& mysqldump,
                                                             const DatabaseCredentials& credentials) {
    std::vector<std::string> args = {
        mysqldump,
        "--single-transaction",
        "--quick",
        "--routines",
        "--triggers",
        "--no-tablespaces",
        std::format("--user={}", credentials.user)
    };

    auto endpoint = splitDatabaseHost(credentials.host);
    if (endpoint.socket) {
        args.push_back(std::format("--socket={}", *endpoint.socket));
    } else {
        args.push_back(std::format("--host={}", endpoint.host));
        if (endpoint.port) {
            args.push_back(std::format("--port={}", *endpoint.port));
        }
    }
    args.push_back(credentials.name);
    return args;
}

std::expected<void, BackupError> MySQLBackupStrategy::execute(const DatabaseCredentials& credentials,
                                                              const fs::path& dumpFile) {
    if (credentials.name.empty() || credentials.user.empty()) {
        return std::unexpected(BackupError{BackupErrorCode::CredentialsIncomplete,
                                           "Invalid MySQL credentials: database or user missing"});
    }

    ProcessSpec spec;
    ScopedSecretWipe envWipe(spec.extraEnv);
    spec.argv = buildArguments(mysqldump, credentials);
    spec.stdoutFile = dumpFile;
    spec.timeout = timeout;
    if (!credentials.password.empty()) {
        spec.extraEnv.push_back("MYSQL_PWD=" + credentials.password);
    }

    // On error nothing was written: the dump file may belong to a concurrent run.
    auto result = runProcess(spec);
    if (!result) {
        return std::unexpected(BackupError{BackupErrorCode::ProcessFailed,
                                           std::format("Failed to execute {}: {}", mysqldump, result.error())});
    }
    if (result->timedOut) {
        removeQuietly(dumpFile);
        return std::unexpected(BackupError{BackupErrorCode::Timeout,
                                           std::format("{} timed out after {} seconds", mysqldump, timeout.count())});
    }
    if (!result->succeeded()) {
        removeQuietly(dumpFile);
        std::string reason = result->signaled
            ? std::string("terminated by signal")
            : std::format("exit code {}", result->exitCode);
        std::string detail = firstLine(result->errorOutput);
        return std::unexpected(BackupError{BackupErrorCode::ProcessFailed,
                                           detail.empty()
                                               ? std::format("{} failed ({})", mysqldump, reason)
                                               : std::format("{} failed ({}): {}", mysqldump, reason, detail)});
    }

    std::error_code ec;
    auto size = fs::file_size(dumpFile, ec);
    if (ec || size == 0) {
        removeQuietly(dumpFile);
        return std::unexpected(BackupError{BackupErrorCode::EmptyOutput,
                                           std::format("{} produced an empty dump for database {}", mysqldump, credentials.name)});
    }
    return {};
}

std::expected<fs::path, std::string> gzipFile(const fs::path& source) {
    fs::path target = source;
    target += ".gz";

    std::ifstream inFile(source, std::ios::binary);
    if (!inFile) {
        return std::unexpected(std::format("Failed to open {} for compression", source.string()));
    }
    gzFile outFile = gzopen(target.c_str(), "wbx");
    if (!outFile) {
        return std::unexpected(std::format("Failed to open gzip file for writing: {}", target.string()));
    }

    char buf[8192];
    bool writeOk = true;
    while (inFile && writeOk) {
        inFile.read(buf, sizeof(buf));
        auto count = static_cast<unsigned>(inFile.gcount());
        if (count > 0 && gzwrite(outFile, buf, count) != static_cast<int>(count)) {
            writeOk = false;
        }
    }
    bool readOk = inFile.eof();
    inFile.close();

    if (gzclose(outFile) != Z_OK || !writeOk || !readOk) {
        removeQuietly(target);
        return std::unexpected(std::format("Failed to compress {}", source.string()));
    }

    removeQuietly(source);
    return target;
}

DatabaseDumpStage::DatabaseDumpStage(const SiteVaultConfig& config,
                                     std::unique_ptr<CredentialsExtractor> extractor,
                                     std::unique_ptr<DatabaseBackupStrategy> strategy)
    : config(config), extractor(std::move(extractor)), strategy(std::move(strategy)) {}

std::string DatabaseDumpStage::name() const {
    return "Database backup";
}

StageOutcome DatabaseDumpStage::run(const Site& site, const BackupContext& context) {
    config.logMessage(std::format("Starting database backup for {}", site.id));

    fs::path configFile = site.configPath.value_or(site.installPath / config.configMarker);
    auto credentials = extractor->extract(configFile);
    if (!credentials) {
        auto errorMsg = std::format("Database backup failed for {}: {}", site.id, credentials.error().message);
        config.logError(errorMsg);
        return StageOutcome::failure(errorMsg);
    }
    ScopedSecretWipe passwordWipe(credentials->password);

    fs::path dumpFile = artifactPath(context.destination, ArtifactKind::DatabaseDump, site.id, context.timestamp);
    config.logMessage(std::format("Dumping database {} as {}@{}", credentials->name, credentials->user, credentials->host));
    auto dumpResult = strategy->execute(*credentials, dumpFile);
    if (!dumpResult) {
        auto errorMsg = std::format("Database backup failed for {}: {}", site.id, dumpResult.error().message);
        config.logError(errorMsg);
        return StageOutcome::failure(errorMsg);
    }

    fs::path artifactFile = dumpFile;
    auto compressed = gzipFile(dumpFile);
    if (compressed) {
        artifactFile = *compressed;
    } else {
        config.logError(std::format("{}; keeping uncompressed dump {}", compressed.error(), dumpFile.string()));
    }

    std::error_code ec;
    auto size = fs::file_size(artifactFile, ec);
    auto successMsg = std::format("Database backup successful: {} ({})", artifactFile.string(), humanReadableSize(ec ? 0 : size));
    config.logMessage(successMsg);
    return StageOutcome::success(successMsg, BackupArtifact{artifactFile, ArtifactKind::DatabaseDump, context.timestamp});
}
