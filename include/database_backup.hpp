/**
 * @file database_backup.hpp
 * @brief Database dump stage for SiteVault.
 *
 * Resolves a site's credentials from its configuration file, runs the MySQL dump
 * utility against the site's database and gzip-compresses the dump in place.
 *
 * @note Requires a mysqldump-compatible client (mysqldump or mariadb-dump) in PATH,
 * or configured by absolute path.
 */

#ifndef DATABASE_BACKUP_HPP
#define DATABASE_BACKUP_HPP

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <vector>
#include "backup_stage.hpp"
#include "config_extractor.hpp"
#include "sitevault_config.hpp"

/**
 * @brief Interface for database dump strategies.
 */
class DatabaseBackupStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~DatabaseBackupStrategy() = default;

    /**
     * @brief Writes a textual dump of one database.
     *
     * @param credentials Connection parameters; only used for the duration of the call.
     * @param dumpFile Path of the uncompressed dump to create. Must not exist.
     * @return std::expected<void, BackupError> Success, or ProcessFailed / Timeout /
     *         EmptyOutput. On failure no dump file is left behind.
     */
    virtual std::expected<void, BackupError> execute(const DatabaseCredentials& credentials,
                                                     const fs::path& dumpFile) = 0;
};

/**
 * @brief MySQL dump strategy using mysqldump.
 *
 * The password reaches the child process only through its MYSQL_PWD environment entry,
 * never through the command line.
 */
class MySQLBackupStrategy : public DatabaseBackupStrategy {
public:
    /**
     * @brief Constructs a MySQL dump strategy.
     *
     * @param mysqldump Dump utility name or path.
     * @param timeout Maximum run time of one dump.
     */
    MySQLBackupStrategy(std::string mysqldump, std::chrono::seconds timeout);

    std::expected<void, BackupError> execute(const DatabaseCredentials& credentials,
                                             const fs::path& dumpFile) override;

    /**
     * @brief Builds the dump utility's argument vector (without the password).
     *
     * @param mysqldump Dump utility name or path (argv[0]).
     * @param credentials Connection parameters.
     * @return std::vector<std::string> Program and arguments.
     */
    static std::vector<std::string> buildArguments(const std::string& mysqldump,
                                                   const DatabaseCredentials& credentials);

private:
    std::string mysqldump;
    std::chrono::seconds timeout;
};

/**
 * @brief Compresses a file with gzip, writing `<file>.gz`.
 *
 * The source file is removed only after the compressed copy has been fully written.
 *
 * @param source File to compress.
 * @return std::expected<fs::path, std::string> Path of the .gz file, or an error message
 *         (the source is then left untouched and no partial .gz remains).
 */
std::expected<fs::path, std::string> gzipFile(const fs::path& source);

/**
 * @brief Stage producing `db_<site>_<timestamp>.sql.gz`.
 *
 * Succeeds only when the dump process exits cleanly and its output is non-empty.
 * A compression failure after a good dump is logged and the uncompressed dump is
 * kept as the artifact.
 */
class DatabaseDumpStage : public BackupStage {
public:
    /**
     * @brief Constructs the stage.
     *
     * @param config Configuration used for logging and the site marker name.
     * @param extractor Credential extraction strategy.
     * @param strategy Dump strategy.
     */
    DatabaseDumpStage(const SiteVaultConfig& config,
                      std::unique_ptr<CredentialsExtractor> extractor,
                      std::unique_ptr<DatabaseBackupStrategy> strategy);

    std::string name() const override;
    StageOutcome run(const Site& site, const BackupContext& context) override;

private:
    const SiteVaultConfig& config;
    std::unique_ptr<CredentialsExtractor> extractor;
    std::unique_ptr<DatabaseBackupStrategy> strategy;
};

#endif // DATABASE_BACKUP_HPP
