/**
 * @file sitevault_config.hpp
 * @brief Configuration management for the SiteVault backup tool.
 *
 * Defines the settings used to discover sites, reach the dump utility, write logs and
 * notify about finished runs. Settings come from an optional JSON file; every key has
 * a built-in default so the tool also runs without one.
 *
 * @note The default file is /etc/sitevault/sitevault.json. Paths are Linux paths.
 */

#ifndef SITEVAULT_CONFIG_HPP
#define SITEVAULT_CONFIG_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Telegram Bot API settings for run notifications.
 */
struct TelegramSettings {
    std::string botToken; ///< Telegram bot token.
    std::string chatId;   ///< Telegram chat ID.

    bool enabled() const { return !botToken.empty() && !chatId.empty(); }
};

/**
 * @brief Settings for pulling backups from a remote host.
 */
struct RemoteSettings {
    int port = 22;                          ///< SSH port.
    std::string remoteDir = "~/wp_backups"; ///< Remote backup directory, overridden by REMOTE_DIR.
};

/**
 * @brief Configuration class for SiteVault.
 *
 * Loads settings from a JSON file and offers the timestamped logging used by every stage.
 */
class SiteVaultConfig {
public:
    /**
     * @brief Path of the configuration file read when none is given on the command line.
     */
    static constexpr const char* kDefaultConfigFile = "/etc/sitevault/sitevault.json";

    /**
     * @brief Constructs a configuration holding only built-in defaults.
     */
    SiteVaultConfig() = default;

    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * Keys missing from the file keep their defaults.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file cannot be opened or parsed, or holds invalid values.
     */
    explicit SiteVaultConfig(const std::string& configFile);

    /**
     * @brief Loads the configuration for a run.
     *
     * An explicitly requested file must exist. Without one, the default file is read
     * when present and built-in defaults are used otherwise.
     *
     * @param configFile File requested with --config, if any.
     * @return SiteVaultConfig The loaded configuration.
     * @throws std::runtime_error If the requested or default file is unreadable or invalid.
     */
    static SiteVaultConfig load(const std::optional<std::string>& configFile);

    /**
     * @brief Logs a message to stdout and the configured log file.
     *
     * @param message Message to log.
     * @note Creates the log file directory when it does not exist.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error to stderr and the configured error log file.
     *
     * @param message Error message to log.
     */
    void logError(const std::string& message) const;

    std::string sitesRoot = "/var/www/";                          ///< Directory scanned for installations.
    std::string backupDir = "/backups";                           ///< Backup destination.
    std::string configMarker = "wp-config.php";                   ///< File marking a directory as a site.
    std::string vhostDir = "/etc/nginx/sites-available";          ///< Virtual-host configuration directory.
    std::string mysqldump = "mysqldump";                          ///< Dump utility (name or path).
    std::chrono::seconds dumpTimeout{600};                        ///< Limit for one dump invocation.
    std::chrono::seconds archiveTimeout{1800};                    ///< Limit for writing one archive.
    std::vector<std::string> excludeExtensions;                   ///< File extensions left out of archives.
    std::string logFile = "/var/log/sitevault/backup.log";        ///< Path to the log file.
    std::string errorLogFile = "/var/log/sitevault/errors.log";   ///< Path to the error log file.
    TelegramSettings telegram;                                    ///< Optional run notification.
    RemoteSettings remote;                                        ///< Settings of sitevault-fetch.
};

#endif // SITEVAULT_CONFIG_HPP
