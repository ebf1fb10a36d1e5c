/**
 * @file config_extractor.hpp
 * @brief Recovers database connection parameters from a site's configuration file.
 *
 * The line-based extractor is a best-effort textual scan, not a PHP parser: the first
 * line mentioning a key provides that key's value, taken from the next quoted literal
 * after the key. A comment mentioning the key before the real assignment therefore
 * wins. Callers depend only on CredentialsExtractor so a structured parser can replace it.
 */

#ifndef CONFIG_EXTRACTOR_HPP
#define CONFIG_EXTRACTOR_HPP

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include "backup_types.hpp"

/**
 * @brief Names of the four assignments read from a configuration file.
 */
struct CredentialKeys {
    std::string name = "DB_NAME";
    std::string user = "DB_USER";
    std::string password = "DB_PASSWORD";
    std::string host = "DB_HOST";
};

/**
 * @brief Interface for credential extraction strategies.
 */
class CredentialsExtractor {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~CredentialsExtractor() = default;

    /**
     * @brief Extracts credentials from a configuration file.
     *
     * @param configFile Path to the site's configuration file.
     * @return std::expected<DatabaseCredentials, BackupError> Credentials, or
     *         ConfigMissing when the file does not exist / cannot be read, or
     *         CredentialsIncomplete when name or user is empty.
     */
    virtual std::expected<DatabaseCredentials, BackupError> extract(const fs::path& configFile) const = 0;
};

/**
 * @brief Line-scanning extractor for `define('KEY', 'value');` style files.
 */
class LineConfigExtractor : public CredentialsExtractor {
public:
    explicit LineConfigExtractor(CredentialKeys keys = {});

    std::expected<DatabaseCredentials, BackupError> extract(const fs::path& configFile) const override;

    /**
     * @brief Returns the first quoted literal following @p key on @p line.
     *
     * A quote directly after the key closes the key's own literal and is skipped.
     *
     * @return std::nullopt if the key does not occur on the line; an empty string
     *         if it occurs but no complete quoted literal follows.
     */
    static std::optional<std::string> quotedValueAfterKey(std::string_view line, std::string_view key);

private:
    CredentialKeys keys;
};

/**
 * @brief Connection target derived from a DB_HOST value.
 */
struct DatabaseEndpoint {
    std::string host = "localhost";
    std::optional<int> port;
    std::optional<std::string> socket;
};

/**
 * @brief Splits "host", "host:port" and "host:/path/to/socket" forms.
 *
 * Values with more than one colon (IPv6 literals) are kept as a plain host.
 */
DatabaseEndpoint splitDatabaseHost(const std::string& hostValue);

#endif // CONFIG_EXTRACTOR_HPP
