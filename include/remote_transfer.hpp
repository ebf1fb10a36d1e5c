/**
 * @file remote_transfer.hpp
 * @brief Pulls previously produced backups from a remote host.
 *
 * Used by sitevault-fetch: the contents of a remote directory are copied recursively
 * into a local directory over SFTP.
 *
 * @note Requires libssh for SFTP transfers.
 */

#ifndef REMOTE_TRANSFER_HPP
#define REMOTE_TRANSFER_HPP

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include "backup_types.hpp"

/**
 * @brief A parsed `user@host` endpoint.
 */
struct RemoteEndpoint {
    std::string user;
    std::string host;
};

/**
 * @brief Parses `user@host`.
 *
 * @return std::expected<RemoteEndpoint, BackupError> The endpoint, or TransferFailed when
 *         either part is empty or the '@' is missing.
 */
std::expected<RemoteEndpoint, BackupError> parseEndpoint(const std::string& text);

/**
 * @brief Resolves a remote directory for SFTP, which has no shell tilde expansion.
 *
 * "~" and "~/x" become paths relative to the remote home ("." and "x").
 */
std::string remoteSftpPath(const std::string& remoteDir);

/**
 * @brief Interface for remote fetch strategies.
 */
class RemoteFetchStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~RemoteFetchStrategy() = default;

    /**
     * @brief Copies the contents of a remote directory into a local directory.
     *
     * @param remoteDir Remote directory.
     * @param localDir Local target directory.
     * @return std::expected<std::size_t, BackupError> Number of files copied, or TransferFailed.
     */
    virtual std::expected<std::size_t, BackupError> fetch(const std::string& remoteDir, const fs::path& localDir) = 0;
};

/**
 * @brief SFTP fetch strategy.
 *
 * Authenticates with the SSH agent or default keys and falls back to an interactive
 * password prompt. Hosts whose key changed or cannot be checked are refused.
 */
class SFTPFetchStrategy : public RemoteFetchStrategy {
public:
    /**
     * @brief Constructs an SFTP fetch strategy.
     *
     * @param endpoint Remote user and host.
     * @param port SSH port (e.g., 22).
     */
    SFTPFetchStrategy(RemoteEndpoint endpoint, int port);

    std::expected<std::size_t, BackupError> fetch(const std::string& remoteDir, const fs::path& localDir) override;

private:
    RemoteEndpoint endpoint_; ///< Remote user and host.
    int port_; ///< SSH port.
};

#endif // REMOTE_TRANSFER_HPP
