#include "remote_transfer.hpp"
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <fcntl.h>
#include <format>
#include <fstream>
#include <print>
#include <utility>

namespace {

BackupError transferError(std::string message) {
    return BackupError{BackupErrorCode::TransferFailed, std::move(message)};
}

void wipe(char* buffer, std::size_t size) {
    volatile char* p = buffer;
    for (std::size_t i = 0; i < size; ++i) {
        p[i] = '\0';
    }
}

std::expected<void, std::string> verifyHost(ssh_session ssh, const std::string& host) {
    switch (ssh_session_is_known_server(ssh)) {
        case SSH_KNOWN_HOSTS_OK:
            return {};
        case SSH_KNOWN_HOSTS_UNKNOWN:
        case SSH_KNOWN_HOSTS_NOT_FOUND:
            if (ssh_session_update_known_hosts(ssh) != SSH_OK) {
                return std::unexpected(std::format("Failed to record host key for {}: {}", host, ssh_get_error(ssh)));
            }
            std::println(stderr, "Warning: Permanently added {} to the list of known hosts.", host);
            return {};
        case SSH_KNOWN_HOSTS_CHANGED:
            return std::unexpected(std::format("Host key for {} has changed, refusing to connect", host));
        case SSH_KNOWN_HOSTS_OTHER:
            return std::unexpected(std::format("Host key type for {} has changed, refusing to connect", host));
        case SSH_KNOWN_HOSTS_ERROR:
            break;
    }
    return std::unexpected(std::format("Failed to verify host key for {}: {}", host, ssh_get_error(ssh)));
}

std::expected<void, std::string> authenticate(ssh_session ssh, const RemoteEndpoint& endpoint) {
    if (ssh_userauth_publickey_auto(ssh, nullptr, nullptr) == SSH_AUTH_SUCCESS) {
        return {};
    }

    char password[256] = {};
    std::string prompt = std::format("{}@{}'s password: ", endpoint.user, endpoint.host);
    if (ssh_getpass(prompt.c_str(), password, sizeof(password), 0, 0) < 0) {
        wipe(password, sizeof(password));
        return std::unexpected("SSH authentication failed");
    }
    int rc = ssh_userauth_password(ssh, nullptr, password);
    wipe(password, sizeof(password));
    if (rc != SSH_AUTH_SUCCESS) {
        return std::unexpected("SSH password authentication failed");
    }
    return {};
}

std::expected<void, std::string> downloadFile(ssh_session ssh, sftp_session sftp,
                                              const std::string& remoteFile, const fs::path& localFile) {
    sftp_file file = sftp_open(sftp, remoteFile.c_str(), O_RDONLY, 0);
    if (!file) {
        return std::unexpected(std::format("Failed to open remote file {}: {}", remoteFile, ssh_get_error(ssh)));
    }

    std::ofstream output(localFile, std::ios::binary | std::ios::trunc);
    if (!output) {
        sftp_close(file);
        return std::unexpected(std::format("Failed to open local file {}", localFile.string()));
    }

    char buf[16384];
    while (true) {
        ssize_t n = sftp_read(file, buf, sizeof(buf));
        if (n < 0) {
            sftp_close(file);
            return std::unexpected(std::format("Failed to read remote file {}: {}", remoteFile, ssh_get_error(ssh)));
        }
        if (n == 0) {
            break;
        }
        output.write(buf, n);
        if (!output) {
            sftp_close(file);
            return std::unexpected(std::format("Failed to write local file {}", localFile.string()));
        }
    }
    sftp_close(file);
    std::println("Fetched: {}", localFile.string());
    return {};
}

std::expected<std::size_t, std::string> downloadDirectory(ssh_session ssh, sftp_session sftp,
                                                          const std::string& remoteDir, const fs::path& localDir) {
    sftp_dir dir = sftp_opendir(sftp, remoteDir.c_str());
    if (!dir) {
        return std::unexpected(std::format("Failed to open remote directory {}: {}", remoteDir, ssh_get_error(ssh)));
    }

    std::error_code ec;
    fs::create_directories(localDir, ec);
    if (ec) {
        sftp_closedir(dir);
        return std::unexpected(std::format("Failed to create local directory {}: {}", localDir.string(), ec.message()));
    }

    std::size_t files = 0;
    std::string failure;
    sftp_attributes attrs;
    while (failure.empty() && (attrs = sftp_readdir(sftp, dir)) != nullptr) {
        std::string name = attrs->name ? attrs->name : "";
        auto type = attrs->type;
        sftp_attributes_free(attrs);
        if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
            continue;
        }

        std::string remotePath = std::format("{}/{}", remoteDir, name);
        if (type == SSH_FILEXFER_TYPE_SYMLINK) {
            sftp_attributes target = sftp_stat(sftp, remotePath.c_str());
            if (!target) {
                continue;
            }
            type = target->type;
            sftp_attributes_free(target);
        }

        if (type == SSH_FILEXFER_TYPE_DIRECTORY) {
            auto copied = downloadDirectory(ssh, sftp, remotePath, localDir / name);
            if (!copied) {
                failure = copied.error();
            } else {
                files += *copied;
            }
        } else if (type == SSH_FILEXFER_TYPE_REGULAR) {
            auto copied = downloadFile(ssh, sftp, remotePath, localDir / name);
            if (!copied) {
                failure = copied.error();
            } else {
                ++files;
            }
        }
    }

    if (failure.empty() && !sftp_dir_eof(dir)) {
        failure = std::format("Failed to list remote directory {}: {}", remoteDir, ssh_get_error(ssh));
    }
    sftp_closedir(dir);
    if (!failure.empty()) {
        return std::unexpected(failure);
    }
    return files;
}

} // namespace

std::expected<RemoteEndpoint, BackupError> parseEndpoint(const std::string& text) {
    auto at = text.find('@');
    if (at == std::string::npos) {
        return std::unexpected(transferError(std::format("Invalid endpoint '{}': expected user@host", text)));
    }
    RemoteEndpoint endpoint{text.substr(0, at), text.substr(at + 1)};
    if (endpoint.user.empty() || endpoint.host.empty() || endpoint.host.find('@') != std::string::npos) {
        return std::unexpected(transferError(std::format("Invalid endpoint '{}': expected user@host", text)));
    }
    return endpoint;
}

std::string remoteSftpPath(const std::string& remoteDir) {
    if (remoteDir == "~" || remoteDir == "~/") {
        return ".";
    }
    if (remoteDir.starts_with("~/")) {
        return remoteDir.substr(2);
    }
    return remoteDir;
}

SFTPFetchStrategy::SFTPFetchStrategy(RemoteEndpoint endpoint, int port)
    : endpoint_(std::move(endpoint)), port_(port) {}

std::expected<std::size_t, BackupError> SFTPFetchStrategy::fetch(const std::string& remoteDir, const fs::path& localDir) {
    ssh_session ssh = ssh_new();
    if (!ssh) {
        return std::unexpected(transferError("Failed to create SSH session"));
    }
    ssh_options_set(ssh, SSH_OPTIONS_HOST, endpoint_.host.c_str());
    ssh_options_set(ssh, SSH_OPTIONS_PORT, &port_);
    ssh_options_set(ssh, SSH_OPTIONS_USER, endpoint_.user.c_str());
    if (ssh_connect(ssh) != SSH_OK) {
        auto errorMsg = std::format("SSH connection to {} failed: {}", endpoint_.host, ssh_get_error(ssh));
        ssh_free(ssh);
        return std::unexpected(transferError(errorMsg));
    }

    auto closeSession = [ssh]() {
        ssh_disconnect(ssh);
        ssh_free(ssh);
    };

    if (auto verified = verifyHost(ssh, endpoint_.host); !verified) {
        closeSession();
        return std::unexpected(transferError(verified.error()));
    }
    if (auto authenticated = authenticate(ssh, endpoint_); !authenticated) {
        closeSession();
        return std::unexpected(transferError(authenticated.error()));
    }

    sftp_session sftp = sftp_new(ssh);
    if (!sftp || sftp_init(sftp) != SSH_OK) {
        if (sftp) {
            sftp_free(sftp);
        }
        closeSession();
        return std::unexpected(transferError("SFTP initialization failed"));
    }

    auto copied = downloadDirectory(ssh, sftp, remoteSftpPath(remoteDir), localDir);
    sftp_free(sftp);
    closeSession();
    if (!copied) {
        return std::unexpected(transferError(copied.error()));
    }
    return *copied;
}
