#include "config_extractor.hpp"
#include <algorithm>
#include <charconv>
#include <format>
#include <fstream>
#include <utility>

LineConfigExtractor::LineConfigExtractor(CredentialKeys keys) : keys(std::move(keys)) {}

std::optional<std::string> LineConfigExtractor::quotedValueAfterKey(std::string_view line, std::string_view key) {
    auto pos = line.find(key);
    if (key.empty() || pos == std::string_view::npos) {
        return std::nullopt;
    }
    auto i = pos + key.size();
    if (i < line.size() && (line[i] == '\'' || line[i] == '"')) {
        ++i;
    }
    auto open = line.find_first_of("'\"", i);
    if (open == std::string_view::npos) {
        return std::string();
    }
    auto close = line.find(line[open], open + 1);
    if (close == std::string_view::npos) {
        return std::string();
    }
    return std::string(line.substr(open + 1, close - open - 1));
}

std::expected<DatabaseCredentials, BackupError> LineConfigExtractor::extract(const fs::path& configFile) const {
    std::error_code ec;
    if (!fs::is_regular_file(configFile, ec)) {
        return std::unexpected(BackupError{BackupErrorCode::ConfigMissing,
                                           std::format("Configuration file not found: {}", configFile.string())});
    }
    std::ifstream file(configFile);
    if (!file.is_open()) {
        return std::unexpected(BackupError{BackupErrorCode::ConfigMissing,
                                           std::format("Cannot read configuration file: {}", configFile.string())});
    }

    std::optional<std::string> name, user, password, host;
    auto scan = [](std::optional<std::string>& slot, std::string_view line, const std::string& key) {
        if (!slot) {
            slot = quotedValueAfterKey(line, key);
        }
    };

    std::string line;
    while (std::getline(file, line)) {
        scan(name, line, keys.name);
        scan(user, line, keys.user);
        scan(password, line, keys.password);
        scan(host, line, keys.host);
        if (name && user && password && host) {
            break;
        }
    }

    DatabaseCredentials credentials;
    credentials.name = name.value_or("");
    credentials.user = user.value_or("");
    credentials.password = password.value_or("");
    credentials.host = host.value_or("");
    if (credentials.host.empty()) {
        credentials.host = "localhost";
    }

    if (credentials.name.empty() || credentials.user.empty()) {
        return std::unexpected(BackupError{BackupErrorCode::CredentialsIncomplete,
                                           std::format("Database name or user missing in {}", configFile.string())});
    }
    return credentials;
}

DatabaseEndpoint splitDatabaseHost(const std::string& hostValue) {
    DatabaseEndpoint endpoint;
    auto first = hostValue.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return endpoint;
    }
    auto last = hostValue.find_last_not_of(" \t");
    std::string value = hostValue.substr(first, last - first + 1);

    if (std::ranges::count(value, ':') != 1) {
        endpoint.host = value;
        return endpoint;
    }

    auto colon = value.find(':');
    std::string host = value.substr(0, colon);
    std::string rest = value.substr(colon + 1);
    if (!host.empty()) {
        endpoint.host = host;
    }

    if (!rest.empty() && rest.front() == '/') {
        endpoint.socket = rest;
        return endpoint;
    }

    int port = 0;
    auto [ptr, err] = std::from_chars(rest.data(), rest.data() + rest.size(), port);
    if (err == std::errc() && ptr == rest.data() + rest.size() && port > 0 && port <= 65535) {
        endpoint.port = port;
    } else {
        endpoint.host = value;
    }
    return endpoint;
}
