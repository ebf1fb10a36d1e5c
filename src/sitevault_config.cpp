#include "sitevault_config.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>
#include <stdexcept>
#include <json/json.h>

namespace fs = std::filesystem;

namespace {

std::chrono::seconds readSeconds(const Json::Value& json, const char* key, std::chrono::seconds fallback) {
    if (!json.isMember(key)) {
        return fallback;
    }
    const Json::Value& value = json[key];
    if (!value.isIntegral() || value.asInt64() <= 0) {
        throw std::runtime_error(std::format("Invalid value for {}: expected a positive number of seconds", key));
    }
    return std::chrono::seconds(value.asInt64());
}

std::string readString(const Json::Value& json, const char* key, const std::string& fallback) {
    if (!json.isMember(key)) {
        return fallback;
    }
    if (!json[key].isString()) {
        throw std::runtime_error(std::format("Invalid value for {}: expected a string", key));
    }
    return json[key].asString();
}

std::string currentTime() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&timeT, &local);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &local);
    return timeBuf;
}

void appendToLog(const std::string& path, const std::string& logEntry) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << logEntry << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", path);
    }
}

} // namespace

SiteVaultConfig::SiteVaultConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
        throw std::runtime_error(std::format("Failed to parse config file: {} ({})", configFile, errors));
    }
    if (!configJson.isObject()) {
        throw std::runtime_error(std::format("Config file must contain a JSON object: {}", configFile));
    }

    sitesRoot = readString(configJson, "sites_root", sitesRoot);
    backupDir = readString(configJson, "backup_dir", backupDir);
    configMarker = readString(configJson, "config_marker", configMarker);
    vhostDir = readString(configJson, "vhost_dir", vhostDir);
    mysqldump = readString(configJson, "mysqldump", mysqldump);
    dumpTimeout = readSeconds(configJson, "dump_timeout_seconds", dumpTimeout);
    archiveTimeout = readSeconds(configJson, "archive_timeout_seconds", archiveTimeout);
    logFile = readString(configJson, "log_file", logFile);
    errorLogFile = readString(configJson, "error_log_file", errorLogFile);

    for (const auto& ext : configJson["exclude_extensions"]) {
        excludeExtensions.push_back(ext.asString());
    }

    if (configMarker.empty()) {
        throw std::runtime_error("Invalid value for config_marker: must not be empty");
    }

    const Json::Value& telegramJson = configJson["telegram"];
    if (telegramJson.isObject()) {
        telegram.botToken = telegramJson.get("bot_token", "").asString();
        telegram.chatId = telegramJson.get("chat_id", "").asString();
    }

    const Json::Value& remoteJson = configJson["remote"];
    if (remoteJson.isObject()) {
        remote.port = remoteJson.get("port", remote.port).asInt();
        remote.remoteDir = remoteJson.get("remote_dir", remote.remoteDir).asString();
        if (remote.port <= 0 || remote.port > 65535) {
            throw std::runtime_error(std::format("Invalid value for remote.port: {}", remote.port));
        }
    }
}

SiteVaultConfig SiteVaultConfig::load(const std::optional<std::string>& configFile) {
    if (configFile) {
        return SiteVaultConfig(*configFile);
    }
    std::error_code ec;
    if (fs::exists(kDefaultConfigFile, ec)) {
        return SiteVaultConfig(kDefaultConfigFile);
    }
    return SiteVaultConfig();
}

void SiteVaultConfig::logMessage(const std::string& message) const {
    std::string logEntry = std::format("[{}] {}", currentTime(), message);
    std::println("{}", logEntry);
    appendToLog(logFile, logEntry);
}

void SiteVaultConfig::logError(const std::string& message) const {
    std::string logEntry = std::format("[{}] ERROR: {}", currentTime(), message);
    std::println(stderr, "{}", logEntry);
    appendToLog(errorLogFile, logEntry);
}
