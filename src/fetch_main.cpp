#include "backup_api.hpp"
#include "remote_transfer.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <print>
#include <string>

int main(int argc, char* argv[]) {
    std::optional<std::string> configFile;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else {
            std::cerr << "Usage: " << argv[0] << " [--config <path>]" << std::endl;
            return 1;
        }
    }

    SiteVaultConfig config;
    try {
        config = SiteVaultConfig::load(configFile);
    } catch (const std::exception& e) {
        std::cerr << "Error: Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    std::print("Enter user@ip: ");
    std::string vps;
    std::getline(std::cin, vps);

    const char* remoteDirEnv = std::getenv("REMOTE_DIR");
    std::string remoteDir = remoteDirEnv && *remoteDirEnv ? remoteDirEnv : config.remote.remoteDir;

    auto endpoint = parseEndpoint(vps);
    if (!endpoint) {
        std::println(stderr, "Error: {}", endpoint.error().message);
        std::println("Failed");
        return 1;
    }

    auto localDir = std::filesystem::current_path();
    std::println("Copying backups from {}:{} to {}...", vps, remoteDir, localDir.string());

    SFTPFetchStrategy strategy(*endpoint, config.remote.port);
    auto copied = BackupAPI::fetchBackups(strategy, remoteDir, localDir);
    if (!copied) {
        std::println(stderr, "Error: {}", copied.error().message);
        std::println("Failed");
        return 1;
    }
    std::println("Success");
    return 0;
}
