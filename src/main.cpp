#include "backup_api.hpp"
#include <iostream>
#include <optional>
#include <string>

namespace {

void printUsage(std::ostream& os, const char* program) {
    os << "Usage: " << program << " [--config <path>] [backup_dir]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> configFile;
    std::optional<std::string> destination;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(std::cout, argv[0]);
            return BackupAPI::kExitSuccess;
        } else if (arg.starts_with("-") || destination) {
            printUsage(std::cerr, argv[0]);
            return BackupAPI::kExitConfigError;
        } else {
            destination = arg;
        }
    }

    SiteVaultConfig config;
    try {
        config = SiteVaultConfig::load(configFile);
    } catch (const std::exception& e) {
        std::cerr << "Error: Failed to load config: " << e.what() << std::endl;
        return BackupAPI::kExitConfigError;
    }

    installSignalHandlers();

    auto result = BackupAPI::runInteractive(config, destination.value_or(config.backupDir), std::cin, std::cout);
    if (!result) {
        std::cerr << "Backup aborted (" << toString(result.error().code) << ")" << std::endl;
        return BackupAPI::exitCodeFor(result.error().code);
    }
    return BackupAPI::kExitSuccess;
}
