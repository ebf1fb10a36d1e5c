#include "config_snapshot.hpp"
#include "artifact.hpp"
#include <format>

ConfigSnapshotStage::ConfigSnapshotStage(const SiteVaultConfig& config) : config(config) {}

std::string ConfigSnapshotStage::name() const {
    return "Config snapshot";
}

std::optional<fs::path> ConfigSnapshotStage::findVirtualHost(const std::string& siteId) const {
    fs::path vhostDir(config.vhostDir);
    std::error_code ec;
    for (const auto& candidate : {vhostDir / siteId, vhostDir / (siteId + ".conf")}) {
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

StageOutcome ConfigSnapshotStage::run(const Site& site, const BackupContext& context) {
    config.logMessage(std::format("Starting nginx config backup for {}", site.id));

    auto source = findVirtualHost(site.id);
    if (!source) {
        auto errorMsg = std::format("No nginx configuration found for {} in {}", site.id, config.vhostDir);
        config.logError(errorMsg);
        return StageOutcome::failure(errorMsg);
    }

    fs::path target = artifactPath(context.destination, ArtifactKind::ConfigSnapshot, site.id, context.timestamp);
    std::error_code ec;
    fs::copy_file(*source, target, fs::copy_options::none, ec);
    if (ec) {
        if (ec != std::errc::file_exists) {
            std::error_code removeEc;
            fs::remove(target, removeEc);
        }
        auto errorMsg = std::format("Nginx config backup failed for {}: {} ({})", site.id, source->string(), ec.message());
        config.logError(errorMsg);
        return StageOutcome::failure(errorMsg);
    }

    auto size = fs::file_size(target, ec);
    auto successMsg = std::format("Nginx config backup successful: {} ({})", target.string(), humanReadableSize(ec ? 0 : size));
    config.logMessage(successMsg);
    return StageOutcome::success(successMsg, BackupArtifact{target, ArtifactKind::ConfigSnapshot, context.timestamp});
}
