/**
 * @file config_snapshot.hpp
 * @brief Best-effort copy of a site's web-server virtual-host file.
 */

#ifndef CONFIG_SNAPSHOT_HPP
#define CONFIG_SNAPSHOT_HPP

#include <optional>
#include <string>
#include "backup_stage.hpp"
#include "sitevault_config.hpp"

/**
 * @brief Stage producing `nginx_<site>_<timestamp>.txt`.
 *
 * Looks for `<vhost_dir>/<site>` and then `<vhost_dir>/<site>.conf`. A missing file is a
 * Failure of this stage only.
 */
class ConfigSnapshotStage : public BackupStage {
public:
    explicit ConfigSnapshotStage(const SiteVaultConfig& config);

    std::string name() const override;
    StageOutcome run(const Site& site, const BackupContext& context) override;

    /**
     * @brief Locates the virtual-host file for a site identifier.
     */
    std::optional<fs::path> findVirtualHost(const std::string& siteId) const;

private:
    const SiteVaultConfig& config;
};

#endif // CONFIG_SNAPSHOT_HPP
