#include "sitevault_config.hpp"
#include "test_helpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

using ::testing::ElementsAre;
using ::testing::HasSubstr;

TEST(SiteVaultConfigTest, DefaultsWithoutFile)
{
    SiteVaultConfig config;

    EXPECT_EQ(config.sitesRoot, "/var/www/");
    EXPECT_EQ(config.backupDir, "/backups");
    EXPECT_EQ(config.configMarker, "wp-config.php");
    EXPECT_EQ(config.vhostDir, "/etc/nginx/sites-available");
    EXPECT_EQ(config.mysqldump, "mysqldump");
    EXPECT_EQ(config.dumpTimeout, std::chrono::seconds(600));
    EXPECT_EQ(config.archiveTimeout, std::chrono::seconds(1800));
    EXPECT_FALSE(config.telegram.enabled());
    EXPECT_EQ(config.remote.port, 22);
    EXPECT_EQ(config.remote.remoteDir, "~/wp_backups");
}

TEST(SiteVaultConfigTest, ReadsJsonAndKeepsDefaultsForMissingKeys)
{
    TempDir tmp;
    fs::path file = tmp.path() / "sitevault.json";
    WriteFile(file, R"({
        "sites_root": "/srv/www",
        "backup_dir": "/mnt/backups",
        "mysqldump": "/usr/bin/mariadb-dump",
        "dump_timeout_seconds": 120,
        "exclude_extensions": [".log", ".tmp"],
        "telegram": { "bot_token": "123:abc", "chat_id": "-100" },
        "remote": { "port": 2222 }
    })");

    SiteVaultConfig config(file.string());

    EXPECT_EQ(config.sitesRoot, "/srv/www");
    EXPECT_EQ(config.backupDir, "/mnt/backups");
    EXPECT_EQ(config.mysqldump, "/usr/bin/mariadb-dump");
    EXPECT_EQ(config.dumpTimeout, std::chrono::seconds(120));
    EXPECT_EQ(config.archiveTimeout, std::chrono::seconds(1800));
    EXPECT_EQ(config.configMarker, "wp-config.php");
    EXPECT_THAT(config.excludeExtensions, ElementsAre(".log", ".tmp"));
    EXPECT_TRUE(config.telegram.enabled());
    EXPECT_EQ(config.remote.port, 2222);
    EXPECT_EQ(config.remote.remoteDir, "~/wp_backups");
}

TEST(SiteVaultConfigTest, InvalidValuesAreRejected)
{
    TempDir tmp;
    const std::vector<std::string> documents = {
        R"({ "dump_timeout_seconds": 0 })",
        R"({ "archive_timeout_seconds": "soon" })",
        R"({ "config_marker": "" })",
        R"({ "sites_root": 5 })",
        R"({ "remote": { "port": 70000 } })",
        R"([1, 2, 3])",
        R"({ "sites_root": )",
    };
    for (std::size_t i = 0; i < documents.size(); ++i)
    {
        fs::path file = tmp.path() / ("config" + std::to_string(i) + ".json");
        WriteFile(file, documents[i]);
        EXPECT_THROW(SiteVaultConfig{file.string()}, std::runtime_error) << documents[i];
    }
}

TEST(SiteVaultConfigTest, ExplicitMissingFileThrows)
{
    TempDir tmp;

    EXPECT_THROW(SiteVaultConfig::load((tmp.path() / "absent.json").string()), std::runtime_error);
}

TEST(SiteVaultConfigTest, LogsAreAppendedToConfiguredFiles)
{
    TempDir tmp;
    SiteVaultConfig config = MakeTestConfig(tmp.path());

    config.logMessage("Starting backup for blog");
    config.logMessage("Backup for blog: complete success");
    config.logError("Database backup failed for shop");

    auto log = ReadFile(config.logFile);
    EXPECT_THAT(log, HasSubstr("] Starting backup for blog\n"));
    EXPECT_THAT(log, HasSubstr("] Backup for blog: complete success\n"));
    EXPECT_THAT(log, ::testing::Not(HasSubstr("shop")));
    EXPECT_THAT(ReadFile(config.errorLogFile), HasSubstr("] ERROR: Database backup failed for shop\n"));
    EXPECT_EQ(log.front(), '[');
}
