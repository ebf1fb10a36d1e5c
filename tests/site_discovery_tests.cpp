#include "site_discovery.hpp"
#include "test_helpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::ElementsAre;

class SiteDiscoveryTest : public ::testing::Test
{
  protected:
    TempDir tmp;
    fs::path root = tmp.path() / "www";

    void SetUp() override
    {
        WriteWpConfig(root / "shop", "shop", "shop", "", "localhost");
        WriteWpConfig(root / "blog", "blog", "blog", "", "localhost");
        WriteFile(root / "html" / "index.html", "<html></html>\n");
        fs::create_directories(root / "odd" / "wp-config.php");
        WriteFile(root / "notes.txt", "not a site\n");
    }

    static std::vector<std::string> Ids(const std::vector<Site>& sites)
    {
        std::vector<std::string> ids;
        for (const auto& site : sites)
        {
            ids.push_back(site.id);
        }
        return ids;
    }
};

TEST_F(SiteDiscoveryTest, OnlyDirectoriesWithMarkerAreSites)
{
    auto sites = SiteDiscovery(root, "wp-config.php").discover();

    ASSERT_TRUE(sites.has_value()) << sites.error().message;
    EXPECT_THAT(Ids(*sites), ElementsAre("blog", "shop"));
}

TEST_F(SiteDiscoveryTest, SitesCarryAbsolutePaths)
{
    auto sites = SiteDiscovery(root, "wp-config.php").discover();

    ASSERT_TRUE(sites.has_value());
    const Site& blog = sites->front();
    EXPECT_TRUE(blog.installPath.is_absolute());
    EXPECT_EQ(blog.installPath.filename().string(), "blog");
    ASSERT_TRUE(blog.configPath.has_value());
    EXPECT_EQ(blog.configPath->string(), (blog.installPath / "wp-config.php").string());
}

TEST_F(SiteDiscoveryTest, IterationCanBeRestarted)
{
    SiteDiscovery discovery(root, "wp-config.php");

    std::size_t first = 0;
    for (const auto& site : discovery)
    {
        (void)site;
        ++first;
    }
    WriteWpConfig(root / "news", "news", "news", "", "localhost");
    std::size_t second = 0;
    for (auto it = discovery.begin(); it != discovery.end(); ++it)
    {
        ++second;
    }

    EXPECT_EQ(first, 2u);
    EXPECT_EQ(second, 3u);
}

TEST_F(SiteDiscoveryTest, CustomMarker)
{
    WriteFile(root / "app" / "settings.ini", "[db]\n");

    auto sites = SiteDiscovery(root, "settings.ini").discover();

    ASSERT_TRUE(sites.has_value());
    EXPECT_THAT(Ids(*sites), ElementsAre("app"));
}

TEST(SiteDiscoveryEmptyTest, NoSitesIsAnError)
{
    TempDir tmp;
    WriteFile(tmp.path() / "www" / "html" / "index.html", "");

    auto sites = SiteDiscovery(tmp.path() / "www", "wp-config.php").discover();

    ASSERT_FALSE(sites.has_value());
    EXPECT_EQ(sites.error().code, BackupErrorCode::NoSitesFound);
}

TEST(SiteDiscoveryEmptyTest, MissingRootYieldsEmptyRange)
{
    TempDir tmp;
    SiteDiscovery discovery(tmp.path() / "missing", "wp-config.php");

    EXPECT_TRUE(discovery.begin() == discovery.end());
    auto sites = discovery.discover();
    ASSERT_FALSE(sites.has_value());
    EXPECT_EQ(sites.error().code, BackupErrorCode::NoSitesFound);
}
