#include "config_extractor.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

class ConfigExtractorTest : public ::testing::Test
{
  protected:
    TempDir tmp;
    LineConfigExtractor extractor;

    fs::path configFile() const { return tmp.path() / "wp-config.php"; }
};

TEST_F(ConfigExtractorTest, ReadsAllFourValues)
{
    WriteWpConfig(tmp.path(), "wp_blog", "blog_user", "s3cret", "db.internal");

    auto credentials = extractor.extract(configFile());

    ASSERT_TRUE(credentials.has_value()) << credentials.error().message;
    EXPECT_EQ(credentials->name, "wp_blog");
    EXPECT_EQ(credentials->user, "blog_user");
    EXPECT_EQ(credentials->password, "s3cret");
    EXPECT_EQ(credentials->host, "db.internal");
}

TEST_F(ConfigExtractorTest, AcceptsDoubleQuotes)
{
    WriteFile(configFile(), "<?php\n"
                            "define(\"DB_NAME\", \"shop\");\n"
                            "define(\"DB_USER\", \"shop_user\");\n"
                            "define(\"DB_PASSWORD\", \"pw\");\n"
                            "define(\"DB_HOST\", \"127.0.0.1:3307\");\n");

    auto credentials = extractor.extract(configFile());

    ASSERT_TRUE(credentials.has_value());
    EXPECT_EQ(credentials->name, "shop");
    EXPECT_EQ(credentials->user, "shop_user");
    EXPECT_EQ(credentials->password, "pw");
    EXPECT_EQ(credentials->host, "127.0.0.1:3307");
}

TEST_F(ConfigExtractorTest, MissingPasswordIsEmptyNotAnError)
{
    WriteFile(configFile(), "define('DB_NAME', 'wp');\n"
                            "define('DB_USER', 'root');\n"
                            "define('DB_HOST', 'localhost');\n");

    auto credentials = extractor.extract(configFile());

    ASSERT_TRUE(credentials.has_value());
    EXPECT_EQ(credentials->password, "");
}

TEST_F(ConfigExtractorTest, MissingHostDefaultsToLocalhost)
{
    WriteFile(configFile(), "define('DB_NAME', 'wp');\n"
                            "define('DB_USER', 'root');\n"
                            "define('DB_PASSWORD', '');\n");

    auto credentials = extractor.extract(configFile());

    ASSERT_TRUE(credentials.has_value());
    EXPECT_EQ(credentials->host, "localhost");
}

TEST_F(ConfigExtractorTest, MissingFileIsConfigMissing)
{
    auto credentials = extractor.extract(tmp.path() / "absent.php");

    ASSERT_FALSE(credentials.has_value());
    EXPECT_EQ(credentials.error().code, BackupErrorCode::ConfigMissing);
}

TEST_F(ConfigExtractorTest, MissingUserIsIncomplete)
{
    WriteFile(configFile(), "define('DB_NAME', 'wp');\n"
                            "define('DB_PASSWORD', 'x');\n");

    auto credentials = extractor.extract(configFile());

    ASSERT_FALSE(credentials.has_value());
    EXPECT_EQ(credentials.error().code, BackupErrorCode::CredentialsIncomplete);
}

TEST_F(ConfigExtractorTest, EmptyNameIsIncomplete)
{
    WriteWpConfig(tmp.path(), "", "user", "pw", "localhost");

    auto credentials = extractor.extract(configFile());

    ASSERT_FALSE(credentials.has_value());
    EXPECT_EQ(credentials.error().code, BackupErrorCode::CredentialsIncomplete);
}

TEST_F(ConfigExtractorTest, FirstLineMentioningKeyWins)
{
    WriteFile(configFile(), "<?php\n"
                            "// DB_NAME is set to 'legacy' on staging\n"
                            "define('DB_NAME', 'production');\n"
                            "define('DB_USER', 'wp');\n");

    auto credentials = extractor.extract(configFile());

    ASSERT_TRUE(credentials.has_value());
    EXPECT_EQ(credentials->name, "legacy");
}

TEST_F(ConfigExtractorTest, CustomKeys)
{
    WriteFile(configFile(), "define('APP_DB', 'appdb');\n"
                            "define('APP_USER', 'app');\n");
    LineConfigExtractor custom(CredentialKeys{"APP_DB", "APP_USER", "APP_PASS", "APP_HOST"});

    auto credentials = custom.extract(configFile());

    ASSERT_TRUE(credentials.has_value());
    EXPECT_EQ(credentials->name, "appdb");
    EXPECT_EQ(credentials->user, "app");
    EXPECT_EQ(credentials->host, "localhost");
}

TEST(QuotedValueTest, ExtractsLiteralAfterKey)
{
    EXPECT_EQ(LineConfigExtractor::quotedValueAfterKey("define( 'DB_NAME', 'wp' );", "DB_NAME"), "wp");
    EXPECT_EQ(LineConfigExtractor::quotedValueAfterKey("define(\"DB_NAME\",\"it's\");", "DB_NAME"), "it's");
    EXPECT_EQ(LineConfigExtractor::quotedValueAfterKey("define('DB_NAME', '');", "DB_NAME"), "");
    EXPECT_EQ(LineConfigExtractor::quotedValueAfterKey("define('DB_NAME', getenv('X'));", "DB_NAME"), "X");
    EXPECT_EQ(LineConfigExtractor::quotedValueAfterKey("define('DB_NAME', 'unterminated", "DB_NAME"), "");
    EXPECT_EQ(LineConfigExtractor::quotedValueAfterKey("define('DB_USER', 'wp');", "DB_NAME"), std::nullopt);
}

TEST(SplitDatabaseHostTest, HostForms)
{
    auto plain = splitDatabaseHost("db.example");
    EXPECT_EQ(plain.host, "db.example");
    EXPECT_FALSE(plain.port.has_value());
    EXPECT_FALSE(plain.socket.has_value());

    auto withPort = splitDatabaseHost("db.example:3307");
    EXPECT_EQ(withPort.host, "db.example");
    EXPECT_EQ(withPort.port, 3307);

    auto withSocket = splitDatabaseHost("localhost:/run/mysqld/mysqld.sock");
    EXPECT_EQ(withSocket.host, "localhost");
    EXPECT_EQ(withSocket.socket, "/run/mysqld/mysqld.sock");

    auto ipv6 = splitDatabaseHost("::1");
    EXPECT_EQ(ipv6.host, "::1");
    EXPECT_FALSE(ipv6.port.has_value());

    auto badPort = splitDatabaseHost("db:notaport");
    EXPECT_EQ(badPort.host, "db:notaport");
    EXPECT_FALSE(badPort.port.has_value());

    EXPECT_EQ(splitDatabaseHost("").host, "localhost");
}
