#include <gtest/gtest.h>
#include "common/config.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"
#include <cstdlib>
#include <fstream>

using namespace testing_support;
using json = nlohmann::json;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {"SNAPSHARD_TEMP_DIR", "SNAPSHARD_RECIPIENT_KEY",
                                 "SNAPSHARD_IDENTITY_KEY", "SNAPSHARD_REMOTE"}) {
            unsetenv(name);
        }
    }

    void TearDown() override {
        SetUp();
    }

    std::string writeConfig(const std::string& text) {
        std::string path = dir_.file("config.json");
        std::ofstream(path) << text;
        return path;
    }

    ScopedTempDir dir_;
};

TEST_F(ConfigTest, DefaultsAreUsable) {
    AppConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.shard.size, 0u);
    EXPECT_EQ(config.shard.extension, "zfs.gz.enc");
    EXPECT_EQ(config.shard.compressionLevel, 6);
    EXPECT_EQ(config.snapshots.prefix, "auto");
    EXPECT_THROW(config.remote(""), ConfigurationError);
}

TEST_F(ConfigTest, ParsesFullDocument) {
    json document = json::parse(R"({
        "tempDir": "/scratch",
        "logLevel": "debug",
        "shard": {"size": 52428800, "compressionLevel": 3},
        "encryption": {"recipientKeyFile": "/etc/snapshard/recipient.pem"},
        "snapshots": {"prefix": "nightly", "retentionDays": 7, "incremental": false},
        "defaultRemote": "offsite",
        "remotes": {
            "offsite": {"type": "s3", "endpoint": "https://s3.example.com", "bucket": "backups",
                        "accessKey": "AK", "secretKey": "SK", "pathStyle": false},
            "nas": {"type": "rclone", "path": "nas:zfs"}
        }
    })");

    AppConfig config = AppConfig::fromJson(document);
    EXPECT_EQ(config.tempDir, "/scratch");
    EXPECT_EQ(config.shard.size, 52428800u);
    EXPECT_EQ(config.shard.compressionLevel, 3);
    EXPECT_EQ(config.encryption.recipientKeyFile, "/etc/snapshard/recipient.pem");
    EXPECT_EQ(config.snapshots.prefix, "nightly");
    EXPECT_EQ(config.snapshots.retentionDays, 7);
    EXPECT_FALSE(config.snapshots.incremental);

    const RemoteConfig& offsite = config.remote("");
    EXPECT_EQ(offsite.name, "offsite");
    EXPECT_EQ(offsite.bucket, "backups");
    EXPECT_EQ(offsite.region, "us-east-1");
    EXPECT_FALSE(offsite.pathStyle);
    EXPECT_EQ(config.remote("nas").path, "nas:zfs");
    EXPECT_THROW(config.remote("tape"), ConfigurationError);
}

TEST_F(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(AppConfig::fromJson(json::parse(R"({"shard": {"compressionLevel": 12}})")), ConfigurationError);
    EXPECT_THROW(AppConfig::fromJson(json::parse(R"({"shard": {"minSize": 0}})")), ConfigurationError);
    EXPECT_THROW(AppConfig::fromJson(json::parse(R"({"logLevel": "chatty"})")), ConfigurationError);
    EXPECT_THROW(AppConfig::fromJson(json::parse(R"({"tempDir": 5})")), ConfigurationError);
    EXPECT_THROW(AppConfig::fromJson(json::parse(R"({"remotes": {"x": {"type": "ftp"}}})")), ConfigurationError);
    EXPECT_THROW(AppConfig::fromJson(json::parse(R"({"remotes": {"x": {"type": "s3"}}})")), ConfigurationError);
    EXPECT_THROW(AppConfig::fromJson(json::parse(R"({"defaultRemote": "missing"})")), ConfigurationError);
    EXPECT_THROW(AppConfig::fromJson(json::parse("[1, 2]")), ConfigurationError);
}

TEST_F(ConfigTest, LoadsFileAndAppliesEnvironment) {
    std::string path = writeConfig(R"({"remotes": {"disk": {"type": "local", "path": "/srv/backups"}},
                                       "defaultRemote": "disk"})");
    setenv("SNAPSHARD_TEMP_DIR", "/fast/tmp", 1);
    setenv("SNAPSHARD_RECIPIENT_KEY", "/keys/pub.pem", 1);

    AppConfig config = AppConfig::load(path);
    EXPECT_EQ(config.tempDir, "/fast/tmp");
    EXPECT_EQ(config.encryption.recipientKeyFile, "/keys/pub.pem");
    EXPECT_EQ(config.remote("").path, "/srv/backups");
}

TEST_F(ConfigTest, ExplicitMissingFileIsAnError) {
    EXPECT_THROW(AppConfig::load(dir_.file("absent.json")), ConfigurationError);
}

TEST_F(ConfigTest, MalformedFileIsAnError) {
    std::string path = writeConfig("{ not json");
    EXPECT_THROW(AppConfig::load(path), ConfigurationError);
}
