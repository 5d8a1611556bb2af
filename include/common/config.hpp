#pragma once

#include <cstdint>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

struct ShardSettings {
    uint64_t size = 0;  // 0 lets the planner decide
    uint64_t minSize = 10ULL * 1024 * 1024;
    uint64_t maxSize = 50ULL * 1024 * 1024 * 1024;
    uint64_t defaultSize = 1024ULL * 1024 * 1024;
    int compressionLevel = 6;
    std::string extension = "zfs.gz.enc";
};

struct EncryptionSettings {
    std::string recipientKeyFile;  // PEM public key, used by backup
    std::string identityKeyFile;   // PEM private key, used by restore
};

struct SnapshotSettings {
    std::string prefix = "auto";
    int retentionDays = 14;
    bool incremental = true;
};

struct RemoteConfig {
    std::string name;
    std::string type;  // "local", "rclone" or "s3"

    // local: root directory; rclone: "remote:bucket/path"
    std::string path;
    std::string rcloneBinary = "rclone";

    // s3
    std::string endpoint;
    std::string region = "us-east-1";
    std::string bucket;
    std::string accessKey;
    std::string secretKey;
    bool pathStyle = true;
    uint64_t multipartThreshold = 64ULL * 1024 * 1024;
    uint64_t partSize = 16ULL * 1024 * 1024;
};

struct AppConfig {
    std::string tempDir = "/var/tmp";
    std::string logFile;
    std::string logLevel = "info";
    std::string lockDir = "/tmp";

    ShardSettings shard;
    EncryptionSettings encryption;
    SnapshotSettings snapshots;

    std::string defaultRemote;
    std::map<std::string, RemoteConfig> remotes;

    // Throws ConfigurationError when the document or a value is invalid.
    static AppConfig fromJson(const nlohmann::json& document);
    static AppConfig loadFile(const std::string& path);

    // Missing file yields defaults; environment overrides are applied last.
    static AppConfig load(const std::string& explicitPath);
    static std::string defaultConfigPath();

    void applyEnvironment();
    void validate() const;
    const RemoteConfig& remote(const std::string& name) const;
};
