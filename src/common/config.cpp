#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <cstdlib>
#include <fstream>
#include <filesystem>

using json = nlohmann::json;

namespace {

template <typename T>
void readValue(const json& object, const char* key, T& target) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

RemoteConfig parseRemote(const std::string& name, const json& object) {
    if (!object.is_object()) {
        throw ConfigurationError("Remote '" + name + "' must be an object");
    }

    RemoteConfig remote;
    remote.name = name;
    readValue(object, "type", remote.type);
    readValue(object, "path", remote.path);
    readValue(object, "rcloneBinary", remote.rcloneBinary);
    readValue(object, "endpoint", remote.endpoint);
    readValue(object, "region", remote.region);
    readValue(object, "bucket", remote.bucket);
    readValue(object, "accessKey", remote.accessKey);
    readValue(object, "secretKey", remote.secretKey);
    readValue(object, "pathStyle", remote.pathStyle);
    readValue(object, "multipartThreshold", remote.multipartThreshold);
    readValue(object, "partSize", remote.partSize);
    return remote;
}

std::string envOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

} // namespace

AppConfig AppConfig::fromJson(const json& document) {
    if (!document.is_object()) {
        throw ConfigurationError("Configuration root must be a JSON object");
    }

    AppConfig config;
    readValue(document, "tempDir", config.tempDir);
    readValue(document, "logFile", config.logFile);
    readValue(document, "logLevel", config.logLevel);
    readValue(document, "lockDir", config.lockDir);
    readValue(document, "defaultRemote", config.defaultRemote);

    if (document.contains("shard")) {
        const json& shard = document["shard"];
        readValue(shard, "size", config.shard.size);
        readValue(shard, "minSize", config.shard.minSize);
        readValue(shard, "maxSize", config.shard.maxSize);
        readValue(shard, "defaultSize", config.shard.defaultSize);
        readValue(shard, "compressionLevel", config.shard.compressionLevel);
        readValue(shard, "extension", config.shard.extension);
    }

    if (document.contains("encryption")) {
        const json& encryption = document["encryption"];
        readValue(encryption, "recipientKeyFile", config.encryption.recipientKeyFile);
        readValue(encryption, "identityKeyFile", config.encryption.identityKeyFile);
    }

    if (document.contains("snapshots")) {
        const json& snapshots = document["snapshots"];
        readValue(snapshots, "prefix", config.snapshots.prefix);
        readValue(snapshots, "retentionDays", config.snapshots.retentionDays);
        readValue(snapshots, "incremental", config.snapshots.incremental);
    }

    if (document.contains("remotes")) {
        const json& remotes = document["remotes"];
        if (!remotes.is_object()) {
            throw ConfigurationError("'remotes' must be an object keyed by remote name");
        }
        for (auto it = remotes.begin(); it != remotes.end(); ++it) {
            config.remotes[it.key()] = parseRemote(it.key(), it.value());
        }
    }

    config.validate();
    return config;
}

AppConfig AppConfig::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigurationError("Cannot open configuration file: " + path);
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Failed to parse " + path + ": " + e.what());
    }
    return fromJson(document);
}

std::string AppConfig::defaultConfigPath() {
    std::string fromEnv = envOrEmpty("SNAPSHARD_CONFIG");
    if (!fromEnv.empty()) {
        return fromEnv;
    }
    std::string home = envOrEmpty("HOME");
    if (home.empty()) {
        return "";
    }
    return home + "/.config/snapshard/config.json";
}

AppConfig AppConfig::load(const std::string& explicitPath) {
    std::string path = explicitPath.empty() ? defaultConfigPath() : explicitPath;

    AppConfig config;
    if (!path.empty() && std::filesystem::exists(path)) {
        config = loadFile(path);
    } else if (!explicitPath.empty()) {
        throw ConfigurationError("Configuration file not found: " + explicitPath);
    } else {
        Logger::warning("No configuration file at '" + path + "', using defaults");
    }

    config.applyEnvironment();
    config.validate();
    return config;
}

void AppConfig::applyEnvironment() {
    std::string value = envOrEmpty("SNAPSHARD_TEMP_DIR");
    if (!value.empty()) {
        tempDir = value;
    }
    value = envOrEmpty("SNAPSHARD_RECIPIENT_KEY");
    if (!value.empty()) {
        encryption.recipientKeyFile = value;
    }
    value = envOrEmpty("SNAPSHARD_IDENTITY_KEY");
    if (!value.empty()) {
        encryption.identityKeyFile = value;
    }
    value = envOrEmpty("SNAPSHARD_REMOTE");
    if (!value.empty()) {
        defaultRemote = value;
    }
}

void AppConfig::validate() const {
    if (shard.minSize == 0 || shard.minSize > shard.maxSize) {
        throw ConfigurationError("shard.minSize must be non-zero and not above shard.maxSize");
    }
    if (shard.defaultSize == 0) {
        throw ConfigurationError("shard.defaultSize must be non-zero");
    }
    if (shard.compressionLevel < 0 || shard.compressionLevel > 9) {
        throw ConfigurationError("shard.compressionLevel must be between 0 and 9");
    }
    if (shard.extension.empty() || shard.extension.find('/') != std::string::npos) {
        throw ConfigurationError("shard.extension must be a non-empty name without '/'");
    }
    if (snapshots.retentionDays < 0) {
        throw ConfigurationError("snapshots.retentionDays must not be negative");
    }
    LogLevel level;
    if (!Logger::parseLevel(logLevel, level)) {
        throw ConfigurationError("Unknown logLevel: " + logLevel);
    }

    for (const auto& entry : remotes) {
        const RemoteConfig& remote = entry.second;
        if (remote.type == "local" || remote.type == "rclone") {
            if (remote.path.empty()) {
                throw ConfigurationError("Remote '" + remote.name + "' requires 'path'");
            }
        } else if (remote.type == "s3") {
            if (remote.endpoint.empty() || remote.bucket.empty()) {
                throw ConfigurationError("Remote '" + remote.name + "' requires 'endpoint' and 'bucket'");
            }
            if (remote.partSize < 5ULL * 1024 * 1024) {
                throw ConfigurationError("Remote '" + remote.name + "' partSize must be at least 5 MiB");
            }
        } else {
            throw ConfigurationError("Remote '" + remote.name + "' has unknown type '" + remote.type + "'");
        }
    }

    if (!defaultRemote.empty() && remotes.find(defaultRemote) == remotes.end()) {
        throw ConfigurationError("defaultRemote '" + defaultRemote + "' is not configured");
    }
}

const RemoteConfig& AppConfig::remote(const std::string& name) const {
    const std::string& key = name.empty() ? defaultRemote : name;
    if (key.empty()) {
        throw ConfigurationError("No remote given and no defaultRemote configured");
    }
    auto it = remotes.find(key);
    if (it == remotes.end()) {
        throw ConfigurationError("Unknown remote: " + key);
    }
    return it->second;
}
