#include "storage/remote_store_factory.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "storage/local_remote_store.hpp"
#include "storage/rclone_remote_store.hpp"
#include "storage/s3_remote_store.hpp"

std::shared_ptr<RemoteStore> createRemoteStore(const RemoteConfig& config) {
    Logger::debug("Creating remote '" + config.name + "' of type: " + config.type);

    if (config.type == "local") {
        return std::make_shared<LocalRemoteStore>(config.path);
    } else if (config.type == "rclone") {
        return std::make_shared<RcloneRemoteStore>(config.path, config.rcloneBinary);
    } else if (config.type == "s3") {
        if (config.accessKey.empty() || config.secretKey.empty()) {
            Logger::warning("Remote '" + config.name + "' has no credentials; requests will be rejected by most endpoints");
        }
        return std::make_shared<S3RemoteStore>(config);
    }

    Logger::error("Unsupported remote type: " + config.type);
    throw ConfigurationError("Unsupported remote type: " + config.type);
}

RemoteStoreRegistry::RemoteStoreRegistry(const AppConfig& config)
    : defaultRemote_(config.defaultRemote) {
    for (const auto& entry : config.remotes) {
        try {
            stores_[entry.first] = createRemoteStore(entry.second);
        } catch (const StorageError& e) {
            throw ConfigurationError("Remote '" + entry.first + "': " + e.what());
        }
    }
}

std::shared_ptr<RemoteStore> RemoteStoreRegistry::get(const std::string& name) const {
    const std::string& key = name.empty() ? defaultRemote_ : name;
    if (key.empty()) {
        throw ConfigurationError("No remote given and no defaultRemote configured");
    }
    auto it = stores_.find(key);
    if (it == stores_.end()) {
        throw ConfigurationError("Unknown remote: " + key);
    }
    return it->second;
}
