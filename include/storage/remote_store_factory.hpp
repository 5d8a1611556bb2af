#pragma once

#include <map>
#include <memory>
#include <string>

#include "common/config.hpp"
#include "storage/remote_store.hpp"

// Creates a backend for a single remote definition.
std::shared_ptr<RemoteStore> createRemoteStore(const RemoteConfig& config);

// Every configured remote, resolved once at startup.
class RemoteStoreRegistry {
public:
    explicit RemoteStoreRegistry(const AppConfig& config);

    // Empty name selects the default remote. Throws ConfigurationError.
    std::shared_ptr<RemoteStore> get(const std::string& name) const;

private:
    std::map<std::string, std::shared_ptr<RemoteStore>> stores_;
    std::string defaultRemote_;
};
