#pragma once

#include "storage/remote_store.hpp"

// Drives the rclone CLI against "remote:bucket/path". rcat streams from
// stdin and only publishes the object once the stream completes.
class RcloneRemoteStore : public RemoteStore {
public:
    RcloneRemoteStore(const std::string& remoteRoot, const std::string& binary = "rclone");

    std::string name() const override { return "rclone:" + remoteRoot_; }

    void putFile(const std::string& path, const std::string& localFile,
                 const CancellationToken* cancel = nullptr) override;
    void putObject(const std::string& path, const std::string& content) override;
    void getFile(const std::string& path, const std::string& localFile,
                 const CancellationToken* cancel = nullptr) override;
    std::string getObject(const std::string& path) override;

    std::vector<RemoteObject> list(const std::string& directory) override;
    std::optional<uint64_t> objectSize(const std::string& path) override;
    void remove(const std::string& path) override;

    // Parses "size<TAB>name" lines printed by lsf --format sp.
    static std::vector<RemoteObject> parseListing(const std::string& output);

private:
    std::string target(const std::string& path) const;

    std::string remoteRoot_;
    std::string binary_;
};
