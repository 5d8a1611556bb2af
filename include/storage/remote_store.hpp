#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class CancellationToken;

struct RemoteObject {
    std::string name;  // relative to the listed directory
    uint64_t size = 0;
};

// Remote object storage. Paths are "<destinationPath>/<objectName>".
// A put must never leave a partially written object visible to list().
// Every method throws StorageError on failure.
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    virtual std::string name() const = 0;

    // Object transfer
    virtual void putFile(const std::string& path, const std::string& localFile,
                         const CancellationToken* cancel = nullptr) = 0;
    virtual void putObject(const std::string& path, const std::string& content) = 0;
    virtual void getFile(const std::string& path, const std::string& localFile,
                         const CancellationToken* cancel = nullptr) = 0;
    virtual std::string getObject(const std::string& path) = 0;

    // Namespace
    // Objects directly under directory; an absent directory lists as empty.
    virtual std::vector<RemoteObject> list(const std::string& directory) = 0;
    virtual std::optional<uint64_t> objectSize(const std::string& path) = 0;
    virtual void remove(const std::string& path) = 0;
};

inline std::string remoteJoin(const std::string& directory, const std::string& name) {
    if (directory.empty()) {
        return name;
    }
    if (directory.back() == '/') {
        return directory + name;
    }
    return directory + "/" + name;
}
