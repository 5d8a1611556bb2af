#pragma once

#include "storage/remote_store.hpp"

// Directory tree standing in for a bucket. Puts go to a hidden temp file
// in the target directory and are renamed into place.
class LocalRemoteStore : public RemoteStore {
public:
    explicit LocalRemoteStore(const std::string& root);

    std::string name() const override { return "local:" + root_; }

    void putFile(const std::string& path, const std::string& localFile,
                 const CancellationToken* cancel = nullptr) override;
    void putObject(const std::string& path, const std::string& content) override;
    void getFile(const std::string& path, const std::string& localFile,
                 const CancellationToken* cancel = nullptr) override;
    std::string getObject(const std::string& path) override;

    std::vector<RemoteObject> list(const std::string& directory) override;
    std::optional<uint64_t> objectSize(const std::string& path) override;
    void remove(const std::string& path) override;

    const std::string& root() const { return root_; }

private:
    std::string resolve(const std::string& path) const;
    void copyStream(std::istream& in, std::ostream& out, const std::string& what,
                    const CancellationToken* cancel);
    void commitTemp(const std::string& tempPath, const std::string& finalPath);

    std::string root_;
};
