#pragma once

#include <cstdio>
#include <map>
#include <memory>

#include "common/config.hpp"
#include "storage/remote_store.hpp"
#include "storage/s3_signer.hpp"

// S3-compatible object storage over libcurl. Objects above the multipart
// threshold are uploaded in parts and only become visible on
// CompleteMultipartUpload; a failed upload is aborted.
class S3RemoteStore : public RemoteStore {
public:
    explicit S3RemoteStore(const RemoteConfig& config);
    ~S3RemoteStore() override;

    std::string name() const override { return "s3:" + config_.bucket; }

    void putFile(const std::string& path, const std::string& localFile,
                 const CancellationToken* cancel = nullptr) override;
    void putObject(const std::string& path, const std::string& content) override;
    void getFile(const std::string& path, const std::string& localFile,
                 const CancellationToken* cancel = nullptr) override;
    std::string getObject(const std::string& path) override;

    std::vector<RemoteObject> list(const std::string& directory) override;
    std::optional<uint64_t> objectSize(const std::string& path) override;
    void remove(const std::string& path) override;

    struct ListPage {
        std::vector<RemoteObject> objects;  // full keys
        std::string continuationToken;
        bool truncated = false;
    };
    // Parses one ListObjectsV2 response body.
    static ListPage parseListResponse(const std::string& xml);

private:
    struct Body {
        const std::string* data = nullptr;
        FILE* file = nullptr;
        uint64_t offset = 0;
        uint64_t length = 0;
    };

    struct Response {
        long status = 0;
        std::string body;
        std::map<std::string, std::string> headers;
        uint64_t contentLength = 0;
    };

    Response perform(const std::string& method, const std::string& key,
                     const std::map<std::string, std::string>& query,
                     const Body* body, FILE* download, const CancellationToken* cancel);

    void uploadSingle(const std::string& key, FILE* file, uint64_t size, const CancellationToken* cancel);
    void uploadMultipart(const std::string& key, FILE* file, uint64_t size, const CancellationToken* cancel);
    void abortMultipart(const std::string& key, const std::string& uploadId);

    std::string objectKey(const std::string& path) const;
    std::string requestUri(const std::string& key) const;
    std::string requestHost() const;

    RemoteConfig config_;
    S3Signer signer_;
    std::string scheme_;
    std::string endpointHost_;
};
