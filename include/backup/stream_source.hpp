#pragma once

#include <memory>
#include <string>

#include "common/byte_stream.hpp"

// `zfs send [-I since] dataset@snapshot`
class ZfsStreamSourceFactory : public StreamSourceFactory {
public:
    explicit ZfsStreamSourceFactory(const std::string& zfsBinary = "zfs");

    std::unique_ptr<ByteSource> openExport(const std::string& sourceIdentifier,
                                           const std::string& sinceIdentifier) override;

private:
    std::string zfsBinary_;
};

// Reads the named file. Used for non-ZFS streams and in tests.
class FileStreamSourceFactory : public StreamSourceFactory {
public:
    std::unique_ptr<ByteSource> openExport(const std::string& sourceIdentifier,
                                           const std::string& sinceIdentifier) override;
};
