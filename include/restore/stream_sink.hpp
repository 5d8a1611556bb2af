#pragma once

#include <memory>
#include <string>

#include "common/byte_stream.hpp"

// `zfs recv -F <target>`. abort() kills the receiver so ZFS discards the
// partial receive.
class ZfsReceiveSinkFactory : public StreamSinkFactory {
public:
    explicit ZfsReceiveSinkFactory(const std::string& zfsBinary = "zfs");

    std::unique_ptr<ByteSink> openImport(const std::string& target) override;

private:
    std::string zfsBinary_;
};

// Writes "<target>.partial" and renames it to target on commit.
class FileSinkFactory : public StreamSinkFactory {
public:
    std::unique_ptr<ByteSink> openImport(const std::string& target) override;
};
