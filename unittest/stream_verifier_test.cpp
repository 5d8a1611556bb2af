#include <gtest/gtest.h>
#include "backup/stream_source.hpp"
#include "backup/stream_verifier.hpp"
#include "common/checksum.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>

using namespace testing_support;

namespace {

// Source whose bytes change on every export, like a live filesystem.
class DriftingSourceFactory : public StreamSourceFactory {
public:
    std::unique_ptr<ByteSource> openExport(const std::string&, const std::string&) override {
        return std::make_unique<MemorySource>(patternBytes(10000, ++calls_));
    }

private:
    uint32_t calls_ = 0;
};

std::string drain(ByteSource& source) {
    std::string data;
    char buffer[1024];
    size_t n;
    while ((n = source.read(buffer, sizeof(buffer))) > 0) {
        data.append(buffer, n);
    }
    return data;
}

} // namespace

TEST(StreamVerifierTest, FileExportIsDeterministic) {
    ScopedTempDir dir;
    std::string path = dir.file("stream.bin");
    std::string data = patternBytes(3 * 1024 * 1024 + 17);
    std::ofstream(path, std::ios::binary) << data;

    StreamVerifier verifier(std::make_shared<FileStreamSourceFactory>());
    VerificationResult result = verifier.verify(path, "");

    EXPECT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(result.firstLength, data.size());
    EXPECT_EQ(result.secondLength, data.size());
    EXPECT_EQ(result.firstDigest, sha256Hex(data));
    EXPECT_EQ(result.firstDigest, result.secondDigest);
}

TEST(StreamVerifierTest, DetectsDifferingExports) {
    StreamVerifier verifier(std::make_shared<DriftingSourceFactory>());
    VerificationResult result = verifier.verify("tank/data@auto-1", "");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.firstDigest, result.secondDigest);
    EXPECT_FALSE(result.errorMessage.empty());
}

TEST(StreamSourceTest, FileSourceRejectsIncrementalAndMissingFiles) {
    ScopedTempDir dir;
    FileStreamSourceFactory files;
    EXPECT_THROW(files.openExport(dir.file("absent.bin"), ""), SourceUnavailable);

    std::string path = dir.file("stream.bin");
    std::ofstream(path) << "abc";
    EXPECT_THROW(files.openExport(path, "base"), SourceUnavailable);
}

TEST(StreamSourceTest, ZfsSendArgumentsAndExitStatus) {
    ScopedTempDir dir;
    std::string zfs = dir.file("zfs");
    std::ofstream(zfs) << "#!/bin/sh\n"
                       << "echo \"$@\"\n"
                       << "[ \"$4\" = \"tank/data@bad\" ] && exit 3\n"
                       << "exit 0\n";
    std::filesystem::permissions(zfs, std::filesystem::perms::owner_all);
    ZfsStreamSourceFactory sources(zfs);

    std::unique_ptr<ByteSource> incremental = sources.openExport("tank/data@auto-2", "tank/data@auto-1");
    EXPECT_EQ(drain(*incremental), "send -I tank/data@auto-1 tank/data@auto-2\n");
    EXPECT_NO_THROW(incremental->close());

    std::unique_ptr<ByteSource> full = sources.openExport("tank/data@auto-2", "");
    EXPECT_EQ(drain(*full), "send tank/data@auto-2\n");
    full->close();

    std::unique_ptr<ByteSource> failing = sources.openExport("tank/data@bad", "tank/data@auto-1");
    drain(*failing);
    EXPECT_THROW(failing->close(), SourceUnavailable);

    EXPECT_THROW(sources.openExport("tank/data", ""), SourceUnavailable);
}
