#pragma once

#include <gtest/gtest.h>
#include <memory>
#include <string>

#include "backup/remote_inventory.hpp"
#include "backup/shard_pipeline.hpp"
#include "codec/shard_codec.hpp"
#include "restore/reconstruction_pipeline.hpp"
#include "test_helpers.hpp"

// Key pair shared by the whole suite plus a fresh bucket, staging area and
// in-memory export per test.
class PipelineTestBase : public ::testing::Test {
protected:
    static constexpr uint64_t kShard = 10 * 1024;
    static constexpr const char* kDest = "tank_data";
    static constexpr const char* kSource = "tank/data@auto-20240101-020000";
    static constexpr const char* kPrefix = "full-auto-20240101-020000";

    static void SetUpTestSuite() {
        keyDir_ = std::make_unique<testing_support::ScopedTempDir>();
        keys_ = testing_support::writeKeyPair(keyDir_->path());
    }

    static void TearDownTestSuite() {
        keyDir_.reset();
    }

    void SetUp() override {
        store_ = std::make_shared<testing_support::FlakyStore>(dir_.file("bucket"));
        sources_ = std::make_shared<testing_support::MemorySourceFactory>();
        encoder_ = std::make_shared<ShardEncoder>(RecipientKey::loadPem(keys_.publicKey), 1);
        decoder_ = std::make_shared<ShardDecoder>(IdentityKey::loadPem(keys_.privateKey));
        pipeline_ = std::make_unique<ShardPipeline>(store_, sources_, encoder_, tempDir(), "zfs.gz.enc");
    }

    std::string tempDir() const { return dir_.file("staging"); }

    BackupJob job() const {
        BackupJob job;
        job.sourceIdentifier = kSource;
        job.backupPrefix = kPrefix;
        job.destinationPath = kDest;
        return job;
    }

    RemoteShardSet scan() const {
        return RemoteInventory(store_).scan(kDest, kPrefix);
    }

    std::string shardPath(uint64_t index, uint64_t offset) const {
        return remoteJoin(kDest, formatShardName(kPrefix, index, offset, "zfs.gz.enc"));
    }

    std::string metadataPath(uint64_t index) const {
        return remoteJoin(kDest, formatMetadataName(kPrefix, index));
    }

    inline static std::unique_ptr<testing_support::ScopedTempDir> keyDir_;
    inline static testing_support::KeyPairFiles keys_;

    testing_support::ScopedTempDir dir_;
    std::shared_ptr<testing_support::FlakyStore> store_;
    std::shared_ptr<testing_support::MemorySourceFactory> sources_;
    std::shared_ptr<ShardEncoder> encoder_;
    std::shared_ptr<ShardDecoder> decoder_;
    std::unique_ptr<ShardPipeline> pipeline_;
};
