#include "pipeline_fixture.hpp"
#include "backup/backup_manager.hpp"
#include "backup/completion_detector.hpp"
#include "backup/stream_source.hpp"
#include "common/cancellation.hpp"
#include "common/errors.hpp"
#include "common/file_lock.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

using namespace testing_support;

class ShardPipelineTest : public PipelineTestBase {
protected:
    std::string decodeShard(uint64_t index, uint64_t offset) {
        std::string local = dir_.file("download.enc");
        store_->getFile(shardPath(index, offset), local);
        std::string plain;
        decoder_->decode(local, [&](const char* data, size_t length) { plain.append(data, length); });
        return plain;
    }

    ShardMetadata sidecar(uint64_t index) {
        return ShardMetadata::fromJson(store_->getObject(metadataPath(index)));
    }
};

TEST_F(ShardPipelineTest, SplitsStreamIntoOrderedShards) {
    std::string data = patternBytes(25 * 1024);
    sources_->set(kSource, data);

    PipelineResult result = pipeline_->run(job(), kShard);
    EXPECT_EQ(result.shardsUploaded, 3u);
    EXPECT_EQ(result.totalShards, 3u);
    EXPECT_EQ(result.bytesStreamed, data.size());
    EXPECT_TRUE(result.complete);
    EXPECT_EQ(pipeline_->state(), PipelineState::Done);

    RemoteShardSet set = scan();
    ASSERT_EQ(set.shards.size(), 3u);
    EXPECT_EQ(set.shards[0].byteOffset, 0u);
    EXPECT_EQ(set.shards[1].byteOffset, kShard);
    EXPECT_EQ(set.shards[2].byteOffset, 2 * kShard);
    EXPECT_EQ(set.shards[2].plaintextSize, 5u * 1024);
    EXPECT_EQ(CompletionDetector::evaluate(set.shards), CompletionState::Complete);

    EXPECT_FALSE(sidecar(1).isFinal);
    EXPECT_FALSE(sidecar(2).isFinal);
    ShardMetadata last = sidecar(3);
    EXPECT_TRUE(last.isFinal);
    EXPECT_EQ(last.plaintextSize, 5u * 1024);
    EXPECT_EQ(last.shardSizeTarget, kShard);
    EXPECT_EQ(last.sourceIdentifier, kSource);
    EXPECT_EQ(last.ciphertextSize, set.shards[2].ciphertextSize);

    EXPECT_EQ(decodeShard(1, 0) + decodeShard(2, kShard) + decodeShard(3, 2 * kShard), data);
}

TEST_F(ShardPipelineTest, ExactMultipleLeavesNoEmptyShard) {
    sources_->set(kSource, patternBytes(2 * kShard));

    PipelineResult result = pipeline_->run(job(), kShard);
    EXPECT_EQ(result.shardsUploaded, 2u);
    EXPECT_TRUE(result.complete);

    RemoteShardSet set = scan();
    ASSERT_EQ(set.shards.size(), 2u);
    EXPECT_EQ(set.shards[1].plaintextSize, kShard);
    EXPECT_EQ(set.shards[1].isFinal, true);
    EXPECT_FALSE(store_->objectSize(metadataPath(3)).has_value());
}

TEST_F(ShardPipelineTest, CompletedBackupIsNotRepeated) {
    sources_->set(kSource, patternBytes(25 * 1024));
    pipeline_->run(job(), kShard);

    PipelineResult again = pipeline_->run(job(), kShard);
    EXPECT_EQ(again.shardsUploaded, 0u);
    EXPECT_EQ(again.totalShards, 3u);
    EXPECT_TRUE(again.complete);
    EXPECT_EQ(sources_->opened(), 1);
}

TEST_F(ShardPipelineTest, ResumesAfterInterruptedUpload) {
    std::string data = patternBytes(25 * 1024);
    sources_->set(kSource, data);

    store_->failShardUploadsAfter(2);
    EXPECT_THROW(pipeline_->run(job(), kShard), UploadFailure);
    EXPECT_EQ(pipeline_->state(), PipelineState::Aborted);
    ASSERT_EQ(scan().shards.size(), 2u);

    store_->heal();
    PipelineResult result = pipeline_->run(job(), kShard);
    EXPECT_EQ(result.shardsUploaded, 1u);
    EXPECT_EQ(result.bytesSkipped, 2 * kShard);
    EXPECT_EQ(result.totalShards, 3u);
    EXPECT_TRUE(result.complete);

    RemoteShardSet set = scan();
    ASSERT_EQ(set.shards.size(), 3u);
    EXPECT_EQ(set.shards[2].byteOffset, 2 * kShard);
    EXPECT_EQ(decodeShard(3, 2 * kShard), data.substr(2 * kShard));
}

TEST_F(ShardPipelineTest, ResumeAtExactEndMarksLastShardFinal) {
    std::string data = patternBytes(3 * kShard);
    sources_->set(kSource, data);
    store_->failShardUploadsAfter(2);
    EXPECT_THROW(pipeline_->run(job(), kShard), UploadFailure);
    EXPECT_FALSE(sidecar(2).isFinal);

    // The stream now ends exactly where the stored shards do.
    store_->heal();
    sources_->set(kSource, data.substr(0, 2 * kShard));
    PipelineResult result = pipeline_->run(job(), kShard);
    EXPECT_EQ(result.shardsUploaded, 0u);
    EXPECT_TRUE(result.complete);
    EXPECT_TRUE(sidecar(2).isFinal);
    EXPECT_EQ(CompletionDetector::evaluate(scan().shards), CompletionState::Complete);
}

TEST_F(ShardPipelineTest, ShorterExportThanStoredShardsFails) {
    sources_->set(kSource, patternBytes(3 * kShard));
    store_->failShardUploadsAfter(2);
    EXPECT_THROW(pipeline_->run(job(), kShard), UploadFailure);

    store_->heal();
    sources_->set(kSource, patternBytes(kShard + 100));
    EXPECT_THROW(pipeline_->run(job(), kShard), SourceUnavailable);
}

TEST_F(ShardPipelineTest, FailedExportNeverUploadsFinalShard) {
    sources_->set(kSource, patternBytes(25 * 1024));
    sources_->failOnClose(true);

    EXPECT_THROW(pipeline_->run(job(), kShard), SourceUnavailable);
    RemoteShardSet set = scan();
    ASSERT_EQ(set.shards.size(), 2u);
    EXPECT_EQ(CompletionDetector::evaluate(set.shards), CompletionState::InProgress);
    EXPECT_FALSE(store_->objectSize(metadataPath(3)).has_value());
}

TEST_F(ShardPipelineTest, ResumeRefusesShardsOfAnotherStream) {
    sources_->set(kSource, patternBytes(25 * 1024));
    store_->failShardUploadsAfter(2);
    EXPECT_THROW(pipeline_->run(job(), kShard), UploadFailure);
    store_->heal();

    sources_->set(std::string("tank/data@other..") + kSource, patternBytes(25 * 1024, 7));
    BackupJob incremental = job();
    incremental.sinceIdentifier = "tank/data@other";
    EXPECT_THROW(pipeline_->run(incremental, kShard), InconsistentRemoteState);

    BackupJob later = job();
    later.sourceIdentifier = "tank/data@auto-20240102-020000";
    sources_->set(later.sourceIdentifier, patternBytes(25 * 1024, 9));
    EXPECT_THROW(pipeline_->run(later, kShard), InconsistentRemoteState);

    EXPECT_EQ(sources_->opened(), 1);
    EXPECT_EQ(scan().shards.size(), 2u);
}

TEST_F(ShardPipelineTest, TruncatedLastShardBlocksResume) {
    sources_->set(kSource, patternBytes(25 * 1024));
    store_->failShardUploadsAfter(2);
    EXPECT_THROW(pipeline_->run(job(), kShard), UploadFailure);
    store_->heal();

    std::string stored = dir_.file("bucket/" + shardPath(2, kShard));
    std::filesystem::resize_file(stored, std::filesystem::file_size(stored) / 2);

    EXPECT_THROW(pipeline_->run(job(), kShard), InconsistentRemoteState);
    EXPECT_EQ(sources_->opened(), 1);
}

TEST_F(ShardPipelineTest, UnusableStagingDirectoryIsTransformFailure) {
    sources_->set(kSource, patternBytes(25 * 1024));
    std::ofstream(dir_.file("blocker")) << "not a directory";
    ShardPipeline pipeline(store_, sources_, encoder_, dir_.file("blocker") + "/staging", "zfs.gz.enc");

    EXPECT_THROW(pipeline.run(job(), kShard), ShardTransformFailure);
    EXPECT_EQ(pipeline.state(), PipelineState::Aborted);
    EXPECT_TRUE(scan().empty());
}

TEST_F(ShardPipelineTest, GapInRemoteShardsIsInconsistent) {
    sources_->set(kSource, patternBytes(25 * 1024));
    pipeline_->run(job(), kShard);
    store_->remove(shardPath(2, kShard));

    EXPECT_THROW(pipeline_->run(job(), kShard), InconsistentRemoteState);
}

TEST_F(ShardPipelineTest, MissingLastSidecarIsInconsistent) {
    sources_->set(kSource, patternBytes(3 * kShard));
    store_->failShardUploadsAfter(2);
    EXPECT_THROW(pipeline_->run(job(), kShard), UploadFailure);
    store_->heal();
    store_->remove(metadataPath(2));

    EXPECT_THROW(pipeline_->run(job(), kShard), InconsistentRemoteState);
}

TEST_F(ShardPipelineTest, EmptyExportUploadsNothing) {
    sources_->set(kSource, "");
    PipelineResult result = pipeline_->run(job(), kShard);
    EXPECT_EQ(result.shardsUploaded, 0u);
    EXPECT_FALSE(result.complete);
    EXPECT_TRUE(scan().empty());
}

TEST_F(ShardPipelineTest, CancellationStopsBeforeUpload) {
    sources_->set(kSource, patternBytes(25 * 1024));
    CancellationToken cancel;
    cancel.cancel();

    EXPECT_THROW(pipeline_->run(job(), kShard, &cancel), OperationCancelled);
    EXPECT_TRUE(scan().empty());
}

TEST_F(ShardPipelineTest, ReportsStatesAndShards) {
    sources_->set(kSource, patternBytes(15 * 1024));
    std::vector<PipelineState> states;
    std::vector<uint64_t> indices;
    pipeline_->setStateCallback([&](PipelineState state) { states.push_back(state); });
    pipeline_->setShardCallback([&](const ShardMetadata& shard) { indices.push_back(shard.index); });

    pipeline_->run(job(), kShard);
    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.front(), PipelineState::Planning);
    EXPECT_EQ(states.back(), PipelineState::Done);
    EXPECT_EQ(std::count(states.begin(), states.end(), PipelineState::Uploading), 2);
    EXPECT_EQ(indices, (std::vector<uint64_t>{1, 2}));
}

TEST_F(ShardPipelineTest, ZeroShardTargetIsRejected) {
    sources_->set(kSource, "abc");
    EXPECT_THROW(pipeline_->run(job(), 0), ConfigurationError);
}

class BackupManagerTest : public PipelineTestBase {
protected:
    void SetUp() override {
        PipelineTestBase::SetUp();
        config_.tempDir = tempDir();
        config_.lockDir = dir_.file("locks");
        streamPath_ = dir_.file("stream.bin");
        data_ = patternBytes(25 * 1024);
        std::ofstream(streamPath_, std::ios::binary) << data_;
        manager_ = std::make_unique<BackupManager>(config_, store_, std::make_shared<FileStreamSourceFactory>(),
                                                   nullptr, encoder_);
    }

    BackupRequest request() const {
        BackupRequest request;
        request.dataset = streamPath_;
        request.shardSize = kShard;
        request.destinationPath = kDest;
        return request;
    }

    AppConfig config_;
    std::string streamPath_;
    std::string data_;
    std::unique_ptr<BackupManager> manager_;
};

TEST_F(BackupManagerTest, BacksUpFileAndListsIt) {
    BackupReport report = manager_->runBackup(request());
    EXPECT_EQ(report.job.backupPrefix, "full-stream.bin");
    EXPECT_EQ(report.shardSizeTarget, kShard);
    EXPECT_EQ(report.result.totalShards, 3u);
    EXPECT_EQ(report.state, CompletionState::Complete);

    std::vector<BackupSummary> backups = manager_->listBackups(kDest);
    ASSERT_EQ(backups.size(), 1u);
    EXPECT_EQ(backups[0].prefix, "full-stream.bin");
    EXPECT_EQ(backups[0].shardCount, 3u);
    EXPECT_EQ(backups[0].plaintextBytes, data_.size());
    EXPECT_EQ(backups[0].state, CompletionState::Complete);
    EXPECT_GT(backups[0].storedBytes, 0u);
}

TEST_F(BackupManagerTest, ReusesRecordedShardSize) {
    store_->failShardUploadsAfter(1);
    EXPECT_THROW(manager_->runBackup(request()), UploadFailure);
    store_->heal();

    BackupRequest resumed = request();
    resumed.shardSize.reset();
    BackupReport report = manager_->runBackup(resumed);
    EXPECT_EQ(report.shardSizeTarget, kShard);
    EXPECT_EQ(report.result.shardsUploaded, 2u);
    EXPECT_EQ(report.state, CompletionState::Complete);
}

TEST_F(BackupManagerTest, ConcurrentRunIsRefused) {
    FileLock held(config_.lockDir, streamPath_);
    ASSERT_TRUE(held.tryLock());
    EXPECT_THROW(manager_->runBackup(request()), ResourceBusy);
}

TEST_F(BackupManagerTest, CleanRemovesEveryObjectOfOneBackup) {
    manager_->runBackup(request());
    store_->putObject(remoteJoin(kDest, "notes.txt"), "keep me");

    EXPECT_EQ(manager_->cleanBackup(kDest, "full-stream.bin"), 6u);
    EXPECT_TRUE(manager_->listBackups(kDest).empty());
    EXPECT_EQ(store_->list(kDest).size(), 1u);
}
