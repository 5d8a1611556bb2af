#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

struct SnapshotInfo {
    std::string name;      // "pool/fs@snap"
    std::time_t creation = 0;
};

// Local ZFS snapshot lifecycle around a backup run.
class SnapshotManager {
public:
    SnapshotManager(const std::string& snapshotPrefix, const std::string& zfsBinary = "zfs");

    // Creates "<dataset>@<prefix>-YYYYmmdd-HHMMSS" and returns its full name.
    std::string createSnapshot(const std::string& dataset);
    bool snapshotExists(const std::string& snapshot);
    bool datasetExists(const std::string& dataset);
    void destroyDataset(const std::string& dataset);

    // Prefixed snapshots of the dataset, oldest first.
    std::vector<SnapshotInfo> listSnapshots(const std::string& dataset);
    // Newest prefixed snapshot created before current, if any.
    std::optional<std::string> previousSnapshot(const std::string& dataset, const std::string& current);

    std::optional<uint64_t> datasetUsedBytes(const std::string& dataset);

    // Destroys prefixed snapshots older than retentionDays; returns the count.
    int pruneSnapshots(const std::string& dataset, int retentionDays, std::time_t now);

    static std::string makeSnapshotName(const std::string& prefix, std::time_t time);
    // Parses `zfs list -Hp -o name,creation` output, keeping prefixed
    // snapshots of exactly this dataset.
    static std::vector<SnapshotInfo> parseSnapshotList(const std::string& output, const std::string& dataset,
                                                       const std::string& prefix);

private:
    std::string prefix_;
    std::string zfsBinary_;
};
