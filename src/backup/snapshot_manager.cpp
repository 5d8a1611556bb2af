#include "backup/snapshot_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/process.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <sstream>

SnapshotManager::SnapshotManager(const std::string& snapshotPrefix, const std::string& zfsBinary)
    : prefix_(snapshotPrefix)
    , zfsBinary_(zfsBinary) {
}

std::string SnapshotManager::makeSnapshotName(const std::string& prefix, std::time_t time) {
    std::tm tm{};
    localtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d-%H%M%S", &tm);
    return prefix + "-" + buffer;
}

std::string SnapshotManager::createSnapshot(const std::string& dataset) {
    std::string snapshot = dataset + "@" + makeSnapshotName(prefix_, std::time(nullptr));
    Logger::info("Creating snapshot " + snapshot);

    CommandResult result = runCommand({zfsBinary_, "snapshot", snapshot});
    if (result.exitCode != 0) {
        throw SourceUnavailable("zfs snapshot " + snapshot + " failed with status " + std::to_string(result.exitCode));
    }
    return snapshot;
}

bool SnapshotManager::snapshotExists(const std::string& snapshot) {
    return runCommand({zfsBinary_, "list", "-H", "-t", "snapshot", "-o", "name", snapshot}).exitCode == 0;
}

bool SnapshotManager::datasetExists(const std::string& dataset) {
    return runCommand({zfsBinary_, "list", "-H", "-o", "name", dataset}).exitCode == 0;
}

void SnapshotManager::destroyDataset(const std::string& dataset) {
    Logger::warning("Destroying existing dataset " + dataset);
    CommandResult result = runCommand({zfsBinary_, "destroy", "-r", dataset});
    if (result.exitCode != 0) {
        throw SinkFailure("zfs destroy -r " + dataset + " failed with status " + std::to_string(result.exitCode));
    }
}

std::vector<SnapshotInfo> SnapshotManager::parseSnapshotList(const std::string& output, const std::string& dataset,
                                                             const std::string& prefix) {
    std::vector<SnapshotInfo> snapshots;
    const std::string wanted = dataset + "@" + prefix + "-";

    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        size_t tab = line.find('\t');
        if (tab == std::string::npos) {
            continue;
        }
        std::string name = line.substr(0, tab);
        if (name.compare(0, wanted.size(), wanted) != 0) {
            continue;
        }
        SnapshotInfo info;
        info.name = name;
        try {
            info.creation = static_cast<std::time_t>(std::stoll(utils::trim(line.substr(tab + 1))));
        } catch (const std::exception&) {
            Logger::warning("Ignoring snapshot with unparsable creation time: " + line);
            continue;
        }
        snapshots.push_back(info);
    }

    std::stable_sort(snapshots.begin(), snapshots.end(),
                     [](const SnapshotInfo& a, const SnapshotInfo& b) { return a.creation < b.creation; });
    return snapshots;
}

std::vector<SnapshotInfo> SnapshotManager::listSnapshots(const std::string& dataset) {
    CommandResult result = runCommand({zfsBinary_, "list", "-Hp", "-t", "snapshot", "-d", "1",
                                       "-o", "name,creation", "-s", "creation", dataset});
    if (result.exitCode != 0) {
        throw SourceUnavailable("Cannot list snapshots of " + dataset);
    }
    return parseSnapshotList(result.output, dataset, prefix_);
}

std::optional<std::string> SnapshotManager::previousSnapshot(const std::string& dataset, const std::string& current) {
    std::vector<SnapshotInfo> snapshots = listSnapshots(dataset);

    auto it = std::find_if(snapshots.begin(), snapshots.end(),
                           [&](const SnapshotInfo& info) { return info.name == current; });
    if (it == snapshots.begin()) {
        return std::nullopt;
    }
    if (it == snapshots.end()) {
        // current is not one of ours; take the newest prefixed snapshot
        if (snapshots.empty()) {
            return std::nullopt;
        }
        return snapshots.back().name;
    }
    return std::prev(it)->name;
}

std::optional<uint64_t> SnapshotManager::datasetUsedBytes(const std::string& dataset) {
    CommandResult result = runCommand({zfsBinary_, "get", "-Hp", "-o", "value", "used", dataset});
    if (result.exitCode != 0) {
        Logger::warning("Cannot read used bytes of " + dataset);
        return std::nullopt;
    }
    try {
        return std::stoull(utils::trim(result.output));
    } catch (const std::exception&) {
        Logger::warning("Unexpected 'used' value for " + dataset + ": " + result.output);
        return std::nullopt;
    }
}

int SnapshotManager::pruneSnapshots(const std::string& dataset, int retentionDays, std::time_t now) {
    const std::time_t cutoff = now - static_cast<std::time_t>(retentionDays) * 86400;
    std::vector<SnapshotInfo> snapshots = listSnapshots(dataset);

    int destroyed = 0;
    // The newest snapshot is the base of the next incremental; keep it.
    for (size_t i = 0; i + 1 < snapshots.size(); ++i) {
        if (snapshots[i].creation >= cutoff) {
            continue;
        }
        Logger::info("Destroying old snapshot " + snapshots[i].name);
        CommandResult result = runCommand({zfsBinary_, "destroy", snapshots[i].name});
        if (result.exitCode != 0) {
            Logger::warning("zfs destroy " + snapshots[i].name + " failed with status " +
                            std::to_string(result.exitCode));
            continue;
        }
        ++destroyed;
    }
    return destroyed;
}
