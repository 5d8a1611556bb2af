#pragma once

#include <string>

// One logical backup run. The prefix is the naming namespace for its
// shards and never changes once chosen.
struct BackupJob {
    std::string sourceIdentifier;  // e.g. "tank/data@auto-20240101-020000"
    std::string sinceIdentifier;   // empty for a full stream
    std::string backupPrefix;
    std::string destinationPath;

    bool isIncremental() const { return !sinceIdentifier.empty(); }
};

// "full-<snapshot>" or "incr-<snapshot>".
std::string makeBackupPrefix(const std::string& snapshotName, bool incremental);

// Dataset name with '/' replaced by '_', so one dataset maps to one
// flat remote directory.
std::string destinationPathFor(const std::string& dataset);

// Splits "pool/fs@snap" into dataset and snapshot; snapshot is empty when
// there is no '@'.
void splitSnapshotIdentifier(const std::string& identifier, std::string& dataset, std::string& snapshot);
