#include "backup/backup_job.hpp"
#include <algorithm>

std::string makeBackupPrefix(const std::string& snapshotName, bool incremental) {
    return (incremental ? "incr-" : "full-") + snapshotName;
}

std::string destinationPathFor(const std::string& dataset) {
    std::string path = dataset;
    std::replace(path.begin(), path.end(), '/', '_');
    return path;
}

void splitSnapshotIdentifier(const std::string& identifier, std::string& dataset, std::string& snapshot) {
    size_t at = identifier.find('@');
    if (at == std::string::npos) {
        dataset = identifier;
        snapshot.clear();
        return;
    }
    dataset = identifier.substr(0, at);
    snapshot = identifier.substr(at + 1);
}
