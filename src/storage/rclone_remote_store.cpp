#include "storage/rclone_remote_store.hpp"
#include "common/cancellation.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/process.hpp"
#include "common/utils.hpp"
#include <fstream>
#include <sstream>
#include <vector>

namespace {

// rclone exit status for "directory not found"
const int kDirectoryNotFound = 3;

} // namespace

RcloneRemoteStore::RcloneRemoteStore(const std::string& remoteRoot, const std::string& binary)
    : remoteRoot_(remoteRoot)
    , binary_(binary) {
    if (remoteRoot_.empty()) {
        throw StorageError("rclone remote requires a path such as 'remote:bucket'");
    }
}

std::string RcloneRemoteStore::target(const std::string& path) const {
    if (remoteRoot_.back() == ':') {
        return remoteRoot_ + path;
    }
    return remoteJoin(remoteRoot_, path);
}

void RcloneRemoteStore::putFile(const std::string& path, const std::string& localFile,
                                const CancellationToken* cancel) {
    std::ifstream in(localFile, std::ios::binary);
    if (!in) {
        throw StorageError("Cannot open " + localFile);
    }

    try {
        ChildProcess rcat({binary_, "rcat", target(path)}, ChildProcess::Mode::Write);
        std::vector<char> buffer(1024 * 1024);
        while (in) {
            if (cancel && cancel->isCancelled()) {
                rcat.terminate();
                cancel->throwIfCancelled("upload of " + path);
            }
            in.read(buffer.data(), buffer.size());
            if (in.gcount() > 0) {
                rcat.write(buffer.data(), static_cast<size_t>(in.gcount()));
            }
        }
        if (in.bad()) {
            rcat.terminate();
            throw StorageError("Failed to read " + localFile);
        }
        int status = rcat.wait();
        if (status != 0) {
            throw StorageError("rclone rcat " + target(path) + " exited with status " + std::to_string(status));
        }
    } catch (const StorageError&) {
        throw;
    } catch (const OperationCancelled&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw StorageError("rclone upload of " + path + " failed: " + e.what());
    }
}

void RcloneRemoteStore::putObject(const std::string& path, const std::string& content) {
    try {
        ChildProcess rcat({binary_, "rcat", target(path)}, ChildProcess::Mode::Write);
        rcat.write(content.data(), content.size());
        int status = rcat.wait();
        if (status != 0) {
            throw StorageError("rclone rcat " + target(path) + " exited with status " + std::to_string(status));
        }
    } catch (const StorageError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw StorageError("rclone upload of " + path + " failed: " + e.what());
    }
}

void RcloneRemoteStore::getFile(const std::string& path, const std::string& localFile,
                                const CancellationToken* cancel) {
    std::ofstream out(localFile, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw StorageError("Cannot create " + localFile);
    }

    try {
        ChildProcess cat({binary_, "cat", target(path)}, ChildProcess::Mode::Read);
        std::vector<char> buffer(1024 * 1024);
        size_t n;
        while ((n = cat.read(buffer.data(), buffer.size())) > 0) {
            if (cancel && cancel->isCancelled()) {
                cat.terminate();
                cancel->throwIfCancelled("download of " + path);
            }
            out.write(buffer.data(), static_cast<std::streamsize>(n));
            if (!out) {
                cat.terminate();
                throw StorageError("Failed to write " + localFile);
            }
        }
        int status = cat.wait();
        if (status != 0) {
            throw StorageError("rclone cat " + target(path) + " exited with status " + std::to_string(status));
        }
    } catch (const StorageError&) {
        throw;
    } catch (const OperationCancelled&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw StorageError("rclone download of " + path + " failed: " + e.what());
    }

    out.close();
    if (!out) {
        throw StorageError("Failed to flush " + localFile);
    }
}

std::string RcloneRemoteStore::getObject(const std::string& path) {
    CommandResult result;
    try {
        result = runCommand({binary_, "cat", target(path)});
    } catch (const std::runtime_error& e) {
        throw StorageError("rclone cat " + target(path) + " failed: " + e.what());
    }
    if (result.exitCode != 0) {
        throw StorageError("rclone cat " + target(path) + " exited with status " + std::to_string(result.exitCode));
    }
    return result.output;
}

std::vector<RemoteObject> RcloneRemoteStore::parseListing(const std::string& output) {
    std::vector<RemoteObject> objects;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.empty()) {
            continue;
        }
        size_t tab = line.find('\t');
        if (tab == std::string::npos) {
            throw StorageError("Unexpected rclone lsf line: " + line);
        }
        RemoteObject object;
        try {
            object.size = std::stoull(line.substr(0, tab));
        } catch (const std::exception&) {
            throw StorageError("Unexpected rclone lsf size: " + line);
        }
        object.name = line.substr(tab + 1);
        objects.push_back(object);
    }
    return objects;
}

std::vector<RemoteObject> RcloneRemoteStore::list(const std::string& directory) {
    CommandResult result;
    try {
        result = runCommand({binary_, "lsf", "--files-only", "--format", "sp", "--separator", "\t",
                             target(directory)});
    } catch (const std::runtime_error& e) {
        throw StorageError("rclone lsf " + target(directory) + " failed: " + e.what());
    }

    if (result.exitCode == kDirectoryNotFound) {
        return {};
    }
    if (result.exitCode != 0) {
        throw StorageError("rclone lsf " + target(directory) + " exited with status " + std::to_string(result.exitCode));
    }
    return parseListing(result.output);
}

std::optional<uint64_t> RcloneRemoteStore::objectSize(const std::string& path) {
    size_t slash = path.rfind('/');
    std::string directory = slash == std::string::npos ? "" : path.substr(0, slash);
    std::string objectName = slash == std::string::npos ? path : path.substr(slash + 1);

    for (const auto& object : list(directory)) {
        if (object.name == objectName) {
            return object.size;
        }
    }
    return std::nullopt;
}

void RcloneRemoteStore::remove(const std::string& path) {
    CommandResult result;
    try {
        result = runCommand({binary_, "deletefile", target(path)});
    } catch (const std::runtime_error& e) {
        throw StorageError("rclone deletefile " + target(path) + " failed: " + e.what());
    }
    if (result.exitCode != 0) {
        throw StorageError("rclone deletefile " + target(path) + " exited with status " + std::to_string(result.exitCode));
    }
    Logger::debug("Deleted " + target(path));
}
