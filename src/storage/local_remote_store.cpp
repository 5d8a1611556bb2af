#include "storage/local_remote_store.hpp"
#include "common/cancellation.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::string tempNameFor(const fs::path& target) {
    std::random_device rd;
    std::ostringstream name;
    name << "." << target.filename().string() << ".tmp." << std::hex << rd() << rd();
    return (target.parent_path() / name.str()).string();
}

bool isTempName(const std::string& name) {
    return !name.empty() && name[0] == '.' && name.find(".tmp.") != std::string::npos;
}

} // namespace

LocalRemoteStore::LocalRemoteStore(const std::string& root)
    : root_(root) {
    if (root_.empty()) {
        throw StorageError("Local remote requires a root directory");
    }
}

std::string LocalRemoteStore::resolve(const std::string& path) const {
    fs::path relative(path);
    for (const auto& part : relative) {
        if (part == "..") {
            throw StorageError("Path escapes the remote root: " + path);
        }
    }
    return (fs::path(root_) / relative.relative_path()).string();
}

void LocalRemoteStore::copyStream(std::istream& in, std::ostream& out, const std::string& what,
                                  const CancellationToken* cancel) {
    std::vector<char> buffer(1024 * 1024);
    while (in) {
        if (cancel) {
            cancel->throwIfCancelled(what);
        }
        in.read(buffer.data(), buffer.size());
        std::streamsize count = in.gcount();
        if (count > 0) {
            out.write(buffer.data(), count);
            if (!out) {
                throw StorageError("Write failed during " + what);
            }
        }
    }
    if (in.bad()) {
        throw StorageError("Read failed during " + what);
    }
}

void LocalRemoteStore::commitTemp(const std::string& tempPath, const std::string& finalPath) {
    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        fs::remove(tempPath, ec);
        throw StorageError("Failed to publish " + finalPath + ": " + ec.message());
    }
}

void LocalRemoteStore::putFile(const std::string& path, const std::string& localFile,
                               const CancellationToken* cancel) {
    fs::path target(resolve(path));
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw StorageError("Cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    std::ifstream in(localFile, std::ios::binary);
    if (!in) {
        throw StorageError("Cannot open " + localFile);
    }

    std::string tempPath = tempNameFor(target);
    try {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StorageError("Cannot create " + tempPath);
        }
        copyStream(in, out, "upload of " + path, cancel);
        out.close();
        if (!out) {
            throw StorageError("Failed to flush " + tempPath);
        }
    } catch (...) {
        fs::remove(tempPath, ec);
        throw;
    }
    commitTemp(tempPath, target.string());
}

void LocalRemoteStore::putObject(const std::string& path, const std::string& content) {
    fs::path target(resolve(path));
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw StorageError("Cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    std::string tempPath = tempNameFor(target);
    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (!out) {
            fs::remove(tempPath, ec);
            throw StorageError("Failed to write " + tempPath);
        }
    }
    commitTemp(tempPath, target.string());
}

void LocalRemoteStore::getFile(const std::string& path, const std::string& localFile,
                               const CancellationToken* cancel) {
    std::string source = resolve(path);
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw StorageError("Object not found: " + path);
    }
    std::ofstream out(localFile, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw StorageError("Cannot create " + localFile);
    }
    copyStream(in, out, "download of " + path, cancel);
    out.close();
    if (!out) {
        throw StorageError("Failed to flush " + localFile);
    }
}

std::string LocalRemoteStore::getObject(const std::string& path) {
    std::ifstream in(resolve(path), std::ios::binary);
    if (!in) {
        throw StorageError("Object not found: " + path);
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        throw StorageError("Failed to read " + path);
    }
    return content.str();
}

std::vector<RemoteObject> LocalRemoteStore::list(const std::string& directory) {
    std::vector<RemoteObject> objects;
    fs::path dir(resolve(directory));

    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return objects;
    }
    if (!fs::is_directory(dir, ec)) {
        throw StorageError("Not a directory: " + dir.string());
    }

    for (fs::directory_iterator it(dir, ec), end; it != end && !ec; it.increment(ec)) {
        if (!it->is_regular_file()) {
            continue;
        }
        std::string name = it->path().filename().string();
        if (isTempName(name)) {
            continue;
        }
        objects.push_back({name, static_cast<uint64_t>(it->file_size())});
    }
    if (ec) {
        throw StorageError("Failed to list " + dir.string() + ": " + ec.message());
    }
    return objects;
}

std::optional<uint64_t> LocalRemoteStore::objectSize(const std::string& path) {
    std::error_code ec;
    uint64_t size = fs::file_size(resolve(path), ec);
    if (ec) {
        return std::nullopt;
    }
    return size;
}

void LocalRemoteStore::remove(const std::string& path) {
    std::error_code ec;
    if (!fs::remove(resolve(path), ec) && ec) {
        throw StorageError("Failed to delete " + path + ": " + ec.message());
    }
    Logger::debug("Deleted " + path + " from " + name());
}
