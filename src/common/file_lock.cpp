#include "common/file_lock.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

FileLock::FileLock(const std::string& lockDir, const std::string& resource)
    : fd_(-1) {
    std::filesystem::create_directories(lockDir);
    path_ = (std::filesystem::path(lockDir) / lockFileName(resource)).string();
}

FileLock::~FileLock() {
    unlock();
}

bool FileLock::tryLock() {
    if (fd_ >= 0) {
        return true;
    }

    int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::runtime_error("Cannot open lock file " + path_ + ": " + strerror(errno));
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        close(fd);
        if (err == EWOULDBLOCK) {
            return false;
        }
        throw std::runtime_error("Cannot lock " + path_ + ": " + strerror(err));
    }

    fd_ = fd;
    Logger::debug("Acquired lock " + path_);
    return true;
}

void FileLock::unlock() {
    if (fd_ < 0) {
        return;
    }
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
    Logger::debug("Released lock " + path_);
}

std::string FileLock::lockFileName(const std::string& resource) {
    std::string name;
    name.reserve(resource.size() + 5);
    for (char c : resource) {
        if (c == '/' || c == '@' || c == ':' || c == ' ') {
            name.push_back('_');
        } else {
            name.push_back(c);
        }
    }
    return name + ".lock";
}
