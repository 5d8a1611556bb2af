#pragma once

#include <string>

// Advisory cross-process lock keyed by a logical resource name
// (a dataset or restore target). Released on destruction.
class FileLock {
public:
    FileLock(const std::string& lockDir, const std::string& resource);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // Non-blocking; false when another process holds the lock.
    bool tryLock();
    void unlock();
    bool isLocked() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

    static std::string lockFileName(const std::string& resource);

private:
    std::string path_;
    int fd_;
};
