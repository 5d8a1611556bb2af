#pragma once

#include <cstdint>
#include <string>

// Uniquely named file under a staging directory, removed when the owner
// goes out of scope (including on exceptions and cancellation).
class TempFile {
public:
    TempFile(const std::string& directory, const std::string& tag);
    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }
    uint64_t size() const;
    void remove();

private:
    std::string path_;
};
