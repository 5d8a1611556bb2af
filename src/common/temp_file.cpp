#include "common/temp_file.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <system_error>
#include <vector>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <stdlib.h>

TempFile::TempFile(const std::string& directory, const std::string& tag) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("Cannot create staging directory " + directory + ": " + ec.message());
    }

    std::string pattern = (std::filesystem::path(directory) / ("snapshard-" + tag + "-XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = mkstemp(buffer.data());
    if (fd < 0) {
        throw std::runtime_error("Cannot create temporary file in " + directory + ": " + strerror(errno));
    }
    close(fd);
    path_ = buffer.data();
}

TempFile::~TempFile() {
    remove();
}

uint64_t TempFile::size() const {
    std::error_code ec;
    auto bytes = std::filesystem::file_size(path_, ec);
    return ec ? 0 : static_cast<uint64_t>(bytes);
}

void TempFile::remove() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        Logger::warning("Failed to remove temporary file " + path_ + ": " + ec.message());
    }
    path_.clear();
}
