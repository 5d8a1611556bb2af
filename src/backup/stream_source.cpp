#include "backup/stream_source.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/process.hpp"
#include <fstream>
#include <vector>

namespace {

class ProcessSource : public ByteSource {
public:
    explicit ProcessSource(const std::vector<std::string>& argv)
        : process_(argv, ChildProcess::Mode::Read) {
    }

    size_t read(char* buffer, size_t length) override {
        try {
            return process_.read(buffer, length);
        } catch (const std::runtime_error& e) {
            throw SourceUnavailable(e.what());
        }
    }

    void close() override {
        if (!process_.isRunning()) {
            return;
        }
        int status;
        try {
            status = process_.wait();
        } catch (const std::runtime_error& e) {
            throw SourceUnavailable(e.what());
        }
        if (status != 0) {
            throw SourceUnavailable("'" + process_.commandLine() + "' exited with status " + std::to_string(status));
        }
    }

private:
    ChildProcess process_;
};

class FileSource : public ByteSource {
public:
    explicit FileSource(const std::string& path)
        : path_(path)
        , file_(path, std::ios::binary) {
        if (!file_) {
            throw SourceUnavailable("Cannot open " + path);
        }
    }

    size_t read(char* buffer, size_t length) override {
        if (!file_.is_open()) {
            return 0;
        }
        file_.read(buffer, static_cast<std::streamsize>(length));
        if (file_.bad()) {
            throw SourceUnavailable("Read error on " + path_);
        }
        return static_cast<size_t>(file_.gcount());
    }

    void close() override {
        file_.close();
    }

private:
    std::string path_;
    std::ifstream file_;
};

} // namespace

ZfsStreamSourceFactory::ZfsStreamSourceFactory(const std::string& zfsBinary)
    : zfsBinary_(zfsBinary) {
}

std::unique_ptr<ByteSource> ZfsStreamSourceFactory::openExport(const std::string& sourceIdentifier,
                                                               const std::string& sinceIdentifier) {
    if (sourceIdentifier.find('@') == std::string::npos) {
        throw SourceUnavailable("Not a snapshot name: " + sourceIdentifier);
    }

    std::vector<std::string> argv = {zfsBinary_, "send"};
    if (!sinceIdentifier.empty()) {
        argv.push_back("-I");
        argv.push_back(sinceIdentifier);
    }
    argv.push_back(sourceIdentifier);

    Logger::debug("Opening export of " + sourceIdentifier +
                  (sinceIdentifier.empty() ? "" : " since " + sinceIdentifier));
    try {
        return std::make_unique<ProcessSource>(argv);
    } catch (const std::runtime_error& e) {
        throw SourceUnavailable(std::string("Cannot start zfs send: ") + e.what());
    }
}

std::unique_ptr<ByteSource> FileStreamSourceFactory::openExport(const std::string& sourceIdentifier,
                                                                const std::string& sinceIdentifier) {
    if (!sinceIdentifier.empty()) {
        throw SourceUnavailable("File sources do not support incremental export");
    }
    return std::make_unique<FileSource>(sourceIdentifier);
}
