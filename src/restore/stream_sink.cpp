#include "restore/stream_sink.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/process.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace {

class ZfsReceiveSink : public ByteSink {
public:
    ZfsReceiveSink(const std::string& zfsBinary, const std::string& target)
        : target_(target)
        , process_({zfsBinary, "recv", "-F", target}, ChildProcess::Mode::Write) {
    }

    ~ZfsReceiveSink() override {
        if (process_.isRunning()) {
            Logger::warning("Receive into " + target_ + " was neither committed nor aborted, aborting");
            process_.terminate();
        }
    }

    void write(const char* data, size_t length) override {
        try {
            process_.write(data, length);
        } catch (const std::runtime_error& e) {
            throw SinkFailure("zfs recv " + target_ + ": " + e.what());
        }
    }

    void commit() override {
        int status;
        try {
            status = process_.wait();
        } catch (const std::runtime_error& e) {
            throw SinkFailure("zfs recv " + target_ + ": " + e.what());
        }
        if (status != 0) {
            throw SinkFailure("zfs recv " + target_ + " exited with status " + std::to_string(status));
        }
        Logger::info("Received stream into " + target_);
    }

    void abort() override {
        process_.terminate();
        Logger::warning("Aborted receive into " + target_);
    }

private:
    std::string target_;
    ChildProcess process_;
};

class FileSink : public ByteSink {
public:
    explicit FileSink(const std::string& target)
        : target_(target)
        , partial_(target + ".partial")
        , out_(partial_, std::ios::binary | std::ios::trunc)
        , finished_(false) {
        if (!out_) {
            throw SinkFailure("Cannot create " + partial_);
        }
    }

    ~FileSink() override {
        if (!finished_) {
            abort();
        }
    }

    void write(const char* data, size_t length) override {
        out_.write(data, static_cast<std::streamsize>(length));
        if (!out_) {
            throw SinkFailure("Write to " + partial_ + " failed");
        }
    }

    void commit() override {
        out_.close();
        if (!out_) {
            throw SinkFailure("Failed to flush " + partial_);
        }
        std::error_code ec;
        std::filesystem::rename(partial_, target_, ec);
        if (ec) {
            throw SinkFailure("Cannot rename " + partial_ + " to " + target_ + ": " + ec.message());
        }
        finished_ = true;
    }

    void abort() override {
        out_.close();
        std::error_code ec;
        std::filesystem::remove(partial_, ec);
        if (ec) {
            Logger::warning("Cannot remove " + partial_ + ": " + ec.message());
        }
        finished_ = true;
    }

private:
    std::string target_;
    std::string partial_;
    std::ofstream out_;
    bool finished_;
};

} // namespace

ZfsReceiveSinkFactory::ZfsReceiveSinkFactory(const std::string& zfsBinary)
    : zfsBinary_(zfsBinary) {
}

std::unique_ptr<ByteSink> ZfsReceiveSinkFactory::openImport(const std::string& target) {
    try {
        return std::make_unique<ZfsReceiveSink>(zfsBinary_, target);
    } catch (const std::runtime_error& e) {
        throw SinkFailure(std::string("Cannot start zfs recv: ") + e.what());
    }
}

std::unique_ptr<ByteSink> FileSinkFactory::openImport(const std::string& target) {
    return std::make_unique<FileSink>(target);
}
