#include "common/process.hpp"
#include "common/logger.hpp"
#include <stdexcept>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

ChildProcess::ChildProcess(const std::vector<std::string>& argv, Mode mode)
    : pid_(-1)
    , fd_(-1)
    , mode_(mode) {
    if (argv.empty()) {
        throw std::invalid_argument("Empty command line");
    }

    for (const auto& arg : argv) {
        if (!commandLine_.empty()) {
            commandLine_ += " ";
        }
        commandLine_ += arg;
    }

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error("pipe failed for '" + commandLine_ + "': " + strerror(errno));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        throw std::runtime_error("fork failed for '" + commandLine_ + "': " + strerror(err));
    }

    if (pid == 0) {
        if (mode == Mode::Read) {
            dup2(fds[1], STDOUT_FILENO);
        } else {
            dup2(fds[0], STDIN_FILENO);
        }
        execvp(args[0], args.data());
        _exit(127);
    }

    pid_ = pid;
    if (mode == Mode::Read) {
        close(fds[1]);
        fd_ = fds[0];
    } else {
        close(fds[0]);
        fd_ = fds[1];
    }

    Logger::debug("Started '" + commandLine_ + "' (pid " + std::to_string(pid_) + ")");
}

ChildProcess::~ChildProcess() {
    if (pid_ > 0) {
        terminate();
    }
    closePipe();
}

size_t ChildProcess::read(char* buffer, size_t length) {
    if (mode_ != Mode::Read || fd_ < 0) {
        throw std::logic_error("Process '" + commandLine_ + "' is not readable");
    }

    while (true) {
        ssize_t n = ::read(fd_, buffer, length);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno != EINTR) {
            throw std::runtime_error("Read from '" + commandLine_ + "' failed: " + strerror(errno));
        }
    }
}

void ChildProcess::write(const char* data, size_t length) {
    if (mode_ != Mode::Write || fd_ < 0) {
        throw std::logic_error("Process '" + commandLine_ + "' is not writable");
    }

    while (length > 0) {
        ssize_t n = ::write(fd_, data, length);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error("Write to '" + commandLine_ + "' failed: " + strerror(errno));
        }
        data += n;
        length -= static_cast<size_t>(n);
    }
}

void ChildProcess::closePipe() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

int ChildProcess::wait() {
    if (pid_ <= 0) {
        return -1;
    }

    // A reader may stop early; closing first lets the child see EPIPE.
    closePipe();

    int status = 0;
    while (waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            pid_ = -1;
            throw std::runtime_error("waitpid failed for '" + commandLine_ + "': " + strerror(errno));
        }
    }
    pid_ = -1;

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void ChildProcess::terminate() {
    if (pid_ <= 0) {
        return;
    }
    Logger::debug("Terminating '" + commandLine_ + "' (pid " + std::to_string(pid_) + ")");
    kill(pid_, SIGKILL);
    closePipe();
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    pid_ = -1;
}

CommandResult runCommand(const std::vector<std::string>& argv) {
    CommandResult result;
    ChildProcess process(argv, ChildProcess::Mode::Read);

    char buffer[4096];
    size_t n;
    while ((n = process.read(buffer, sizeof(buffer))) > 0) {
        result.output.append(buffer, n);
    }
    result.exitCode = process.wait();
    return result;
}
