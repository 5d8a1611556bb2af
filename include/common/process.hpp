#pragma once

#include <string>
#include <vector>
#include <sys/types.h>

// Child process connected to the parent through one pipe: either its
// stdout (Mode::Read) or its stdin (Mode::Write). The argv form avoids
// shell quoting of dataset and object names.
class ChildProcess {
public:
    enum class Mode {
        Read,
        Write
    };

    ChildProcess(const std::vector<std::string>& argv, Mode mode);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Returns 0 at end of output. Throws std::runtime_error on I/O errors.
    size_t read(char* buffer, size_t length);
    void write(const char* data, size_t length);

    // Closes our end of the pipe so the child sees EOF on stdin.
    void closePipe();

    // Waits for exit and returns the exit status (128 + signal when killed).
    int wait();
    void terminate();

    bool isRunning() const { return pid_ > 0; }
    const std::string& commandLine() const { return commandLine_; }

private:
    pid_t pid_;
    int fd_;
    Mode mode_;
    std::string commandLine_;
};

struct CommandResult {
    int exitCode = -1;
    std::string output;
};

// Runs a command to completion, capturing stdout.
CommandResult runCommand(const std::vector<std::string>& argv);
