#pragma once

#include "common/byte_stream.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

struct ProcessResult {
    int exitCode{-1};
    std::string stdoutData;
    std::string stderrData;

    bool success() const { return exitCode == 0; }
};

struct ProcessOptions {
    // Added to (or overriding) the parent's environment
    std::map<std::string, std::string> environment;
    bool pipeStdin{false};
};

// A spawned child with its stdout/stderr connected to pipes. The child is terminated
// and reaped on destruction if nobody waited for it.
class ChildProcess {
    struct SpawnTag {};

public:
    static std::unique_ptr<ChildProcess> spawn(const std::vector<std::string>& argv,
                                               const ProcessOptions& options = ProcessOptions());
    // Only reachable through spawn()
    explicit ChildProcess(SpawnTag) {}
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    ByteStream& stdoutStream() { return *stdout_; }
    ByteStream& stderrStream() { return *stderr_; }

    // Throws std::runtime_error when the child closed its end
    void writeStdin(const char* data, size_t size);
    void closeStdin();

    // Reaps the child. Exit code, or 128 + signal number when it was killed.
    int wait();
    void terminate();

    pid_t pid() const { return pid_; }
    bool reaped() const { return reaped_; }

private:
    pid_t pid_{-1};
    int stdinFd_{-1};
    std::unique_ptr<FdByteStream> stdout_;
    std::unique_ptr<FdByteStream> stderr_;
    bool reaped_{false};
    int exitCode_{-1};
};

class ProcessRunner {
public:
    // Runs argv to completion collecting both output channels.
    static ProcessResult run(const std::vector<std::string>& argv,
                             const ProcessOptions& options = ProcessOptions());

    // Command line for log output; the value following any of secretFlags is masked.
    static std::string describe(const std::vector<std::string>& argv,
                                const std::vector<std::string>& secretFlags = {"-pw"});
};
