#include "common/process.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

std::once_flag sigpipeOnce;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string line(*entry);
        std::string key = line.substr(0, line.find('='));
        if (overrides.find(key) == overrides.end()) {
            env.push_back(line);
        }
    }
    for (const auto& pair : overrides) {
        env.push_back(pair.first + "=" + pair.second);
    }
    return env;
}

} // namespace

std::unique_ptr<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& argv,
                                                  const ProcessOptions& options) {
    if (argv.empty()) {
        throw std::runtime_error("Cannot spawn process without arguments");
    }

    // A child closing its stdin must surface as EPIPE, not kill us.
    std::call_once(sigpipeOnce, [] { std::signal(SIGPIPE, SIG_IGN); });

    int stdinPipe[2] = {-1, -1};
    int stdoutPipe[2] = {-1, -1};
    int stderrPipe[2] = {-1, -1};

    auto closeAll = [&]() {
        closeFd(stdinPipe[0]);
        closeFd(stdinPipe[1]);
        closeFd(stdoutPipe[0]);
        closeFd(stdoutPipe[1]);
        closeFd(stderrPipe[0]);
        closeFd(stderrPipe[1]);
    };

    if ((options.pipeStdin && pipe2(stdinPipe, O_CLOEXEC) != 0) ||
        pipe2(stdoutPipe, O_CLOEXEC) != 0 ||
        pipe2(stderrPipe, O_CLOEXEC) != 0) {
        std::string reason = strerror(errno);
        closeAll();
        throw std::runtime_error("Failed to create pipes for " + argv[0] + ": " + reason);
    }

    // Everything the child needs is prepared before fork
    std::vector<std::string> envStrings = buildEnvironment(options.environment);
    std::vector<char*> envp;
    for (auto& s : envStrings) {
        envp.push_back(const_cast<char*>(s.c_str()));
    }
    envp.push_back(nullptr);

    std::vector<char*> args;
    for (const auto& s : argv) {
        args.push_back(const_cast<char*>(s.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        std::string reason = strerror(errno);
        closeAll();
        throw std::runtime_error("Failed to fork for " + argv[0] + ": " + reason);
    }

    if (pid == 0) {
        if (options.pipeStdin) {
            dup2(stdinPipe[0], STDIN_FILENO);
        } else {
            int devNull = open("/dev/null", O_RDONLY);
            if (devNull >= 0) {
                dup2(devNull, STDIN_FILENO);
            }
        }
        dup2(stdoutPipe[1], STDOUT_FILENO);
        dup2(stderrPipe[1], STDERR_FILENO);
        execvpe(args[0], args.data(), envp.data());
        _exit(127);
    }

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);

    auto child = std::make_unique<ChildProcess>(SpawnTag{});
    child->pid_ = pid;
    child->stdinFd_ = stdinPipe[1];
    child->stdout_ = std::make_unique<FdByteStream>(stdoutPipe[0]);
    child->stderr_ = std::make_unique<FdByteStream>(stderrPipe[0]);
    return child;
}

ChildProcess::~ChildProcess() {
    closeStdin();
    if (!reaped_) {
        terminate();
    }
}

void ChildProcess::writeStdin(const char* data, size_t size) {
    if (stdinFd_ < 0) {
        throw std::runtime_error("Process stdin is not open");
    }
    size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(stdinFd_, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error(std::string("Failed to write to process stdin: ") + strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
}

void ChildProcess::closeStdin() {
    closeFd(stdinFd_);
}

int ChildProcess::wait() {
    if (reaped_) {
        return exitCode_;
    }

    int status = 0;
    while (waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            reaped_ = true;
            exitCode_ = -1;
            return exitCode_;
        }
    }

    reaped_ = true;
    if (WIFEXITED(status)) {
        exitCode_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exitCode_ = 128 + WTERMSIG(status);
    } else {
        exitCode_ = -1;
    }
    return exitCode_;
}

void ChildProcess::terminate() {
    if (reaped_) {
        return;
    }
    closeStdin();
    kill(pid_, SIGTERM);
    // The reader ends stay open until the streams are destroyed; close them so a child
    // blocked on a full pipe gets EPIPE instead of hanging.
    stdout_->close();
    stderr_->close();
    wait();
}

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv, const ProcessOptions& options) {
    auto child = ChildProcess::spawn(argv, options);
    child->closeStdin();

    ProcessResult result;
    FdByteStream* streams[2] = {
        static_cast<FdByteStream*>(&child->stdoutStream()),
        static_cast<FdByteStream*>(&child->stderrStream())
    };
    std::string* sinks[2] = {&result.stdoutData, &result.stderrData};
    bool streamOpen[2] = {true, true};
    char buffer[8192];

    while (streamOpen[0] || streamOpen[1]) {
        struct pollfd fds[2];
        nfds_t count = 0;
        int index[2];
        for (int i = 0; i < 2; ++i) {
            if (streamOpen[i]) {
                fds[count].fd = streams[i]->fd();
                fds[count].events = POLLIN;
                fds[count].revents = 0;
                index[count] = i;
                ++count;
            }
        }

        int ready = poll(fds, count, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error(std::string("poll failed: ") + strerror(errno));
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            int which = index[i];
            size_t n = streams[which]->read(buffer, sizeof(buffer));
            if (n == 0) {
                streamOpen[which] = false;
            } else {
                sinks[which]->append(buffer, n);
            }
        }
    }

    result.exitCode = child->wait();
    return result;
}

std::string ProcessRunner::describe(const std::vector<std::string>& argv,
                                    const std::vector<std::string>& secretFlags) {
    std::string line;
    bool maskNext = false;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += " ";
        }
        line += maskNext ? "[REDACTED]" : arg;
        maskNext = std::find(secretFlags.begin(), secretFlags.end(), arg) != secretFlags.end();
    }
    return line;
}
