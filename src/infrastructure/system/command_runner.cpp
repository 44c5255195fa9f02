// EN: Implementation of ShellCommandRunner on top of fork/exec/waitpid.
// FR: Implémentation de ShellCommandRunner basée sur fork/exec/waitpid.

#include "infrastructure/system/command_runner.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/signal_handler.hpp"

#include <cerrno>
#include <iostream>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace PHR {

namespace {

// EN: Keeps the SignalHandler's view of the running child in sync with waitpid.
// FR: Garde la vue du SignalHandler sur l'enfant en cours synchronisée avec waitpid.
class ActiveChildGuard {
public:
    ActiveChildGuard(pid_t pid, bool enabled) : enabled_(enabled) {
        if (enabled_) {
            SignalHandler::getInstance().setActiveChild(pid);
        }
    }
    ~ActiveChildGuard() {
        if (enabled_) {
            SignalHandler::getInstance().clearActiveChild();
        }
    }

    ActiveChildGuard(const ActiveChildGuard&) = delete;
    ActiveChildGuard& operator=(const ActiveChildGuard&) = delete;

private:
    bool enabled_;
};

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

std::system_error lastSystemError(const std::string& what) {
    return std::system_error(errno, std::generic_category(), what);
}

} // namespace

ShellCommandRunner::ShellCommandRunner() : ShellCommandRunner(Config{}) {}

ShellCommandRunner::ShellCommandRunner(Config config) : config_(std::move(config)) {}

CommandResult ShellCommandRunner::run(const std::string& command, CommandOutputMode mode) {
    const bool capture = mode == CommandOutputMode::CAPTURE;

    FileDescriptor read_end;
    FileDescriptor write_end;
    if (capture) {
        int fds[2];
        if (::pipe(fds) < 0) {
            throw lastSystemError("pipe() failed");
        }
        read_end.reset(fds[0]);
        write_end.reset(fds[1]);
        ::fcntl(read_end.get(), F_SETFD, FD_CLOEXEC);
    }

    std::cout.flush();

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw lastSystemError("fork() failed");
    }

    if (pid == 0) {
        // EN: Child: default signal dispositions, stdout to the pipe when capturing.
        // FR: Enfant : signaux par défaut, stdout vers le tube en mode capture.
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);
        if (capture) {
            ::dup2(write_end.get(), STDOUT_FILENO);
            ::close(write_end.get());
            ::close(read_end.get());
        }
        ::execl(config_.shell.c_str(), config_.shell.c_str(), "-c", command.c_str(),
                static_cast<char*>(nullptr));
        _exit(127);
    }

    ActiveChildGuard guard(pid, config_.track_child);
    write_end.reset();

    CommandResult result;
    if (capture) {
        char buffer[4096];
        for (;;) {
            ssize_t count = ::read(read_end.get(), buffer, sizeof(buffer));
            if (count > 0) {
                result.standard_output.append(buffer, static_cast<size_t>(count));
            } else if (count == 0) {
                break;
            } else if (errno != EINTR) {
                LOG_WARN("command_runner", "read() on child output failed: " +
                         std::error_code(errno, std::generic_category()).message());
                break;
            }
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw lastSystemError("waitpid() failed");
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.signal_number = WTERMSIG(status);
        result.exit_code = 128 + result.signal_number;
    } else {
        result.exit_code = 1;
    }

    LOG_DEBUG_META("command_runner", "Command finished", (std::unordered_map<std::string, std::string>{
        {"command", command},
        {"exit_code", std::to_string(result.exit_code)},
        {"mode", capture ? "capture" : "inherit"}
    }));

    return result;
}

} // namespace PHR
