#include "core/process_handle.hpp"
#include "core/errors.hpp"

#include <cerrno>
#include <signal.h>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr int kExecFailureExitCode = 127;

// Child side: report errno over the error pipe and leave without running
// any parent-owned destructors.
[[noreturn]] void fail_child(int error_fd) {
    int err = errno;
    ssize_t n = ::write(error_fd, &err, sizeof(err));
    (void)n;
    _exit(kExecFailureExitCode);
}

} // namespace

ProcessHandle::ProcessHandle(PrivateTag, pid_t pid) : pid_(pid) {}

ProcessHandle::~ProcessHandle() {
    // Never leave a zombie or an orphan behind
    if (!returncode_) {
        ::kill(pid_, SIGKILL);
        int status;
        while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {}
    }
}

std::unique_ptr<ProcessHandle> ProcessHandle::spawn(const std::vector<std::string>& command) {
    if (command.empty() || command[0].empty()) {
        throw SpawnError("Empty command");
    }

    // Build argv before fork; only async-signal-safe calls happen in the child
    std::vector<const char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& arg : command) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    int error_pipe[2];
    if (::pipe2(error_pipe, O_CLOEXEC) == -1) {
        throw SpawnError(std::string("pipe2 failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(error_pipe[0]);
        ::close(error_pipe[1]);
        throw SpawnError(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child process
        ::close(error_pipe[0]);

        // Own process group, so terminate() reaches grandchildren too
        if (::setpgid(0, 0) == -1) {
            fail_child(error_pipe[1]);
        }

        // Undo dispositions the supervisor may have changed
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t empty;
        sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);

        ::execvp(argv[0], const_cast<char* const*>(argv.data()));
        fail_child(error_pipe[1]);
    }

    // Parent process
    ::close(error_pipe[1]);

    // EOF means exec succeeded (the write end was close-on-exec)
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    ::close(error_pipe[0]);

    auto handle = std::make_unique<ProcessHandle>(PrivateTag{}, pid);

    if (n > 0) {
        handle->reap();
        throw SpawnError("Failed to exec '" + command[0] + "': " + std::strerror(child_errno));
    }
    if (n < 0) {
        // Could not learn the outcome; the handle destructor cleans up the child
        throw SpawnError(std::string("Failed to read spawn status: ") + std::strerror(errno));
    }

    return handle;
}

pid_t ProcessHandle::pid() const {
    return pid_;
}

bool ProcessHandle::send_signal(int sig) {
    if (returncode_) return true;
    if (::kill(pid_, sig) == 0) return true;
    return errno == ESRCH;
}

bool ProcessHandle::send_group_signal(int sig) {
    if (returncode_) return true;
    if (::killpg(pid_, sig) == 0) return true;
    return errno == ESRCH;
}

bool ProcessHandle::wait_exited() {
    if (returncode_) return true;

    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    while (::waitid(P_PID, pid_, &info, WEXITED | WNOWAIT) == -1) {
        if (errno != EINTR) return false;
    }
    return true;
}

int ProcessHandle::reap() {
    if (returncode_) return *returncode_;

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result == -1 && errno == EINTR);

    if (result == -1) {
        // ECHILD: reaped elsewhere (e.g. SIGCHLD set to SIG_IGN), status lost
        returncode_ = -1;
    } else {
        returncode_ = decode_status(status);
    }
    return *returncode_;
}

bool ProcessHandle::reaped() const {
    return returncode_.has_value();
}

std::optional<int> ProcessHandle::returncode() const {
    return returncode_;
}

int ProcessHandle::decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}
