#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

/// One live child process, launched as the leader of its own process group.
///
/// The handle separates "has exited" from "has been reaped": wait_exited()
/// blocks without reaping, so the pid stays reserved (as a zombie) until
/// reap() is called. Callers that serialise reap() and send_signal() behind
/// the same lock can never signal a recycled pid.
class ProcessHandle {
public:
    /// Fork and exec `command` (PATH lookup on command[0]).
    /// Returns once the child has exec'd; throws SpawnError otherwise.
    static std::unique_ptr<ProcessHandle> spawn(const std::vector<std::string>& command);

private:
    struct PrivateTag {};

public:
    /// Adopts an already-forked child; only spawn() can name the tag
    ProcessHandle(PrivateTag, pid_t pid);

    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    pid_t pid() const;

    /// Deliver `sig` to the child only. ESRCH and already-reaped are not errors.
    bool send_signal(int sig);

    /// Deliver `sig` to the child's whole process group.
    bool send_group_signal(int sig);

    /// Block until the child has exited (does not reap). False if waiting failed.
    bool wait_exited();

    /// Reap the child and return its returncode: exit status, or -N if it
    /// died from signal N. Idempotent.
    int reap();

    bool reaped() const;
    std::optional<int> returncode() const;

    /// Convert a waitpid() status into the returncode convention above
    static int decode_status(int status);

private:
    pid_t pid_;
    std::optional<int> returncode_;
};
