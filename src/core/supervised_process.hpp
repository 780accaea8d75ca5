#pragma once

#include "core/process_handle.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

enum class ProcessState {
    NotStarted,
    Running,
    Exited,
    Killed,
};

const char* to_string(ProcessState state);

/// Supervises one external command: launches it, watches it from a
/// background monitor thread, optionally relaunches it when it exits, and
/// stops it on request.
///
/// Killed is terminal. Every control call on a killed process throws
/// KilledProcessError.
class SupervisedProcess {
public:
    SupervisedProcess(std::string name,
                      std::vector<std::string> command,
                      bool always_restart = false,
                      std::chrono::milliseconds restart_delay = std::chrono::milliseconds(0));
    ~SupervisedProcess();

    SupervisedProcess(const SupervisedProcess&) = delete;
    SupervisedProcess& operator=(const SupervisedProcess&) = delete;

    /// Launch the command unless it is already running.
    /// Throws KilledProcessError after kill/terminate, SpawnError if the
    /// command cannot be executed (state is left unchanged).
    void start();

    /// SIGTERM to the process group, then block until the exit is observed.
    /// Landing in the restart window (child already reaped, replacement not
    /// yet spawned) cancels the restart without sending anything.
    void terminate();

    /// SIGKILL to the process, then block until the exit is observed.
    /// In the restart window no signal is sent: the state becomes Killed but
    /// returncode keeps the exited child's own code, not -SIGKILL.
    void kill();

    bool running() const;

    /// Pid of the most recent child (-1 before the first start)
    pid_t pid() const;

    /// Last observed exit code; -N when the child died from signal N
    std::optional<int> returncode() const;

    ProcessState state() const;
    int restart_count() const;

    const std::string& name() const { return name_; }
    const std::vector<std::string>& command() const { return command_; }
    bool always_restart() const { return always_restart_; }

    /// Invoked from the monitor thread after every observed exit.
    /// Set it before start(); it must not call terminate() or kill().
    std::function<void(int returncode)> on_exit;

private:
    const std::string name_;
    const std::vector<std::string> command_;
    const bool always_restart_;
    const std::chrono::milliseconds restart_delay_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ProcessState state_ = ProcessState::NotStarted;
    std::unique_ptr<ProcessHandle> handle_;
    pid_t pid_ = -1;
    std::optional<int> returncode_;
    bool kill_requested_ = false;
    int restart_count_ = 0;

    // Serialises start() so concurrent callers never launch two monitors
    std::mutex start_mutex_;
    std::thread monitor_thread_;

    void monitor_loop();
    void signal_and_wait(int sig, bool whole_group);
    void settle(ProcessState final_state);
    void notify_exit(int code);
};
