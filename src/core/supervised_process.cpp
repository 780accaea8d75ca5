#include "core/supervised_process.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <signal.h>
#include <cstring>
#include <system_error>

const char* to_string(ProcessState state) {
    switch (state) {
        case ProcessState::NotStarted: return "not_started";
        case ProcessState::Running:    return "running";
        case ProcessState::Exited:     return "exited";
        case ProcessState::Killed:     return "killed";
    }
    return "unknown";
}

SupervisedProcess::SupervisedProcess(std::string name,
                                     std::vector<std::string> command,
                                     bool always_restart,
                                     std::chrono::milliseconds restart_delay)
    : name_(std::move(name)),
      command_(std::move(command)),
      always_restart_(always_restart),
      restart_delay_(restart_delay) {}

SupervisedProcess::~SupervisedProcess() {
    bool live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live = state_ == ProcessState::Running;
    }
    // Only the monitor thread is left to race with, and it never enters Killed
    // on its own, so kill() cannot throw here
    if (live) {
        kill();
    }
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
}

// ── Control surface ─────────────────────────────────────────

void SupervisedProcess::start() {
    std::lock_guard<std::mutex> start_lock(start_mutex_);
    std::unique_lock<std::mutex> lock(mutex_);

    if (state_ == ProcessState::Killed) {
        throw KilledProcessError(name_);
    }
    if (state_ == ProcessState::Running) {
        return;
    }

    // A previous monitor has already settled in Exited and is returning
    if (monitor_thread_.joinable()) {
        lock.unlock();
        monitor_thread_.join();
        lock.lock();
    }

    ProcessState prev_state = state_;
    handle_ = ProcessHandle::spawn(command_);
    pid_ = handle_->pid();
    kill_requested_ = false;
    state_ = ProcessState::Running;
    Logger::info("[%s] started (pid %d)", name_.c_str(), static_cast<int>(pid_));

    try {
        monitor_thread_ = std::thread(&SupervisedProcess::monitor_loop, this);
    } catch (const std::system_error& e) {
        // Nobody would ever reap it; take the child down with us
        handle_.reset();
        state_ = prev_state;
        throw SpawnError(std::string("Failed to start monitor thread: ") + e.what());
    }
}

void SupervisedProcess::terminate() {
    signal_and_wait(SIGTERM, true);
}

void SupervisedProcess::kill() {
    signal_and_wait(SIGKILL, false);
}

void SupervisedProcess::signal_and_wait(int sig, bool whole_group) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (state_ == ProcessState::Killed) {
        throw KilledProcessError(name_);
    }
    if (state_ != ProcessState::Running) {
        return;
    }

    if (!kill_requested_) {
        Logger::info("[%s] stopping with signal %d", name_.c_str(), sig);
    }
    kill_requested_ = true;
    // Wakes a monitor sleeping out a restart delay
    cv_.notify_all();

    // Between reap and re-spawn the handle is already reaped and this is a no-op
    if (handle_) {
        bool ok = whole_group ? handle_->send_group_signal(sig) : handle_->send_signal(sig);
        if (!ok) {
            Logger::warn("[%s] failed to deliver signal %d to pid %d: %s",
                         name_.c_str(), sig, static_cast<int>(pid_), std::strerror(errno));
        }
    }

    cv_.wait(lock, [this] { return state_ != ProcessState::Running; });
}

// ── Observers ───────────────────────────────────────────────

bool SupervisedProcess::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == ProcessState::Running && handle_ && !handle_->reaped();
}

pid_t SupervisedProcess::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

std::optional<int> SupervisedProcess::returncode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return returncode_;
}

ProcessState SupervisedProcess::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int SupervisedProcess::restart_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return restart_count_;
}

// ── Monitor ─────────────────────────────────────────────────

void SupervisedProcess::monitor_loop() {
    while (true) {
        ProcessHandle* handle;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handle = handle_.get();
        }

        // handle_ is only replaced by this thread while Running, so the
        // pointer stays valid without the lock
        if (!handle->wait_exited()) {
            Logger::error("[%s] waiting for pid %d failed: %s",
                          name_.c_str(), static_cast<int>(handle->pid()), std::strerror(errno));
        }

        int code;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            code = handle_->reap();
            returncode_ = code;
        }
        Logger::info("[%s] pid %d exited with code %d",
                     name_.c_str(), static_cast<int>(handle->pid()), code);
        notify_exit(code);

        std::unique_lock<std::mutex> lock(mutex_);
        if (kill_requested_) {
            settle(ProcessState::Killed);
            return;
        }
        if (!always_restart_) {
            settle(ProcessState::Exited);
            return;
        }

        if (restart_delay_.count() > 0) {
            cv_.wait_for(lock, restart_delay_, [this] { return kill_requested_; });
        }

        // A kill may have landed in the restart window; check under the lock
        // right before spawning
        if (kill_requested_) {
            settle(ProcessState::Killed);
            return;
        }

        try {
            handle_ = ProcessHandle::spawn(command_);
        } catch (const SpawnError& e) {
            Logger::error("[%s] restart failed: %s", name_.c_str(), e.what());
            settle(ProcessState::Exited);
            return;
        }
        pid_ = handle_->pid();
        ++restart_count_;
        Logger::info("[%s] restarted (pid %d, restart #%d)",
                     name_.c_str(), static_cast<int>(pid_), restart_count_);
    }
}

// Caller holds mutex_
void SupervisedProcess::settle(ProcessState final_state) {
    state_ = final_state;
    handle_.reset();
    Logger::info("[%s] %s", name_.c_str(), to_string(final_state));
    cv_.notify_all();
}

void SupervisedProcess::notify_exit(int code) {
    if (!on_exit) return;
    try {
        on_exit(code);
    } catch (const std::exception& e) {
        Logger::warn("[%s] exit callback threw: %s", name_.c_str(), e.what());
    }
}
