#pragma once

#include "core/config.hpp"
#include "core/supervised_process.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

/// Terminate `proc`, escalating to kill once `timeout` has passed.
/// Returns false with `err` set if the process was already killed.
bool terminate_or_kill(SupervisedProcess& proc, std::chrono::milliseconds timeout, std::string& err);

class Daemon {
public:
    explicit Daemon(Config& config);
    ~Daemon();

    /// Main loop — blocks until stop is requested
    int run();

    /// Request graceful stop (called from signal handler)
    void request_stop();

    /// The supervised process, or nullptr when no command is configured
    SupervisedProcess* process();

    /// terminate_or_kill() on the configured program
    bool stop_process(std::chrono::milliseconds timeout, std::string& err);

    /// Handle one IPC request line and return the JSON response line
    std::string handle_command(const std::string& json_line);

private:
    Config& config_;
    std::unique_ptr<SupervisedProcess> process_;
    std::atomic<bool> stop_flag_{false};
    int socket_fd_ = -1;
    std::vector<std::future<void>> client_tasks_;

    // IPC
    std::string socket_path() const;
    bool start_ipc_server();
    void ipc_loop();
    void serve_client(int client_fd);
    /// Collect finished request tasks; with `wait_all`, block for every one
    void reap_clients(bool wait_all);
    void cleanup_socket();
};
