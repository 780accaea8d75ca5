#include "daemon/daemon.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <future>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

Daemon::Daemon(Config& config)
    : config_(config) {
    const auto& program = config_.data().program;
    if (!program.command.empty()) {
        process_ = std::make_unique<SupervisedProcess>(
            program.name,
            program.command,
            program.always_restart,
            std::chrono::milliseconds(program.restart_delay_ms));
    }
}

Daemon::~Daemon() {
    request_stop();
    cleanup_socket();
}

SupervisedProcess* Daemon::process() {
    return process_.get();
}

std::string Daemon::socket_path() const {
    return config_.resolved_socket_path();
}

void Daemon::cleanup_socket() {
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
        std::string path = socket_path();
        if (!path.empty()) {
            unlink(path.c_str());
        }
    }
}

bool Daemon::start_ipc_server() {
    std::string path = socket_path();
    if (path.empty()) {
        Logger::error("No socket path (HOME is not set)");
        return false;
    }

    // Clean up any existing socket
    unlink(path.c_str());

    // Ensure directory exists
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        Logger::error("Cannot create %s: %s",
                      fs::path(path).parent_path().c_str(), ec.message().c_str());
        return false;
    }

    struct sockaddr_un addr;
    if (path.size() >= sizeof(addr.sun_path)) {
        Logger::error("Socket path too long: %s", path.c_str());
        return false;
    }

    socket_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (socket_fd_ < 0) {
        Logger::error("socket() failed: %s", std::strerror(errno));
        return false;
    }

    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(socket_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        Logger::error("bind(%s) failed: %s", path.c_str(), std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        return false;
    }

    // Restrict permissions to owner only
    chmod(path.c_str(), 0600);

    if (listen(socket_fd_, 5) < 0) {
        Logger::error("listen() failed: %s", std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        unlink(path.c_str());
        return false;
    }

    Logger::info("Listening on %s", path.c_str());
    return true;
}

void Daemon::serve_client(int client_fd) {
    // Read a single JSON line
    std::string buffer;
    char c;
    while (read(client_fd, &c, 1) == 1) {
        if (c == '\n') break;
        buffer += c;
        if (buffer.size() > 65536) break; // prevent abuse
    }

    if (!buffer.empty()) {
        std::string response = handle_command(buffer);
        response += "\n";
        ssize_t total = 0;
        while (total < (ssize_t)response.size()) {
            ssize_t n = write(client_fd, response.data() + total,
                              response.size() - total);
            if (n <= 0) {
                Logger::warn("IPC client went away before the response was written");
                break;
            }
            total += n;
        }
    }

    close(client_fd);
}

void Daemon::reap_clients(bool wait_all) {
    for (auto it = client_tasks_.begin(); it != client_tasks_.end();) {
        if (!wait_all && it->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }
        try {
            it->get();
        } catch (const std::exception& e) {
            Logger::error("IPC request failed: %s", e.what());
        }
        it = client_tasks_.erase(it);
    }
}

void Daemon::ipc_loop() {
    struct pollfd pfd;
    pfd.fd = socket_fd_;
    pfd.events = POLLIN;

    while (!stop_flag_.load()) {
        reap_clients(false);

        int ret = poll(&pfd, 1, 500); // 500ms timeout
        if (ret <= 0) continue;

        if (pfd.revents & POLLIN) {
            int client_fd = accept4(socket_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (client_fd < 0) continue;

            // A client that connects and never sends must not pin its worker
            struct timeval tv;
            tv.tv_sec = 5;
            tv.tv_usec = 0;
            setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

            // Each request gets its own task, so a kill can reach a pending terminate
            try {
                client_tasks_.push_back(std::async(std::launch::async,
                                                   [this, client_fd] { serve_client(client_fd); }));
            } catch (const std::system_error& e) {
                Logger::warn("No worker for IPC request (%s), serving inline", e.what());
                serve_client(client_fd);
            }
        }
    }
}

bool terminate_or_kill(SupervisedProcess& proc, std::chrono::milliseconds timeout, std::string& err) {
    auto pending = std::async(std::launch::async, [&proc] { proc.terminate(); });
    if (pending.wait_for(timeout) == std::future_status::timeout) {
        Logger::warn("[%s] still running %lld ms after SIGTERM, sending SIGKILL",
                     proc.name().c_str(), static_cast<long long>(timeout.count()));
        try {
            proc.kill();
        } catch (const KilledProcessError&) {
            // terminate() completed in the meantime
        }
    }

    try {
        pending.get();
    } catch (const KilledProcessError& e) {
        err = e.what();
        return false;
    }
    return true;
}

bool Daemon::stop_process(std::chrono::milliseconds timeout, std::string& err) {
    if (!process_) {
        err = "No program configured";
        return false;
    }
    return terminate_or_kill(*process_, timeout, err);
}

static json status_json(const SupervisedProcess& proc) {
    json data;
    data["configured"] = true;
    data["name"] = proc.name();
    data["command"] = proc.command();
    data["state"] = to_string(proc.state());
    data["running"] = proc.running();
    data["pid"] = proc.pid();
    auto rc = proc.returncode();
    data["returncode"] = rc ? json(*rc) : json(nullptr);
    data["restart_count"] = proc.restart_count();
    data["always_restart"] = proc.always_restart();
    return data;
}

std::string Daemon::handle_command(const std::string& json_line) {
    try {
        auto req = json::parse(json_line);
        std::string cmd = req.value("cmd", "");

        if (cmd == "status") {
            if (!process_) {
                return json({{"ok", true}, {"data", {{"configured", false}}}}).dump();
            }
            return json({{"ok", true}, {"data", status_json(*process_)}}).dump();
        }

        if (cmd != "start" && cmd != "terminate" && cmd != "kill") {
            return json({{"ok", false}, {"error", "Unknown command: " + cmd}}).dump();
        }

        if (!process_) {
            return json({{"ok", false}, {"error", "No program configured"}}).dump();
        }

        if (cmd == "start") {
            process_->start();
            return json({{"ok", true}}).dump();
        }

        if (cmd == "terminate") {
            int timeout_ms = std::clamp(req.value("timeout_ms", config_.data().stop_timeout_ms),
                                        0, kMaxDurationMs);
            std::string err;
            if (stop_process(std::chrono::milliseconds(timeout_ms), err)) {
                return json({{"ok", true}}).dump();
            }
            return json({{"ok", false}, {"error", err}}).dump();
        }

        process_->kill();
        return json({{"ok", true}}).dump();

    } catch (const json::exception& e) {
        return json({{"ok", false}, {"error", std::string("Parse error: ") + e.what()}}).dump();
    } catch (const std::runtime_error& e) {
        // KilledProcessError, SpawnError
        return json({{"ok", false}, {"error", e.what()}}).dump();
    }
}

void Daemon::request_stop() {
    stop_flag_.store(true);
}

int Daemon::run() {
    // 1. Start IPC server
    if (!start_ipc_server()) {
        return 1;
    }

    // 2. Start the supervised program
    if (process_ && config_.data().autostart) {
        try {
            process_->start();
        } catch (const SpawnError& e) {
            Logger::error("[%s] %s", process_->name().c_str(), e.what());
        }
    } else if (!process_) {
        Logger::warn("No program configured; waiting for IPC requests only");
    }

    // 3. IPC main loop
    ipc_loop();

    // 4. Cleanup
    if (process_ && process_->state() == ProcessState::Running) {
        std::string err;
        if (!stop_process(std::chrono::milliseconds(config_.data().stop_timeout_ms), err)) {
            Logger::warn("[%s] %s", process_->name().c_str(), err.c_str());
        }
    }
    // Requests still waiting on the process have been released by the stop above
    reap_clients(true);
    cleanup_socket();

    return 0;
}
