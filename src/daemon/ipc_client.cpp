#include "daemon/ipc_client.hpp"
#include "core/config.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <algorithm>
#include <cstring>

using json = nlohmann::json;

// Slack on top of the daemon-side wait for the kill and the reply itself
static constexpr int kResponseMarginMs = 30000;

DaemonClient::DaemonClient() {
    Config config;
    config.load();
    socket_path_ = config.resolved_socket_path();
    stop_timeout_ms_ = config.data().stop_timeout_ms;
}

DaemonClient::DaemonClient(std::string socket_path)
    : socket_path_(std::move(socket_path)),
      stop_timeout_ms_(AppConfig().stop_timeout_ms) {}

int DaemonClient::response_timeout_ms(int work_ms) {
    return std::clamp(work_ms, 0, kMaxDurationMs) + kResponseMarginMs;
}

json DaemonClient::send_command(const json& cmd, int work_ms) {
    if (socket_path_.empty()) return json();

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return json();

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        return json();
    }

    // Set read timeout; terminate may legitimately take a while
    int timeout_ms = response_timeout_ms(work_ms);
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    // Send command
    std::string msg = cmd.dump() + "\n";
    ssize_t total = 0;
    while (total < (ssize_t)msg.size()) {
        ssize_t n = write(fd, msg.data() + total, msg.size() - total);
        if (n <= 0) {
            close(fd);
            return json();
        }
        total += n;
    }

    // Read response
    std::string buffer;
    char c;
    while (read(fd, &c, 1) == 1) {
        if (c == '\n') break;
        buffer += c;
        if (buffer.size() > 65536) break;
    }

    close(fd);

    if (buffer.empty()) return json();

    try {
        return json::parse(buffer);
    } catch (const json::parse_error&) {
        return json();
    }
}

bool DaemonClient::simple_command(const json& cmd, std::string& err, int work_ms) {
    auto resp = send_command(cmd, work_ms);
    if (resp.empty()) {
        err = "Cannot connect to daemon";
        return false;
    }
    if (resp.value("ok", false)) return true;
    err = resp.value("error", "Unknown error");
    return false;
}

bool DaemonClient::get_status(DaemonStatus& status, std::string& err) {
    auto resp = send_command({{"cmd", "status"}});
    if (resp.empty()) {
        err = "Cannot connect to daemon";
        return false;
    }
    if (!resp.value("ok", false)) {
        err = resp.value("error", "Unknown error");
        return false;
    }

    try {
        const auto& data = resp.at("data");
        status.configured = data.value("configured", false);
        status.name = data.value("name", "");
        status.command = data.value("command", std::vector<std::string>{});
        status.state = data.value("state", "");
        status.running = data.value("running", false);
        status.pid = data.value("pid", -1);
        if (data.contains("returncode") && data["returncode"].is_number_integer()) {
            status.returncode = data["returncode"].get<int>();
        }
        status.restart_count = data.value("restart_count", 0);
        status.always_restart = data.value("always_restart", false);
    } catch (const json::exception& e) {
        err = std::string("Malformed status response: ") + e.what();
        return false;
    }

    return true;
}

bool DaemonClient::start(std::string& err) {
    return simple_command({{"cmd", "start"}}, err);
}

bool DaemonClient::terminate(std::string& err, int timeout_ms) {
    if (timeout_ms < 0) timeout_ms = stop_timeout_ms_;
    json cmd = {{"cmd", "terminate"}, {"timeout_ms", timeout_ms}};
    return simple_command(cmd, err, timeout_ms);
}

bool DaemonClient::kill(std::string& err) {
    return simple_command({{"cmd", "kill"}}, err);
}
