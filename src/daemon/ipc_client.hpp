#pragma once

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

class DaemonClient {
public:
    /// Connect to the socket configured in the user's config file
    DaemonClient();

    /// Connect to an explicit socket path
    explicit DaemonClient(std::string socket_path);

    struct DaemonStatus {
        bool configured = false;
        std::string name;
        std::vector<std::string> command;
        std::string state;
        bool running = false;
        int pid = -1;
        std::optional<int> returncode;
        int restart_count = 0;
        bool always_restart = false;
    };

    /// Get daemon status; false with `err` set on failure
    bool get_status(DaemonStatus& status, std::string& err);

    /// Control the supervised program
    bool start(std::string& err);
    /// timeout_ms < 0 uses the configured stop timeout
    bool terminate(std::string& err, int timeout_ms = -1);
    bool kill(std::string& err);

    /// How long to wait for a reply to a request the daemon may spend
    /// `work_ms` on (terminate waits out the stop timeout before replying)
    static int response_timeout_ms(int work_ms);

private:
    std::string socket_path_;
    int stop_timeout_ms_;

    /// Send a JSON command and receive response
    /// Returns empty json on connection failure
    nlohmann::json send_command(const nlohmann::json& cmd, int work_ms = 0);

    bool simple_command(const nlohmann::json& cmd, std::string& err, int work_ms = 0);
};
