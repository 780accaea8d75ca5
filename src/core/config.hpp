#pragma once

#include <string>
#include <vector>

// Upper bound for any configured or requested duration (24 h)
constexpr int kMaxDurationMs = 24 * 3600 * 1000;

struct ProgramConfig {
    std::string name = "program";
    std::vector<std::string> command;
    bool always_restart = false;
    int restart_delay_ms = 0;
};

struct AppConfig {
    // Supervised program
    ProgramConfig program;

    // Daemon
    std::string socket_path;  // empty → <config_dir>/procwarden.sock
    bool autostart = true;
    int stop_timeout_ms = 5000;  // terminate, then kill after this long

    // Logging
    std::string log_level = "info";
};

class Config {
public:
    Config();
    ~Config();

    bool load();
    bool save();

    /// Load from an explicit path instead of the default location
    bool load_from(const std::string& path);
    bool save_to(const std::string& path);

    AppConfig& data();
    const AppConfig& data() const;

    /// Socket path from the config, or the default under config_dir()
    std::string resolved_socket_path() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string default_socket_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};
