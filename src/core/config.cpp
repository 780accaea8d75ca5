#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/procwarden";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/procwarden";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::default_socket_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/procwarden.sock";
}

std::string Config::resolved_socket_path() const {
    if (!config_.socket_path.empty()) {
        return expand_home(config_.socket_path);
    }
    return default_socket_path();
}

bool Config::load() {
    return load_from(config_path());
}

bool Config::load_from(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    // Parse into a copy so a malformed file leaves the defaults intact
    AppConfig loaded = config_;

    try {
        YAML::Node root = YAML::LoadFile(path);

        // Program section
        if (auto program = root["program"]) {
            loaded.program.name = program["name"].as<std::string>(loaded.program.name);
            loaded.program.always_restart = program["always_restart"].as<bool>(loaded.program.always_restart);
            loaded.program.restart_delay_ms = program["restart_delay_ms"].as<int>(loaded.program.restart_delay_ms);

            if (auto command = program["command"]) {
                loaded.program.command.clear();
                if (command.IsSequence()) {
                    for (const auto& arg : command) {
                        loaded.program.command.push_back(arg.as<std::string>());
                    }
                } else {
                    // A bare scalar is a program without arguments
                    loaded.program.command.push_back(command.as<std::string>());
                }
            }
            if (!loaded.program.command.empty()) {
                loaded.program.command[0] = expand_home(loaded.program.command[0]);
            }
        }

        // Daemon section
        if (auto daemon = root["daemon"]) {
            loaded.socket_path = daemon["socket_path"].as<std::string>(loaded.socket_path);
            loaded.autostart = daemon["autostart"].as<bool>(loaded.autostart);
            loaded.stop_timeout_ms = daemon["stop_timeout_ms"].as<int>(loaded.stop_timeout_ms);
        }

        // Log section
        if (auto log = root["log"]) {
            loaded.log_level = log["level"].as<std::string>(loaded.log_level);
        }
    } catch (const std::exception&) {
        // Parse failed, keep defaults
        return false;
    }

    loaded.program.restart_delay_ms = std::clamp(loaded.program.restart_delay_ms, 0, kMaxDurationMs);
    loaded.stop_timeout_ms = std::clamp(loaded.stop_timeout_ms, 0, kMaxDurationMs);

    config_ = std::move(loaded);
    return true;
}

bool Config::save() {
    std::string dir = config_dir();
    std::string path = config_path();
    if (dir.empty() || path.empty()) return false;
    return save_to(path);
}

bool Config::save_to(const std::string& path) {
    try {
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        // Program section
        out << YAML::Key << "program" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << config_.program.name;
        out << YAML::Key << "command" << YAML::Value << YAML::BeginSeq;
        for (const auto& arg : config_.program.command) {
            out << arg;
        }
        out << YAML::EndSeq;
        out << YAML::Key << "always_restart" << YAML::Value << config_.program.always_restart;
        out << YAML::Key << "restart_delay_ms" << YAML::Value << config_.program.restart_delay_ms;
        out << YAML::EndMap;

        // Daemon section
        out << YAML::Key << "daemon" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "socket_path" << YAML::Value << config_.socket_path;
        out << YAML::Key << "autostart" << YAML::Value << config_.autostart;
        out << YAML::Key << "stop_timeout_ms" << YAML::Value << config_.stop_timeout_ms;
        out << YAML::EndMap;

        // Log section
        out << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config_.log_level;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << out.c_str();
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
