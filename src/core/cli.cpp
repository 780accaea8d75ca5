#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/supervised_process.hpp"
#include "daemon/daemon.hpp"
#include "daemon/ipc_client.hpp"

#include <chrono>
#include <signal.h>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>
#include <vector>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

namespace {

volatile sig_atomic_t g_run_signal = 0;

void run_signal_handler(int sig) {
    g_run_signal = sig;
}

} // namespace

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return 1;
    }

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "daemon") == 0 || std::strcmp(cmd, "--daemon") == 0) {
        return -2;  // special: caller handles daemon mode
    }
    if (std::strcmp(cmd, "run") == 0) {
        return cmd_run(argc, argv);
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status();
    }
    if (std::strcmp(cmd, "start") == 0) {
        return cmd_start();
    }
    if (std::strcmp(cmd, "stop") == 0) {
        return cmd_stop(argc, argv);
    }
    if (std::strcmp(cmd, "kill") == 0) {
        return cmd_kill();
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'procwarden help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "procwarden — supervise a single process\n"
        "\n"
        "Usage:\n"
        "  procwarden run [options] [--] <program> [args...]\n"
        "                           Supervise a program in the foreground\n"
        "      --restart            Relaunch the program whenever it exits\n"
        "      --delay <ms>         Wait before each relaunch (default 0)\n"
        "      --timeout <ms>       SIGKILL this long after SIGTERM on shutdown\n"
        "      --verbose            Debug logging\n"
        "  procwarden daemon        Supervise the configured program and serve IPC\n"
        "  procwarden status        Show the daemon's program status\n"
        "  procwarden start         Start the program (or relaunch it after exit)\n"
        "  procwarden stop [--timeout <ms>]\n"
        "                           SIGTERM the program's process group, SIGKILL after timeout\n"
        "  procwarden kill          SIGKILL the program\n"
        "  procwarden version       Show version\n"
        "  procwarden help          Show this help\n"
        "\n"
        "Configuration: " << Config::config_path() << "\n"
        "\n"
        "A killed program stays killed; restart the daemon to launch it again.\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "procwarden " << APP_VERSION << "\n";
    return 0;
}

// ── run ─────────────────────────────────────────────────────

int CLI::exit_status(int returncode) {
    if (returncode < 0) return 128 - returncode;
    return returncode;
}

bool CLI::parse_int(const char* text, int& out) {
    if (!text || !*text) return false;
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (*end != '\0' || value < 0 || value > kMaxDurationMs) return false;
    out = static_cast<int>(value);
    return true;
}

int CLI::cmd_run(int argc, char* argv[]) {
    Config config;
    config.load();

    bool always_restart = false;
    int delay_ms = 0;
    int timeout_ms = config.data().stop_timeout_ms;
    std::vector<std::string> command;

    int i = 2;
    for (; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--") == 0) {
            ++i;
            break;
        }
        if (std::strcmp(arg, "--restart") == 0) {
            always_restart = true;
        } else if (std::strcmp(arg, "--verbose") == 0) {
            Logger::init(Logger::Level::Debug);
        } else if (std::strcmp(arg, "--delay") == 0 || std::strcmp(arg, "--timeout") == 0) {
            int value = 0;
            if (i + 1 >= argc || !parse_int(argv[i + 1], value)) {
                std::cerr << "Invalid value for " << arg << "\n";
                return 1;
            }
            if (std::strcmp(arg, "--delay") == 0) delay_ms = value;
            else timeout_ms = value;
            ++i;
        } else if (arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        } else {
            break;
        }
    }
    for (; i < argc; ++i) {
        command.push_back(argv[i]);
    }

    if (command.empty()) {
        std::cerr << "Usage: procwarden run [--restart] [--delay <ms>] [--timeout <ms>] [--] <program> [args...]\n";
        return 1;
    }

    SupervisedProcess proc(command[0], command, always_restart,
                           std::chrono::milliseconds(delay_ms));

    g_run_signal = 0;
    struct sigaction sa;
    struct sigaction old_term;
    struct sigaction old_int;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = run_signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, &old_term);
    sigaction(SIGINT, &sa, &old_int);

    int ret = 0;
    try {
        proc.start();

        while (proc.state() == ProcessState::Running && g_run_signal == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_run_signal != 0) {
            Logger::info("Received signal %d, stopping %s", static_cast<int>(g_run_signal), proc.name().c_str());
            std::string err;
            if (!terminate_or_kill(proc, std::chrono::milliseconds(timeout_ms), err)) {
                Logger::warn("%s", err.c_str());
            }
        }

        auto rc = proc.returncode();
        ret = rc ? exit_status(*rc) : 1;
    } catch (const SpawnError& e) {
        std::cerr << "Failed to start " << command[0] << ": " << e.what() << "\n";
        ret = 127;
    }

    sigaction(SIGTERM, &old_term, nullptr);
    sigaction(SIGINT, &old_int, nullptr);
    return ret;
}

// ── Daemon control ──────────────────────────────────────────

int CLI::cmd_status() {
    DaemonClient dc;
    DaemonClient::DaemonStatus st;
    std::string err;

    if (!dc.get_status(st, err)) {
        std::cout << "Daemon:   stopped\n";
        return 0;
    }

    std::cout << "Daemon:   running\n";
    if (!st.configured) {
        std::cout << "Program:  (none configured)\n";
        return 0;
    }

    std::string command;
    for (const auto& arg : st.command) {
        if (!command.empty()) command += " ";
        command += arg;
    }

    std::cout << "Program:  " << st.name << " (" << st.state << ")\n";
    std::cout << "Command:  " << command << "\n";
    if (st.running) {
        std::cout << "PID:      " << st.pid << "\n";
    }
    std::cout << "Restart:  " << (st.always_restart ? "always" : "never")
              << " (" << st.restart_count << " so far)\n";
    if (st.returncode) {
        std::cout << "Last exit: " << *st.returncode << "\n";
    }
    return 0;
}

int CLI::cmd_start() {
    DaemonClient dc;
    std::string err;
    if (dc.start(err)) {
        std::cout << "Started.\n";
        return 0;
    }
    std::cerr << "Failed to start: " << err << "\n";
    return 1;
}

int CLI::cmd_stop(int argc, char* argv[]) {
    int timeout_ms = -1;
    if (argc >= 3) {
        if (std::strcmp(argv[2], "--timeout") != 0 || argc < 4 || !parse_int(argv[3], timeout_ms)) {
            std::cerr << "Usage: procwarden stop [--timeout <ms>]\n";
            return 1;
        }
    }

    DaemonClient dc;
    std::string err;
    if (dc.terminate(err, timeout_ms)) {
        std::cout << "Stopped.\n";
        return 0;
    }
    std::cerr << "Failed to stop: " << err << "\n";
    return 1;
}

int CLI::cmd_kill() {
    DaemonClient dc;
    std::string err;
    if (dc.kill(err)) {
        std::cout << "Killed.\n";
        return 0;
    }
    std::cerr << "Failed to kill: " << err << "\n";
    return 1;
}
