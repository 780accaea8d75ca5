#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "daemon/daemon.hpp"

#include <signal.h>

static Daemon* g_daemon = nullptr;

static void signal_handler(int /*sig*/) {
    if (g_daemon) {
        g_daemon->request_stop();
    }
}

static int run_daemon() {
    Config config;
    if (!config.load()) {
        Logger::warn("No usable config at %s, using defaults", Config::config_path().c_str());
    }

    Logger::Level level;
    if (Logger::parse_level(config.data().log_level, level)) {
        Logger::init(level);
    } else {
        Logger::warn("Unknown log level '%s', using info", config.data().log_level.c_str());
    }

    Daemon daemon(config);
    g_daemon = &daemon;

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    // A client hanging up mid-response must not take the daemon down
    signal(SIGPIPE, SIG_IGN);

    int ret = daemon.run();
    g_daemon = nullptr;
    return ret;
}

int main(int argc, char* argv[]) {
    int cli_result = CLI::run(argc, argv);

    if (cli_result == -2) {
        // daemon subcommand
        return run_daemon();
    }
    return cli_result;
}
