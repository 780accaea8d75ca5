#pragma once

#include <string>

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -2 for the daemon subcommand (caller runs it).
    static int run(int argc, char* argv[]);

    /// Map a returncode to a shell exit status (128+N for signal N)
    static int exit_status(int returncode);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_run(int argc, char* argv[]);
    static int cmd_status();
    static int cmd_start();
    static int cmd_stop(int argc, char* argv[]);
    static int cmd_kill();

    static bool parse_int(const char* text, int& out);
};
