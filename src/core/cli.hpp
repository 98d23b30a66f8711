#pragma once

#include <string>

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -1 if the caller should run the supervisor.
    static int run(int argc, char* argv[]);

    /// Seconds `nasmon stop` waits for the supervisor to exit
    static constexpr int STOP_TIMEOUT_SEC = 10;

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_status();
    static int cmd_stop();
};
