#include "core/cli.hpp"
#include "app.hpp"

int main(int argc, char* argv[]) {
    int cli_result = CLI::run(argc, argv);

    if (cli_result != -1) {
        // handled by CLI (help, version, status, stop, or error)
        return cli_result;
    }

    // No subcommand or `start` → run the supervisor in the foreground
    App app;
    return app.run();
}
