#include <iostream>
#include <string>
#include "cli/pipeline_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        PipelineCLI cli;

        if (argc == 1) {
            cli.print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        auto arg = [&](int i) { return argc > i ? std::string(argv[i]) : std::string(); };

        if (cmd == "--version") {
            cli.print_version();
            return 0;
        } else if (cmd == "--help") {
            cli.print_usage();
            return 0;
        } else if (cmd == "client" || cmd == "server") {
            if (argc < 3) {
                std::cerr << theme::fail("Missing config file.");
                std::cerr << theme::step("Usage: pipeline " + cmd + " <config.yaml>");
                return 1;
            }
            return cmd == "client" ? cli.run_client(argv[2]) : cli.run_server(argv[2]);
        } else if (cmd == "mark") {
            if (argc < 4) {
                std::cerr << theme::fail("Missing hash or outcome.");
                std::cerr << theme::step("Usage: pipeline mark <hash> done|failed [config.yaml]");
                return 1;
            }
            return cli.run_mark(argv[2], argv[3], arg(4));
        } else if (cmd == "status") {
            return cli.run_status(arg(2));
        } else if (cmd == "clean") {
            bool force = false;
            std::string config;
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "-f" || a == "--force") force = true;
                else config = a;
            }
            return cli.run_clean(force, config);
        } else if (cmd == "print-config") {
            return cli.run_print_config(arg(2).empty() ? "client" : arg(2));
        } else {
            std::cerr << theme::fail("Unknown command: " + cmd);
            cli.print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
