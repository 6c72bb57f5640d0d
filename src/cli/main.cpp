// File: src/cli/main.cpp
//
// p3if_cli entry point
//
// Usage:
//   p3if_cli [--config <file.yaml>] [--no-color]          interactive shell
//   p3if_cli [--config <file.yaml>] <command> [args...]   run one command

#include "cli/p3if_cli.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace p3if;

static void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config <file.yaml>] [--no-color] [command [args...]]\n"
              << "Commands are the shell commands without the leading '/', e.g.\n"
              << "  " << program << " merge external.json\n"
              << "  " << program << " stats\n";
}

int main(int argc, char** argv) {
    FrameworkConfig config = FrameworkConfig::Default();
    std::vector<std::string> command;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (command.empty() && arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a file argument\n";
                return 2;
            }
            auto loaded = FrameworkConfig::LoadFromFile(argv[++i]);
            if (!loaded) {
                std::cerr << "Could not load configuration from " << argv[i] << "\n";
                return 2;
            }
            config = *loaded;
        } else if (command.empty() && arg == "--no-color") {
            config.interface.colors_enabled = false;
        } else if (command.empty() && (arg == "--help" || arg == "-h")) {
            PrintUsage(argv[0]);
            return 0;
        } else {
            command.push_back(arg);
        }
    }

    try {
        P3ifCli cli(config);
        if (command.empty()) {
            cli.Run();
            return 0;
        }

        std::string line = "/";
        for (size_t i = 0; i < command.size(); ++i) {
            if (i > 0) line += " ";
            line += command[i];
        }
        cli.ProcessCommand(line);
        return cli.GetErrorCount() == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
