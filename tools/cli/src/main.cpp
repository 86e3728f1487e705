/**
 * @file main.cpp
 * @brief lanscope-cli entry point
 */

#include "cli.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cout << "lanscope-cli - LAN device inspection client\n\n";
    std::cout << "Usage: " << program << " [options] [command]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --host <host>      Connect to host (default: localhost)\n";
    std::cout << "  -p, --port <port>      Connect to port (default: 5680)\n";
    std::cout << "  --json                 Output in JSON format\n";
    std::cout << "  --no-connect           Don't auto-connect on startup\n";
    std::cout << "  --help                 Show this help message\n";
    std::cout << "  --version              Show version information\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program << "                      # Interactive mode\n";
    std::cout << "  " << program << " -p 5681              # Connect to specific port\n";
    std::cout << "  " << program << " SCAN QUICK           # Run a quick scan\n";
    std::cout << "  " << program << " --json DEVICES       # JSON output\n";
    std::cout << "  " << program << " COMPARE              # Diff the two latest snapshots\n";
}

void print_version() {
    std::cout << "lanscope-cli version 1.0.0\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    lanscope::cli::CliConfig config;
    std::string command;
    bool command_mode = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "-h" || arg == "--host") {
                if (i + 1 < argc) {
                    config.host = argv[++i];
                }
            }
            else if (arg == "-p" || arg == "--port") {
                if (i + 1 < argc) {
                    int port = std::stoi(argv[++i]);
                    if (port <= 0 || port > 65535) {
                        std::cerr << "Invalid port: " << port << "\n";
                        return 1;
                    }
                    config.port = static_cast<uint16_t>(port);
                }
            }
            else if (arg == "--json") {
                config.json_mode = true;
            }
            else if (arg == "--no-connect") {
                config.auto_connect = false;
            }
            else if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }
            else if (arg == "--version") {
                print_version();
                return 0;
            }
            else if (arg[0] != '-') {
                // First non-option argument starts the command; the rest are its arguments
                command_mode = true;
                command = arg;
                for (int j = i + 1; j < argc; ++j) {
                    command += " ";
                    command += argv[j];
                }
                break;
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                std::cerr << "Use --help for usage information.\n";
                return 1;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Invalid value for " << arg << "\n";
            return 1;
        }
    }

    try {
        lanscope::cli::Cli cli(config);

        if (command_mode) {
            return cli.run_command(command);
        }
        return cli.run();
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
