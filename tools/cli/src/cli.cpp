/**
 * @file cli.cpp
 * @brief Main CLI implementation with REPL loop
 */

#include "cli.hpp"
#include "commands/commands.hpp"
#include "utils/string_utils.hpp"

#include <csignal>
#include <iomanip>
#include <iostream>

namespace lanscope::cli {

// Global CLI pointer for signal handler
static Cli* g_cli = nullptr;

static void signal_handler(int) {
    if (g_cli) {
        g_cli->request_quit();
    }
}

namespace {

CommandInfo make_command(const std::string& name, const std::string& description,
                         const std::string& usage, std::vector<std::string> subcommands,
                         CommandHandler handler) {
    CommandInfo info;
    info.name = name;
    info.description = description;
    info.usage = usage;
    info.subcommands = std::move(subcommands);
    info.handler = std::move(handler);
    return info;
}

} // anonymous namespace

Cli::Cli(CliConfig config)
    : config_(std::move(config))
    , parser_(std::make_unique<CommandParser>())
    , output_(std::make_unique<OutputFormatter>(config_.json_mode))
    , client_(std::make_unique<GrpcClient>())
{
    register_commands();
}

Cli::~Cli() {
    if (g_cli == this) {
        g_cli = nullptr;
    }
}

void Cli::register_commands() {
    parser_->register_command("SCAN", make_command(
        "SCAN", "Run a discovery scan and show the devices found",
        "SCAN [QUICK|STANDARD|DEEP] [--window <ms>]",
        {"QUICK", "STANDARD", "DEEP"},
        commands::scan_cmd));

    parser_->register_command("DEVICES", make_command(
        "DEVICES", "List the current device inventory",
        "DEVICES [--identities]",
        {},
        commands::devices_cmd));

    parser_->register_command("HISTORY", make_command(
        "HISTORY", "Show discovery events, most recent first",
        "HISTORY [--limit <n>]",
        {},
        commands::history_cmd));

    parser_->register_command("SNAPSHOTS", make_command(
        "SNAPSHOTS", "List stored scan snapshots, newest first",
        "SNAPSHOTS [--limit <n>]",
        {},
        commands::snapshots_cmd));

    parser_->register_command("COMPARE", make_command(
        "COMPARE", "Compare two snapshots (default: the two most recent)",
        "COMPARE [<before-id> <after-id>]",
        {},
        commands::compare_cmd));

    parser_->register_command("TRUST", make_command(
        "TRUST", "Clear the rogue flag on a device",
        "TRUST <address>",
        {},
        commands::trust_cmd));

    parser_->register_command("UNTRUST", make_command(
        "UNTRUST", "Flag a device as rogue",
        "UNTRUST <address>",
        {},
        commands::trust_cmd));

    // CONNECT command (reconnect to different daemon)
    parser_->register_command("CONNECT", make_command(
        "CONNECT", "Connect to a lanscoped instance",
        "CONNECT <host:port>",
        {},
        [](Cli& cli, const ParsedCommand& cmd) -> int {
            if (cmd.args.empty()) {
                cli.output().print_error("Usage: CONNECT <host:port>");
                return 1;
            }
            if (cli.connect(cmd.args[0])) {
                cli.output().print_ok("Connected to " + cmd.args[0]);
                return 0;
            }
            cli.output().print_error(cli.client().last_error());
            return 1;
        }));

    parser_->register_command("DISCONNECT", make_command(
        "DISCONNECT", "Disconnect from current daemon",
        "DISCONNECT",
        {},
        [](Cli& cli, const ParsedCommand&) -> int {
            cli.disconnect();
            cli.output().print_ok("Disconnected");
            return 0;
        }));

    parser_->register_command("HELP", make_command(
        "HELP", "Show help for commands",
        "HELP [command]",
        {},
        [](Cli& cli, const ParsedCommand& cmd) -> int {
            auto& out = cli.output();

            if (!cmd.args.empty()) {
                const auto* info = cli.parser().get_command_info(cmd.args[0]);
                if (info) {
                    out.print_line(info->name + " - " + info->description);
                    out.print_line("Usage: " + info->usage);
                    if (!info->subcommands.empty()) {
                        out.print_line("Subcommands: " + utils::join(info->subcommands, ", "));
                    }
                    return 0;
                }
                out.print_error("Unknown command: " + cmd.args[0]);
                return 1;
            }

            out.print_line("lanscope-cli - Available Commands:");
            out.print_line("");

            for (const auto& name : cli.parser().get_commands()) {
                const auto* info = cli.parser().get_command_info(name);
                if (info) {
                    std::cout << "  " << std::left << std::setw(12) << name
                              << info->description << "\n";
                }
            }

            out.print_line("");
            out.print_line("Type HELP <command> for detailed help on a specific command.");
            out.print_line("Commands are case-insensitive (e.g., SCAN, scan, Scan).");
            return 0;
        }));

    parser_->register_command("QUIT", make_command(
        "QUIT", "Exit the CLI",
        "QUIT",
        {},
        [](Cli& cli, const ParsedCommand&) -> int {
            cli.request_quit();
            return -1;
        }));

    parser_->register_command("CLEAR", make_command(
        "CLEAR", "Clear the terminal screen",
        "CLEAR",
        {},
        [](Cli&, const ParsedCommand&) -> int {
            std::cout << "\033[2J\033[H";
            return 0;
        }));
}

void Cli::print_banner() {
    if (config_.json_mode) return;

    std::cout << R"(
 _                                            
| |    __ _ _ __  ___  ___ ___  _ __   ___ 
| |   / _` | '_ \/ __|/ __/ _ \| '_ \ / _ \
| |__| (_| | | | \__ \ (_| (_) | |_) |  __/
|_____\__,_|_| |_|___/\___\___/| .__/ \___|
                               |_|         
)" << "\n";
    std::cout << "lanscope-cli v1.0.0 - Type HELP for commands\n\n";
}

void Cli::print_prompt() {
    if (config_.json_mode) return;

    if (is_connected()) {
        std::cout << client_->get_address() << "> ";
    } else {
        std::cout << "(not connected)> ";
    }
    std::cout.flush();
}

std::string Cli::read_line() {
    std::string line;
    std::getline(std::cin, line);
    return line;
}

std::string Cli::default_address() const {
    return config_.host + ":" + std::to_string(config_.port);
}

int Cli::run() {
    g_cli = this;
    std::signal(SIGINT, signal_handler);

    print_banner();

    if (config_.auto_connect) {
        std::string address = default_address();
        if (!connect(address) && !config_.json_mode) {
            std::cout << "Could not connect to " << address << "\n";
            std::cout << "Use CONNECT <host:port> once lanscoped is running\n\n";
        }
    }

    // REPL loop
    while (!quit_requested_ && !std::cin.eof()) {
        print_prompt();

        std::string line = read_line();
        if (line.empty() && std::cin.eof()) {
            break;
        }

        line = utils::trim(line);
        if (line.empty()) {
            continue;
        }

        if (history_.empty() || history_.back() != line) {
            history_.push_back(line);
        }

        execute(line);
    }

    if (!config_.json_mode) {
        std::cout << "Bye!\n";
    }
    return 0;
}

int Cli::execute(const std::string& line) {
    return parser_->execute(*this, line);
}

int Cli::run_command(const std::string& command) {
    if (config_.auto_connect && !is_connected()) {
        connect(default_address());
    }

    int result = execute(command);
    return result < 0 ? 0 : result;
}

bool Cli::is_connected() const {
    return client_ && client_->is_connected();
}

bool Cli::connect(const std::string& address) {
    return client_->connect(address);
}

void Cli::disconnect() {
    client_->disconnect();
}

void Cli::request_quit() {
    quit_requested_ = true;
}

} // namespace lanscope::cli
