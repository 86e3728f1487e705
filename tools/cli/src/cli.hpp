/**
 * @file cli.hpp
 * @brief Main CLI class with REPL and state management
 */

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <vector>

#include "command_parser.hpp"
#include "output_formatter.hpp"
#include "grpc_client.hpp"

namespace lanscope::cli {

/**
 * @brief CLI configuration
 */
struct CliConfig {
    bool json_mode = false;
    std::string host = "localhost";
    uint16_t port = 5680;
    bool auto_connect = true;
};

/**
 * @brief Main CLI application class
 */
class Cli {
public:
    explicit Cli(CliConfig config = {});
    ~Cli();

    /**
     * @brief Run the CLI REPL loop
     * @return Exit code
     */
    int run();

    /**
     * @brief Execute a single command
     * @param line Command line
     * @return Command result code (-1 = quit)
     */
    int execute(const std::string& line);

    /**
     * @brief Run in non-interactive mode with a single command
     * @param command Command to execute
     * @return Exit code
     */
    int run_command(const std::string& command);

    // Accessors for commands
    GrpcClient& client() { return *client_; }
    OutputFormatter& output() { return *output_; }
    CommandParser& parser() { return *parser_; }
    const CliConfig& config() const { return config_; }

    bool is_connected() const;

    /**
     * @brief Connect to lanscoped
     * @param address Host:port address
     * @return true if connected
     */
    bool connect(const std::string& address);

    void disconnect();

    /**
     * @brief Request to quit the REPL
     */
    void request_quit();
    bool quit_requested() const { return quit_requested_; }

private:
    CliConfig config_;
    std::unique_ptr<CommandParser> parser_;
    std::unique_ptr<OutputFormatter> output_;
    std::unique_ptr<GrpcClient> client_;
    bool quit_requested_ = false;
    std::vector<std::string> history_;

    void register_commands();
    void print_banner();
    void print_prompt();
    std::string read_line();
    std::string default_address() const;
};

} // namespace lanscope::cli
