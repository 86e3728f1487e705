/**
 * @file commands.hpp
 * @brief Command handlers (defined in commands/*.cpp)
 */

#pragma once

#include "../command_parser.hpp"
#include "../grpc_client.hpp"
#include "../output_formatter.hpp"

#include <vector>

namespace lanscope::cli::commands {

int scan_cmd(Cli& cli, const ParsedCommand& cmd);
int devices_cmd(Cli& cli, const ParsedCommand& cmd);
int history_cmd(Cli& cli, const ParsedCommand& cmd);
int snapshots_cmd(Cli& cli, const ParsedCommand& cmd);
int compare_cmd(Cli& cli, const ParsedCommand& cmd);
int trust_cmd(Cli& cli, const ParsedCommand& cmd);

/**
 * @brief Print the device inventory table (shared by SCAN and DEVICES)
 */
void print_device_table(OutputFormatter& out, const std::vector<DeviceInfo>& devices);

/**
 * @brief Print an error if not connected
 * @return true if connected
 */
bool require_connection(Cli& cli);

} // namespace lanscope::cli::commands
