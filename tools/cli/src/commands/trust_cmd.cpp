/**
 * @file trust_cmd.cpp
 * @brief TRUST / UNTRUST commands - operator rogue flag
 */

#include "commands.hpp"
#include "../cli.hpp"

namespace lanscope::cli::commands {

int trust_cmd(Cli& cli, const ParsedCommand& cmd) {
    if (!require_connection(cli)) {
        return 1;
    }
    auto& out = cli.output();

    if (cmd.args.size() != 1) {
        out.print_error("Usage: " + cmd.command + " <address>");
        return 1;
    }

    bool rogue = cmd.command == "UNTRUST";
    const std::string& address = cmd.args[0];
    if (!cli.client().set_trust(address, rogue)) {
        out.print_error(cli.client().last_error());
        return 1;
    }

    out.print_ok(address + (rogue ? " flagged as rogue" : " marked trusted"));
    return 0;
}

} // namespace lanscope::cli::commands
