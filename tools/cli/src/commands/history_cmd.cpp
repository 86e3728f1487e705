/**
 * @file history_cmd.cpp
 * @brief HISTORY and SNAPSHOTS commands
 */

#include "commands.hpp"
#include "../cli.hpp"
#include "../utils/string_utils.hpp"

#include <stdexcept>

namespace lanscope::cli::commands {

namespace {

// Parses --limit; -1 on a bad value
int64_t parse_limit(Cli& cli, const ParsedCommand& cmd) {
    std::string text = cmd.get_option("limit", "0");
    try {
        long long limit = std::stoll(text);
        if (limit >= 0) {
            return limit;
        }
    } catch (const std::logic_error&) {
    }
    cli.output().print_error("Invalid --limit value: " + text);
    return -1;
}

} // anonymous namespace

int history_cmd(Cli& cli, const ParsedCommand& cmd) {
    if (!require_connection(cli)) {
        return 1;
    }
    int64_t limit = parse_limit(cli, cmd);
    if (limit < 0) {
        return 1;
    }

    auto events = cli.client().get_history(static_cast<uint32_t>(limit));
    if (!events) {
        cli.output().print_error(cli.client().last_error());
        return 1;
    }

    std::vector<TableRow> rows;
    for (const auto& e : *events) {
        rows.push_back({{
            utils::format_timestamp(e.timestamp_ms),
            e.kind,
            e.device_name,
            e.address.empty() ? "-" : e.address,
            e.category,
        }});
    }
    cli.output().print_table({"TIME", "EVENT", "NAME", "ADDRESS", "CATEGORY"}, rows);
    return 0;
}

int snapshots_cmd(Cli& cli, const ParsedCommand& cmd) {
    if (!require_connection(cli)) {
        return 1;
    }
    int64_t limit = parse_limit(cli, cmd);
    if (limit < 0) {
        return 1;
    }

    auto snapshots = cli.client().list_snapshots(static_cast<uint32_t>(limit));
    if (!snapshots) {
        cli.output().print_error(cli.client().last_error());
        return 1;
    }

    std::vector<TableRow> rows;
    for (const auto& s : *snapshots) {
        rows.push_back({{
            s.id,
            utils::format_timestamp(s.created_at_ms),
            std::to_string(s.device_count),
            std::to_string(s.online_count),
            std::to_string(s.open_port_count),
            utils::format_duration(s.duration_ms),
        }});
    }
    cli.output().print_table({"ID", "CREATED", "DEVICES", "ONLINE", "PORTS", "DURATION"}, rows);
    return 0;
}

} // namespace lanscope::cli::commands
