/**
 * @file compare_cmd.cpp
 * @brief COMPARE command - change report between two snapshots
 */

#include "commands.hpp"
#include "../cli.hpp"
#include "../utils/string_utils.hpp"

#include <iostream>

namespace lanscope::cli::commands {

namespace {

JsonObject to_json(const std::vector<std::string>& items) {
    std::vector<JsonObject> arr(items.begin(), items.end());
    return arr;
}

JsonObject to_json(const SnapshotInfo& s) {
    std::map<std::string, JsonObject> obj;
    obj["id"] = s.id;
    obj["created_at_ms"] = s.created_at_ms;
    obj["device_count"] = s.device_count;
    return obj;
}

} // anonymous namespace

int compare_cmd(Cli& cli, const ParsedCommand& cmd) {
    if (!require_connection(cli)) {
        return 1;
    }
    auto& out = cli.output();

    auto ids = cmd.positional();
    if (ids.size() != 0 && ids.size() != 2) {
        out.print_error("Usage: COMPARE [<before-id> <after-id>]");
        return 1;
    }
    std::string before_id = ids.empty() ? "" : ids[0];
    std::string after_id = ids.empty() ? "" : ids[1];

    auto result = cli.client().compare_snapshots(before_id, after_id);
    if (!result) {
        out.print_error(cli.client().last_error());
        return 1;
    }

    if (out.is_json_mode()) {
        std::vector<JsonObject> events;
        for (const auto& e : result->events) {
            std::map<std::string, JsonObject> event;
            event["address"] = e.address;
            event["kind"] = e.kind;
            event["detail"] = e.detail;
            event["severity"] = e.severity;
            events.push_back(event);
        }
        std::map<std::string, JsonObject> obj;
        obj["before"] = to_json(result->before);
        obj["after"] = to_json(result->after);
        obj["events"] = events;
        obj["new"] = to_json(result->new_addresses);
        obj["removed"] = to_json(result->removed_addresses);
        obj["modified"] = to_json(result->modified_addresses);
        obj["unchanged"] = to_json(result->unchanged_addresses);
        obj["summary"] = result->summary;
        out.print_json(obj);
        return 0;
    }

    out.print_line("Before: " + result->before.id + " (" +
                   utils::format_timestamp(result->before.created_at_ms) + ")");
    out.print_line("After:  " + result->after.id + " (" +
                   utils::format_timestamp(result->after.created_at_ms) + ")");

    if (result->events.empty()) {
        out.print_line("");
        out.print_line("No changes.");
    }

    // Events arrive ordered critical, warning, info
    std::string current;
    for (const auto& e : result->events) {
        if (e.severity != current) {
            current = e.severity;
            out.print_section(utils::to_upper(current));
        }
        std::cout << "  " << e.address << "  [" << e.kind << "] " << e.detail << "\n";
    }

    out.print_line("");
    out.print_line(result->summary);
    return 0;
}

} // namespace lanscope::cli::commands
