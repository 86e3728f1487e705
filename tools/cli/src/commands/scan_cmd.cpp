/**
 * @file scan_cmd.cpp
 * @brief SCAN command - run a discovery scan with live progress
 */

#include "commands.hpp"
#include "../cli.hpp"
#include "../utils/string_utils.hpp"

#include <iomanip>
#include <iostream>
#include <map>
#include <stdexcept>

namespace lanscope::cli::commands {

int scan_cmd(Cli& cli, const ParsedCommand& cmd) {
    if (!require_connection(cli)) {
        return 1;
    }
    auto& out = cli.output();

    std::string mode = utils::to_lower(cmd.subcommand);
    int64_t window_ms = 0;
    std::string window = cmd.get_option("window");
    if (!window.empty()) {
        try {
            window_ms = std::stoll(window);
        } catch (const std::logic_error&) {
            out.print_error("Invalid --window value: " + window);
            return 1;
        }
        if (window_ms <= 0) {
            out.print_error("--window must be positive");
            return 1;
        }
    }

    auto final_update = cli.client().start_scan(mode, window_ms, [&out](const ScanUpdateInfo& u) {
        if (u.complete) {
            return;
        }
        if (out.is_json_mode()) {
            std::map<std::string, JsonObject> obj;
            obj["type"] = "progress";
            obj["phase"] = u.phase;
            obj["progress"] = u.progress;
            obj["status"] = u.status;
            out.print_json(obj);
        } else {
            std::cout << "[" << std::setw(3) << static_cast<int>(u.progress * 100.0) << "%] "
                      << u.status << "\n";
        }
        out.flush();
    });

    if (!final_update) {
        out.print_error(cli.client().last_error());
        return 1;
    }

    if (out.is_json_mode()) {
        std::map<std::string, JsonObject> obj;
        obj["type"] = "complete";
        obj["status"] = final_update->status;
        obj["failed"] = final_update->failed;
        obj["snapshot_id"] = final_update->snapshot_id;
        obj["duration_ms"] = final_update->duration_ms;
        obj["device_count"] = static_cast<int64_t>(final_update->devices.size());
        out.print_json(obj);
        print_device_table(out, final_update->devices);
        return final_update->failed ? 1 : 0;
    }

    out.print_line("[100%] " + final_update->status);
    out.print_section("Devices");
    print_device_table(out, final_update->devices);
    out.print_line("");
    out.print_key_values({
        {"snapshot", final_update->snapshot_id},
        {"duration", utils::format_duration(final_update->duration_ms)},
    });
    return final_update->failed ? 1 : 0;
}

} // namespace lanscope::cli::commands
