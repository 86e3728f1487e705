/**
 * @file devices_cmd.cpp
 * @brief DEVICES command - current inventory and identity records
 */

#include "commands.hpp"
#include "../cli.hpp"
#include "../utils/string_utils.hpp"

namespace lanscope::cli::commands {

bool require_connection(Cli& cli) {
    if (cli.is_connected()) {
        return true;
    }
    std::string reason = cli.client().last_error();
    cli.output().print_error(reason.empty()
        ? "Not connected. Use CONNECT <host:port> first."
        : "Not connected: " + reason);
    return false;
}

void print_device_table(OutputFormatter& out, const std::vector<DeviceInfo>& devices) {
    std::vector<TableRow> rows;
    rows.reserve(devices.size());
    for (const auto& d : devices) {
        rows.push_back({{
            d.address,
            d.hostname.empty() ? "-" : d.hostname,
            d.device_type,
            d.manufacturer.empty() ? "-" : d.manufacturer,
            d.mac_address.empty() ? "-" : d.mac_address,
            utils::join_ports(d.open_ports),
            d.online ? "online" : "offline",
            d.rogue ? "ROGUE" : "trusted",
        }});
    }
    out.print_table({"ADDRESS", "HOSTNAME", "TYPE", "VENDOR", "MAC", "PORTS", "STATUS", "TRUST"},
                    rows);
}

int devices_cmd(Cli& cli, const ParsedCommand& cmd) {
    if (!require_connection(cli)) {
        return 1;
    }
    auto& out = cli.output();

    if (cmd.has_flag("identities")) {
        auto identities = cli.client().list_identities();
        if (!identities) {
            out.print_error(cli.client().last_error());
            return 1;
        }

        std::vector<TableRow> rows;
        for (const auto& i : *identities) {
            rows.push_back({{
                i.name,
                i.category_label,
                utils::join(i.seen_categories, ","),
                i.strong ? "strong" : "weak",
                i.address.empty() ? "-" : i.address,
                utils::format_timestamp(i.discovered_at_ms),
            }});
        }
        out.print_table({"NAME", "CATEGORY", "SEEN", "SIGNAL", "ADDRESS", "DISCOVERED"}, rows);
        return 0;
    }

    auto devices = cli.client().list_devices();
    if (!devices) {
        out.print_error(cli.client().last_error());
        return 1;
    }
    print_device_table(out, *devices);
    return 0;
}

} // namespace lanscope::cli::commands
