/**
 * @file test_cli_parser.cpp
 * @brief Unit tests for lanscope-cli parsing, dispatch and output formatting
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "cli.hpp"
#include "command_parser.hpp"
#include "commands/commands.hpp"
#include "output_formatter.hpp"
#include "utils/string_utils.hpp"

using namespace lanscope::cli;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

CliConfig offlineConfig(bool json = false) {
    CliConfig config;
    config.auto_connect = false;
    config.json_mode = json;
    return config;
}

}  // namespace

// =============================================================================
// String utilities
// =============================================================================

TEST(StringUtilsTest, TokenizeHonorsQuotes) {
    EXPECT_THAT(utils::tokenize("  compare 'a b'  \"c d\" e "), ElementsAre("compare", "a b", "c d", "e"));
    EXPECT_TRUE(utils::tokenize("   ").empty());
}

TEST(StringUtilsTest, Formatting) {
    EXPECT_EQ(utils::join_ports({}), "-");
    EXPECT_EQ(utils::join_ports({80, 443}), "80,443");
    EXPECT_EQ(utils::format_duration(850), "850ms");
    EXPECT_EQ(utils::format_duration(15234), "15.2s");
    EXPECT_EQ(utils::to_upper("scan"), "SCAN");
    EXPECT_EQ(utils::trim("\t x \n"), "x");
}

// =============================================================================
// Parsing
// =============================================================================

class CommandParserTest : public ::testing::Test {
protected:
    Cli cli{offlineConfig()};
    CommandParser& parser() { return cli.parser(); }
};

TEST_F(CommandParserTest, CommandsAreCaseInsensitive) {
    auto cmd = parser().parse("scan quick --window 3000");
    EXPECT_EQ(cmd.command, "SCAN");
    EXPECT_EQ(cmd.subcommand, "QUICK");
    EXPECT_THAT(cmd.args, ElementsAre("--window", "3000"));
    EXPECT_EQ(cmd.get_option("window"), "3000");
    EXPECT_EQ(cmd.get_option("limit", "20"), "20");
}

TEST_F(CommandParserTest, UnknownSubcommandBecomesArgument) {
    auto cmd = parser().parse("Scan turbo");
    EXPECT_EQ(cmd.command, "SCAN");
    EXPECT_TRUE(cmd.subcommand.empty());
    EXPECT_THAT(cmd.args, ElementsAre("turbo"));
}

TEST_F(CommandParserTest, AliasesResolve) {
    EXPECT_EQ(parser().parse("ls").command, "DEVICES");
    EXPECT_EQ(parser().parse("dev --identities").command, "DEVICES");
    EXPECT_EQ(parser().parse("diff a b").command, "COMPARE");
    EXPECT_EQ(parser().parse("snaps").command, "SNAPSHOTS");
    EXPECT_EQ(parser().parse("events").command, "HISTORY");
    EXPECT_EQ(parser().parse("exit").command, "QUIT");
    EXPECT_EQ(parser().parse("?").command, "HELP");
}

TEST_F(CommandParserTest, FlagsAndPositionals) {
    auto cmd = parser().parse("compare --limit 5 before-id after-id");
    EXPECT_THAT(cmd.positional({"limit"}), ElementsAre("before-id", "after-id"));

    auto devices = parser().parse("devices --IDENTITIES");
    EXPECT_TRUE(devices.has_flag("identities"));
    EXPECT_FALSE(devices.has_flag("json"));

    // Argument case is preserved
    EXPECT_THAT(parser().parse("trust AA:BB").args, ElementsAre("AA:BB"));
}

TEST_F(CommandParserTest, EmptyLineParsesToNothing) {
    EXPECT_TRUE(parser().parse("   ").command.empty());
    EXPECT_EQ(cli.execute(""), 0);
}

TEST_F(CommandParserTest, RegisteredCommandsAreSorted) {
    EXPECT_THAT(parser().get_commands(),
                ElementsAre("CLEAR", "COMPARE", "CONNECT", "DEVICES", "DISCONNECT", "HELP",
                            "HISTORY", "QUIT", "SCAN", "SNAPSHOTS", "TRUST", "UNTRUST"));
    ASSERT_NE(parser().get_command_info("scan"), nullptr);
    EXPECT_THAT(parser().get_command_info("scan")->subcommands,
                ElementsAre("QUICK", "STANDARD", "DEEP"));
    EXPECT_EQ(parser().get_command_info("nope"), nullptr);
}

TEST_F(CommandParserTest, Completions) {
    EXPECT_THAT(parser().get_completions("sc"), ElementsAre("SCAN"));
    EXPECT_THAT(parser().get_completions("scan q"), ElementsAre("SCAN QUICK"));
    EXPECT_THAT(parser().get_completions("scan "),
                ElementsAre("SCAN QUICK", "SCAN STANDARD", "SCAN DEEP"));
    EXPECT_THAT(parser().get_completions("snap"), ElementsAre("SNAPS", "SNAPSHOTS"));
}

TEST_F(CommandParserTest, UnknownCommandFails) {
    testing::internal::CaptureStderr();
    int rc = cli.execute("frobnicate");
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(rc, 1);
    EXPECT_THAT(err, HasSubstr("(error) ERR unknown command 'FROBNICATE'"));
}

TEST_F(CommandParserTest, CustomCommandReceivesParsedLine) {
    ParsedCommand seen;
    CommandInfo info;
    info.description = "test";
    info.handler = [&seen](Cli&, const ParsedCommand& cmd) {
        seen = cmd;
        return 7;
    };
    parser().register_command("ping", info);
    parser().register_alias("p", "ping");

    EXPECT_EQ(cli.execute("p 'hello world'"), 7);
    EXPECT_EQ(seen.command, "PING");
    EXPECT_THAT(seen.args, ElementsAre("hello world"));
}

// =============================================================================
// Dispatch without a daemon
// =============================================================================

TEST(CliTest, HelpListsCommands) {
    Cli cli(offlineConfig());
    OutputBuffer buffer;
    EXPECT_EQ(cli.execute("help"), 0);
    EXPECT_THAT(buffer.str(), HasSubstr("SCAN"));
    EXPECT_THAT(buffer.str(), HasSubstr("COMPARE"));
}

TEST(CliTest, HelpForOneCommand) {
    Cli cli(offlineConfig());
    OutputBuffer buffer;
    EXPECT_EQ(cli.execute("help scan"), 0);
    EXPECT_THAT(buffer.str(), HasSubstr("Usage: SCAN [QUICK|STANDARD|DEEP] [--window <ms>]"));
    EXPECT_THAT(buffer.str(), HasSubstr("Subcommands: QUICK, STANDARD, DEEP"));
}

TEST(CliTest, CommandsNeedConnection) {
    Cli cli(offlineConfig(true));
    EXPECT_FALSE(cli.is_connected());

    OutputBuffer buffer;
    EXPECT_EQ(cli.execute("devices"), 1);
    EXPECT_EQ(cli.execute("snapshots"), 1);
    EXPECT_THAT(buffer.str(), HasSubstr(R"({"error":"Not connected)"));
}

TEST(CliTest, QuitRequestsExit) {
    Cli cli(offlineConfig());
    EXPECT_EQ(cli.execute("QUIT"), -1);
    EXPECT_TRUE(cli.quit_requested());

    Cli other(offlineConfig());
    EXPECT_EQ(other.run_command("exit"), 0);
}

// =============================================================================
// Output formatting
// =============================================================================

TEST(OutputFormatterTest, TextTableAlignsColumns) {
    OutputFormatter out;
    OutputBuffer buffer;
    out.print_table({"ADDRESS", "NAME"}, {{{"10.0.0.5", "Eve"}}, {{"10.0.0.10", "Living Room"}}});

    EXPECT_EQ(buffer.str(),
              "ADDRESS    NAME         \n"
              "---------  -----------  \n"
              "10.0.0.5   Eve          \n"
              "10.0.0.10  Living Room  \n");
}

TEST(OutputFormatterTest, EmptyTable) {
    OutputFormatter out;
    OutputBuffer buffer;
    out.print_table({"ADDRESS"}, {});
    EXPECT_EQ(buffer.str(), "(empty list)\n");

    OutputFormatter json(true);
    OutputBuffer json_buffer;
    json.print_table({"ADDRESS"}, {});
    EXPECT_EQ(json_buffer.str(), "[]\n");
}

TEST(OutputFormatterTest, JsonTableIsArrayOfObjects) {
    OutputFormatter out(true);
    OutputBuffer buffer;
    out.print_table({"ADDRESS", "NAME"}, {{{"10.0.0.5", "Eve \"Energy\""}}});
    EXPECT_EQ(buffer.str(), R"([{"ADDRESS":"10.0.0.5","NAME":"Eve \"Energy\""}])" "\n");
}

TEST(OutputFormatterTest, JsonStringify) {
    OutputFormatter out(true);
    std::map<std::string, JsonObject> obj;
    obj["count"] = 2;
    obj["ok"] = true;
    obj["ports"] = std::vector<JsonObject>{80u, 443u};
    obj["name"] = "line\nbreak";
    obj["missing"] = nullptr;

    EXPECT_EQ(out.json_stringify(obj),
              R"({"count":2,"missing":null,"name":"line\nbreak","ok":true,"ports":[80,443]})");
}

TEST(OutputFormatterTest, OkAndKeyValues) {
    OutputFormatter out;
    OutputBuffer buffer;
    out.print_ok("Connected to localhost:5680");
    out.print_key_values({{"Snapshot", "abc"}, {"Devices", "3"}});
    out.print_section("Critical");

    EXPECT_EQ(buffer.str(),
              "OK: Connected to localhost:5680\n"
              "Snapshot: abc\n"
              "Devices:  3\n"
              "\n# Critical\n");
}

TEST(OutputFormatterTest, SectionsAreSkippedInJson) {
    OutputFormatter out(true);
    OutputBuffer buffer;
    out.print_section("Critical");
    out.print_ok("done");
    EXPECT_EQ(buffer.str(), R"({"status":"OK","message":"done"})" "\n");
}

TEST(OutputFormatterTest, DeviceTable) {
    DeviceInfo device;
    device.address = "10.0.0.5";
    device.hostname = "Eve Energy";
    device.device_type = "Outlet";
    device.open_ports = {80, 8080};
    device.online = true;

    OutputFormatter out(true);
    OutputBuffer buffer;
    commands::print_device_table(out, {device});

    EXPECT_THAT(buffer.str(), HasSubstr(R"("HOSTNAME":"Eve Energy")"));
    EXPECT_THAT(buffer.str(), HasSubstr(R"("VENDOR":"-")"));
    EXPECT_THAT(buffer.str(), HasSubstr(R"("PORTS":"80,8080")"));
    EXPECT_THAT(buffer.str(), HasSubstr(R"("STATUS":"online")"));
    EXPECT_THAT(buffer.str(), HasSubstr(R"("TRUST":"trusted")"));
}
