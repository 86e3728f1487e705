/**
 * @file external_tool_runner.hpp
 * @brief Bounded-time execution of external discovery tools.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/core/export.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace lanscope {
namespace core {

/**
 * @enum ToolOutcome
 * @brief How an external command ended.
 */
enum class ToolOutcome {
    Completed,    ///< Exited on its own
    TimedOut,     ///< Killed at the deadline
    SpawnFailed   ///< Could not be launched
};

/**
 * @struct ToolOutput
 * @brief Raw result of one invocation.
 *
 * For TimedOut, text holds whatever the tool printed before it was
 * killed. For SpawnFailed, text holds "Error: <reason>".
 */
struct LANSCOPE_CORE_API ToolOutput {
    ToolOutcome outcome = ToolOutcome::Completed;
    std::string text;
    int exitCode = -1;
};

/// Returned by run() for a tool that completed silently.
constexpr const char* kNoOutput = "No output";

/**
 * @brief Text returned by run() when a tool is killed at its deadline.
 */
LANSCOPE_CORE_API std::string timeoutMessage(const std::string& command,
                                             std::chrono::milliseconds timeout);

LANSCOPE_CORE_API bool isTimeoutMessage(const std::string& text);
LANSCOPE_CORE_API bool isSpawnError(const std::string& text);

/**
 * @class CommandRunner
 * @brief Seam for anything that runs a command and hands back its text.
 */
class LANSCOPE_CORE_API CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run a command, never exceeding timeout.
     *
     * Never throws for tool-level problems; spawn failures and
     * timeouts are reported through ToolOutput::outcome.
     */
    virtual ToolOutput execute(const std::string& command,
                               const std::vector<std::string>& arguments,
                               std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Text-only contract.
     *
     * Returns the captured output, "No output" when it is empty, the
     * timeout message on timeout, or the spawn error text.
     */
    std::string run(const std::string& command,
                    const std::vector<std::string>& arguments,
                    std::chrono::milliseconds timeout);
};

/**
 * @class ExternalToolRunner
 * @brief fork/exec based CommandRunner.
 *
 * stdout and stderr share one pipe. A detached watcher thread reads
 * the pipe until the child exits, drains what is left for at most
 * 200ms, and reaps the child. Output of background descendants that
 * keep the pipe open past that window is dropped. The calling thread
 * waits on the same
 * SettleOnce slot with the deadline. Whichever side settles first
 * decides the result. On timeout the child's whole process group is
 * sent SIGKILL and the watcher reaps it later.
 */
class LANSCOPE_CORE_API ExternalToolRunner : public CommandRunner {
public:
    ExternalToolRunner() = default;

    ToolOutput execute(const std::string& command,
                       const std::vector<std::string>& arguments,
                       std::chrono::milliseconds timeout) override;
};

}  // namespace core
}  // namespace lanscope
