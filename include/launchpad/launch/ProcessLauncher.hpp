#pragma once
// include/launchpad/launch/ProcessLauncher.hpp
//
// Executes ExecutionPlans. Launches are fire-and-forget: the launcher returns as
// soon as the child has been started and keeps no handle to it.

#include "launchpad/launch/ExecutionPlan.hpp"

#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace launchpad::launch {

struct LaunchError {
    enum class Code {
        NotFound,      // no entry with that id
        Inapplicable,  // category entry
        MissingTarget, // path vanished
        SpawnFailed,   // the OS refused to start the process
    } code{};
    std::string message;
};

[[nodiscard]] const char* LaunchErrorName(LaunchError::Code c) noexcept;

class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;
    [[nodiscard]] virtual std::expected<void, LaunchError> launch(const ExecutionPlan& plan) = 0;
};

struct ProcessLauncherOptions {
    // POSIX terminal emulator used for NewConsoleHoldOpen plans; invoked as
    // `<terminal> -e <command...>`.
    std::string terminal = "x-terminal-emulator";
};

// Real launcher for the current platform (fork/exec on POSIX, CreateProcessW /
// ShellExecuteW on Windows).
class SystemProcessLauncher final : public IProcessLauncher {
public:
    SystemProcessLauncher() = default;
    explicit SystemProcessLauncher(ProcessLauncherOptions options) : m_options(std::move(options)) {}

    [[nodiscard]] std::expected<void, LaunchError> launch(const ExecutionPlan& plan) override;

private:
    ProcessLauncherOptions m_options;
};

// ---------------------------------------------------------------------------
// Command builders (pure; available on every platform so they can be tested)
// ---------------------------------------------------------------------------

// argv for POSIX exec. Hold-open plans run inside `terminal` through `sh -c`,
// which prints the exit status and waits for Enter before the window closes.
[[nodiscard]] std::vector<std::string> BuildPosixArgv(const ExecutionPlan& plan, const std::string& terminal);

// CommandLineToArgvW-compatible quoting of a single argument.
[[nodiscard]] std::string QuoteArgWindows(const std::string& arg);

// Command line for CreateProcessW. Hold-open plans become
//   cmd.exe /k "<program> <args...>"
// other plans are the quoted program followed by quoted args.
[[nodiscard]] std::string BuildWindowsCommandLine(const ExecutionPlan& plan);

} // namespace launchpad::launch
