#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace launchpad::app {

// Parsed command-line arguments for the launchpad executable.
//
// Notes:
//   - All option names are case-insensitive (values are kept verbatim).
//   - "--opt value", "--opt=value" and "--opt:value" forms are supported.
struct CommandLineArgs
{
    bool showHelp = false;             // --help / -h / -?
    bool showVersion = false;          // --version / -v

    std::optional<std::string> dataDir;  // --data-dir <dir>
    std::optional<std::string> logLevel; // --log-level <lvl>
    std::optional<std::string> launch;   // --launch <id|name>

    // Any unknown/unsupported args are collected here (so we can show a useful error).
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(std::span<const std::string_view> argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace launchpad::app
