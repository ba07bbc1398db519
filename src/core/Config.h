#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "launchpad/launch/LaunchResolver.hpp"
#include "launchpad/launch/ProcessLauncher.hpp"

namespace core {

struct Config {
    std::string logLevel = "info";
    std::string terminal = "x-terminal-emulator";
#if defined(_WIN32)
    std::string scriptInterpreter = "python";
#else
    std::string scriptInterpreter = "python3";
#endif
    std::vector<std::string> scriptExtensions  = {".py", ".pyw"};
    std::vector<std::string> consoleExtensions = {".exe", ".bat", ".cmd"};
};

// launcher.ini in `dataDir`. A missing file is not an error for the caller's
// purposes (returns false, `cfg` keeps its defaults).
bool LoadConfig(Config& cfg, const std::filesystem::path& dataDir);
bool SaveConfig(const Config& cfg, const std::filesystem::path& dataDir);

[[nodiscard]] launchpad::launch::LaunchPolicy ToLaunchPolicy(const Config& cfg);
[[nodiscard]] launchpad::launch::ProcessLauncherOptions ToProcessLauncherOptions(const Config& cfg);

} // namespace core
