#pragma once
// include/launchpad/launch/ExecutionPlan.hpp

#include <cstdint>
#include <string>
#include <vector>

namespace launchpad::launch {

enum class PlanKind : std::uint8_t {
    Script,         // interpreter runs the file
    Executable,     // the file is run directly
    DefaultHandler, // whatever the OS associates with the file type
};

enum class DisplayMode : std::uint8_t {
    Default,            // no explicit console
    NewConsoleHoldOpen, // fresh terminal window, kept open after the program exits
};

// Declarative description of how to start an entry. Produced without side
// effects; executed by an IProcessLauncher.
struct ExecutionPlan {
    PlanKind    kind = PlanKind::DefaultHandler;
    std::string program;
    std::vector<std::string> args;
    std::string workingDir;
    DisplayMode display = DisplayMode::Default;
    std::string title; // console window title (entry name)

    friend bool operator==(const ExecutionPlan&, const ExecutionPlan&) = default;
};

[[nodiscard]] const char* PlanKindName(PlanKind k) noexcept;

} // namespace launchpad::launch
