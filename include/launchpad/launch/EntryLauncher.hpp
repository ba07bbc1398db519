#pragma once
// include/launchpad/launch/EntryLauncher.hpp
//
// Resolve-and-launch: id -> registry entry -> plan -> process launcher.

#include "launchpad/launch/LaunchResolver.hpp"
#include "launchpad/launch/ProcessLauncher.hpp"
#include "launchpad/registry/EntryRegistry.hpp"

#include <expected>

namespace launchpad::launch {

class EntryLauncher {
public:
    EntryLauncher(const registry::EntryRegistry& registry,
                  const LaunchResolver& resolver,
                  IProcessLauncher& launcher) noexcept
        : m_registry(registry), m_resolver(resolver), m_launcher(launcher)
    {
    }

    // Returns the plan that was handed to the process launcher.
    [[nodiscard]] std::expected<ExecutionPlan, LaunchError> launch(const entry::EntryId& id);

private:
    const registry::EntryRegistry& m_registry;
    const LaunchResolver&          m_resolver;
    IProcessLauncher&              m_launcher;
};

} // namespace launchpad::launch
