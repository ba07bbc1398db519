// src/launchpad/launch/EntryLauncher.cpp
#include "launchpad/launch/EntryLauncher.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace launchpad::launch {

std::expected<ExecutionPlan, LaunchError> EntryLauncher::launch(const entry::EntryId& id)
{
    const auto e = m_registry.find(id);
    if (!e)
        return std::unexpected(LaunchError{LaunchError::Code::NotFound, "no entry with id " + id});

    auto plan = m_resolver.resolve(*e);
    if (!plan)
    {
        const auto code = plan.error().code == ResolveError::Code::Inapplicable
                              ? LaunchError::Code::Inapplicable
                              : LaunchError::Code::MissingTarget;
        spdlog::warn("Launch: '{}' refused: {}", e->name, plan.error().message);
        return std::unexpected(LaunchError{code, plan.error().message});
    }

    if (auto started = m_launcher.launch(*plan); !started)
        return std::unexpected(started.error());

    return std::move(*plan);
}

} // namespace launchpad::launch
