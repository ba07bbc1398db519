// src/app/main.cpp
//
// Command-line front end: loads config and the entry registry from the data
// directory, prints the ordered entries, and optionally launches one.

#include "app/CommandLineArgs.h"
#include "core/Config.h"
#include "core/Paths.h"
#include "logging/Log.h"

#include "launchpad/launch/EntryLauncher.hpp"
#include "launchpad/launch/LaunchResolver.hpp"
#include "launchpad/launch/ProcessLauncher.hpp"
#include "launchpad/registry/EntryRegistry.hpp"
#include "launchpad/store/JsonEntryStore.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <optional>
#include <string>

#ifndef LAUNCHPAD_VERSION
#define LAUNCHPAD_VERSION "0.0.0"
#endif

namespace {

using launchpad::entry::Entry;

void PrintEntries(const std::vector<Entry>& entries)
{
    if (entries.empty())
    {
        std::printf("(no entries)\n");
        return;
    }

    int n = 0;
    for (const auto& e : entries)
    {
        ++n;
        if (e.isCategory())
        {
            std::printf("%3d  -- %s --\n", n, e.name.c_str());
            continue;
        }
        std::printf("%3d  %-24s %s\n", n, e.name.c_str(), e.path()->c_str());
        if (!e.description.empty())
            std::printf("     %s\n", e.description.c_str());
        std::printf("     id: %s\n", e.id.c_str());
    }
}

// Exact id first, then the first entry with that name.
std::optional<launchpad::entry::EntryId> FindByIdOrName(const launchpad::registry::EntryRegistry& registry,
                                                        const std::string& key)
{
    if (registry.find(key))
        return key;
    for (const auto& e : registry.list())
    {
        if (e.name == key)
            return e.id;
    }
    return std::nullopt;
}

} // namespace

int main(int argc, char** argv)
{
    const auto args = launchpad::app::ParseCommandLineArgs(argc, argv);

    if (!args.unknown.empty())
    {
        for (const auto& u : args.unknown)
            std::fprintf(stderr, "launchpad: unrecognized argument '%s'\n", u.c_str());
        std::fprintf(stderr, "%s", launchpad::app::BuildCommandLineHelpText().c_str());
        return 2;
    }
    if (args.showHelp)
    {
        std::printf("%s", launchpad::app::BuildCommandLineHelpText().c_str());
        return 0;
    }
    if (args.showVersion)
    {
        std::printf("launchpad %s\n", LAUNCHPAD_VERSION);
        return 0;
    }

    const std::filesystem::path dataDir = args.dataDir ? std::filesystem::path(*args.dataDir) : paths::data_dir();
    if (!paths::ensure_created(dataDir))
        return 1;

    core::Config cfg;
    const bool haveConfig = core::LoadConfig(cfg, dataDir);
    if (args.logLevel)
        cfg.logLevel = *args.logLevel;

    spdlog::level::level_enum level = spdlog::level::info;
    const bool levelOk = logsys::parse_level(cfg.logLevel, level);
    logsys::init_logs(paths::log_dir(dataDir), level);
    if (!levelOk)
        spdlog::warn("Unknown log level '{}', using info", cfg.logLevel);

    if (!haveConfig && !core::SaveConfig(cfg, dataDir))
        spdlog::warn("Could not write default launcher.ini to {}", dataDir.string());

    auto store = launchpad::store::JsonEntryStore::InDirectory(dataDir);
    launchpad::registry::EntryRegistry registry(store);

    const auto loaded = registry.load();
    if (loaded.degraded())
    {
        std::fprintf(stderr, "launchpad: %s (%s); %zu record(s) skipped\n",
                     launchpad::store::LoadStatusName(loaded.status),
                     loaded.diagnostic.c_str(), loaded.skippedRecords);
        const auto backups = registry.backups();
        if (!backups.empty())
            std::fprintf(stderr, "launchpad: %zu backup generation(s) available next to %s\n",
                         backups.size(), store.documentPath().string().c_str());
    }

    PrintEntries(registry.list());

    if (!args.launch)
        return 0;

    const auto id = FindByIdOrName(registry, *args.launch);
    if (!id)
    {
        spdlog::error("No entry with id or name '{}'", *args.launch);
        return 1;
    }

    const launchpad::launch::LaunchResolver resolver(core::ToLaunchPolicy(cfg));
    launchpad::launch::SystemProcessLauncher processLauncher(core::ToProcessLauncherOptions(cfg));
    launchpad::launch::EntryLauncher launcher(registry, resolver, processLauncher);

    const auto started = launcher.launch(*id);
    if (!started)
    {
        std::fprintf(stderr, "launchpad: %s: %s\n",
                     launchpad::launch::LaunchErrorName(started.error().code),
                     started.error().message.c_str());
        return 1;
    }

    spdlog::info("Launched '{}' ({})", *args.launch, launchpad::launch::PlanKindName(started->kind));
    return 0;
}
