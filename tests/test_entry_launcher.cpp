// tests/test_entry_launcher.cpp
//
// Resolve-and-launch path with a recording process launcher in place of the OS.

#include <doctest/doctest.h>

#include "launchpad/launch/EntryLauncher.hpp"
#include "launchpad/store/JsonEntryStore.hpp"
#include "test_support/TempDir.h"

#include <filesystem>
#include <string>
#include <vector>

using namespace launchpad::launch;
using launchpad::entry::Application;
using launchpad::entry::DraftCategory;
using launchpad::entry::EntryDraft;
using launchpad::registry::EntryRegistry;
using launchpad::store::JsonEntryStore;
using launchpad::test::ScopedTempDir;
using launchpad::test::write_text;

namespace fs = std::filesystem;

namespace {

class RecordingLauncher final : public IProcessLauncher {
public:
    std::vector<ExecutionPlan> started;
    bool refuse = false;

    std::expected<void, LaunchError> launch(const ExecutionPlan& plan) override
    {
        if (refuse)
            return std::unexpected(LaunchError{LaunchError::Code::SpawnFailed, "no such program"});
        started.push_back(plan);
        return {};
    }
};

EntryDraft app_draft(const std::string& name, const fs::path& path)
{
    EntryDraft d;
    d.name = name;
    d.kind = Application{launchpad::entry::PathToUtf8(path)};
    return d;
}

} // namespace

TEST_CASE("EntryLauncher: launches the resolved plan for an entry")
{
    ScopedTempDir tmp("launcher_ok");
    const fs::path tool = tmp.path() / "tool.exe";
    write_text(tool, "");

    JsonEntryStore store = JsonEntryStore::InDirectory(tmp.path());
    EntryRegistry registry(store);
    registry.load();
    auto added = registry.add(app_draft("Tool", tool));
    REQUIRE(added.has_value());

    const LaunchResolver resolver;
    RecordingLauncher process;
    EntryLauncher launcher(registry, resolver, process);

    auto plan = launcher.launch(added->entry.id);
    REQUIRE(plan.has_value());
    CHECK(plan->kind == PlanKind::Executable);
    REQUIRE(process.started.size() == 1);
    CHECK(process.started[0] == *plan);
    CHECK(process.started[0].title == "Tool");
}

TEST_CASE("EntryLauncher: refusals never reach the process launcher")
{
    ScopedTempDir tmp("launcher_refusals");
    const fs::path gone = tmp.path() / "gone.py";

    JsonEntryStore store = JsonEntryStore::InDirectory(tmp.path());
    EntryRegistry registry(store);
    registry.load();
    auto missing = registry.add(app_draft("Gone", gone));
    auto section = registry.add(DraftCategory("Section"));
    REQUIRE((missing && section));
    CHECK(missing->targetMissing);

    const LaunchResolver resolver;
    RecordingLauncher process;
    EntryLauncher launcher(registry, resolver, process);

    auto unknown = launcher.launch("no-such-id");
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code == LaunchError::Code::NotFound);

    auto cat = launcher.launch(section->entry.id);
    REQUIRE_FALSE(cat.has_value());
    CHECK(cat.error().code == LaunchError::Code::Inapplicable);

    auto vanished = launcher.launch(missing->entry.id);
    REQUIRE_FALSE(vanished.has_value());
    CHECK(vanished.error().code == LaunchError::Code::MissingTarget);

    CHECK(process.started.empty());
}

TEST_CASE("EntryLauncher: spawn failures are passed through")
{
    ScopedTempDir tmp("launcher_spawn_failure");
    const fs::path doc = tmp.path() / "readme.txt";
    write_text(doc, "hello");

    JsonEntryStore store = JsonEntryStore::InDirectory(tmp.path());
    EntryRegistry registry(store);
    registry.load();
    auto added = registry.add(app_draft("Readme", doc));
    REQUIRE(added.has_value());

    const LaunchResolver resolver;
    RecordingLauncher process;
    process.refuse = true;
    EntryLauncher launcher(registry, resolver, process);

    auto r = launcher.launch(added->entry.id);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == LaunchError::Code::SpawnFailed);
    CHECK(r.error().message == "no such program");
}
