// src/launchpad/launch/LaunchResolver.cpp
#include "launchpad/launch/LaunchResolver.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <utility>

namespace launchpad::launch {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] bool Contains(const std::vector<std::string>& set, const std::string& ext)
{
    return std::find(set.begin(), set.end(), ext) != set.end();
}

} // namespace

const char* PlanKindName(PlanKind k) noexcept
{
    switch (k) {
    case PlanKind::Script:         return "script";
    case PlanKind::Executable:     return "executable";
    case PlanKind::DefaultHandler: return "default-handler";
    }
    return "unknown";
}

std::string NormalizeExtension(std::string ext)
{
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!ext.empty() && ext.front() != '.')
        ext.insert(ext.begin(), '.');
    return ext;
}

LaunchPolicy LaunchPolicy::Defaults()
{
    LaunchPolicy p;
    p.scriptExtensions  = {".py", ".pyw"};
    p.consoleExtensions = {".exe", ".bat", ".cmd"};
#if defined(_WIN32)
    p.scriptInterpreter = "python";
#else
    p.scriptInterpreter = "python3";
#endif
    return p;
}

LaunchResolver::LaunchResolver(LaunchPolicy policy)
    : m_policy(std::move(policy))
{
    for (auto& e : m_policy.scriptExtensions)  e = NormalizeExtension(std::move(e));
    for (auto& e : m_policy.consoleExtensions) e = NormalizeExtension(std::move(e));
}

std::expected<ExecutionPlan, ResolveError> LaunchResolver::resolve(const entry::Entry& e) const
{
    const std::string* path = e.path();
    if (!path)
        return std::unexpected(ResolveError{ResolveError::Code::Inapplicable,
                                            "'" + e.name + "' is a category and cannot be launched"});

    const fs::path target = entry::PathFromUtf8(*path);
    std::error_code ec;
    if (!fs::exists(target, ec))
        return std::unexpected(ResolveError{ResolveError::Code::MissingTarget,
                                            "file not found: " + *path});

    const std::string ext = NormalizeExtension(entry::PathToUtf8(target.extension()));

    ExecutionPlan plan;
    plan.workingDir = entry::PathToUtf8(target.parent_path());
    plan.title = e.name;

    if (!ext.empty() && Contains(m_policy.scriptExtensions, ext))
    {
        plan.kind = PlanKind::Script;
        plan.program = m_policy.scriptInterpreter;
        plan.args = {*path};
        plan.display = DisplayMode::NewConsoleHoldOpen;
    }
    else if (!ext.empty() && Contains(m_policy.consoleExtensions, ext))
    {
        plan.kind = PlanKind::Executable;
        plan.program = *path;
        plan.display = DisplayMode::NewConsoleHoldOpen;
    }
    else
    {
        plan.kind = PlanKind::DefaultHandler;
        plan.program = *path;
        plan.display = DisplayMode::Default;
    }
    return plan;
}

} // namespace launchpad::launch
