#pragma once
// include/launchpad/launch/LaunchResolver.hpp
//
// Maps an entry to an execution plan by file extension (case-insensitive):
//
//   script extensions   -> interpreter <path>, new console held open
//   console extensions  -> <path>, new console held open
//   anything else       -> OS default handler, no console
//
// Categories are never launchable; a path that is gone at resolution time is
// reported instead of planned.

#include "launchpad/entry/Entry.hpp"
#include "launchpad/launch/ExecutionPlan.hpp"

#include <expected>
#include <string>
#include <vector>

namespace launchpad::launch {

struct ResolveError {
    enum class Code {
        Inapplicable,  // category entry
        MissingTarget, // path does not exist
    } code{};
    std::string message;
};

struct LaunchPolicy {
    std::vector<std::string> scriptExtensions;  // lowercase, with leading dot
    std::vector<std::string> consoleExtensions;
    std::string scriptInterpreter;

    // .py/.pyw via python (python3 off Windows); .exe/.bat/.cmd in a console.
    [[nodiscard]] static LaunchPolicy Defaults();
};

class LaunchResolver {
public:
    LaunchResolver() : LaunchResolver(LaunchPolicy::Defaults()) {}
    explicit LaunchResolver(LaunchPolicy policy);

    [[nodiscard]] std::expected<ExecutionPlan, ResolveError> resolve(const entry::Entry& e) const;

    [[nodiscard]] const LaunchPolicy& policy() const noexcept { return m_policy; }

private:
    LaunchPolicy m_policy;
};

// ".PY" -> ".py"; adds the leading dot when missing. Empty input stays empty.
[[nodiscard]] std::string NormalizeExtension(std::string ext);

} // namespace launchpad::launch
