// src/launchpad/launch/ProcessLauncher.cpp
//
// Platform-neutral parts of the process launcher: command-line construction.

#include "launchpad/launch/ProcessLauncher.hpp"

namespace launchpad::launch {

namespace {

// $@ is the program and its arguments; $0 is a display name for sh.
constexpr const char* kHoldOpenScript =
    "\"$@\"; status=$?; printf '\\n[exit %s] Press Enter to close...' \"$status\"; read -r _";

} // namespace

const char* LaunchErrorName(LaunchError::Code c) noexcept
{
    switch (c) {
    case LaunchError::Code::NotFound:      return "NotFound";
    case LaunchError::Code::Inapplicable:  return "Inapplicable";
    case LaunchError::Code::MissingTarget: return "MissingTarget";
    case LaunchError::Code::SpawnFailed:   return "SpawnFailed";
    }
    return "Unknown";
}

std::vector<std::string> BuildPosixArgv(const ExecutionPlan& plan, const std::string& terminal)
{
    std::vector<std::string> argv;

    if (plan.display == DisplayMode::NewConsoleHoldOpen)
    {
        argv.reserve(7 + plan.args.size());
        argv.push_back(terminal);
        argv.push_back("-e");
        argv.push_back("sh");
        argv.push_back("-c");
        argv.push_back(kHoldOpenScript);
        argv.push_back(plan.title.empty() ? std::string("launchpad") : plan.title);
        argv.push_back(plan.program);
        argv.insert(argv.end(), plan.args.begin(), plan.args.end());
        return argv;
    }

    if (plan.kind == PlanKind::DefaultHandler)
    {
#if defined(__APPLE__)
        argv.push_back("open");
#else
        argv.push_back("xdg-open");
#endif
        argv.push_back(plan.program);
        return argv;
    }

    argv.push_back(plan.program);
    argv.insert(argv.end(), plan.args.begin(), plan.args.end());
    return argv;
}

std::string QuoteArgWindows(const std::string& arg)
{
    if (arg.empty())
        return "\"\"";

    bool needsQuotes = false;
    for (char ch : arg)
    {
        if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\v' || ch == '"')
        {
            needsQuotes = true;
            break;
        }
    }

    if (!needsQuotes)
        return arg;

    std::string result;
    result.reserve(arg.size() + 2);
    result.push_back('"');

    std::size_t backslashCount = 0;

    for (char ch : arg)
    {
        if (ch == '\\')
        {
            ++backslashCount;
        }
        else if (ch == '"')
        {
            // Backslashes before a quote are doubled, plus one to escape the quote.
            result.append(backslashCount * 2 + 1, '\\');
            result.push_back('"');
            backslashCount = 0;
        }
        else
        {
            if (backslashCount > 0)
            {
                result.append(backslashCount, '\\');
                backslashCount = 0;
            }
            result.push_back(ch);
        }
    }

    // Trailing backslashes precede the closing quote, so they are doubled.
    result.append(backslashCount * 2, '\\');
    result.push_back('"');
    return result;
}

std::string BuildWindowsCommandLine(const ExecutionPlan& plan)
{
    std::string inner = QuoteArgWindows(plan.program);
    for (const auto& a : plan.args)
    {
        inner.push_back(' ');
        inner.append(QuoteArgWindows(a));
    }

    if (plan.display != DisplayMode::NewConsoleHoldOpen)
        return inner;

    // cmd strips the outermost pair of quotes after /k, leaving `inner` intact.
    return "cmd.exe /k \"" + inner + "\"";
}

} // namespace launchpad::launch
