// src/launchpad/launch/ProcessLauncherWin.cpp
//
// Windows process launcher: console plans run through CreateProcessW with a new
// console, default-handler plans go through ShellExecuteW("open").

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif

#include "launchpad/launch/ProcessLauncher.hpp"

#include <windows.h>
#include <shellapi.h> // ShellExecuteW

#include <spdlog/spdlog.h>

#include <cstdint>
#include <string>
#include <vector>

namespace launchpad::launch {

namespace {

[[nodiscard]] std::wstring Utf8ToWide(const std::string& s)
{
    if (s.empty())
        return {};

    const int needed = ::MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0);
    if (needed <= 0)
        return {};

    std::wstring out(static_cast<std::size_t>(needed), L'\0');
    ::MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), needed);
    return out;
}

[[nodiscard]] std::string LastErrorText(DWORD code)
{
    return "Win32 error " + std::to_string(static_cast<unsigned long>(code));
}

} // namespace

std::expected<void, LaunchError> SystemProcessLauncher::launch(const ExecutionPlan& plan)
{
    const std::wstring workDir = Utf8ToWide(plan.workingDir);

    if (plan.kind == PlanKind::DefaultHandler && plan.display == DisplayMode::Default)
    {
        const std::wstring target = Utf8ToWide(plan.program);
        const HINSTANCE h = ::ShellExecuteW(nullptr, L"open", target.c_str(), nullptr,
                                            workDir.empty() ? nullptr : workDir.c_str(), SW_SHOWNORMAL);

        // Per ShellExecuteW docs: values <= 32 are errors.
        const auto code = reinterpret_cast<std::intptr_t>(h);
        if (code <= 32)
        {
            spdlog::error("Launch: ShellExecuteW failed for '{}' (code {})", plan.program, static_cast<long long>(code));
            return std::unexpected(LaunchError{LaunchError::Code::SpawnFailed,
                                               "cannot open " + plan.program + " (ShellExecute code " +
                                                   std::to_string(static_cast<long long>(code)) + ")"});
        }
        spdlog::info("Launch: opened '{}' with its default handler", plan.program);
        return {};
    }

    // CreateProcessW requires a mutable, NUL-terminated command line buffer.
    const std::wstring cmd = Utf8ToWide(BuildWindowsCommandLine(plan));
    std::vector<wchar_t> cmdMutable(cmd.begin(), cmd.end());
    cmdMutable.push_back(L'\0');

    std::wstring title = Utf8ToWide(plan.title);

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    if (!title.empty())
        si.lpTitle = title.data();

    PROCESS_INFORMATION pi{};

    const DWORD flags = plan.display == DisplayMode::NewConsoleHoldOpen ? CREATE_NEW_CONSOLE : 0;
    if (!::CreateProcessW(
            nullptr,               // resolved from the command line (cmd.exe / program)
            cmdMutable.data(),
            nullptr, nullptr,
            FALSE,
            flags,
            nullptr,
            workDir.empty() ? nullptr : workDir.c_str(),
            &si, &pi))
    {
        const DWORD err = ::GetLastError();
        spdlog::error("Launch: CreateProcessW failed for '{}': {}", plan.program, LastErrorText(err));
        return std::unexpected(LaunchError{LaunchError::Code::SpawnFailed,
                                           "cannot start " + plan.program + ": " + LastErrorText(err)});
    }

    // Fire-and-forget: nothing waits on the child.
    ::CloseHandle(pi.hThread);
    ::CloseHandle(pi.hProcess);

    spdlog::info("Launch: started {} plan '{}'", PlanKindName(plan.kind), plan.program);
    return {};
}

} // namespace launchpad::launch
