// tests/test_process_launcher.cpp
//
// Command builders used by SystemProcessLauncher. These are pure and are
// exercised on every platform. On POSIX the real launcher is also run against
// `true` and against plans that must fail before the program starts.

#include <doctest/doctest.h>

#include "launchpad/launch/ProcessLauncher.hpp"
#include "test_support/TempDir.h"

#include <string>
#include <vector>

using namespace launchpad::launch;

namespace {

ExecutionPlan script_plan()
{
    ExecutionPlan p;
    p.kind = PlanKind::Script;
    p.program = "python3";
    p.args = {"/home/me/My Scripts/backup.py"};
    p.workingDir = "/home/me/My Scripts";
    p.display = DisplayMode::NewConsoleHoldOpen;
    p.title = "Backup";
    return p;
}

} // namespace

TEST_CASE("BuildPosixArgv: held-open plans run inside the terminal through sh")
{
    const auto argv = BuildPosixArgv(script_plan(), "xterm");

    REQUIRE(argv.size() == 8);
    CHECK(argv[0] == "xterm");
    CHECK(argv[1] == "-e");
    CHECK(argv[2] == "sh");
    CHECK(argv[3] == "-c");
    CHECK(argv[4].find("\"$@\"") != std::string::npos);
    CHECK(argv[4].find("read") != std::string::npos);
    CHECK(argv[5] == "Backup");
    CHECK(argv[6] == "python3");
    CHECK(argv[7] == "/home/me/My Scripts/backup.py"); // passed as one argument, no quoting
}

TEST_CASE("BuildPosixArgv: untitled held-open plans still get a $0")
{
    ExecutionPlan p = script_plan();
    p.title.clear();
    const auto argv = BuildPosixArgv(p, "x-terminal-emulator");
    REQUIRE(argv.size() == 8);
    CHECK(argv[5] == "launchpad");
}

TEST_CASE("BuildPosixArgv: default-handler plans go through the desktop opener")
{
    ExecutionPlan p;
    p.kind = PlanKind::DefaultHandler;
    p.program = "/home/me/report.pdf";
    p.display = DisplayMode::Default;

    const auto argv = BuildPosixArgv(p, "xterm");
    REQUIRE(argv.size() == 2);
#if defined(__APPLE__)
    CHECK(argv[0] == "open");
#else
    CHECK(argv[0] == "xdg-open");
#endif
    CHECK(argv[1] == "/home/me/report.pdf");
}

TEST_CASE("BuildPosixArgv: plain plans exec the program directly")
{
    ExecutionPlan p;
    p.kind = PlanKind::Executable;
    p.program = "/usr/bin/env";
    p.args = {"true"};
    p.display = DisplayMode::Default;

    CHECK(BuildPosixArgv(p, "xterm") == std::vector<std::string>{"/usr/bin/env", "true"});
}

TEST_CASE("QuoteArgWindows follows CommandLineToArgvW rules")
{
    CHECK(QuoteArgWindows("") == "\"\"");
    CHECK(QuoteArgWindows("plain") == "plain");
    CHECK(QuoteArgWindows("C:\\dir\\app.exe") == "C:\\dir\\app.exe");
    CHECK(QuoteArgWindows("two words") == "\"two words\"");
    CHECK(QuoteArgWindows("say \"hi\"") == "\"say \\\"hi\\\"\"");
    CHECK(QuoteArgWindows("C:\\My Dir\\") == "\"C:\\My Dir\\\\\"");
    CHECK(QuoteArgWindows("a\\\\\"b c") == "\"a\\\\\\\\\\\"b c\"");
}

TEST_CASE("BuildWindowsCommandLine wraps held-open plans in cmd /k")
{
    ExecutionPlan p;
    p.kind = PlanKind::Script;
    p.program = "python";
    p.args = {"C:\\My Scripts\\backup.py"};
    p.display = DisplayMode::NewConsoleHoldOpen;

    CHECK(BuildWindowsCommandLine(p) == "cmd.exe /k \"python \"C:\\My Scripts\\backup.py\"\"");

    p.display = DisplayMode::Default;
    CHECK(BuildWindowsCommandLine(p) == "python \"C:\\My Scripts\\backup.py\"");
}

TEST_CASE("LaunchErrorName names every code")
{
    CHECK(std::string(LaunchErrorName(LaunchError::Code::NotFound)) == "NotFound");
    CHECK(std::string(LaunchErrorName(LaunchError::Code::Inapplicable)) == "Inapplicable");
    CHECK(std::string(LaunchErrorName(LaunchError::Code::MissingTarget)) == "MissingTarget");
    CHECK(std::string(LaunchErrorName(LaunchError::Code::SpawnFailed)) == "SpawnFailed");
}

#if !defined(_WIN32)

namespace {

ExecutionPlan true_plan(const std::string& workingDir)
{
    ExecutionPlan p;
    p.kind = PlanKind::Executable;
    p.program = "true";
    p.workingDir = workingDir;
    p.display = DisplayMode::Default;
    p.title = "True";
    return p;
}

} // namespace

TEST_CASE("SystemProcessLauncher: a program found on PATH starts")
{
    launchpad::test::ScopedTempDir tmp("launcher_true");

    SystemProcessLauncher launcher;
    auto r = launcher.launch(true_plan(tmp.path().string()));
    CHECK_MESSAGE(r.has_value(), (r.has_value() ? std::string() : r.error().message));
}

TEST_CASE("SystemProcessLauncher: a missing terminal is a spawn failure")
{
    launchpad::test::ScopedTempDir tmp("launcher_terminal");
    const std::string terminal = "/nonexistent/launchpad-terminal";

    ExecutionPlan p = true_plan(tmp.path().string());
    p.display = DisplayMode::NewConsoleHoldOpen;

    SystemProcessLauncher launcher(ProcessLauncherOptions{terminal});
    auto r = launcher.launch(p);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == LaunchError::Code::SpawnFailed);
    CHECK(r.error().message.find(terminal) != std::string::npos);
}

TEST_CASE("SystemProcessLauncher: a missing working directory is reported as such")
{
    launchpad::test::ScopedTempDir tmp("launcher_workdir");
    const std::string gone = (tmp.path() / "gone").string();

    SystemProcessLauncher launcher;
    auto r = launcher.launch(true_plan(gone));
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == LaunchError::Code::SpawnFailed);
    CHECK(r.error().message.find("working directory") != std::string::npos);
    CHECK(r.error().message.find(gone) != std::string::npos);
    CHECK(r.error().message.find("cannot start") == std::string::npos);
}

#endif
