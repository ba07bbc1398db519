// tests/test_core_config.cpp
//
// Regression/robustness tests for src/core/Config.{h,cpp}.
//
// Goals:
//   - Saving creates the directory + writes launcher.ini
//   - Loading round-trips values
//   - Bad values keep the defaults instead of clobbering them

#include <doctest/doctest.h>

#include "core/Config.h"
#include "logging/Log.h"
#include "test_support/TempDir.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using launchpad::test::ScopedTempDir;

TEST_CASE("core::SaveConfig creates launcher.ini and core::LoadConfig round-trips values")
{
    ScopedTempDir tmp("core_config_roundtrip");
    const fs::path dir = tmp.path() / "nested";

    core::Config cfg;
    cfg.logLevel = "debug";
    cfg.terminal = "kitty";
    cfg.scriptInterpreter = "/usr/local/bin/python3.12";
    cfg.scriptExtensions = {".py", ".pyz"};
    cfg.consoleExtensions = {".sh"};

    CHECK(core::SaveConfig(cfg, dir));
    CHECK(fs::exists(dir / "launcher.ini"));

    core::Config loaded;
    CHECK(core::LoadConfig(loaded, dir));
    CHECK(loaded.logLevel == "debug");
    CHECK(loaded.terminal == "kitty");
    CHECK(loaded.scriptInterpreter == "/usr/local/bin/python3.12");
    CHECK(loaded.scriptExtensions == std::vector<std::string>{".py", ".pyz"});
    CHECK(loaded.consoleExtensions == std::vector<std::string>{".sh"});
}

TEST_CASE("core::LoadConfig returns false for missing file (first run)")
{
    ScopedTempDir tmp("core_config_missing");

    core::Config cfg; // defaults
    CHECK_FALSE(core::LoadConfig(cfg, tmp.path()));
    CHECK(cfg.logLevel == "info");
    CHECK(cfg.scriptExtensions == std::vector<std::string>{".py", ".pyw"});
    CHECK(cfg.consoleExtensions == std::vector<std::string>{".exe", ".bat", ".cmd"});
}

TEST_CASE("core::LoadConfig ignores bad values and unknown keys")
{
    ScopedTempDir tmp("core_config_bad_values");
    {
        std::ofstream f(tmp.path() / "launcher.ini", std::ios::binary | std::ios::trunc);
        REQUIRE(f.good());
        f << "log_level=chatty\n";
        f << "terminal=\n";
        f << "script_extensions= , ,\n";
        f << "console_extensions=EXE, sh\n";
        f << "window_width=1280\n";
        f << "no equals sign here\n";
    }

    core::Config cfg;
    CHECK(core::LoadConfig(cfg, tmp.path()));
    CHECK(cfg.logLevel == "info");
    CHECK(cfg.terminal == "x-terminal-emulator");
    CHECK(cfg.scriptExtensions == std::vector<std::string>{".py", ".pyw"});
    CHECK(cfg.consoleExtensions == std::vector<std::string>{".exe", ".sh"});
}

TEST_CASE("core::LoadConfig accepts exactly the log levels the logger can apply")
{
    ScopedTempDir tmp("core_config_levels");

    for (const char* level : {"trace", "WARNING", "Fatal", "off", "verbose", "err", ""})
    {
        INFO("log_level: ", level);
        {
            std::ofstream f(tmp.path() / "launcher.ini", std::ios::binary | std::ios::trunc);
            REQUIRE(f.good());
            f << "log_level=" << level << "\n";
        }

        spdlog::level::level_enum parsed{};
        const bool known = logsys::parse_level(level, parsed);

        core::Config cfg;
        CHECK(core::LoadConfig(cfg, tmp.path()));
        CHECK((cfg.logLevel == level) == known);
        if (!known)
            CHECK(cfg.logLevel == "info");
    }
}

TEST_CASE("core::LoadConfig supports comments, sections, CRLF and a UTF-8 BOM")
{
    ScopedTempDir tmp("core_config_comments");
    {
        std::ofstream f(tmp.path() / "launcher.ini", std::ios::binary | std::ios::trunc);
        REQUIRE(f.good());
        f << "\xEF\xBB\xBF" << "[launcher]\r\n";
        f << "; whole line comment\r\n";
        f << "# whole line comment\r\n";
        f << "log_level = WARN   # quieter\r\n";
        f << "script_interpreter=pypy3 ; faster\r\n";
    }

    core::Config cfg;
    CHECK(core::LoadConfig(cfg, tmp.path()));
    CHECK(cfg.logLevel == "WARN");
    CHECK(cfg.scriptInterpreter == "pypy3");
}

TEST_CASE("core::ToLaunchPolicy and ToProcessLauncherOptions carry the configured values")
{
    core::Config cfg;
    cfg.terminal = "alacritty";
    cfg.scriptInterpreter = "ruby";
    cfg.scriptExtensions = {".rb"};

    const auto policy = core::ToLaunchPolicy(cfg);
    CHECK(policy.scriptInterpreter == "ruby");
    CHECK(policy.scriptExtensions == std::vector<std::string>{".rb"});
    CHECK(policy.consoleExtensions == cfg.consoleExtensions);

    CHECK(core::ToProcessLauncherOptions(cfg).terminal == "alacritty");
}
