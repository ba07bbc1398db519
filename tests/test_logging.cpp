// tests/test_logging.cpp
//
// logsys::init_logs / logsys::parse_level.
// init_logs replaces spdlog's default logger; each test puts the previous one back.

#include <doctest/doctest.h>

#include "logging/Log.h"
#include "test_support/TempDir.h"

#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;
using launchpad::test::ScopedTempDir;
using launchpad::test::read_text;

namespace {

class DefaultLoggerGuard {
public:
    DefaultLoggerGuard() : m_logger(spdlog::default_logger()), m_level(spdlog::get_level()) {}
    ~DefaultLoggerGuard()
    {
        spdlog::set_default_logger(m_logger);
        spdlog::set_level(m_level);
        spdlog::drop("launchpad"); // releases launchpad.log

    }

    DefaultLoggerGuard(const DefaultLoggerGuard&) = delete;
    DefaultLoggerGuard& operator=(const DefaultLoggerGuard&) = delete;

private:
    std::shared_ptr<spdlog::logger> m_logger;
    spdlog::level::level_enum m_level;
};

} // namespace

TEST_CASE("logsys::init_logs installs the launchpad logger and writes launchpad.log")
{
    ScopedTempDir tmp("logging_init");
    const fs::path dir = tmp.path() / "logs";
    {
        DefaultLoggerGuard guard;
        logsys::init_logs(dir, spdlog::level::err);

        auto logger = spdlog::default_logger();
        CHECK(logger->name() == "launchpad");
        CHECK(logger->sinks().size() == 2);
        CHECK(spdlog::get_level() == spdlog::level::err);

        spdlog::info("below the threshold");
        spdlog::error("log file check");
        logger->flush();
    }

    const std::string text = read_text(dir / "launchpad.log");
    CHECK(text.find("log file check") != std::string::npos);
    CHECK(text.find("below the threshold") == std::string::npos);
}

TEST_CASE("logsys::init_logs falls back to stderr when the directory cannot be created")
{
    ScopedTempDir tmp("logging_fallback");
    const fs::path blocker = tmp.path() / "not_a_dir";
    launchpad::test::write_text(blocker, "x");

    DefaultLoggerGuard guard;
    logsys::init_logs(blocker / "logs", spdlog::level::off);
    CHECK(spdlog::default_logger()->name() == "launchpad");
    CHECK(spdlog::default_logger()->sinks().size() == 1);
}

TEST_CASE("logsys::parse_level accepts spdlog names and common aliases")
{
    spdlog::level::level_enum lvl = spdlog::level::info;

    CHECK(logsys::parse_level("DEBUG", lvl));
    CHECK(lvl == spdlog::level::debug);
    CHECK(logsys::parse_level("warning", lvl));
    CHECK(lvl == spdlog::level::warn);
    CHECK(logsys::parse_level("fatal", lvl));
    CHECK(lvl == spdlog::level::critical);
    CHECK(logsys::parse_level("error", lvl));
    CHECK(lvl == spdlog::level::err);

    CHECK_FALSE(logsys::parse_level("err", lvl));
    CHECK_FALSE(logsys::parse_level("", lvl));
    CHECK(lvl == spdlog::level::err); // untouched on failure
}
