#include "Log.h"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <memory>
#include <cctype>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

void logsys::init_logs(const fs::path& logDir, spdlog::level::level_enum level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    const auto file = (logDir / "launchpad.log").string();
    std::string fileError;
    std::error_code ec; fs::create_directories(logDir, ec);
    if (ec) {
        fileError = ec.message();
    } else {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4)); // 1MB * 4
        } catch (const spdlog::spdlog_ex& ex) {
            fileError = ex.what();
        }
    }

    spdlog::set_default_logger(std::make_shared<spdlog::logger>("launchpad", sinks.begin(), sinks.end()));
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (fileError.empty())
        spdlog::info("Logging started ({})", file);
    else
        spdlog::warn("Logging to stderr only; cannot open {}: {}", file, fileError);
}

bool logsys::parse_level(std::string_view text, spdlog::level::level_enum& out) noexcept {
    std::string s(text);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "warning") s = "warn";
    if (s == "fatal") s = "critical";

    static constexpr std::pair<const char*, spdlog::level::level_enum> kLevels[] = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug}, {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},   {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    for (const auto& [name, lvl] : kLevels) {
        if (s == name) { out = lvl; return true; }
    }
    return false;
}
