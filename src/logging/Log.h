#pragma once
#include <filesystem>
#include <string_view>
#include <spdlog/spdlog.h>

namespace logsys {
    // Rotating file sink under `logDir` (launchpad.log, 1 MiB x 4) plus a colour
    // stderr sink; installs the result as spdlog's default logger.
    void init_logs(const std::filesystem::path& logDir, spdlog::level::level_enum level);

    // "trace" .. "critical", "off", plus "warning" and "fatal"; case-insensitive.
    bool parse_level(std::string_view text, spdlog::level::level_enum& out) noexcept;
}
