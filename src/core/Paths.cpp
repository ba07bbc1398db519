// src/core/Paths.cpp
#include "Paths.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <system_error>

namespace {
  std::filesystem::path HomeDir() {
#if defined(_WIN32)
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (home && *home)
      return std::filesystem::path(home);

    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return ec ? std::filesystem::current_path(ec) : tmp;
  }

  constexpr const char* kDataDirName = ".launcher";
}

namespace paths {
  std::filesystem::path data_dir() {
    if (const char* overrideDir = std::getenv("LAUNCHPAD_DATA_DIR"); overrideDir && *overrideDir)
      return std::filesystem::path(overrideDir);
    return HomeDir() / kDataDirName;
  }

  std::filesystem::path log_dir(const std::filesystem::path& dataDir) { return dataDir / "logs"; }

  bool ensure_created(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::create_directories(p, ec);
    if (ec) {
      spdlog::warn("paths: cannot create {}: {}", p.string(), ec.message());
      return false;
    }
    return true;
  }
}
