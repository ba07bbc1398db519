// src/core/Paths.h
#pragma once
#include <filesystem>
namespace paths {
    // Per-user data directory: $LAUNCHPAD_DATA_DIR, else ~/.launcher
    // (%USERPROFILE%\.launcher on Windows). Falls back to the temp directory
    // when no home can be found.
    std::filesystem::path data_dir();
    std::filesystem::path log_dir(const std::filesystem::path& dataDir);   // <data>/logs

    // create_directories; false (with a logged warning) on failure.
    bool ensure_created(const std::filesystem::path& p);
}
