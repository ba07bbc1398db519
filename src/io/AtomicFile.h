// src/io/AtomicFile.h
//
// Portable whole-file helpers used by the persistence layer.
//
// write_atomic:
//  - Writes to a sibling "<final>.tmp" file, flushes and closes it, then renames it
//    over the destination (std::filesystem::rename replaces an existing file).
//  - Creates the parent directory on demand.
//  - On failure the temp file is removed and the destination is left as it was.
//
// Build: C++23.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace launchpad::io {

namespace fs = std::filesystem;

/// Atomically replace the contents of `final_path` with `bytes`.
///
/// @param final_path   Destination path.
/// @param bytes        Entire file contents to write.
/// @param err          Optional: receives a human-readable error on failure.
///
/// @return true on success; false on error (with `err` populated if provided).
[[nodiscard]] bool write_atomic(const fs::path& final_path,
                                std::string_view bytes,
                                std::string* err = nullptr);

/// Read the entire file at `path` into `out`.
///
/// @return true on success; false on error (with `err` populated if provided).
[[nodiscard]] bool read_all(const fs::path& path,
                            std::string& out,
                            std::string* err = nullptr);

/// Return the sibling temp path "<final>.tmp" used by write_atomic.
[[nodiscard]] inline fs::path temp_path_for(const fs::path& final_path)
{
    fs::path p = final_path;
    p += ".tmp";
    return p;
}

} // namespace launchpad::io
