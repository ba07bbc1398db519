#pragma once
// include/launchpad/store/EntryStore.hpp
//
// Durable storage seam for the entry registry.

#include "launchpad/entry/Entry.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace launchpad::store {

namespace fs = std::filesystem;

using entry::Entry;

inline constexpr int kMaxBackupGenerations = 10;

struct StoreError {
    enum class Code {
        BackupRotateFailed,
        WriteFailed,
        InvalidBackup,
        BackupMissing,
        RestoreFailed,
    } code{};
    std::string message;
};

enum class LoadStatus {
    NoDocument, // no file yet (first run)
    Loaded,     // every record parsed
    Recovered,  // document parsed, some records were dropped
    Corrupt,    // document unparseable; nothing recovered
    ReadFailed, // file exists but could not be read
};

struct LoadResult {
    std::vector<Entry> entries;
    LoadStatus  status = LoadStatus::NoDocument;
    std::size_t skippedRecords = 0;
    std::size_t assignedIds = 0; // records that had no id; the document needs rewriting
    std::string diagnostic; // first problem encountered, for logs / UI

    // True when the result is empty or partial because of damage rather than
    // because nothing was stored.
    [[nodiscard]] bool degraded() const noexcept
    {
        return status == LoadStatus::Recovered || status == LoadStatus::Corrupt ||
               status == LoadStatus::ReadFailed;
    }
};

struct BackupHandle {
    int      generation = 0; // 1 = newest
    fs::path path;
    std::optional<fs::file_time_type> lastWriteTime;
};

class IEntryStore {
public:
    virtual ~IEntryStore() = default;

    // Never fails: damage is reported through LoadResult::status.
    [[nodiscard]] virtual LoadResult load() = 0;

    // Rotates backups (when a document exists), then writes `entries` in order.
    [[nodiscard]] virtual std::expected<void, StoreError> save(const std::vector<Entry>& entries) = 0;

    // Existing generations, ascending (1..kMaxBackupGenerations), gaps skipped.
    [[nodiscard]] virtual std::vector<BackupHandle> listBackups() const = 0;

    // Copies the backup over the document verbatim.
    [[nodiscard]] virtual std::expected<void, StoreError> restore(const BackupHandle& handle) = 0;
};

[[nodiscard]] const char* LoadStatusName(LoadStatus s) noexcept;

} // namespace launchpad::store
