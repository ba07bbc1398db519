// src/launchpad/store/JsonEntryStore.cpp
#include "launchpad/store/JsonEntryStore.hpp"

#include "launchpad/entry/EntryJson.hpp"
#include "io/AtomicFile.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <string>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace launchpad::store {

namespace {

using json = nlohmann::json;

constexpr const char* kKeyEntries = "entries";

[[nodiscard]] std::unexpected<StoreError> Fail(StoreError::Code code, std::string message)
{
    return std::unexpected(StoreError{code, std::move(message)});
}

[[nodiscard]] std::string Describe(const std::error_code& ec)
{
    return ec.message() + " (code " + std::to_string(ec.value()) + ")";
}

} // namespace

const char* LoadStatusName(LoadStatus s) noexcept
{
    switch (s) {
    case LoadStatus::NoDocument: return "no-document";
    case LoadStatus::Loaded:     return "loaded";
    case LoadStatus::Recovered:  return "recovered";
    case LoadStatus::Corrupt:    return "corrupt";
    case LoadStatus::ReadFailed: return "read-failed";
    }
    return "unknown";
}

JsonEntryStore::JsonEntryStore(fs::path documentPath)
    : m_path(std::move(documentPath))
{
}

JsonEntryStore JsonEntryStore::InDirectory(const fs::path& dataDir)
{
    return JsonEntryStore(dataDir / kDocumentFileName);
}

fs::path JsonEntryStore::backupPath(int generation) const
{
    fs::path p = m_path;
    p += ".bak" + std::to_string(generation);
    return p;
}

std::string JsonEntryStore::Serialize(const std::vector<Entry>& entries)
{
    json arr = json::array();
    for (const auto& e : entries)
        arr.push_back(entry::EntryToJson(e));

    json doc = json::object();
    doc[kKeyEntries] = std::move(arr);

    // Invalid UTF-8 in user text is replaced rather than throwing.
    std::string text = doc.dump(2, ' ', /*ensure_ascii=*/false, json::error_handler_t::replace);
    text.push_back('\n');
    return text;
}

LoadResult JsonEntryStore::Parse(const std::string& text)
{
    LoadResult result;

    json doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object())
    {
        result.status = LoadStatus::Corrupt;
        result.diagnostic = doc.is_discarded() ? "JSON parse failed" : "document is not a JSON object";
        return result;
    }

    auto it = doc.find(kKeyEntries);
    if (it == doc.end())
    {
        result.status = LoadStatus::Loaded;
        return result;
    }
    if (!it->is_array())
    {
        result.status = LoadStatus::Corrupt;
        result.diagnostic = "\"entries\" is not an array";
        return result;
    }

    std::unordered_set<std::string> seen;
    seen.reserve(it->size());
    result.entries.reserve(it->size());

    std::size_t index = 0;
    for (const auto& record : *it)
    {
        entry::Entry e;
        std::string reason;
        bool idAssigned = false;
        if (!entry::EntryFromJson(record, e, &reason, &idAssigned))
        {
            ++result.skippedRecords;
            if (result.diagnostic.empty())
                result.diagnostic = "record " + std::to_string(index) + ": " + reason;
        }
        else if (!seen.insert(e.id).second)
        {
            ++result.skippedRecords;
            if (result.diagnostic.empty())
                result.diagnostic = "record " + std::to_string(index) + ": duplicate id " + e.id;
        }
        else
        {
            if (idAssigned)
                ++result.assignedIds;
            result.entries.push_back(std::move(e));
        }
        ++index;
    }

    result.status = result.skippedRecords ? LoadStatus::Recovered : LoadStatus::Loaded;
    return result;
}

LoadResult JsonEntryStore::load()
{
    std::error_code ec;
    if (!fs::exists(m_path, ec))
    {
        if (ec)
        {
            LoadResult r;
            r.status = LoadStatus::ReadFailed;
            r.diagnostic = "cannot stat " + m_path.string() + ": " + Describe(ec);
            spdlog::warn("Entry store: {}", r.diagnostic);
            return r;
        }
        spdlog::info("Entry store: no document at {}, starting empty", m_path.string());
        return LoadResult{};
    }

    std::string text;
    std::string err;
    if (!io::read_all(m_path, text, &err))
    {
        LoadResult r;
        r.status = LoadStatus::ReadFailed;
        r.diagnostic = err;
        spdlog::warn("Entry store: {}; starting empty", err);
        return r;
    }

    LoadResult r = Parse(text);
    switch (r.status) {
    case LoadStatus::Corrupt:
        spdlog::warn("Entry store: {} is corrupt ({}); starting empty", m_path.string(), r.diagnostic);
        break;
    case LoadStatus::Recovered:
        spdlog::warn("Entry store: dropped {} malformed record(s) from {} (first: {})",
                     r.skippedRecords, m_path.string(), r.diagnostic);
        break;
    default:
        spdlog::info("Entry store: loaded {} entries from {}", r.entries.size(), m_path.string());
        break;
    }
    return r;
}

std::expected<void, StoreError> JsonEntryStore::rotateBackups()
{
    std::error_code ec;

    // Shift 9->10, 8->9, ... 1->2; whatever sat in the last slot is dropped.
    for (int i = kMaxBackupGenerations - 1; i >= 1; --i)
    {
        const fs::path src = backupPath(i);
        const fs::path dst = backupPath(i + 1);

        ec.clear();
        if (!fs::exists(src, ec))
        {
            if (ec)
                return Fail(StoreError::Code::BackupRotateFailed, "cannot stat " + src.string() + ": " + Describe(ec));
            continue;
        }

        if (fs::exists(dst, ec))
        {
            fs::remove(dst, ec);
            if (ec)
                return Fail(StoreError::Code::BackupRotateFailed, "cannot remove " + dst.string() + ": " + Describe(ec));
        }

        fs::rename(src, dst, ec);
        if (ec)
            return Fail(StoreError::Code::BackupRotateFailed,
                        "cannot rename " + src.string() + " -> " + dst.string() + ": " + Describe(ec));
    }

    const fs::path newest = backupPath(1);
    ec.clear();
    fs::copy_file(m_path, newest, fs::copy_options::overwrite_existing, ec);
    if (ec)
        return Fail(StoreError::Code::BackupRotateFailed,
                    "cannot copy " + m_path.string() + " -> " + newest.string() + ": " + Describe(ec));

    return {};
}

std::expected<void, StoreError> JsonEntryStore::save(const std::vector<Entry>& entries)
{
    std::error_code ec;
    if (fs::exists(m_path, ec))
    {
        if (auto rotated = rotateBackups(); !rotated)
        {
            spdlog::error("Entry store: backup rotation failed: {}", rotated.error().message);
            return rotated;
        }
    }
    else if (ec)
    {
        return Fail(StoreError::Code::WriteFailed, "cannot stat " + m_path.string() + ": " + Describe(ec));
    }

    std::string err;
    if (!io::write_atomic(m_path, Serialize(entries), &err))
    {
        spdlog::error("Entry store: write failed: {}", err);
        return Fail(StoreError::Code::WriteFailed, err);
    }

    spdlog::debug("Entry store: saved {} entries to {}", entries.size(), m_path.string());
    return {};
}

std::vector<BackupHandle> JsonEntryStore::listBackups() const
{
    std::vector<BackupHandle> out;
    for (int i = 1; i <= kMaxBackupGenerations; ++i)
    {
        BackupHandle h;
        h.generation = i;
        h.path = backupPath(i);

        std::error_code ec;
        if (!fs::is_regular_file(h.path, ec))
            continue;

        const auto t = fs::last_write_time(h.path, ec);
        if (!ec)
            h.lastWriteTime = t;
        out.push_back(std::move(h));
    }
    return out;
}

std::expected<void, StoreError> JsonEntryStore::restore(const BackupHandle& handle)
{
    if (handle.generation < 1 || handle.generation > kMaxBackupGenerations)
        return Fail(StoreError::Code::InvalidBackup,
                    "backup generation " + std::to_string(handle.generation) + " is out of range");

    // Handles are resolved against this store, never trusted as raw paths.
    const fs::path src = backupPath(handle.generation);

    std::error_code ec;
    if (!fs::is_regular_file(src, ec))
        return Fail(StoreError::Code::BackupMissing, "backup " + src.string() + " does not exist");

    if (m_path.has_parent_path())
        fs::create_directories(m_path.parent_path(), ec);

    ec.clear();
    fs::copy_file(src, m_path, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        spdlog::error("Entry store: restore from {} failed: {}", src.string(), Describe(ec));
        return Fail(StoreError::Code::RestoreFailed,
                    "cannot copy " + src.string() + " -> " + m_path.string() + ": " + Describe(ec));
    }

    spdlog::info("Entry store: restored {} from backup generation {}", m_path.string(), handle.generation);
    return {};
}

} // namespace launchpad::store
