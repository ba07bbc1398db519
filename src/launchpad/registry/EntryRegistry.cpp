// src/launchpad/registry/EntryRegistry.cpp
#include "launchpad/registry/EntryRegistry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace launchpad::registry {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] std::unexpected<RegistryError> Reject(RegistryError::Code code, std::string message)
{
    return std::unexpected(RegistryError{code, std::move(message)});
}

void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

// Normalizes the fields in place; returns an error message when they are unusable.
[[nodiscard]] std::optional<std::string> ValidateFields(std::string& name, entry::EntryKind& kind)
{
    TrimInPlace(name);
    if (name.empty())
        return "name must not be empty";

    if (auto* app = std::get_if<entry::Application>(&kind))
    {
        TrimInPlace(app->path);
        if (app->path.empty())
            return "an application entry needs a path";
    }
    return std::nullopt;
}

[[nodiscard]] bool TargetMissing(const Entry& e)
{
    const std::string* p = e.path();
    if (!p)
        return false;
    std::error_code ec;
    return !fs::exists(entry::PathFromUtf8(*p), ec);
}

} // namespace

EntryRegistry::EntryRegistry(store::IEntryStore& store)
    : m_store(store)
{
}

store::LoadResult EntryRegistry::load()
{
    store::LoadResult r = m_store.load();
    m_entries = r.entries;
    m_loaded = true;

    // Ids filled in during the load exist only in memory until written back.
    if (r.assignedIds > 0)
    {
        if (auto ok = commit(r.entries, "id assignment"); ok)
            spdlog::info("Registry: assigned and saved ids for {} entries", r.assignedIds);
        else
            spdlog::warn("Registry: {} assigned ids are not persisted yet", r.assignedIds);
    }
    return r;
}

std::optional<std::size_t> EntryRegistry::indexOf(const EntryId& id) const noexcept
{
    for (std::size_t i = 0; i < m_entries.size(); ++i)
        if (m_entries[i].id == id)
            return i;
    return std::nullopt;
}

std::optional<Entry> EntryRegistry::find(const EntryId& id) const
{
    if (auto idx = indexOf(id))
        return m_entries[*idx];
    return std::nullopt;
}

std::expected<void, RegistryError> EntryRegistry::commit(std::vector<Entry> next, const char* what)
{
    if (auto saved = m_store.save(next); !saved)
    {
        spdlog::error("Registry: {} not applied, save failed: {}", what, saved.error().message);
        return Reject(RegistryError::Code::PersistenceFailure, saved.error().message);
    }
    m_entries = std::move(next);
    return {};
}

std::expected<AddOutcome, RegistryError> EntryRegistry::add(EntryDraft draft)
{
    if (!m_loaded)
        return Reject(RegistryError::Code::NotLoaded, "registry has not been loaded");

    if (auto problem = ValidateFields(draft.name, draft.kind))
        return Reject(RegistryError::Code::ValidationError, *problem);

    Entry e;
    if (draft.id && !draft.id->empty())
    {
        if (indexOf(*draft.id) || m_retired.contains(*draft.id))
            return Reject(RegistryError::Code::ValidationError, "id " + *draft.id + " is already in use");
        e.id = std::move(*draft.id);
    }
    else
    {
        do {
            e.id = entry::GenerateEntryId();
        } while (indexOf(e.id) || m_retired.contains(e.id));
    }
    e.name = std::move(draft.name);
    e.description = std::move(draft.description);
    e.kind = std::move(draft.kind);

    AddOutcome out;
    out.targetMissing = TargetMissing(e);

    std::vector<Entry> next = m_entries;
    next.push_back(e);
    if (auto ok = commit(std::move(next), "add"); !ok)
        return std::unexpected(ok.error());

    if (out.targetMissing)
        spdlog::warn("Registry: added '{}' but its path does not exist: {}", e.name, *e.path());
    else
        spdlog::info("Registry: added '{}' ({})", e.name, e.id);

    out.entry = std::move(e);
    return out;
}

std::expected<AddOutcome, RegistryError> EntryRegistry::edit(const EntryId& id, EntryFields fields)
{
    if (!m_loaded)
        return Reject(RegistryError::Code::NotLoaded, "registry has not been loaded");

    const auto idx = indexOf(id);
    if (!idx)
        return Reject(RegistryError::Code::NotFound, "no entry with id " + id);

    if (auto problem = ValidateFields(fields.name, fields.kind))
        return Reject(RegistryError::Code::ValidationError, *problem);

    std::vector<Entry> next = m_entries;
    Entry& e = next[*idx];
    e.name = std::move(fields.name);
    e.description = std::move(fields.description);
    e.kind = std::move(fields.kind);

    AddOutcome out;
    out.entry = e;
    out.targetMissing = TargetMissing(e);

    if (auto ok = commit(std::move(next), "edit"); !ok)
        return std::unexpected(ok.error());

    if (out.targetMissing)
        spdlog::warn("Registry: edited '{}' but its path does not exist: {}", out.entry.name, *out.entry.path());
    else
        spdlog::info("Registry: edited '{}' ({})", out.entry.name, id);
    return out;
}

std::expected<void, RegistryError> EntryRegistry::remove(const EntryId& id)
{
    if (!m_loaded)
        return Reject(RegistryError::Code::NotLoaded, "registry has not been loaded");

    const auto idx = indexOf(id);
    if (!idx)
        return Reject(RegistryError::Code::NotFound, "no entry with id " + id);

    std::vector<Entry> next = m_entries;
    const std::string name = next[*idx].name;
    next.erase(next.begin() + static_cast<std::ptrdiff_t>(*idx));

    if (auto ok = commit(std::move(next), "delete"); !ok)
        return ok;

    m_retired.insert(id);
    spdlog::info("Registry: deleted '{}' ({})", name, id);
    return {};
}

std::expected<void, RegistryError> EntryRegistry::reorder(std::span<const EntryId> observedOrder)
{
    if (!m_loaded)
        return Reject(RegistryError::Code::NotLoaded, "registry has not been loaded");

    std::unordered_map<EntryId, std::size_t> held;
    held.reserve(m_entries.size());
    for (std::size_t i = 0; i < m_entries.size(); ++i)
        held.emplace(m_entries[i].id, i);

    // Membership first: the reported id set must equal the held id set.
    std::unordered_set<EntryId> reported(observedOrder.begin(), observedOrder.end());
    std::size_t missing = 0;
    for (const auto& [id, _] : held)
        if (!reported.contains(id))
            ++missing;
    std::size_t unknown = 0;
    for (const auto& id : reported)
        if (!held.contains(id))
            ++unknown;

    if (missing || unknown)
    {
        spdlog::warn("Registry: reorder rejected ({} missing, {} unknown ids); resync required", missing, unknown);
        return Reject(RegistryError::Code::Incomplete,
                      "reported order has " + std::to_string(missing) + " missing and " +
                      std::to_string(unknown) + " unknown id(s)");
    }

    if (reported.size() != observedOrder.size())
    {
        spdlog::warn("Registry: reorder rejected (duplicate ids); resync required");
        return Reject(RegistryError::Code::Duplicate, "reported order contains duplicate ids");
    }

    std::vector<Entry> next;
    next.reserve(m_entries.size());
    for (const auto& id : observedOrder)
        next.push_back(m_entries[held.at(id)]);

    if (next == m_entries)
        return {};

    if (auto ok = commit(std::move(next), "reorder"); !ok)
        return ok;

    spdlog::info("Registry: reordered {} entries", m_entries.size());
    return {};
}

std::expected<store::LoadResult, RegistryError> EntryRegistry::restoreBackup(const store::BackupHandle& handle)
{
    if (auto restored = m_store.restore(handle); !restored)
        return Reject(RegistryError::Code::PersistenceFailure, restored.error().message);

    store::LoadResult r = load();
    spdlog::info("Registry: reloaded {} entries after restoring backup generation {} ({})",
                 m_entries.size(), handle.generation, store::LoadStatusName(r.status));
    return r;
}

} // namespace launchpad::registry
