#pragma once
// include/launchpad/registry/EntryRegistry.hpp
//
// Ordered, uniquely-keyed collection of launcher entries.
//
// Every mutation is applied to a copy, saved through the store, and committed
// only when the save succeeds; the in-memory order therefore always matches the
// last document written. Callers only ever receive copies.

#include "launchpad/entry/Entry.hpp"
#include "launchpad/store/EntryStore.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <unordered_set>
#include <vector>

namespace launchpad::registry {

using entry::Entry;
using entry::EntryDraft;
using entry::EntryFields;
using entry::EntryId;

struct RegistryError {
    enum class Code {
        ValidationError,    // bad add/edit input
        NotFound,           // id does not address an entry
        Incomplete,         // reorder id-set differs from the held set
        Duplicate,          // reorder report repeats an id
        PersistenceFailure, // store failed; in-memory state unchanged
        NotLoaded,          // load() has not run yet
    } code{};
    std::string message;

    // Reorder rejections: the caller's view is stale and must be re-fetched via list().
    [[nodiscard]] bool requiresResync() const noexcept
    {
        return code == Code::Incomplete || code == Code::Duplicate;
    }
};

struct AddOutcome {
    Entry entry;
    // The application path does not exist right now. Not an error; the caller
    // decides whether to keep the entry.
    bool targetMissing = false;
};

class EntryRegistry {
public:
    explicit EntryRegistry(store::IEntryStore& store);

    EntryRegistry(const EntryRegistry&) = delete;
    EntryRegistry& operator=(const EntryRegistry&) = delete;

    // Reads the store once at startup. Damaged documents yield an empty (or
    // partial) registry; the result says which. Records stored without an id
    // get one, and the document is rewritten once so it survives restarts.
    store::LoadResult load();

    [[nodiscard]] bool isLoaded() const noexcept { return m_loaded; }

    [[nodiscard]] std::expected<AddOutcome, RegistryError> add(EntryDraft draft);
    [[nodiscard]] std::expected<AddOutcome, RegistryError> edit(const EntryId& id, EntryFields fields);
    [[nodiscard]] std::expected<void, RegistryError> remove(const EntryId& id);

    // Applies an order reported by the presentation layer after a move gesture.
    // The report is untrusted: it must be a permutation of the held ids.
    [[nodiscard]] std::expected<void, RegistryError> reorder(std::span<const EntryId> observedOrder);

    [[nodiscard]] std::vector<Entry> list() const { return m_entries; }
    [[nodiscard]] std::optional<Entry> find(const EntryId& id) const;
    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

    [[nodiscard]] std::vector<store::BackupHandle> backups() const { return m_store.listBackups(); }

    // Restores a backup on disk and reloads this registry from it.
    [[nodiscard]] std::expected<store::LoadResult, RegistryError> restoreBackup(const store::BackupHandle& handle);

private:
    [[nodiscard]] std::expected<void, RegistryError> commit(std::vector<Entry> next, const char* what);
    [[nodiscard]] std::optional<std::size_t> indexOf(const EntryId& id) const noexcept;

    store::IEntryStore& m_store;
    std::vector<Entry>  m_entries;
    std::unordered_set<EntryId> m_retired; // deleted this session; never handed out again
    bool                m_loaded = false;
};

} // namespace launchpad::registry
