#pragma once
// include/launchpad/store/JsonEntryStore.hpp
//
// JSON document store with numbered backup generations:
//
//   <dir>/launcher_data.json        current document
//   <dir>/launcher_data.json.bak1   state before the most recent save
//   ...
//   <dir>/launcher_data.json.bak10  oldest kept state

#include "launchpad/store/EntryStore.hpp"

#include <filesystem>

namespace launchpad::store {

inline constexpr const char* kDocumentFileName = "launcher_data.json";

class JsonEntryStore final : public IEntryStore {
public:
    explicit JsonEntryStore(fs::path documentPath);

    // Convenience: <dataDir>/launcher_data.json
    [[nodiscard]] static JsonEntryStore InDirectory(const fs::path& dataDir);

    [[nodiscard]] LoadResult load() override;
    [[nodiscard]] std::expected<void, StoreError> save(const std::vector<Entry>& entries) override;
    [[nodiscard]] std::vector<BackupHandle> listBackups() const override;
    [[nodiscard]] std::expected<void, StoreError> restore(const BackupHandle& handle) override;

    [[nodiscard]] const fs::path& documentPath() const noexcept { return m_path; }

    // "<document>.bak<generation>"
    [[nodiscard]] fs::path backupPath(int generation) const;

    // Serialized form written by save() (2-space indent, UTF-8 kept verbatim).
    [[nodiscard]] static std::string Serialize(const std::vector<Entry>& entries);

    // Tolerant parse of a whole document; never throws.
    [[nodiscard]] static LoadResult Parse(const std::string& text);

private:
    [[nodiscard]] std::expected<void, StoreError> rotateBackups();

    fs::path m_path;
};

} // namespace launchpad::store
