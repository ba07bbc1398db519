#pragma once
// include/launchpad/entry/Entry.hpp
//
// Launcher entry model: one launchable application or one category marker.
// Categories structurally carry no path.

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace launchpad::entry {

namespace fs = std::filesystem;

using EntryId = std::string;

struct Application {
    std::string path; // absolute, UTF-8

    friend bool operator==(const Application&, const Application&) = default;
};

struct Category {
    friend bool operator==(const Category&, const Category&) = default;
};

using EntryKind = std::variant<Application, Category>;

// Mutable part of an entry (everything except the id).
struct EntryFields {
    std::string name;
    std::string description;
    EntryKind   kind{Application{}};

    friend bool operator==(const EntryFields&, const EntryFields&) = default;
};

struct Entry {
    EntryId     id;
    std::string name;
    std::string description;
    EntryKind   kind{Application{}};

    [[nodiscard]] bool isCategory() const noexcept { return std::holds_alternative<Category>(kind); }

    // nullptr for categories.
    [[nodiscard]] const std::string* path() const noexcept
    {
        const auto* app = std::get_if<Application>(&kind);
        return app ? &app->path : nullptr;
    }

    friend bool operator==(const Entry&, const Entry&) = default;
};

// Input of EntryRegistry::add. `id` is normally left empty so the registry
// assigns one.
struct EntryDraft {
    std::optional<EntryId> id;
    std::string name;
    std::string description;
    EntryKind   kind{Application{}};
};

// Fresh random (v4) UUID in canonical 8-4-4-4-12 lowercase form.
[[nodiscard]] EntryId GenerateEntryId();

// Draft for a file dropped onto the launcher:
//   name = file name without extension, path = absolute path, kind = Application.
[[nodiscard]] EntryDraft DraftFromFile(const fs::path& file);

[[nodiscard]] EntryDraft DraftCategory(std::string name);

// Paths are stored as UTF-8. path::string() on Windows goes through the ANSI
// code page, so every conversion between a stored path and fs::path uses these.
[[nodiscard]] fs::path PathFromUtf8(std::string_view utf8);
[[nodiscard]] std::string PathToUtf8(const fs::path& p);

// "app" / "separator" (the persisted tag).
[[nodiscard]] std::string_view KindTag(const EntryKind& kind) noexcept;

} // namespace launchpad::entry
