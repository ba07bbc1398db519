#pragma once
// include/launchpad/entry/EntryJson.hpp
//
// nlohmann::json mapping for launcher entries.
//
// Record layout (one element of the document's "entries" array):
//   { "id": "...", "name": "...", "path": "...", "description": "...",
//     "entry_type": "app" | "separator" }

#include "launchpad/entry/Entry.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace launchpad::entry {

using json = nlohmann::json;

[[nodiscard]] json EntryToJson(const Entry& e);

// Tolerant single-record parse. Returns false (and a reason in `outReason`)
// when the record is unusable; a missing id is filled with a fresh one and
// `outIdAssigned` is set so the caller can persist it.
[[nodiscard]] bool EntryFromJson(const json& j, Entry& out, std::string* outReason = nullptr,
                                 bool* outIdAssigned = nullptr);

} // namespace launchpad::entry
