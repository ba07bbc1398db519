// src/launchpad/entry/EntryJson.cpp
#include "launchpad/entry/EntryJson.hpp"

namespace launchpad::entry {

namespace {

constexpr const char* kKeyId          = "id";
constexpr const char* kKeyName        = "name";
constexpr const char* kKeyPath        = "path";
constexpr const char* kKeyDescription = "description";
constexpr const char* kKeyEntryType   = "entry_type";

void SetReason(std::string* out, const char* reason)
{
    if (out) *out = reason;
}

// Non-throwing string lookup; nullptr when absent or not a string.
const std::string* StringField(const json& j, const char* key) noexcept
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return nullptr;
    return it->get_ptr<const std::string*>();
}

} // namespace

json EntryToJson(const Entry& e)
{
    const std::string* p = e.path();
    return json{
        {kKeyId, e.id},
        {kKeyName, e.name},
        {kKeyPath, p ? *p : std::string{}},
        {kKeyDescription, e.description},
        {kKeyEntryType, std::string(KindTag(e.kind))},
    };
}

bool EntryFromJson(const json& j, Entry& out, std::string* outReason, bool* outIdAssigned)
{
    if (outIdAssigned) *outIdAssigned = false;

    if (!j.is_object())
    {
        SetReason(outReason, "record is not an object");
        return false;
    }

    const std::string* name = StringField(j, kKeyName);
    if (!name || name->empty())
    {
        SetReason(outReason, "missing or empty name");
        return false;
    }

    EntryKind kind = Application{};
    if (auto it = j.find(kKeyEntryType); it != j.end())
    {
        if (!it->is_string())
        {
            SetReason(outReason, "entry_type is not a string");
            return false;
        }
        const auto& tag = it->get_ref<const std::string&>();
        if (tag == "separator")
            kind = Category{};
        else if (tag != "app")
        {
            SetReason(outReason, "unknown entry_type");
            return false;
        }
    }

    if (std::holds_alternative<Application>(kind))
    {
        const std::string* path = StringField(j, kKeyPath);
        if (!path || path->empty())
        {
            SetReason(outReason, "application without path");
            return false;
        }
        kind = Application{*path};
    }

    Entry e;
    const std::string* id = StringField(j, kKeyId);
    if (id && !id->empty())
    {
        e.id = *id;
    }
    else
    {
        e.id = GenerateEntryId();
        if (outIdAssigned) *outIdAssigned = true;
    }
    e.name = *name;
    if (const std::string* desc = StringField(j, kKeyDescription))
        e.description = *desc;
    e.kind = std::move(kind);

    out = std::move(e);
    return true;
}

} // namespace launchpad::entry
