// src/launchpad/entry/Entry.cpp
#include "launchpad/entry/Entry.hpp"

#include <array>
#include <cstdint>
#include <cstdio>
#include <random>
#include <system_error>

namespace launchpad::entry {

namespace {

// SplitMix64 mixer; expands one seed into well-distributed 64-bit words.
std::uint64_t splitmix64(std::uint64_t& x) noexcept
{
    x += 0x9E3779B97F4A7C15ull;
    std::uint64_t z = x;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    return z ^ (z >> 31);
}

std::mt19937_64& IdEngine()
{
    static std::mt19937_64 engine = [] {
        std::random_device rd;
        std::uint64_t seed = (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
        std::seed_seq seq{splitmix64(seed), splitmix64(seed), splitmix64(seed), splitmix64(seed)};
        return std::mt19937_64(seq);
    }();
    return engine;
}

} // namespace

EntryId GenerateEntryId()
{
    std::array<std::uint8_t, 16> b{};
    auto& engine = IdEngine();
    for (std::size_t i = 0; i < b.size(); i += 8)
    {
        const std::uint64_t w = engine();
        for (std::size_t k = 0; k < 8; ++k)
            b[i + k] = static_cast<std::uint8_t>(w >> (k * 8));
    }

    // RFC 4122: version 4, variant 10xx.
    b[6] = static_cast<std::uint8_t>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<std::uint8_t>((b[8] & 0x3F) | 0x80);

    char buf[37] = {};
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                  b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return EntryId(buf);
}

EntryDraft DraftFromFile(const fs::path& file)
{
    std::error_code ec;
    fs::path abs = fs::absolute(file, ec);
    if (ec)
        abs = file;

    EntryDraft d;
    d.name = PathToUtf8(abs.stem());
    d.kind = Application{PathToUtf8(abs.lexically_normal())};
    return d;
}

EntryDraft DraftCategory(std::string name)
{
    EntryDraft d;
    d.name = std::move(name);
    d.kind = Category{};
    return d;
}

fs::path PathFromUtf8(std::string_view utf8)
{
    return fs::path(std::u8string(utf8.begin(), utf8.end()));
}

std::string PathToUtf8(const fs::path& p)
{
    const std::u8string u = p.u8string();
    return std::string(u.begin(), u.end());
}

std::string_view KindTag(const EntryKind& kind) noexcept
{
    return std::holds_alternative<Category>(kind) ? "separator" : "app";
}

} // namespace launchpad::entry
