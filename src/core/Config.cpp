#include "Config.h"
#include "io/AtomicFile.h"
#include "logging/Log.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>
#include <string_view>
#include <system_error>

namespace core {

static std::filesystem::path Path(const std::filesystem::path& dir) {
    return dir / "launcher.ini";
}

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

// ".py, .PYW,,pyz" -> {".py", ".pyw", ".pyz"}; false when nothing usable remains.
static bool ParseExtensionList(std::string_view sv, std::vector<std::string>& out)
{
    std::vector<std::string> parsed;
    std::size_t start = 0;
    while (start <= sv.size())
    {
        std::size_t comma = sv.find(',', start);
        if (comma == std::string_view::npos)
            comma = sv.size();

        std::string item(sv.substr(start, comma - start));
        TrimInPlace(item);
        item = launchpad::launch::NormalizeExtension(std::move(item));
        if (item.size() > 1)
            parsed.push_back(std::move(item));

        start = comma + 1;
    }

    if (parsed.empty())
        return false;

    out = std::move(parsed);
    return true;
}

static std::string JoinExtensions(const std::vector<std::string>& exts)
{
    std::string out;
    for (const auto& e : exts)
    {
        if (!out.empty()) out.push_back(',');
        out += e;
    }
    return out;
}

// Tiny INI-style parser: key=value lines
bool LoadConfig(Config& cfg, const std::filesystem::path& dataDir)
{
    const auto path = Path(dataDir);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false; // first run

    std::string text;
    std::string err;
    if (!launchpad::io::read_all(path, text, &err))
    {
        spdlog::warn("LoadConfig: failed to read {} ({})", path.string(), err);
        return false;
    }

    // Files saved by Windows editors may carry a UTF-8 BOM.
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF)
        text.erase(0, 3);

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line))
    {
        // Comments / empty
        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';' || tmp[0] == '[') continue;

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);

        // Strip trailing inline comments, e.g.:
        //   log_level=debug      # noisy
        //   terminal=kitty       ; GPU terminal
        {
            const std::size_t hashPos = v.find('#');
            const std::size_t semiPos = v.find(';');

            std::size_t cut = std::string::npos;
            if (hashPos != std::string::npos) cut = hashPos;
            if (semiPos != std::string::npos && (cut == std::string::npos || semiPos < cut)) cut = semiPos;

            if (cut != std::string::npos)
            {
                v.erase(cut);
                TrimInPlace(v);
            }
        }

        if (k.empty()) continue;

        if (k == "log_level")
        {
            spdlog::level::level_enum lvl{};
            if (logsys::parse_level(v, lvl))
                cfg.logLevel = v;
            else
                spdlog::warn("LoadConfig: ignoring log_level '{}'", v);
        }
        else if (k == "terminal")
        {
            if (!v.empty())
                cfg.terminal = v;
        }
        else if (k == "script_interpreter")
        {
            if (!v.empty())
                cfg.scriptInterpreter = v;
        }
        else if (k == "script_extensions")
        {
            if (!ParseExtensionList(v, cfg.scriptExtensions))
                spdlog::warn("LoadConfig: ignoring empty script_extensions");
        }
        else if (k == "console_extensions")
        {
            if (!ParseExtensionList(v, cfg.consoleExtensions))
                spdlog::warn("LoadConfig: ignoring empty console_extensions");
        }
        else
        {
            spdlog::debug("LoadConfig: unknown key '{}'", k);
        }
    }

    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& dataDir)
{
    std::ostringstream oss;
    oss << "log_level="          << cfg.logLevel          << "\n";
    oss << "terminal="           << cfg.terminal          << "\n";
    oss << "script_interpreter=" << cfg.scriptInterpreter << "\n";
    oss << "script_extensions="  << JoinExtensions(cfg.scriptExtensions)  << "\n";
    oss << "console_extensions=" << JoinExtensions(cfg.consoleExtensions) << "\n";

    const auto path = Path(dataDir);

    std::string err;
    if (!launchpad::io::write_atomic(path, oss.str(), &err))
    {
        spdlog::error("SaveConfig: write failed for {} ({})", path.string(), err);
        return false;
    }
    return true;
}

launchpad::launch::LaunchPolicy ToLaunchPolicy(const Config& cfg)
{
    launchpad::launch::LaunchPolicy p;
    p.scriptExtensions  = cfg.scriptExtensions;
    p.consoleExtensions = cfg.consoleExtensions;
    p.scriptInterpreter = cfg.scriptInterpreter;
    return p;
}

launchpad::launch::ProcessLauncherOptions ToProcessLauncherOptions(const Config& cfg)
{
    launchpad::launch::ProcessLauncherOptions o;
    o.terminal = cfg.terminal;
    return o;
}

} // namespace core
