#include "app/CommandLineArgs.h"

#include <cctype>
#include <sstream>

namespace launchpad::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// "--opt=value" / "--opt:value". `lowered` selects the option, the value is
// cut from `raw` so it keeps its case.
[[nodiscard]] bool ConsumeValue(std::string_view lowered,
                                std::string_view raw,
                                std::string_view prefix,
                                std::string_view& outValue)
{
    if (!StartsWith(lowered, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (lowered.size() == n)
        return false;

    const char sep = lowered[n];
    if (sep != '=' && sep != ':')
        return false;

    outValue = raw.substr(n + 1);
    return true;
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(std::span<const std::string_view> argv)
{
    CommandLineArgs out;

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        const std::string lowered = ToLower(raw);
        const std::string_view arg(lowered);

        if (arg == "--help" || arg == "-h" || arg == "-?") {
            out.showHelp = true;
            continue;
        }
        if (arg == "--version" || arg == "-v") {
            out.showVersion = true;
            continue;
        }

        // Options with values
        const auto takeNext = [&](std::optional<std::string>& dst) {
            if (i + 1 >= argv.size() || argv[i + 1].empty()) {
                addUnknown(raw);
                return;
            }
            dst = std::string(argv[i + 1]);
            ++i;
        };

        const auto takeInline = [&](std::optional<std::string>& dst, std::string_view v) {
            if (v.empty()) {
                addUnknown(raw);
                return;
            }
            dst = std::string(v);
        };

        std::string_view value;

        if (arg == "--data-dir") { takeNext(out.dataDir); continue; }
        if (ConsumeValue(arg, raw, "--data-dir", value)) { takeInline(out.dataDir, value); continue; }

        if (arg == "--log-level") { takeNext(out.logLevel); continue; }
        if (ConsumeValue(arg, raw, "--log-level", value)) { takeInline(out.logLevel, value); continue; }

        if (arg == "--launch") { takeNext(out.launch); continue; }
        if (ConsumeValue(arg, raw, "--launch", value)) { takeInline(out.launch, value); continue; }

        // Anything else is unknown.
        addUnknown(raw);
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, char** argv)
{
    std::vector<std::string_view> v;
    v.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0u);
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "LaunchPad - Command Line Options\n\n";
    oss << "  --data-dir <dir>         Data directory (default: $LAUNCHPAD_DATA_DIR or ~/.launcher)\n";
    oss << "  --log-level <lvl>        trace, debug, info, warn, error, critical, off\n";
    oss << "  --launch <id|name>       Launch an entry after loading\n";
    oss << "  --version, -v            Print the version\n";
    oss << "  --help, -h               Show this help\n\n";

    oss << "Examples\n";
    oss << "  launchpad\n";
    oss << "  launchpad --data-dir=/tmp/lp --log-level debug\n";
    oss << "  launchpad --launch \"My Editor\"\n";
    return oss.str();
}

} // namespace launchpad::app
