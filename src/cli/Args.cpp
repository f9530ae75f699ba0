#include "cli/Args.hpp"
#include "fs/model/Path.hpp"

#include <fmt/core.h>

using namespace ms::fs::model;

namespace ms::cli {

namespace {

std::string takeValue(const std::vector<std::string>& args, size_t& i, const std::string& flag) {
    if (i + 1 >= args.size() || args[i + 1].empty())
        throw UsageError(fmt::format("Option '{}' requires a directory argument", flag));
    return args[++i];
}

// "--flag=value" form
bool splitInline(const std::string& arg, std::string& flag, std::string& value) {
    const auto eq = arg.find('=');
    if (arg.rfind("--", 0) != 0 || eq == std::string::npos) return false;
    flag = arg.substr(0, eq);
    value = arg.substr(eq + 1);
    return true;
}

}

Args parseArgs(const int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parseArgs(args);
}

Args parseArgs(const std::vector<std::string>& args) {
    Args out;
    std::optional<std::string> in, sync;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i], inlineValue;
        std::string flag;
        const bool hasInline = splitInline(arg, flag, inlineValue);
        if (hasInline) arg = flag;

        auto value = [&](const std::string& name) {
            if (!hasInline) return takeValue(args, i, name);
            if (inlineValue.empty()) throw UsageError(fmt::format("Option '{}' requires a directory argument", name));
            return inlineValue;
        };

        if (arg == "-h" || arg == "--help") out.help = true;
        else if (arg == "-v" || arg == "--verbose") out.verbose = true;
        else if (arg == "--once") out.once = true;
        else if (arg == "-i" || arg == "--in") in = value(arg);
        else if (arg == "-s" || arg == "--sync") sync = value(arg);
        else if (arg == "-c" || arg == "--config") out.configPath = std::filesystem::path(value(arg));
        else if (arg == "--") {
            for (++i; i < args.size(); ++i) positional.push_back(args[i]);
        }
        else if (arg.size() > 1 && arg[0] == '-') throw UsageError(fmt::format("Unknown option '{}'", arg));
        else positional.push_back(arg);
    }

    if (out.help) return out;

    for (const auto& p : positional) {
        if (!in) in = p;
        else if (!sync) sync = p;
        else throw UsageError(fmt::format("Unexpected argument '{}'", p));
    }

    if (!in) throw UsageError("Missing the source directory (--in)");
    if (!sync) throw UsageError("Missing the destination directory (--sync)");

    out.source = normalizeRoot(*in);
    out.destination = normalizeRoot(*sync);

    if (out.source == out.destination)
        throw UsageError(fmt::format("Source and destination are the same directory: {}", out.source.string()));

    return out;
}

std::string usage(const std::string& program) {
    return fmt::format(
        "Usage: {0} --in <source> --sync <destination> [options]\n"
        "       {0} <source> <destination> [options]\n"
        "\n"
        "Mirrors the source directory onto the destination, then keeps it in sync.\n"
        "\n"
        "Options:\n"
        "  -i, --in <dir>        Source directory (must exist and be readable)\n"
        "  -s, --sync <dir>      Destination directory (created when missing)\n"
        "      --once            Stop after the initial synchronization\n"
        "  -c, --config <path>   Configuration file (default: $MIRRORSYNC_CONFIG or /etc/mirrorsync/config.yaml)\n"
        "  -v, --verbose         Debug output on the console\n"
        "  -h, --help            Show this help\n",
        program);
}

}
