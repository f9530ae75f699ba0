#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ms::cli {

inline constexpr int EXIT_USAGE = 64;

class UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct Args {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::optional<std::filesystem::path> configPath;
    bool once = false;
    bool verbose = false;
    bool help = false;
};

// Accepts "--in <src> --sync <dst>" or two positional directories.
// Roots come back normalized to absolute form. Throws UsageError.
Args parseArgs(int argc, const char* const* argv);
Args parseArgs(const std::vector<std::string>& args);

std::string usage(const std::string& program = "mirrorsync");

}
