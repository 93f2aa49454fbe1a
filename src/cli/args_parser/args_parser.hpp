#pragma once

#include <string>
#include <optional>
#include <expected>

namespace fcopy::args_parser {

struct CLIArgs
{
    std::string source;                     // SRC (positional)
    std::string destination;                // DST (positional)
    std::optional<std::string> block_size;  // -b, --block-size=SIZE (K/M/G suffix)
    bool progress{false};                   // -p, --progress
    bool recursive{false};                  // -r, --recursive
    bool stats{false};                      // -s, --stats
    bool force{false};                      // -f, --force
    bool move{false};                       // -m, --move
    bool no_dir_error{false};               // -n, --no-dir-error
    bool verbose{false};                    // -v, --verbose
    bool resume{false};                     // -c, --continue
    std::optional<std::string> config_file; // --config=FILE
};

/// Parses the command line. On --help, --version or a usage error the
/// message is printed and the process exit code is returned as the error.
[[nodiscard]] auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int>;

} // namespace fcopy::args_parser
