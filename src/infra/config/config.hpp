#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace fcopy::args_parser {
    struct CLIArgs;
}

namespace fcopy::infra {

struct Config {
    // I/O
    std::optional<std::uint64_t> block_size;   // bytes per transfer chunk

    // Behavior
    bool force = false;
    bool progress = false;
    bool recursive = false;
    bool stats = false;
    bool move = false;           // remove the source after a successful copy
    bool no_dir_error = false;   // keep going when a file of a directory fails
    bool verbose = false;
    bool resume = false;

    /// Block size to use: the configured one, or 8M when unset or zero.
    [[nodiscard]] auto effective_block_size() const -> std::uint64_t;

    Config& with_block_size(std::uint64_t bytes) { block_size = bytes; return *this; }
    Config& with_force(bool on = true) { force = on; return *this; }
    Config& with_progress(bool on = true) { progress = on; return *this; }
    Config& with_recursive(bool on = true) { recursive = on; return *this; }
    Config& with_stats(bool on = true) { stats = on; return *this; }
    Config& with_move(bool on = true) { move = on; return *this; }
    Config& with_no_dir_error(bool on = true) { no_dir_error = on; return *this; }
    Config& with_verbose(bool on = true) { verbose = on; return *this; }
    Config& with_resume(bool on = true) { resume = on; return *this; }

    // Merges another Config (e.g. from the CLI) on top of this one
    void merge_with(const Config& other);
};

/// Loads the configuration from a YAML file.
/// Search order:
///   1. ./.fcopy.yaml
///   2. $XDG_CONFIG_HOME/fcopy/config.yaml, else ~/.config/fcopy/config.yaml
/// Returns a default Config if no file is found.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Loads the configuration from an explicit YAML file, which must exist.
[[nodiscard]] auto load_config_from_file(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Builds a Config from the parsed command line
[[nodiscard]] auto config_from_cli(const fcopy::args_parser::CLIArgs& args) -> Config;

} // namespace fcopy::infra
