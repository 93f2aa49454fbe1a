#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <vector>

#include "config.hpp"
#include "../units/units.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace fcopy::infra {

auto Config::effective_block_size() const -> std::uint64_t {
    if (!block_size || *block_size == 0) {
        return kDefaultBlockSize;
    }
    return *block_size;
}

void Config::merge_with(const Config& other) {
    if (other.block_size) block_size = other.block_size;
    if (other.force) force = true;
    if (other.progress) progress = true;
    if (other.recursive) recursive = true;
    if (other.stats) stats = true;
    if (other.move) move = true;
    if (other.no_dir_error) no_dir_error = true;
    if (other.verbose) verbose = true;
    if (other.resume) resume = true;
}

static auto get_config_paths() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;

    // 1. Local file
    paths.push_back(".fcopy.yaml");

    // 2. User file
    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && std::filesystem::exists(config_home)) {
        paths.push_back(std::filesystem::path(config_home) / "fcopy" / "config.yaml");
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            paths.push_back(std::filesystem::path(home) / ".config" / "fcopy" / "config.yaml");
        }
    }

    return paths;
}

static auto parse_config(const std::filesystem::path& path) -> std::expected<Config, std::string> {
    try {
        YAML::Node config = YAML::LoadFile(path.string());
        Config cfg{};

        if (config.IsNull()) {
            return cfg;
        }
        if (!config.IsMap()) {
            return std::unexpected(fmt::format("Failed to parse {}: top level is not a mapping",
                                               path.string()));
        }

        if (config["block_size"]) cfg.block_size = parse_size(config["block_size"].as<std::string>());

        if (config["force"]) cfg.force = config["force"].as<bool>();
        if (config["progress"]) cfg.progress = config["progress"].as<bool>();
        if (config["recursive"]) cfg.recursive = config["recursive"].as<bool>();
        if (config["stats"]) cfg.stats = config["stats"].as<bool>();
        if (config["move"]) cfg.move = config["move"].as<bool>();
        if (config["no_dir_error"]) cfg.no_dir_error = config["no_dir_error"].as<bool>();
        if (config["verbose"]) cfg.verbose = config["verbose"].as<bool>();
        if (config["resume"]) cfg.resume = config["resume"].as<bool>();

        for (const auto& item : config) {
            const auto key = item.first.as<std::string>();
            if (key != "block_size" && key != "force" && key != "progress" &&
                key != "recursive" && key != "stats" && key != "move" &&
                key != "no_dir_error" && key != "verbose" && key != "resume") {
                spdlog::warn("Unknown key '{}' in {}", key, path.string());
            }
        }

        spdlog::debug("Loaded config from {}", path.string());
        return cfg;

    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

auto load_config_from_file() -> std::expected<Config, std::string> {
    for (const auto& path : get_config_paths()) {
        if (!std::filesystem::exists(path)) continue;
        return parse_config(path);
    }

    // No file is not an error
    return Config{};
}

auto load_config_from_file(const std::filesystem::path& path) -> std::expected<Config, std::string> {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(fmt::format("Config file {} does not exist", path.string()));
    }
    return parse_config(path);
}

auto config_from_cli(const fcopy::args_parser::CLIArgs& args) -> Config {
    Config cfg{};
    if (args.block_size) cfg.block_size = parse_size(*args.block_size);
    cfg.force = args.force;
    cfg.progress = args.progress;
    cfg.recursive = args.recursive;
    cfg.stats = args.stats;
    cfg.move = args.move;
    cfg.no_dir_error = args.no_dir_error;
    cfg.verbose = args.verbose;
    cfg.resume = args.resume;
    return cfg;
}

} // namespace fcopy::infra
