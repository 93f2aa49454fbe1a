#include <filesystem>
#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "infra/units/units.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/copy_engine/copy_engine.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>

using GIT = fcopy::build_info::GitInfo;
using ARGS = fcopy::args_parser::CLIArgs;

constexpr auto git = fcopy::build_info::get_git_info();

static auto
out_git_verse(const GIT& info)
-> void {
    spdlog::debug("Version: {}", info.version);
    spdlog::debug("Git branch: {}", info.branch);
    spdlog::debug("Git commit: {}", info.commit);
    spdlog::debug("Git dirty: {}", info.dirty ? "yes" : "no");
    spdlog::debug("Build timestamp (UTC): {}", info.timestamp);
}

static auto
out_config_verse(const ARGS& args, const fcopy::infra::Config& config)
-> void {
    spdlog::debug("Source: {}", args.source);
    spdlog::debug("Destination: {}", args.destination);
    spdlog::debug("Block size: {}", fcopy::infra::format_size_precise(config.effective_block_size()));
    spdlog::debug("Recursive: {}", config.recursive ? "yes" : "no");
    spdlog::debug("Force: {}", config.force ? "yes" : "no");
    spdlog::debug("Resume: {}", config.resume ? "yes" : "no");
    spdlog::debug("Move: {}", config.move ? "yes" : "no");
    spdlog::debug("Ignore directory errors: {}", config.no_dir_error ? "yes" : "no");
    spdlog::debug("Progress: {}", config.progress ? "yes" : "no");
    spdlog::debug("Stats: {}", config.stats ? "yes" : "no");
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        auto args_res = fcopy::args_parser::parse_args(argc, argv);
        if (!args_res) {
            return args_res.error(); // --help, --version or usage error
        }
        const auto& args = *args_res;

        // 1. Defaults from the config file
        auto config_res = args.config_file
            ? fcopy::infra::load_config_from_file(std::filesystem::path(*args.config_file))
            : fcopy::infra::load_config_from_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. CLI takes precedence
        config.merge_with(fcopy::infra::config_from_cli(args));

        if (config.verbose) {
            spdlog::set_level(spdlog::level::debug);
            out_git_verse(git);
            out_config_verse(args, config);
        }

        fcopy::infra::ProgressMonitor monitor;
        fcopy::core::CopyEngine engine(config, monitor);

        auto result = engine.run(args.source, args.destination);
        if (!result) {
            const auto& err = result.error();
            spdlog::debug("[{}:{} in {}] {}", err.file, err.line, err.function,
                          fcopy::infra::to_string(err.code));
            fmt::print("{} failed: {}\n", config.move ? "Move" : "Copy", err.what());
            return 1;
        }

        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
