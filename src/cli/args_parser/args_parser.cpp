#include "args_parser.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <git_info.hpp>

namespace fcopy::args_parser {

auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int> {
    constexpr auto git = fcopy::build_info::get_git_info();

    CLIArgs args{};
    CLI::App app{"A file copy utility with resume, progress and statistics tracking", "fcopy"};

    app.set_version_flag("--version",
        fmt::format("fcopy {} ({}{})", git.version, git.commit_short, git.dirty ? ", dirty" : ""));

    app.add_option("-b,--block-size", args.block_size,
                   "Block size for transfer (in units of K, M and G. Ex: 32M)")
        ->default_str("8M");
    app.add_flag("-p,--progress", args.progress, "Show progress of the transfer");
    app.add_flag("-r,--recursive", args.recursive, "Copy files recursively");
    app.add_flag("-s,--stats", args.stats, "Show statistics of the transfer");
    app.add_flag("-f,--force", args.force, "Overwrite the destination file");
    app.add_flag("-m,--move", args.move, "Remove the source file after transfer");
    app.add_flag("-n,--no-dir-error", args.no_dir_error, "Ignore errors while copying directories");
    app.add_flag("-v,--verbose", args.verbose, "Print verbose output for the copy operation");
    app.add_flag("-c,--continue", args.resume, "Resume a partially completed copy");
    app.add_option("--config", args.config_file, "Read defaults from this YAML file")
        ->check(CLI::ExistingFile);

    app.add_option("SRC", args.source, "Path to source file")->required();
    app.add_option("DST", args.destination, "Path to destination")->required();

    app.footer("Supply source and destination respectively as positional arguments "
               "after specifying the options");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return std::unexpected(app.exit(e));
    }
    return args;
}

} // namespace fcopy::args_parser
