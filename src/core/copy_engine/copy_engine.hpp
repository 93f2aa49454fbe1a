#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"

namespace fcopy::core {

class CopyEngine {
public:
    explicit CopyEngine(const infra::Config& config,
                        infra::ProgressReporter& reporter);

    /// Copies (or moves) `source` to `destination`, a file or, with
    /// `recursive`, a whole directory tree. An existing destination directory
    /// receives the source under its own name. Returns the final statistics;
    /// every transferred byte must be accounted for or the copy fails.
    [[nodiscard]] auto run(const std::string& source, const std::string& destination)
        -> infra::Result<infra::TransferStats>;

    /// Copies one file and returns the bytes written for it. `stats` is the
    /// accumulator of the whole operation; its `transferred` count grows as
    /// chunks are written. Honours `force` and `resume`.
    [[nodiscard]] auto copy_file(const std::filesystem::path& src,
                                 const std::filesystem::path& dst,
                                 infra::TransferStats& stats)
        -> infra::Result<std::uint64_t>;

    /// Copies every file below `src` into `dst`. Adds the size of the whole
    /// tree to `stats.total` before the first byte is written.
    [[nodiscard]] auto copy_directory(const std::filesystem::path& src,
                                      const std::filesystem::path& dst,
                                      infra::TransferStats& stats)
        -> infra::VoidResult;

private:
    void report_stats_(const infra::TransferStats& stats) const;

    const infra::Config& config_;
    infra::ProgressReporter& reporter_;
};

} // namespace fcopy::core
