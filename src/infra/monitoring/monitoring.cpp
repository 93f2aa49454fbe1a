#include "monitoring.hpp"
#include "../units/units.hpp"
#include <algorithm>
#include <cstdio>
#include <fmt/core.h>

namespace fcopy::infra {

auto TransferStats::bytes_per_second() const -> double {
    const auto micros = std::max<std::chrono::microseconds::rep>(time_taken.count(), 1);
    return static_cast<double>(total) / static_cast<double>(micros) * 1'000'000.0;
}

void ProgressMonitor::report(const std::filesystem::path& source,
                             const std::filesystem::path& /*destination*/,
                             std::uint64_t file_transferred,
                             std::uint64_t file_total,
                             const TransferStats& stats)
{
    const auto name = fmt::format("'{}'", source.filename().string());
    fmt::print("\rCopying file {:50} ({:>8} /{:>8})\tTotal: ({:>8} /{:>8})",
               name,
               format_size_precise(file_transferred),
               format_size_precise(file_total),
               format_size_precise(stats.transferred),
               format_size_precise(stats.total));
    std::fflush(stdout);
}

} // namespace fcopy::infra
