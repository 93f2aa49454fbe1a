#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>

namespace fcopy::infra {

// Byte accounting for one copy invocation.
struct TransferStats {
    std::uint64_t transferred = 0;
    std::uint64_t total = 0;
    std::chrono::microseconds time_taken{0};

    /// total / time_taken, in bytes per second. A zero duration counts as 1us.
    [[nodiscard]] auto bytes_per_second() const -> double;
};

class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    /// Called after every chunk written. `file_transferred` and `file_total`
    /// are for the current file, `stats` for the whole operation.
    virtual void report(const std::filesystem::path& source,
                        const std::filesystem::path& destination,
                        std::uint64_t file_transferred,
                        std::uint64_t file_total,
                        const TransferStats& stats) = 0;
};

// Single-line console progress, rewritten in place with '\r'.
class ProgressMonitor final : public ProgressReporter {
public:
    void report(const std::filesystem::path& source,
                const std::filesystem::path& destination,
                std::uint64_t file_transferred,
                std::uint64_t file_total,
                const TransferStats& stats) override;
};

} // namespace fcopy::infra
