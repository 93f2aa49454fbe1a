#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace fcopy::infra {

inline constexpr std::uint64_t KiB = 1024;
inline constexpr std::uint64_t MiB = 1024 * KiB;
inline constexpr std::uint64_t GiB = 1024 * MiB;

inline constexpr std::uint64_t kDefaultBlockSize = 8 * MiB;

/// Parses "<digits>[kKmMgG]" into bytes, e.g. "32M" -> 33554432.
/// Anything it cannot make sense of (bad digits, no or unknown suffix,
/// overflow) yields kDefaultBlockSize.
[[nodiscard]] auto parse_size(std::string_view text) -> std::uint64_t;

/// Human-readable size with two decimals above 1K: "512B", "1.50K", "8.00M".
[[nodiscard]] auto format_size_precise(std::uint64_t bytes) -> std::string;

} // namespace fcopy::infra
