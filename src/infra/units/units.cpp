#include "units.hpp"
#include <charconv>
#include <limits>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace fcopy::infra {

std::uint64_t parse_size(std::string_view text) {
    std::size_t digits = 0;
    while (digits < text.size() && text[digits] >= '0' && text[digits] <= '9') {
        ++digits;
    }

    std::uint64_t number = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + digits, number);
    if (digits == 0 || ec != std::errc{} || ptr != text.data() + digits) {
        spdlog::debug("Unparsable size '{}', using default block size", text);
        return kDefaultBlockSize;
    }

    const auto suffix = text.substr(digits);
    std::uint64_t unit = 0;
    if (suffix == "k" || suffix == "K") {
        unit = KiB;
    } else if (suffix == "m" || suffix == "M") {
        unit = MiB;
    } else if (suffix == "g" || suffix == "G") {
        unit = GiB;
    } else {
        spdlog::debug("Unknown size suffix in '{}', using default block size", text);
        return kDefaultBlockSize;
    }

    if (number > std::numeric_limits<std::uint64_t>::max() / unit) {
        spdlog::debug("Size '{}' overflows, using default block size", text);
        return kDefaultBlockSize;
    }
    return number * unit;
}

std::string format_size_precise(std::uint64_t bytes) {
    const auto value = static_cast<double>(bytes);
    if (bytes > GiB) return fmt::format("{:.2f}G", value / static_cast<double>(GiB));
    if (bytes > MiB) return fmt::format("{:.2f}M", value / static_cast<double>(MiB));
    if (bytes > KiB) return fmt::format("{:.2f}K", value / static_cast<double>(KiB));
    return fmt::format("{}B", bytes);
}

} // namespace fcopy::infra
