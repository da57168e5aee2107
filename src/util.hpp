#pragma once

#include <charconv>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

template <std::integral T>
inline std::string display(T cnt) {
    if (cnt < 1000ull)
        return fmt::format("{}", cnt);
    if (cnt < 1000 * 1000ull)
        return fmt::format("{:.2f}K", 1.0 * cnt / 1e3);
    if (cnt < 1000 * 1000ull * 1000ull)
        return fmt::format("{:.2f}M", 1.0 * cnt / 1e6);
    return fmt::format("{:.2f}G", 1.0 * cnt / 1e9);
}

// wall-clock durations, from sub-millisecond solves to hour-long sweeps
inline std::string display(double s) {
    if (s < 1e-3)
        return fmt::format("{:.0f}us", s * 1e6);
    if (s < 1.0)
        return fmt::format("{:.1f}ms", s * 1e3);
    if (s < 60.0)
        return fmt::format("{:.2f}s", s);
    auto sec = uint64_t(s);
    if (sec < 3600)
        return fmt::format("{}m{:02}s", sec / 60, sec % 60);
    return fmt::format("{}h{:02}m", sec / 3600, sec / 60 % 60);
}

// whole decimal number in [lo, hi], nothing else
inline std::optional<unsigned> parse_uint(std::string_view sv, unsigned lo, unsigned hi) {
    unsigned v{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
        return std::nullopt;
    if (v < lo || v > hi)
        return std::nullopt;
    return v;
}
