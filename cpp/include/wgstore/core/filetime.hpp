#pragma once

#include "wgstore/core/types.hpp"

namespace wgstore::core {

    // Offset between 1601-01-01 and 1970-01-01 in 100ns ticks.
    inline constexpr u64 kFileTimeUnixEpochTicks = 116444736000000000ull;
    inline constexpr u64 kFileTimeTicksPerSecond = 10000000ull;

    // No range validation: values before 1601 wrap, as the on-disk field is unsigned.
    // Values past the u64 range saturate; NaN maps to the Unix epoch.
    [[nodiscard]] FileTime filetime_from_unix_seconds(double seconds) noexcept;

    // Signed seconds relative to 1970 for every tick count, including those above 2^63.
    [[nodiscard]] double filetime_to_unix_seconds(FileTime t) noexcept;

    [[nodiscard]] FileTime filetime_now() noexcept;

    // "YYYY-MM-DD HH:MM:SS" in UTC, for display. Returns false when the tick count
    // does not map onto a calendar time the C library can format.
    bool filetime_format_utc(FileTime t, char* out, std::size_t out_size) noexcept;

} // namespace wgstore::core
