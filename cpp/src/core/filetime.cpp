#include "wgstore/core/filetime.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace wgstore::core {
    namespace {
        // 2^64 as a double; the smallest double that no u64 can hold.
        constexpr double kTwoPow64 = 18446744073709551616.0;
    } // namespace

    FileTime filetime_from_unix_seconds(double seconds) noexcept {
        if (std::isnan(seconds)) {
            return FileTime{kFileTimeUnixEpochTicks};
        }
        const double ticks = std::trunc(seconds * static_cast<double>(kFileTimeTicksPerSecond));
        if (ticks >= 0.0) {
            if (ticks >= kTwoPow64) {
                return FileTime{UINT64_MAX};
            }
            const u64 rel = static_cast<u64>(ticks);
            if (rel > UINT64_MAX - kFileTimeUnixEpochTicks) {
                return FileTime{UINT64_MAX};
            }
            return FileTime{rel + kFileTimeUnixEpochTicks};
        }
        if (-ticks >= kTwoPow64) {
            return FileTime{0};
        }
        // Before 1601 the unsigned field wraps.
        return FileTime{kFileTimeUnixEpochTicks - static_cast<u64>(-ticks)};
    }

    double filetime_to_unix_seconds(FileTime t) noexcept {
        const double per_second = static_cast<double>(kFileTimeTicksPerSecond);
        if (t.ticks >= kFileTimeUnixEpochTicks) {
            return static_cast<double>(t.ticks - kFileTimeUnixEpochTicks) / per_second;
        }
        return -static_cast<double>(kFileTimeUnixEpochTicks - t.ticks) / per_second;
    }

    FileTime filetime_now() noexcept {
        using namespace std::chrono;
        const auto since_epoch = system_clock::now().time_since_epoch();
        // 100ns resolution, matching the on-disk tick.
        const i64 ticks = duration_cast<duration<i64, std::ratio<1, 10000000>>>(since_epoch).count();
        return FileTime{static_cast<u64>(ticks) + kFileTimeUnixEpochTicks};
    }

    bool filetime_format_utc(FileTime t, char* out, std::size_t out_size) noexcept {
        if (out == nullptr || out_size == 0) {
            return false;
        }
        out[0] = '\0';

        std::time_t secs = 0;
        if (t.ticks >= kFileTimeUnixEpochTicks) {
            secs = static_cast<std::time_t>((t.ticks - kFileTimeUnixEpochTicks) / kFileTimeTicksPerSecond);
        } else {
            const u64 before = kFileTimeUnixEpochTicks - t.ticks;
            secs = -static_cast<std::time_t>((before + kFileTimeTicksPerSecond - 1) / kFileTimeTicksPerSecond);
        }
        std::tm tm{};
        if (gmtime_r(&secs, &tm) == nullptr) {
            return false;
        }
        return std::strftime(out, out_size, "%Y-%m-%d %H:%M:%S", &tm) != 0;
    }
} // namespace wgstore::core
