#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace wgstore::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // 128-bit identifier in canonical (RFC 4122) byte order, as embedded in records.
    struct Guid {
        std::array<u8, 16> b{};
        friend constexpr bool operator==(const Guid&, const Guid&) noexcept = default;
        friend constexpr auto operator<=>(const Guid&, const Guid&) noexcept = default;
    };
    static_assert(sizeof(Guid) == 16);

    // Windows FILETIME: 100ns ticks since 1601-01-01 UTC.
    struct FileTime {
        u64 ticks{0};
        friend constexpr bool operator==(FileTime, FileTime) noexcept = default;
        friend constexpr auto operator<=>(FileTime, FileTime) noexcept = default;
    };
    static_assert(sizeof(FileTime) == 8);

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(const Hash256&, const Hash256&) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    [[nodiscard]] constexpr bool guid_is_nil(const Guid& g) noexcept {
        for (u8 v : g.b) {
            if (v != 0) {
                return false;
            }
        }
        return true;
    }

    static_assert(std::is_trivially_copyable_v<Guid>);
    static_assert(std::is_trivially_copyable_v<FileTime>);
    static_assert(std::is_trivially_copyable_v<Hash256>);
    static_assert(std::is_standard_layout_v<Guid>);
    static_assert(std::is_standard_layout_v<FileTime>);

} // namespace wgstore::core
