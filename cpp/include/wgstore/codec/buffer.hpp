#pragma once

#include <type_traits>

#include "wgstore/core/types.hpp"

namespace wgstore::codec {
    using u8 = wgstore::core::u8;
    using u32 = wgstore::core::u32;

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u32 len{0};
    };

    // Forward-only cursor over a BufferView. pos never exceeds in.len.
    struct ByteReader {
        BufferView in{};
        u32 pos{0};
    };

    [[nodiscard]] constexpr u32 reader_remaining(const ByteReader& r) noexcept {
        return r.pos >= r.in.len ? 0 : r.in.len - r.pos;
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
    static_assert(std::is_trivially_copyable_v<ByteReader>);
} // namespace wgstore::codec
