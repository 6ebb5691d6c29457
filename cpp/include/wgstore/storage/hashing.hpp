#pragma once

#include <string>

#include "wgstore/codec/buffer.hpp"
#include "wgstore/core/errors.hpp"
#include "wgstore/core/types.hpp"

namespace wgstore::storage {
    using u8 = wgstore::core::u8;

    [[nodiscard]] constexpr bool hash_is_zero(const wgstore::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    // BLAKE3, 32-byte output.
    wgstore::core::Status hash_compute(wgstore::codec::BufferView data, wgstore::core::Hash256* out) noexcept;

    // Streams the file through BLAKE3 in fixed-size chunks.
    wgstore::core::Status hash_file(const char* path, wgstore::core::Hash256* out) noexcept;

    [[nodiscard]] std::string hash_to_hex(const wgstore::core::Hash256& h);

} // namespace wgstore::storage
