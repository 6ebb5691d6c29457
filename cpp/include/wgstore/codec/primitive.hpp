#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "wgstore/codec/buffer.hpp"
#include "wgstore/core/errors.hpp"
#include "wgstore/core/types.hpp"

namespace wgstore::codec {
    using u64 = wgstore::core::u64;

    // Little-endian integer reads. Reading past the end of the buffer is
    // lenient: the bytes that remain are consumed and decoded, and missing
    // high bytes read as zero (an exhausted reader yields 0). Required fields
    // that end up truncated are caught by the callers' invariant checks.
    [[nodiscard]] u8 get_u8(ByteReader& r) noexcept;
    [[nodiscard]] u32 get_u32_le(ByteReader& r) noexcept;
    [[nodiscard]] u64 get_u64_le(ByteReader& r) noexcept;

    // Strict reads: fewer than the requested bytes is Corrupt/Truncated and
    // the reader position is left unchanged.
    wgstore::core::Status get_bytes(ByteReader& r, u8* out, u32 len) noexcept;

    // u32 character count followed by count UTF-16LE code units.
    wgstore::core::Status get_str16(ByteReader& r, std::u16string* out) noexcept;

    // Exactly `chars` UTF-16LE code units; trailing NULs are stripped.
    wgstore::core::Status get_fixed_str16(ByteReader& r, u32 chars, std::u16string* out) noexcept;

    void put_u8(std::vector<u8>& out, u8 v);
    void put_u32_le(std::vector<u8>& out, u32 v);
    void put_u64_le(std::vector<u8>& out, u64 v);
    void put_bytes(std::vector<u8>& out, const u8* data, std::size_t len);
    void put_zeros(std::vector<u8>& out, std::size_t len);

    void put_str16(std::vector<u8>& out, std::u16string_view s);

    // Truncated to `chars` code units, NUL-padded up to exactly chars * 2 bytes.
    void put_fixed_str16(std::vector<u8>& out, std::u16string_view s, u32 chars);

    [[nodiscard]] inline u32 str16_encoded_bytes(std::u16string_view s) noexcept {
        return static_cast<u32>(4 + s.size() * 2);
    }

} // namespace wgstore::codec
