#pragma once

#include <vector>

#include "wgstore/codec/buffer.hpp"
#include "wgstore/core/errors.hpp"
#include "wgstore/core/models.hpp"

namespace wgstore::codec {

    // Layout (little-endian):
    // str16 name | str16 name_again | str16 cloud_id | u8 seq | u32 flags |
    // 16B id | u64 mtime | u64 reserved(=0) | u64 size
    inline constexpr u32 kRecordFixedBytes = 1 + 4 + 16 + 8 + 8 + 8;

    // Cross-field checks shared by decode and encode:
    // name == name_again, cloud bit set iff cloud_id non-empty, reserved == 0.
    wgstore::core::Status record_validate(const wgstore::core::ContainerEntry& e,
        wgstore::core::Diagnostic* diag) noexcept;

    // Stops at the first failing field; on failure *out is left untouched.
    wgstore::core::Status record_decode(ByteReader& r,
        wgstore::core::ContainerEntry* out,
        wgstore::core::Diagnostic* diag) noexcept;

    // Appends the record to out. Entries that would not decode are rejected
    // with Invalid and nothing is appended.
    wgstore::core::Status record_encode(const wgstore::core::ContainerEntry& e,
        std::vector<u8>& out,
        wgstore::core::Diagnostic* diag);

    [[nodiscard]] u32 record_encoded_bytes(const wgstore::core::ContainerEntry& e) noexcept;

} // namespace wgstore::codec
