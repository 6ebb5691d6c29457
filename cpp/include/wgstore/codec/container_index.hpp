#pragma once

#include <vector>

#include "wgstore/codec/buffer.hpp"
#include "wgstore/core/errors.hpp"
#include "wgstore/core/models.hpp"

namespace wgstore::codec {

    // Layout (little-endian):
    // u32 version(=14) | u32 count | u32 flag1 | str16 package_name | u64 mtime |
    // u32 flag2 | str16 index_id | u64 reserved | count x record
    //
    // Decodes exactly `count` records and propagates the first record failure.
    // diag->field is prefixed with the record position ("containers[3].flags").
    wgstore::core::Status index_decode(BufferView in,
        wgstore::core::ContainerIndex* out,
        wgstore::core::Diagnostic* diag) noexcept;

    wgstore::core::Status index_decode(ByteReader& r,
        wgstore::core::ContainerIndex* out,
        wgstore::core::Diagnostic* diag) noexcept;

    // The count field is always containers.size(); version is always 14.
    wgstore::core::Status index_encode(const wgstore::core::ContainerIndex& index,
        std::vector<u8>* out,
        wgstore::core::Diagnostic* diag);

} // namespace wgstore::codec
