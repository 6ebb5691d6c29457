#pragma once

#include <vector>

#include "wgstore/codec/buffer.hpp"
#include "wgstore/core/errors.hpp"
#include "wgstore/core/models.hpp"

namespace wgstore::codec {

    // Layout (little-endian):
    // u32 version(=4) | u32 count | count x (fixed str16[64] name | 16B reserved | 16B id)
    inline constexpr u32 kFileListHeaderBytes = 8;
    inline constexpr u32 kFileListEntryBytes = static_cast<u32>(wgstore::core::kFileNameChars) * 2 + 16 + 16;

    // Supplies the payload of a content blob by identifier. load must fail
    // with NotFound/MissingContentBlob when the blob does not exist.
    struct BlobSource {
        wgstore::core::Status (*load)(void* ctx,
            const wgstore::core::Guid& id,
            std::vector<u8>* out,
            wgstore::core::Diagnostic* diag){nullptr};
        void* ctx{nullptr};
    };

    // Decodes the manifest and loads every referenced blob through `blobs`.
    // Each element's blob is resolved right after the element is read, so a
    // missing blob stops decoding with the reader positioned just past that
    // element. A null blobs.load decodes the manifest without payloads.
    wgstore::core::Status file_list_decode(ByteReader& r,
        u32 seq,
        const BlobSource& blobs,
        wgstore::core::ContainerFileList* out,
        wgstore::core::Diagnostic* diag) noexcept;

    // Manifest bytes only; blobs are written by the storage layer. Names
    // longer than 64 code units are clipped; reserved bytes are written as zero.
    wgstore::core::Status file_list_encode_manifest(const wgstore::core::ContainerFileList& list,
        std::vector<u8>* out,
        wgstore::core::Diagnostic* diag);

} // namespace wgstore::codec
