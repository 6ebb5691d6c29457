#pragma once

#include <filesystem>
#include <vector>

#include "wgstore/core/errors.hpp"
#include "wgstore/core/events.hpp"
#include "wgstore/core/models.hpp"
#include "wgstore/core/types.hpp"

namespace wgstore::merge {
    using u32 = wgstore::core::u32;

    struct MergeStats {
        u32 kept{0};                // existing entries carried over unchanged
        u32 replaced{0};            // existing entries whose name is in the batch
        u32 duplicates_dropped{0};  // earlier same-name entries removed
        u32 appended{0};            // batch entries appended
    };

    // Replace-by-name merge of a batch of freshly written entries into an index.
    //
    // Every existing entry whose name occurs in the batch is removed, the batch
    // is appended in order, and the index mtime becomes `now`. Unrelated
    // entries keep their relative order. Names are unique afterwards: where a
    // name occurs more than once (among unrelated entries or inside the batch)
    // the last occurrence wins and a DuplicateDropped warning is emitted.
    // Header fields other than mtime are copied unchanged.
    wgstore::core::Status merge_new_entries(const wgstore::core::ContainerIndex& index,
        const std::vector<wgstore::core::ContainerEntry>& batch,
        wgstore::core::FileTime now,
        wgstore::core::ContainerIndex* out,
        MergeStats* stats,
        const wgstore::core::EventSink* events) noexcept;

    // merge_new_entries followed by storage::write_index into store_root.
    // Not transactional: a failed write can leave a partial index behind.
    wgstore::core::Status commit_merge(const wgstore::core::ContainerIndex& index,
        const std::vector<wgstore::core::ContainerEntry>& batch,
        const std::filesystem::path& store_root,
        wgstore::core::FileTime now,
        wgstore::core::ContainerIndex* out,
        MergeStats* stats,
        wgstore::core::Diagnostic* diag,
        const wgstore::core::EventSink* events) noexcept;

} // namespace wgstore::merge
