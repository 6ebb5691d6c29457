#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "wgstore/codec/buffer.hpp"
#include "wgstore/core/errors.hpp"
#include "wgstore/core/events.hpp"
#include "wgstore/core/models.hpp"
#include "wgstore/core/types.hpp"
#include "wgstore/storage/fs.hpp"

namespace wgstore::storage {

    inline constexpr const char* kIndexFileName = "containers.index";
    inline constexpr const char* kManifestPrefix = "container.";

    // Container and blob directory names as produced by guid_to_dir_name.
    inline constexpr const char* kGuidDirPattern = "[0-9A-F]{32}";

    // Options for writing a container directory
    struct WriteOptions {
        CopyOptions copy{};
        bool verify_after_write{false};     // re-hash every written blob and compare digests
    };

    struct WrittenBlob {
        wgstore::core::Guid id{};
        u64 size_bytes{0};
        wgstore::core::Hash256 digest{};
    };

    struct WriteReport {
        std::filesystem::path manifest_path;
        std::vector<WrittenBlob> blobs;
    };

    struct VerifyProblem {
        std::string container;              // entry name (UTF-8); empty for store-level problems
        wgstore::core::Status status{};
        wgstore::core::Diagnostic diag{};
    };

    struct VerifyReport {
        u32 entries_checked{0};
        u32 blobs_checked{0};
        std::vector<VerifyProblem> problems;
        std::vector<std::string> orphan_dirs;   // identifier-shaped directories with no index entry
    };

    // ========================================================================
    // Index
    // ========================================================================

    // Reads and decodes <path>. A missing file is NotFound/MissingIndex.
    // diag->path is set to the index path on every failure.
    wgstore::core::Status decode_index(const std::filesystem::path& path,
        wgstore::core::ContainerIndex* out,
        wgstore::core::Diagnostic* diag) noexcept;

    // Encodes the index and overwrites <directory>/containers.index in place.
    wgstore::core::Status write_index(const wgstore::core::ContainerIndex& index,
        const std::filesystem::path& directory,
        wgstore::core::Diagnostic* diag,
        const wgstore::core::EventSink* events) noexcept;

    // ========================================================================
    // Container directories
    // ========================================================================

    [[nodiscard]] std::filesystem::path container_dir_path(const std::filesystem::path& store_root,
        const wgstore::core::Guid& id);

    // Parses the decimal suffix of "container.<seq>". Anything else is
    // Corrupt/BadManifestName.
    wgstore::core::Status parse_manifest_name(const std::string& file_name, u32* seq) noexcept;

    // Locates the manifest of a container directory. More than one candidate
    // picks the highest sequence number.
    wgstore::core::Status find_manifest(const std::filesystem::path& container_dir,
        std::filesystem::path* manifest_path,
        u32* seq,
        wgstore::core::Diagnostic* diag) noexcept;

    // Decodes <path> and reads every blob from the manifest's directory. A
    // missing blob is NotFound/MissingContentBlob with diag->path naming it.
    wgstore::core::Status decode_file_list(const std::filesystem::path& path,
        u32 seq,
        wgstore::core::ContainerFileList* out,
        wgstore::core::Diagnostic* diag) noexcept;

    // Same as above over manifest bytes already in memory; blobs resolve
    // against `directory`. On failure r.pos shows how far decoding got.
    wgstore::core::Status decode_file_list(wgstore::codec::ByteReader& r,
        const std::filesystem::path& directory,
        u32 seq,
        wgstore::core::ContainerFileList* out,
        wgstore::core::Diagnostic* diag) noexcept;

    // Writes every blob, then <directory>/container.<list.seq>. A blob comes
    // from ContentFileEntry::source_path when set (streamed, cancellable)
    // and from ContentFileEntry::data otherwise. The directory is created
    // when missing.
    wgstore::core::Status write_file_list(const wgstore::core::ContainerFileList& list,
        const std::filesystem::path& directory,
        const WriteOptions& opts,
        WriteReport* report,
        wgstore::core::Diagnostic* diag,
        const wgstore::core::EventSink* events) noexcept;

    // find_manifest + decode_file_list for one index entry.
    wgstore::core::Status read_container(const std::filesystem::path& store_root,
        const wgstore::core::ContainerEntry& entry,
        wgstore::core::ContainerFileList* out,
        wgstore::core::Diagnostic* diag) noexcept;

    // ========================================================================
    // Verification
    // ========================================================================

    // Checks every entry's directory, manifest and blobs without reading blob
    // payloads, then lists orphan directories. Never modifies the store.
    // Only an unreadable index fails the call; everything else is reported.
    wgstore::core::Status verify_store(const std::filesystem::path& store_root,
        VerifyReport* report,
        wgstore::core::Diagnostic* diag) noexcept;

} // namespace wgstore::storage
