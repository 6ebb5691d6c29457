#pragma once

#include <csignal>
#include <filesystem>
#include <string>
#include <vector>

#include "wgstore/core/errors.hpp"
#include "wgstore/core/types.hpp"

namespace wgstore::storage {
    using u8 = wgstore::core::u8;
    using u32 = wgstore::core::u32;
    using u64 = wgstore::core::u64;

    // Bounded copy chunk for streamed payloads.
    inline constexpr std::size_t kCopyChunkBytes = 1024 * 1024;

    struct FileStat {
        bool exists{false};
        bool is_dir{false};
        u64 size_bytes{0};
        wgstore::core::FileTime mtime{};
    };

    struct DirEntry {
        std::string name;
        bool is_dir{false};
        wgstore::core::FileTime mtime{};
    };

    struct CopyOptions {
        std::size_t chunk_bytes{kCopyChunkBytes};
        // Polled between chunks; non-zero aborts the copy.
        const volatile std::sig_atomic_t* cancel{nullptr};
    };

    struct CopyResult {
        u64 bytes_copied{0};
        wgstore::core::Hash256 digest{};      // BLAKE3 of the bytes written
    };

    // Missing file -> NotFound; other failures -> Io with errno in aux.
    wgstore::core::Status stat_path(const std::filesystem::path& path, FileStat* out) noexcept;

    wgstore::core::Status read_file_all(const std::filesystem::path& path,
        std::vector<u8>* out,
        wgstore::core::Diagnostic* diag) noexcept;

    // Truncates and rewrites path in place, then fsyncs. Not atomic: a failure
    // part way leaves a partial file behind.
    wgstore::core::Status write_file_all(const std::filesystem::path& path,
        const u8* data,
        std::size_t len,
        wgstore::core::Diagnostic* diag) noexcept;

    // Streams src into dst in opts.chunk_bytes pieces. On any failure or on
    // cancellation the partially written dst is removed before returning
    // (Io / Cancelled).
    wgstore::core::Status copy_file_chunked(const std::filesystem::path& src,
        const std::filesystem::path& dst,
        const CopyOptions& opts,
        CopyResult* result,
        wgstore::core::Diagnostic* diag) noexcept;

    wgstore::core::Status make_dirs(const std::filesystem::path& path, wgstore::core::Diagnostic* diag) noexcept;

    // Entries of dir whose names fully match `pattern` (ECMAScript regex); an
    // empty pattern matches everything. Sorted by name.
    wgstore::core::Status list_dir(const std::filesystem::path& dir,
        const std::string& pattern,
        std::vector<DirEntry>* out,
        wgstore::core::Diagnostic* diag) noexcept;

    // Recursive copy of a directory tree; dst must not exist.
    wgstore::core::Status copy_tree(const std::filesystem::path& src,
        const std::filesystem::path& dst,
        wgstore::core::Diagnostic* diag) noexcept;

} // namespace wgstore::storage
