#pragma once

#include <array>
#include <string>
#include <vector>

#include "wgstore/core/types.hpp"

namespace wgstore::core {

    inline constexpr u32 kContainerIndexVersion = 14;
    inline constexpr u32 kFileListVersion = 4;
    inline constexpr std::size_t kFileNameChars = 64;

    // Set when the entry is associated with a cloud copy (cloud_id non-empty).
    inline constexpr u32 kEntryFlagCloudSync = 4;

    struct ContainerEntry {
        std::u16string name;
        std::u16string name_again;          // serialized copy of name, kept distinct so mismatches are visible
        std::u16string cloud_id;
        u8 seq{1};
        u32 flags{0};
        Guid id{};                          // also the container directory name
        FileTime mtime{};
        u64 reserved{0};                    // must be zero on disk
        u64 size{0};

        friend bool operator==(const ContainerEntry&, const ContainerEntry&) = default;
    };

    struct ContainerIndex {
        u32 version{kContainerIndexVersion};
        u32 flag1{0};
        std::u16string package_name;
        FileTime mtime{};
        u32 flag2{0};
        std::u16string index_id;
        u64 reserved{0};
        std::vector<ContainerEntry> containers;

        friend bool operator==(const ContainerIndex&, const ContainerIndex&) = default;
    };

    struct ContentFileEntry {
        std::u16string name;                // at most kFileNameChars code units on disk
        std::array<u8, 16> reserved{};      // opaque, written as zero
        Guid id{};                          // blob file name in the container directory
        std::vector<u8> data;               // payload when held in memory
        std::string source_path;            // when non-empty, payload is streamed from this file on write

        friend bool operator==(const ContentFileEntry&, const ContentFileEntry&) = default;
    };

    struct ContainerFileList {
        u32 seq{1};                         // from the container.<seq> file name
        std::vector<ContentFileEntry> files;

        friend bool operator==(const ContainerFileList&, const ContainerFileList&) = default;
    };

    [[nodiscard]] constexpr u32 entry_flags_for(u32 base_flags, bool has_cloud_id) noexcept {
        return has_cloud_id ? (base_flags | kEntryFlagCloudSync) : (base_flags & ~kEntryFlagCloudSync);
    }

} // namespace wgstore::core
