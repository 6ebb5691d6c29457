#pragma once

#include <csignal>
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

#include "wgstore/core/errors.hpp"
#include "wgstore/core/events.hpp"
#include "wgstore/core/models.hpp"
#include "wgstore/core/types.hpp"
#include "wgstore/merge/merge.hpp"
#include "wgstore/storage/fs.hpp"

namespace wgstore::import {
    using u32 = wgstore::core::u32;
    using u64 = wgstore::core::u64;

    // Flags written on imported entries before the cloud bit is applied.
    inline constexpr u32 kImportedEntryBaseFlags = 1;

    struct WorldFile {
        std::string file_name;      // e.g. "Level.sav"
        std::string suffix;         // container name suffix, e.g. "Level"
    };

    // Where a game keeps its stores and how a save directory maps onto
    // container names.
    struct GameProfile {
        std::string display_name;
        std::string package_id;
        std::string wgs_subpath;            // below the package directory
        std::string store_dir_pattern;      // full-match regex for store directory names
        std::vector<WorldFile> world_files; // imported in this order when present
        std::string players_dir;            // sub-directory of per-player files
        std::string player_extension;
        std::string blob_name;              // manifest name of the single content blob
    };

    [[nodiscard]] GameProfile palworld_profile();

    struct ImportConfig {
        GameProfile profile{palworld_profile()};
        bool dry_run{false};
        bool backup{true};
        bool verify_after_write{true};
        std::size_t chunk_bytes{wgstore::storage::kCopyChunkBytes};
        const volatile std::sig_atomic_t* cancel{nullptr};
    };

    struct CandidateStore {
        std::filesystem::path path;
        wgstore::core::FileTime mtime{};
    };

    struct PlanItem {
        std::filesystem::path source;
        std::string container_name;
        u64 size_bytes{0};
        wgstore::core::FileTime mtime{};
    };

    struct ImportPlan {
        std::filesystem::path source_dir;
        std::string save_name;
        std::vector<PlanItem> items;        // world files first, then players by file name
        std::vector<std::string> missing_world_files;
    };

    struct ImportResult {
        std::filesystem::path store_root;
        std::filesystem::path backup_path;  // empty when no backup was taken
        bool dry_run{false};
        ImportPlan plan{};
        std::vector<wgstore::core::ContainerEntry> entries;
        wgstore::merge::MergeStats stats{};
        wgstore::core::ContainerIndex index{};  // index as written (or as it would be written)
    };

    // $LOCALAPPDATA/Packages/<package_id>/<wgs_subpath>. Unavailable when the
    // variable is unset.
    wgstore::core::Status default_wgs_root(const GameProfile& profile,
        std::filesystem::path* out,
        wgstore::core::Diagnostic* diag) noexcept;

    // Store directories under wgs_root, newest modification time first. A
    // missing wgs_root yields an empty list.
    wgstore::core::Status find_candidate_stores(const std::filesystem::path& wgs_root,
        const GameProfile& profile,
        std::vector<CandidateStore>* out,
        wgstore::core::Diagnostic* diag) noexcept;

    // `source` may name the save directory or any file inside it.
    wgstore::core::Status plan_import(const std::filesystem::path& source,
        const GameProfile& profile,
        ImportPlan* out,
        wgstore::core::Diagnostic* diag,
        const wgstore::core::EventSink* events) noexcept;

    // "<store>.backup.<YYYYmmddHHMMSS>" in local time.
    [[nodiscard]] std::filesystem::path backup_path_for(const std::filesystem::path& store_root, std::time_t when);

    // Writes one container directory holding item.source as its only blob
    // and returns the index entry describing it. Dry run generates the
    // identifiers and the entry but writes nothing.
    wgstore::core::Status create_container(const std::filesystem::path& store_root,
        const PlanItem& item,
        const ImportConfig& cfg,
        wgstore::core::ContainerEntry* out,
        wgstore::core::Diagnostic* diag,
        const wgstore::core::EventSink* events) noexcept;

    // Plan, read the index, back up the store, write one container per plan
    // item, then merge and rewrite the index. A failure after containers
    // were written leaves them unreferenced and the index untouched.
    wgstore::core::Status import_save(const std::filesystem::path& source,
        const std::filesystem::path& store_root,
        const ImportConfig& cfg,
        ImportResult* result,
        wgstore::core::Diagnostic* diag,
        const wgstore::core::EventSink* events) noexcept;

} // namespace wgstore::import
