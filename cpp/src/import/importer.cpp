#include "wgstore/import/importer.hpp"

#include <algorithm>
#include <cstdlib>

#include "wgstore/codec/utf16.hpp"
#include "wgstore/core/filetime.hpp"
#include "wgstore/core/guid.hpp"
#include "wgstore/storage/store.hpp"

namespace wgstore::import {
    using namespace wgstore::core;
    namespace fs = std::filesystem;

    namespace {
        [[nodiscard]] bool ends_with(const std::string& s, const std::string& suffix) {
            return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        [[nodiscard]] bool cancelled(const ImportConfig& cfg) noexcept {
            return cfg.cancel != nullptr && *cfg.cancel != 0;
        }

        void diag_path(Diagnostic* diag, const fs::path& p) {
            if (diag != nullptr) {
                diag->path = p.string();
            }
        }
    } // namespace

    GameProfile palworld_profile() {
        GameProfile p{};
        p.display_name = "Palworld";
        p.package_id = "PocketpairInc.Palworld_ad4psfrxyesvt";
        p.wgs_subpath = "SystemAppData/wgs";
        p.store_dir_pattern = "[0-9A-F]{16}_[0-9A-F]{32}";
        p.world_files = {
            {"Level.sav", "Level"},
            {"LevelMeta.sav", "LevelMeta"},
            {"LocalData.sav", "LocalData"},
            {"WorldOption.sav", "WorldOption"},
        };
        p.players_dir = "Players";
        p.player_extension = ".sav";
        p.blob_name = "Data";
        return p;
    }

    Status default_wgs_root(const GameProfile& profile, fs::path* out, Diagnostic* diag) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Import, StatusCode::Invalid);
        }
        const char* local = std::getenv("LOCALAPPDATA");
        if (local == nullptr || *local == '\0') {
            diag_set(diag, "LOCALAPPDATA", "environment variable is not set; pass --wgs or --store");
            return make_status(StatusDomain::Import, StatusCode::Unavailable);
        }
        *out = fs::path(local) / "Packages" / profile.package_id / fs::path(profile.wgs_subpath);
        return ok_status();
    }

    Status find_candidate_stores(const fs::path& wgs_root, const GameProfile& profile,
                                 std::vector<CandidateStore>* out, Diagnostic* diag) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Import, StatusCode::Invalid);
        }
        out->clear();

        std::vector<storage::DirEntry> entries;
        const Status s = storage::list_dir(wgs_root, profile.store_dir_pattern, &entries, diag);
        if (s.code == StatusCode::NotFound) {
            return ok_status();
        }
        if (!is_ok(s)) {
            return s;
        }

        for (const storage::DirEntry& e : entries) {
            if (e.is_dir) {
                out->push_back(CandidateStore{wgs_root / e.name, e.mtime});
            }
        }
        // Listing is name-sorted, so equal mtimes stay in name order.
        std::stable_sort(out->begin(), out->end(),
                         [](const CandidateStore& a, const CandidateStore& b) { return a.mtime > b.mtime; });
        return ok_status();
    }

    Status plan_import(const fs::path& source, const GameProfile& profile, ImportPlan* out, Diagnostic* diag,
                       const EventSink* events) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Import, StatusCode::Invalid);
        }

        storage::FileStat st{};
        Status s = storage::stat_path(source, &st);
        if (s.code == StatusCode::NotFound) {
            diag_path(diag, source);
            diag_set(diag, "source", "save path does not exist");
            return make_status(StatusDomain::Import, StatusCode::NotFound);
        }
        if (!is_ok(s)) {
            diag_path(diag, source);
            return s;
        }

        ImportPlan plan{};
        plan.source_dir = st.is_dir ? source : source.parent_path();
        if (!plan.source_dir.has_filename()) {
            plan.source_dir = plan.source_dir.parent_path();
        }
        plan.save_name = plan.source_dir.filename().string();
        if (plan.save_name.empty()) {
            diag_path(diag, source);
            diag_set(diag, "source", "cannot derive a save name from this path");
            return make_status(StatusDomain::Import, StatusCode::Invalid);
        }

        for (const WorldFile& wf : profile.world_files) {
            const fs::path p = plan.source_dir / wf.file_name;
            storage::FileStat fst{};
            s = storage::stat_path(p, &fst);
            if (s.code == StatusCode::NotFound || (is_ok(s) && fst.is_dir)) {
                plan.missing_world_files.push_back(wf.file_name);
                emit(events, EventLevel::Warning, EventKind::OptionalFileMissing,
                     "optional file not found: " + wf.file_name);
                continue;
            }
            if (!is_ok(s)) {
                diag_path(diag, p);
                return s;
            }
            plan.items.push_back(PlanItem{p, plan.save_name + "-" + wf.suffix, fst.size_bytes, fst.mtime});
        }

        const fs::path players = plan.source_dir / profile.players_dir;
        std::vector<storage::DirEntry> entries;
        s = storage::list_dir(players, "", &entries, diag);
        if (!is_ok(s) && s.code != StatusCode::NotFound) {
            return s;
        }
        for (const storage::DirEntry& e : entries) {
            if (e.is_dir || !ends_with(e.name, profile.player_extension) ||
                e.name.size() == profile.player_extension.size()) {
                continue;
            }
            const std::string stem = e.name.substr(0, e.name.size() - profile.player_extension.size());
            const fs::path p = players / e.name;
            storage::FileStat fst{};
            s = storage::stat_path(p, &fst);
            if (!is_ok(s)) {
                diag_path(diag, p);
                return s;
            }
            plan.items.push_back(PlanItem{p, plan.save_name + "-" + profile.players_dir + "-" + stem,
                                          fst.size_bytes, fst.mtime});
        }

        *out = std::move(plan);
        return ok_status();
    }

    fs::path backup_path_for(const fs::path& store_root, std::time_t when) {
        fs::path root = store_root;
        if (!root.has_filename()) {
            root = root.parent_path();
        }
        std::tm tm{};
        localtime_r(&when, &tm);
        char stamp[32];
        if (std::strftime(stamp, sizeof(stamp), "%Y%m%d%H%M%S", &tm) == 0) {
            stamp[0] = '\0';
        }
        return fs::path(root.string() + ".backup." + stamp);
    }

    Status create_container(const fs::path& store_root, const PlanItem& item, const ImportConfig& cfg,
                            ContainerEntry* out, Diagnostic* diag, const EventSink* events) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Import, StatusCode::Invalid);
        }

        Guid container_id{};
        Guid content_id{};
        Status s = guid_generate(&container_id);
        if (is_ok(s)) {
            s = guid_generate(&content_id);
        }
        if (!is_ok(s)) {
            return s;
        }

        const fs::path dir = storage::container_dir_path(store_root, container_id);

        ContainerEntry entry{};
        entry.name = codec::utf8_to_utf16(item.container_name);
        entry.name_again = entry.name;
        entry.seq = 1;
        entry.flags = entry_flags_for(kImportedEntryBaseFlags, !entry.cloud_id.empty());
        entry.id = container_id;
        entry.mtime = item.mtime;
        entry.size = item.size_bytes;

        if (cfg.dry_run) {
            emit(events, EventLevel::Info, EventKind::DryRun,
                 "would write container '" + item.container_name + "' to " + dir.string());
            *out = std::move(entry);
            return ok_status();
        }

        storage::FileStat st{};
        s = storage::stat_path(dir, &st);
        if (is_ok(s)) {
            diag_path(diag, dir);
            diag_set(diag, "id", "container directory already exists");
            return make_status(StatusDomain::Import, StatusCode::Conflict);
        }
        if (s.code != StatusCode::NotFound) {
            diag_path(diag, dir);
            return s;
        }

        ContentFileEntry blob{};
        blob.name = codec::utf8_to_utf16(cfg.profile.blob_name);
        blob.id = content_id;
        blob.source_path = item.source.string();
        ContainerFileList list{};
        list.seq = 1;
        list.files.push_back(std::move(blob));

        storage::WriteOptions opts{};
        opts.copy.chunk_bytes = cfg.chunk_bytes;
        opts.copy.cancel = cfg.cancel;
        opts.verify_after_write = cfg.verify_after_write;

        storage::WriteReport report{};
        s = storage::write_file_list(list, dir, opts, &report, diag, nullptr);
        if (!is_ok(s)) {
            return s;
        }
        // The copy is what the entry describes, even if the source changed since planning.
        entry.size = report.blobs.front().size_bytes;

        emit(events, EventLevel::Info, EventKind::ContainerWritten,
             "wrote container '" + item.container_name + "' to " + dir.string());
        *out = std::move(entry);
        return ok_status();
    }

    Status import_save(const fs::path& source, const fs::path& store_root, const ImportConfig& cfg,
                       ImportResult* result, Diagnostic* diag, const EventSink* events) noexcept {
        if (result == nullptr) {
            return make_status(StatusDomain::Import, StatusCode::Invalid);
        }
        *result = ImportResult{};
        result->store_root = store_root;
        result->dry_run = cfg.dry_run;

        Status s = plan_import(source, cfg.profile, &result->plan, diag, events);
        if (!is_ok(s)) {
            return s;
        }
        const ImportPlan& plan = result->plan;
        if (plan.items.empty()) {
            diag_path(diag, plan.source_dir);
            diag_set(diag, "source", "no " + cfg.profile.display_name + " save files found");
            return make_status(StatusDomain::Import, StatusCode::NotFound);
        }
        emit(events, EventLevel::Info, EventKind::Message,
             "preparing to import '" + plan.save_name + "' from " + plan.source_dir.string());

        ContainerIndex index{};
        s = storage::decode_index(store_root / storage::kIndexFileName, &index, diag);
        if (!is_ok(s)) {
            return s;
        }
        emit(events, EventLevel::Info, EventKind::IndexRead,
             "read " + (store_root / storage::kIndexFileName).string() + " (" +
                 std::to_string(index.containers.size()) + " entries)");

        const std::string prefix = plan.save_name + "-";
        for (const ContainerEntry& e : index.containers) {
            const std::string name = codec::utf16_to_utf8(e.name);
            if (name.compare(0, prefix.size(), prefix) == 0) {
                emit(events, EventLevel::Warning, EventKind::NameCollision,
                     "a save named '" + plan.save_name + "' may already exist (found " + name + ")");
            }
        }

        if (!cfg.dry_run && cfg.backup) {
            const fs::path backup = backup_path_for(store_root, std::time(nullptr));
            s = storage::copy_tree(store_root, backup, diag);
            if (!is_ok(s)) {
                return s;
            }
            result->backup_path = backup;
            emit(events, EventLevel::Info, EventKind::BackupCreated, "backup created at " + backup.string());
        }

        std::vector<ContainerEntry> batch;
        batch.reserve(plan.items.size());
        for (const PlanItem& item : plan.items) {
            if (cancelled(cfg)) {
                return make_status(StatusDomain::Import, StatusCode::Cancelled);
            }
            ContainerEntry entry{};
            s = create_container(store_root, item, cfg, &entry, diag, events);
            if (!is_ok(s)) {
                return s;
            }
            batch.push_back(std::move(entry));
        }

        if (cfg.dry_run) {
            s = merge::merge_new_entries(index, batch, filetime_now(), &result->index, &result->stats, events);
            if (!is_ok(s)) {
                return s;
            }
            emit(events, EventLevel::Info, EventKind::DryRun,
                 "would write " + (store_root / storage::kIndexFileName).string() + " (" +
                     std::to_string(result->index.containers.size()) + " entries)");
        } else {
            s = merge::commit_merge(index, batch, store_root, filetime_now(), &result->index, &result->stats, diag,
                                    events);
            if (!is_ok(s)) {
                return s;
            }
        }

        result->entries = std::move(batch);
        return ok_status();
    }
} // namespace wgstore::import
