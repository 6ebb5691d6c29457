#include "wgstore/merge/merge.hpp"

#include <string>
#include <unordered_map>

#include "wgstore/codec/utf16.hpp"
#include "wgstore/storage/store.hpp"

namespace wgstore::merge {
    using namespace wgstore::core;

    namespace {
        using LastSeen = std::unordered_map<std::u16string, std::size_t>;

        [[nodiscard]] std::string quoted(const std::u16string& name) {
            return "'" + codec::utf16_to_utf8(name) + "'";
        }
    } // namespace

    Status merge_new_entries(const ContainerIndex& index, const std::vector<ContainerEntry>& batch, FileTime now,
                             ContainerIndex* out, MergeStats* stats, const EventSink* events) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Merge, StatusCode::Invalid);
        }

        LastSeen last_in_batch;
        for (std::size_t i = 0; i < batch.size(); ++i) {
            last_in_batch[batch[i].name] = i;
        }

        LastSeen last_existing;
        for (std::size_t i = 0; i < index.containers.size(); ++i) {
            last_existing[index.containers[i].name] = i;
        }

        MergeStats st{};
        ContainerIndex merged{};
        merged.version = index.version;
        merged.flag1 = index.flag1;
        merged.package_name = index.package_name;
        merged.flag2 = index.flag2;
        merged.index_id = index.index_id;
        merged.reserved = index.reserved;
        merged.mtime = now;
        merged.containers.reserve(index.containers.size() + batch.size());

        for (std::size_t i = 0; i < index.containers.size(); ++i) {
            const ContainerEntry& e = index.containers[i];
            if (last_in_batch.count(e.name) != 0) {
                st.replaced++;
                emit(events, EventLevel::Info, EventKind::EntryReplaced, "replacing existing entry " + quoted(e.name));
                continue;
            }
            if (last_existing[e.name] != i) {
                st.duplicates_dropped++;
                emit(events, EventLevel::Warning, EventKind::DuplicateDropped,
                     "dropping earlier duplicate of " + quoted(e.name) + " found in the index");
                continue;
            }
            merged.containers.push_back(e);
            st.kept++;
        }

        for (std::size_t i = 0; i < batch.size(); ++i) {
            const ContainerEntry& e = batch[i];
            if (last_in_batch[e.name] != i) {
                st.duplicates_dropped++;
                emit(events, EventLevel::Warning, EventKind::DuplicateDropped,
                     "batch names " + quoted(e.name) + " more than once; keeping the last");
                continue;
            }
            merged.containers.push_back(e);
            st.appended++;
        }

        *out = std::move(merged);
        if (stats != nullptr) {
            *stats = st;
        }
        return ok_status();
    }

    Status commit_merge(const ContainerIndex& index, const std::vector<ContainerEntry>& batch,
                        const std::filesystem::path& store_root, FileTime now, ContainerIndex* out,
                        MergeStats* stats, Diagnostic* diag, const EventSink* events) noexcept {
        ContainerIndex merged{};
        Status s = merge_new_entries(index, batch, now, &merged, stats, events);
        if (!is_ok(s)) {
            return s;
        }
        s = storage::write_index(merged, store_root, diag, events);
        if (!is_ok(s)) {
            return s;
        }
        if (out != nullptr) {
            *out = std::move(merged);
        }
        return ok_status();
    }
} // namespace wgstore::merge
