#include "wgstore/storage/store.hpp"

#include <charconv>
#include <limits>
#include <set>
#include <unistd.h>

#include "wgstore/codec/container_index.hpp"
#include "wgstore/codec/file_list.hpp"
#include "wgstore/codec/utf16.hpp"
#include "wgstore/core/guid.hpp"
#include "wgstore/storage/hashing.hpp"

namespace wgstore::storage {
    using namespace wgstore::core;

    namespace {
        void diag_path(Diagnostic* diag, const std::filesystem::path& p) {
            if (diag != nullptr) {
                diag->path = p.string();
            }
        }

        void diag_path_if_unset(Diagnostic* diag, const std::filesystem::path& p) {
            if (diag != nullptr && diag->path.empty()) {
                diag->path = p.string();
            }
        }

        [[nodiscard]] Status read_small_file(const std::filesystem::path& path, std::vector<u8>* out,
                                             Diagnostic* diag) noexcept {
            Status s = read_file_all(path, out, diag);
            if (!is_ok(s)) {
                return s;
            }
            if (out->size() > std::numeric_limits<u32>::max()) {
                diag_path(diag, path);
                diag_set(diag, "size", std::numeric_limits<u32>::max(), out->size());
                return make_status(StatusDomain::Storage, StatusCode::Unsupported, Reason::SizeLimit);
            }
            return ok_status();
        }

        [[nodiscard]] codec::BufferView view_of(const std::vector<u8>& bytes) noexcept {
            return codec::BufferView{bytes.data(), static_cast<u32>(bytes.size())};
        }

        [[nodiscard]] Status missing_blob(const std::filesystem::path& blob_path, Diagnostic* diag) {
            diag_path(diag, blob_path);
            if (diag != nullptr) {
                diag->detail = "content blob does not exist";
            }
            return make_status(StatusDomain::Storage, StatusCode::NotFound, Reason::MissingContentBlob);
        }

        // Blob source reading whole files out of one container directory.
        struct DirBlobs {
            const std::filesystem::path* dir{nullptr};
        };

        Status load_dir_blob(void* ctx, const Guid& id, std::vector<u8>* out, Diagnostic* diag) {
            const auto* blobs = static_cast<const DirBlobs*>(ctx);
            const std::filesystem::path blob_path = *blobs->dir / guid_to_dir_name(id);
            const Status s = read_file_all(blob_path, out, diag);
            if (s.code == StatusCode::NotFound) {
                return missing_blob(blob_path, diag);
            }
            return s;
        }

        // Blob source used by verification: stats each blob and records its
        // size instead of reading it.
        struct StatBlobs {
            const std::filesystem::path* dir{nullptr};
            std::vector<u64> sizes;
        };

        Status stat_dir_blob(void* ctx, const Guid& id, std::vector<u8>* out, Diagnostic* diag) {
            auto* blobs = static_cast<StatBlobs*>(ctx);
            const std::filesystem::path blob_path = *blobs->dir / guid_to_dir_name(id);
            out->clear();
            FileStat st{};
            const Status s = stat_path(blob_path, &st);
            if (s.code == StatusCode::NotFound || (is_ok(s) && st.is_dir)) {
                return missing_blob(blob_path, diag);
            }
            if (!is_ok(s)) {
                diag_path(diag, blob_path);
                return s;
            }
            blobs->sizes.push_back(st.size_bytes);
            return ok_status();
        }

        [[nodiscard]] Status verify_blob(const std::filesystem::path& blob_path, const Hash256& expected,
                                         Diagnostic* diag) {
            Hash256 actual{};
            const Status s = hash_file(blob_path.c_str(), &actual);
            if (!is_ok(s)) {
                diag_path(diag, blob_path);
                return s;
            }
            if (actual != expected) {
                diag_path(diag, blob_path);
                diag_set(diag, "digest", "expected " + hash_to_hex(expected) + ", got " + hash_to_hex(actual));
                return make_status(StatusDomain::Storage, StatusCode::Corrupt, Reason::DigestMismatch);
            }
            return ok_status();
        }
    } // namespace

    Status decode_index(const std::filesystem::path& path, ContainerIndex* out, Diagnostic* diag) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        std::vector<u8> bytes;
        Status s = read_small_file(path, &bytes, diag);
        if (s.code == StatusCode::NotFound) {
            diag_path(diag, path);
            return make_status(StatusDomain::Storage, StatusCode::NotFound, Reason::MissingIndex);
        }
        if (!is_ok(s)) {
            return s;
        }

        s = codec::index_decode(view_of(bytes), out, diag);
        if (!is_ok(s)) {
            diag_path(diag, path);
        }
        return s;
    }

    Status write_index(const ContainerIndex& index, const std::filesystem::path& directory, Diagnostic* diag,
                       const EventSink* events) noexcept {
        std::vector<u8> bytes;
        Status s = codec::index_encode(index, &bytes, diag);
        if (!is_ok(s)) {
            return s;
        }

        const std::filesystem::path path = directory / kIndexFileName;
        s = write_file_all(path, bytes.data(), bytes.size(), diag);
        if (!is_ok(s)) {
            return s;
        }
        emit(events, EventLevel::Info, EventKind::IndexWritten,
             "wrote " + path.string() + " (" + std::to_string(index.containers.size()) + " entries)");
        return ok_status();
    }

    std::filesystem::path container_dir_path(const std::filesystem::path& store_root, const Guid& id) {
        return store_root / guid_to_dir_name(id);
    }

    Status parse_manifest_name(const std::string& file_name, u32* seq) noexcept {
        if (seq == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        const std::string prefix = kManifestPrefix;
        if (file_name.size() <= prefix.size() || file_name.compare(0, prefix.size(), prefix) != 0) {
            return make_status(StatusDomain::Storage, StatusCode::Corrupt, Reason::BadManifestName);
        }

        const char* first = file_name.data() + prefix.size();
        const char* last = file_name.data() + file_name.size();
        u32 value = 0;
        const auto [ptr, ec] = std::from_chars(first, last, value, 10);
        if (ec != std::errc{} || ptr != last) {
            return make_status(StatusDomain::Storage, StatusCode::Corrupt, Reason::BadManifestName);
        }
        *seq = value;
        return ok_status();
    }

    Status find_manifest(const std::filesystem::path& container_dir, std::filesystem::path* manifest_path, u32* seq,
                         Diagnostic* diag) noexcept {
        if (manifest_path == nullptr || seq == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        std::vector<DirEntry> entries;
        Status s = list_dir(container_dir, "container\\..*", &entries, diag);
        if (s.code == StatusCode::NotFound) {
            diag_path(diag, container_dir);
            return make_status(StatusDomain::Storage, StatusCode::NotFound, Reason::MissingContainerDir);
        }
        if (!is_ok(s)) {
            return s;
        }

        bool found = false;
        u32 best = 0;
        std::string best_name;
        for (const DirEntry& e : entries) {
            if (e.is_dir) {
                continue;
            }
            u32 candidate = 0;
            s = parse_manifest_name(e.name, &candidate);
            if (!is_ok(s)) {
                diag_path(diag, container_dir / e.name);
                diag_set(diag, "seq", "manifest suffix is not a decimal number");
                return s;
            }
            if (!found || candidate > best) {
                best = candidate;
                best_name = e.name;
                found = true;
            }
        }

        if (!found) {
            diag_path(diag, container_dir);
            return make_status(StatusDomain::Storage, StatusCode::NotFound, Reason::MissingManifest);
        }
        *seq = best;
        *manifest_path = container_dir / best_name;
        return ok_status();
    }

    Status decode_file_list(const std::filesystem::path& path, u32 seq, ContainerFileList* out,
                            Diagnostic* diag) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        std::vector<u8> bytes;
        Status s = read_small_file(path, &bytes, diag);
        if (s.code == StatusCode::NotFound) {
            diag_path(diag, path);
            return make_status(StatusDomain::Storage, StatusCode::NotFound, Reason::MissingManifest);
        }
        if (!is_ok(s)) {
            return s;
        }

        codec::ByteReader r{view_of(bytes), 0};
        s = decode_file_list(r, path.parent_path(), seq, out, diag);
        if (!is_ok(s)) {
            diag_path_if_unset(diag, path);
        }
        return s;
    }

    Status decode_file_list(codec::ByteReader& r, const std::filesystem::path& directory, u32 seq,
                            ContainerFileList* out, Diagnostic* diag) noexcept {
        DirBlobs blobs{&directory};
        const codec::BlobSource source{&load_dir_blob, &blobs};
        return codec::file_list_decode(r, seq, source, out, diag);
    }

    Status write_file_list(const ContainerFileList& list, const std::filesystem::path& directory,
                           const WriteOptions& opts, WriteReport* report, Diagnostic* diag,
                           const EventSink* events) noexcept {
        std::vector<u8> manifest;
        Status s = codec::file_list_encode_manifest(list, &manifest, diag);
        if (!is_ok(s)) {
            return s;
        }

        s = make_dirs(directory, diag);
        if (!is_ok(s)) {
            return s;
        }

        WriteReport rep{};
        rep.blobs.reserve(list.files.size());
        u64 total_bytes = 0;

        for (std::size_t i = 0; i < list.files.size(); ++i) {
            const ContentFileEntry& f = list.files[i];
            if (guid_is_nil(f.id)) {
                diag_set(diag, "id", "files[" + std::to_string(i) + "] has a nil identifier");
                return make_status(StatusDomain::Storage, StatusCode::Invalid);
            }

            const std::filesystem::path blob_path = directory / guid_to_dir_name(f.id);
            WrittenBlob blob{};
            blob.id = f.id;

            if (!f.source_path.empty()) {
                CopyResult copied{};
                s = copy_file_chunked(f.source_path, blob_path, opts.copy, &copied, diag);
                if (!is_ok(s)) {
                    return s;
                }
                blob.size_bytes = copied.bytes_copied;
                blob.digest = copied.digest;
            } else {
                if (opts.copy.cancel != nullptr && *opts.copy.cancel != 0) {
                    return make_status(StatusDomain::Storage, StatusCode::Cancelled);
                }
                if (f.data.size() > std::numeric_limits<u32>::max()) {
                    diag_path(diag, blob_path);
                    diag_set(diag, "data", std::numeric_limits<u32>::max(), f.data.size());
                    return make_status(StatusDomain::Storage, StatusCode::Unsupported, Reason::SizeLimit);
                }
                s = write_file_all(blob_path, f.data.data(), f.data.size(), diag);
                if (!is_ok(s)) {
                    unlink(blob_path.c_str());
                    return s;
                }
                s = hash_compute(view_of(f.data), &blob.digest);
                if (!is_ok(s)) {
                    return s;
                }
                blob.size_bytes = f.data.size();
            }

            if (opts.verify_after_write) {
                s = verify_blob(blob_path, blob.digest, diag);
                if (!is_ok(s)) {
                    return s;
                }
            }
            total_bytes += blob.size_bytes;
            rep.blobs.push_back(blob);
        }

        // The manifest goes last so it never names a blob that is not on disk.
        rep.manifest_path = directory / (std::string(kManifestPrefix) + std::to_string(list.seq));
        s = write_file_all(rep.manifest_path, manifest.data(), manifest.size(), diag);
        if (!is_ok(s)) {
            return s;
        }

        emit(events, EventLevel::Info, EventKind::ContainerWritten,
             "wrote " + directory.string() + " (" + std::to_string(list.files.size()) + " files, " +
                 std::to_string(total_bytes) + " bytes)");
        if (report != nullptr) {
            *report = std::move(rep);
        }
        return ok_status();
    }

    Status read_container(const std::filesystem::path& store_root, const ContainerEntry& entry,
                          ContainerFileList* out, Diagnostic* diag) noexcept {
        std::filesystem::path manifest;
        u32 seq = 0;
        const Status s = find_manifest(container_dir_path(store_root, entry.id), &manifest, &seq, diag);
        if (!is_ok(s)) {
            return s;
        }
        return decode_file_list(manifest, seq, out, diag);
    }

    Status verify_store(const std::filesystem::path& store_root, VerifyReport* report, Diagnostic* diag) noexcept {
        if (report == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        *report = VerifyReport{};

        ContainerIndex index{};
        Status s = decode_index(store_root / kIndexFileName, &index, diag);
        if (!is_ok(s)) {
            return s;
        }

        std::set<std::string> referenced;
        for (const ContainerEntry& entry : index.containers) {
            report->entries_checked++;
            const std::string dir_name = guid_to_dir_name(entry.id);
            referenced.insert(dir_name);

            VerifyProblem problem{};
            problem.container = codec::utf16_to_utf8(entry.name);

            std::filesystem::path manifest;
            u32 seq = 0;
            s = find_manifest(store_root / dir_name, &manifest, &seq, &problem.diag);
            if (!is_ok(s)) {
                problem.status = s;
                report->problems.push_back(std::move(problem));
                continue;
            }
            if (seq != entry.seq) {
                problem.status = make_status(StatusDomain::Storage, StatusCode::Corrupt, Reason::SeqMismatch);
                problem.diag.path = manifest.string();
                diag_set(&problem.diag, "seq", entry.seq, seq);
                report->problems.push_back(std::move(problem));
                continue;
            }

            std::vector<u8> bytes;
            s = read_small_file(manifest, &bytes, &problem.diag);
            if (!is_ok(s)) {
                problem.status = s;
                report->problems.push_back(std::move(problem));
                continue;
            }

            const std::filesystem::path dir = manifest.parent_path();
            StatBlobs blobs{&dir, {}};
            const codec::BlobSource source{&stat_dir_blob, &blobs};
            ContainerFileList list{};
            codec::ByteReader r{view_of(bytes), 0};
            s = codec::file_list_decode(r, seq, source, &list, &problem.diag);
            report->blobs_checked += static_cast<u32>(blobs.sizes.size());
            if (!is_ok(s)) {
                diag_path_if_unset(&problem.diag, manifest);
                problem.status = s;
                report->problems.push_back(std::move(problem));
                continue;
            }

            if (blobs.sizes.size() == 1 && blobs.sizes[0] != entry.size) {
                problem.status = make_status(StatusDomain::Storage, StatusCode::Corrupt, Reason::SizeMismatch);
                problem.diag.path = (dir / guid_to_dir_name(list.files[0].id)).string();
                diag_set(&problem.diag, "size", entry.size, blobs.sizes[0]);
                report->problems.push_back(std::move(problem));
            }
        }

        std::vector<DirEntry> dirs;
        s = list_dir(store_root, kGuidDirPattern, &dirs, diag);
        if (!is_ok(s)) {
            return s;
        }
        for (const DirEntry& d : dirs) {
            if (d.is_dir && referenced.count(d.name) == 0) {
                report->orphan_dirs.push_back(d.name);
            }
        }
        return ok_status();
    }
} // namespace wgstore::storage
