#include "wgstore/codec/file_list.hpp"

#include <limits>
#include <string>

#include "wgstore/codec/primitive.hpp"

namespace wgstore::codec {
    using namespace wgstore::core;

    namespace {
        void prefix_field(Diagnostic* diag, std::size_t i, const char* field) {
            if (diag == nullptr) {
                return;
            }
            diag->field = "files[" + std::to_string(i) + "]." + field;
        }
    } // namespace

    Status file_list_decode(ByteReader& r, u32 seq, const BlobSource& blobs, ContainerFileList* out,
                            Diagnostic* diag) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Codec, StatusCode::Invalid);
        }

        const u32 version = get_u32_le(r);
        if (version != kFileListVersion) {
            diag_set(diag, "version", kFileListVersion, version);
            return make_status(StatusDomain::Codec, StatusCode::Unsupported, Reason::UnsupportedVersion);
        }
        const u32 count = get_u32_le(r);

        ContainerFileList list{};
        list.seq = seq;
        const u32 plausible = reader_remaining(r) / kFileListEntryBytes;
        list.files.reserve(count < plausible ? count : plausible);

        for (u32 i = 0; i < count; ++i) {
            ContentFileEntry f{};
            Status s = get_fixed_str16(r, static_cast<u32>(kFileNameChars), &f.name);
            if (!is_ok(s)) {
                prefix_field(diag, i, "name");
                return s;
            }
            s = get_bytes(r, f.reserved.data(), static_cast<u32>(f.reserved.size()));
            if (!is_ok(s)) {
                prefix_field(diag, i, "reserved");
                return s;
            }
            s = get_bytes(r, f.id.b.data(), static_cast<u32>(f.id.b.size()));
            if (!is_ok(s)) {
                prefix_field(diag, i, "id");
                return s;
            }

            if (blobs.load != nullptr) {
                s = blobs.load(blobs.ctx, f.id, &f.data, diag);
                if (!is_ok(s)) {
                    if (diag != nullptr && diag->field.empty()) {
                        prefix_field(diag, i, "id");
                    }
                    return s;
                }
            }
            list.files.push_back(std::move(f));
        }

        *out = std::move(list);
        return ok_status();
    }

    Status file_list_encode_manifest(const ContainerFileList& list, std::vector<u8>* out, Diagnostic* diag) {
        if (out == nullptr) {
            return make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        if (list.files.size() > std::numeric_limits<u32>::max()) {
            diag_set(diag, "count", std::numeric_limits<u32>::max(), list.files.size());
            return make_status(StatusDomain::Codec, StatusCode::Invalid, Reason::SizeLimit);
        }

        std::vector<u8> buf;
        buf.reserve(kFileListHeaderBytes + list.files.size() * kFileListEntryBytes);
        put_u32_le(buf, kFileListVersion);
        put_u32_le(buf, static_cast<u32>(list.files.size()));
        for (const ContentFileEntry& f : list.files) {
            put_fixed_str16(buf, f.name, static_cast<u32>(kFileNameChars));
            put_zeros(buf, f.reserved.size());
            put_bytes(buf, f.id.b.data(), f.id.b.size());
        }

        *out = std::move(buf);
        return ok_status();
    }
} // namespace wgstore::codec
