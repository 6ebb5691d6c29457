#include "wgstore/codec/container_index.hpp"

#include <limits>
#include <string>

#include "wgstore/codec/container_record.hpp"
#include "wgstore/codec/primitive.hpp"

namespace wgstore::codec {
    using namespace wgstore::core;

    namespace {
        void prefix_field(Diagnostic* diag, std::size_t i) {
            if (diag == nullptr) {
                return;
            }
            std::string f = "containers[" + std::to_string(i) + "]";
            if (!diag->field.empty()) {
                f += '.';
                f += diag->field;
            }
            diag->field = std::move(f);
        }
    } // namespace

    Status index_decode(BufferView in, ContainerIndex* out, Diagnostic* diag) noexcept {
        if (in.len > 0 && in.data == nullptr) {
            return make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        ByteReader r{in, 0};
        return index_decode(r, out, diag);
    }

    Status index_decode(ByteReader& r, ContainerIndex* out, Diagnostic* diag) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Codec, StatusCode::Invalid);
        }

        const u32 version = get_u32_le(r);
        if (version != kContainerIndexVersion) {
            diag_set(diag, "version", kContainerIndexVersion, version);
            return make_status(StatusDomain::Codec, StatusCode::Unsupported, Reason::UnsupportedVersion);
        }

        ContainerIndex idx{};
        idx.version = version;
        const u32 count = get_u32_le(r);
        idx.flag1 = get_u32_le(r);
        Status s = get_str16(r, &idx.package_name);
        if (!is_ok(s)) {
            diag_set(diag, "package_name", "string runs past end of data");
            return s;
        }
        idx.mtime = FileTime{get_u64_le(r)};
        idx.flag2 = get_u32_le(r);
        s = get_str16(r, &idx.index_id);
        if (!is_ok(s)) {
            diag_set(diag, "index_id", "string runs past end of data");
            return s;
        }
        idx.reserved = get_u64_le(r);

        // count comes from the file; each record needs at least this many bytes,
        // so the reservation is bounded by the input size.
        const u32 min_record = 3 * 4 + kRecordFixedBytes;
        const u32 plausible = reader_remaining(r) / min_record;
        idx.containers.reserve(count < plausible ? count : plausible);

        for (u32 i = 0; i < count; ++i) {
            ContainerEntry e{};
            s = record_decode(r, &e, diag);
            if (!is_ok(s)) {
                prefix_field(diag, i);
                return s;
            }
            idx.containers.push_back(std::move(e));
        }

        *out = std::move(idx);
        return ok_status();
    }

    Status index_encode(const ContainerIndex& index, std::vector<u8>* out, Diagnostic* diag) {
        if (out == nullptr) {
            return make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        if (index.containers.size() > std::numeric_limits<u32>::max()) {
            diag_set(diag, "count", std::numeric_limits<u32>::max(), index.containers.size());
            return make_status(StatusDomain::Codec, StatusCode::Invalid, Reason::SizeLimit);
        }

        std::vector<u8> buf;
        put_u32_le(buf, kContainerIndexVersion);
        put_u32_le(buf, static_cast<u32>(index.containers.size()));
        put_u32_le(buf, index.flag1);
        put_str16(buf, index.package_name);
        put_u64_le(buf, index.mtime.ticks);
        put_u32_le(buf, index.flag2);
        put_str16(buf, index.index_id);
        put_u64_le(buf, index.reserved);

        for (std::size_t i = 0; i < index.containers.size(); ++i) {
            const Status s = record_encode(index.containers[i], buf, diag);
            if (!is_ok(s)) {
                prefix_field(diag, i);
                return s;
            }
        }

        *out = std::move(buf);
        return ok_status();
    }
} // namespace wgstore::codec
