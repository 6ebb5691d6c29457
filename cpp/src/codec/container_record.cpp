#include "wgstore/codec/container_record.hpp"

#include "wgstore/codec/primitive.hpp"
#include "wgstore/codec/utf16.hpp"

namespace wgstore::codec {
    using namespace wgstore::core;

    namespace {
        [[nodiscard]] Status read_str_field(ByteReader& r, std::u16string* out, const char* field, Diagnostic* diag) {
            const Status s = get_str16(r, out);
            if (!is_ok(s)) {
                diag_set(diag, field, "string runs past end of data");
            }
            return s;
        }

        [[nodiscard]] Status check_invariants(const ContainerEntry& e, StatusDomain domain, StatusCode code,
                                              Diagnostic* diag) {
            if (e.name != e.name_again) {
                diag_set(diag, "name_again",
                         "'" + utf16_to_utf8(e.name) + "' != '" + utf16_to_utf8(e.name_again) + "'");
                return make_status(domain, code, Reason::NameMismatch);
            }
            const bool cloud_bit = (e.flags & kEntryFlagCloudSync) != 0;
            if (cloud_bit != !e.cloud_id.empty()) {
                diag_set(diag, "flags",
                         "cloud bit " + std::string(cloud_bit ? "set" : "clear") + " but cloud_id is " +
                             (e.cloud_id.empty() ? "empty" : "'" + utf16_to_utf8(e.cloud_id) + "'"));
                return make_status(domain, code, Reason::FlagCloudMismatch);
            }
            if (e.reserved != 0) {
                diag_set(diag, "reserved", 0, e.reserved);
                return make_status(domain, code, Reason::ReservedNonZero);
            }
            return ok_status();
        }
    } // namespace

    Status record_validate(const ContainerEntry& e, Diagnostic* diag) noexcept {
        return check_invariants(e, StatusDomain::Codec, StatusCode::Invalid, diag);
    }

    Status record_decode(ByteReader& r, ContainerEntry* out, Diagnostic* diag) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Codec, StatusCode::Invalid);
        }

        ContainerEntry e{};
        Status s = read_str_field(r, &e.name, "name", diag);
        if (!is_ok(s)) return s;
        s = read_str_field(r, &e.name_again, "name_again", diag);
        if (!is_ok(s)) return s;
        if (e.name != e.name_again) {
            return check_invariants(e, StatusDomain::Codec, StatusCode::Corrupt, diag);
        }

        s = read_str_field(r, &e.cloud_id, "cloud_id", diag);
        if (!is_ok(s)) return s;
        e.seq = get_u8(r);
        e.flags = get_u32_le(r);
        const bool cloud_bit = (e.flags & kEntryFlagCloudSync) != 0;
        if (cloud_bit != !e.cloud_id.empty()) {
            return check_invariants(e, StatusDomain::Codec, StatusCode::Corrupt, diag);
        }

        s = get_bytes(r, e.id.b.data(), static_cast<u32>(e.id.b.size()));
        if (!is_ok(s)) {
            diag_set(diag, "id", "identifier runs past end of data");
            return s;
        }
        e.mtime = FileTime{get_u64_le(r)};
        e.reserved = get_u64_le(r);
        if (e.reserved != 0) {
            return check_invariants(e, StatusDomain::Codec, StatusCode::Corrupt, diag);
        }
        e.size = get_u64_le(r);

        *out = std::move(e);
        return ok_status();
    }

    Status record_encode(const ContainerEntry& e, std::vector<u8>& out, Diagnostic* diag) {
        const Status s = record_validate(e, diag);
        if (!is_ok(s)) {
            return s;
        }

        out.reserve(out.size() + record_encoded_bytes(e));
        put_str16(out, e.name);
        put_str16(out, e.name_again);
        put_str16(out, e.cloud_id);
        put_u8(out, e.seq);
        put_u32_le(out, e.flags);
        put_bytes(out, e.id.b.data(), e.id.b.size());
        put_u64_le(out, e.mtime.ticks);
        put_u64_le(out, 0);
        put_u64_le(out, e.size);
        return ok_status();
    }

    u32 record_encoded_bytes(const ContainerEntry& e) noexcept {
        return str16_encoded_bytes(e.name) + str16_encoded_bytes(e.name_again) + str16_encoded_bytes(e.cloud_id) +
               kRecordFixedBytes;
    }
} // namespace wgstore::codec
