#include "wgstore/codec/primitive.hpp"

#include <algorithm>
#include <cstddef>

namespace wgstore::codec {
    using wgstore::core::Reason;
    using wgstore::core::Status;
    using wgstore::core::StatusCode;
    using wgstore::core::StatusDomain;
    using wgstore::core::make_status;
    using wgstore::core::ok_status;

    namespace {
        template <typename T>
        [[nodiscard]] T get_le_lenient(ByteReader& r) noexcept {
            const u32 avail = reader_remaining(r);
            const u32 n = avail < sizeof(T) ? avail : static_cast<u32>(sizeof(T));
            T v = 0;
            for (u32 i = 0; i < n; ++i) {
                v |= static_cast<T>(r.in.data[r.pos + i]) << (8u * i);
            }
            r.pos += n;
            return v;
        }

        template <typename T>
        void put_le(std::vector<u8>& out, T v) {
            for (std::size_t i = 0; i < sizeof(T); ++i) {
                out.push_back(static_cast<u8>((v >> (8u * i)) & 0xffu));
            }
        }

        [[nodiscard]] Status truncated() noexcept {
            return make_status(StatusDomain::Codec, StatusCode::Corrupt, Reason::Truncated);
        }

        void decode_units(const u8* p, u32 chars, std::u16string* out) {
            out->resize(chars);
            for (u32 i = 0; i < chars; ++i) {
                (*out)[i] = static_cast<char16_t>(static_cast<core::u16>(p[i * 2]) |
                                                  (static_cast<core::u16>(p[i * 2 + 1]) << 8));
            }
        }

        void encode_units(std::vector<u8>& out, std::u16string_view s) {
            for (char16_t c : s) {
                const auto v = static_cast<core::u16>(c);
                out.push_back(static_cast<u8>(v & 0xffu));
                out.push_back(static_cast<u8>((v >> 8) & 0xffu));
            }
        }
    } // namespace

    u8 get_u8(ByteReader& r) noexcept {
        return get_le_lenient<u8>(r);
    }

    u32 get_u32_le(ByteReader& r) noexcept {
        return get_le_lenient<u32>(r);
    }

    u64 get_u64_le(ByteReader& r) noexcept {
        return get_le_lenient<u64>(r);
    }

    Status get_bytes(ByteReader& r, u8* out, u32 len) noexcept {
        if (len > 0 && out == nullptr) {
            return make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        if (reader_remaining(r) < len) {
            return truncated();
        }
        std::copy_n(r.in.data + r.pos, len, out);
        r.pos += len;
        return ok_status();
    }

    Status get_str16(ByteReader& r, std::u16string* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        const ByteReader saved = r;
        const u32 chars = get_u32_le(r);
        if (chars == 0) {
            out->clear();
            return ok_status();
        }
        const u64 need = static_cast<u64>(chars) * 2u;
        if (reader_remaining(r) < need) {
            r = saved;
            return truncated();
        }
        decode_units(r.in.data + r.pos, chars, out);
        r.pos += static_cast<u32>(need);
        return ok_status();
    }

    Status get_fixed_str16(ByteReader& r, u32 chars, std::u16string* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        const u64 need = static_cast<u64>(chars) * 2u;
        if (reader_remaining(r) < need) {
            return truncated();
        }
        decode_units(r.in.data + r.pos, chars, out);
        r.pos += static_cast<u32>(need);

        const auto last = out->find_last_not_of(u'\0');
        out->erase(last == std::u16string::npos ? 0 : last + 1);
        return ok_status();
    }

    void put_u8(std::vector<u8>& out, u8 v) {
        out.push_back(v);
    }

    void put_u32_le(std::vector<u8>& out, u32 v) {
        put_le(out, v);
    }

    void put_u64_le(std::vector<u8>& out, u64 v) {
        put_le(out, v);
    }

    void put_bytes(std::vector<u8>& out, const u8* data, std::size_t len) {
        if (len == 0) {
            return;
        }
        out.insert(out.end(), data, data + len);
    }

    void put_zeros(std::vector<u8>& out, std::size_t len) {
        out.insert(out.end(), len, u8{0});
    }

    void put_str16(std::vector<u8>& out, std::u16string_view s) {
        put_u32_le(out, static_cast<u32>(s.size()));
        encode_units(out, s);
    }

    void put_fixed_str16(std::vector<u8>& out, std::u16string_view s, u32 chars) {
        const std::u16string_view clipped = s.substr(0, std::min<std::size_t>(s.size(), chars));
        encode_units(out, clipped);
        put_zeros(out, (static_cast<std::size_t>(chars) - clipped.size()) * 2u);
    }
} // namespace wgstore::codec
