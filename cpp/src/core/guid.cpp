#include "wgstore/core/guid.hpp"

#include <cstddef>

#include <sodium.h>

namespace wgstore::core {
    namespace {
        constexpr char kHexUpper[] = "0123456789ABCDEF";
        constexpr char kHexLower[] = "0123456789abcdef";

        // bytes_le position i holds canonical byte kDirOrder[i].
        constexpr std::size_t kDirOrder[16] = {3, 2, 1, 0, 5, 4, 7, 6, 8, 9, 10, 11, 12, 13, 14, 15};

        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        [[nodiscard]] bool parse_hex_byte(char hi, char lo, u8* out) noexcept {
            const int h = hex_value(hi);
            const int l = hex_value(lo);
            if (h < 0 || l < 0) {
                return false;
            }
            *out = static_cast<u8>((h << 4) | l);
            return true;
        }

        Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return make_status(StatusDomain::External, StatusCode::Unavailable);
            }
            return ok_status();
        }
    } // namespace

    std::string guid_to_dir_name(const Guid& g) {
        std::string out;
        out.reserve(kGuidDirNameChars);
        for (std::size_t i = 0; i < 16; ++i) {
            const u8 v = g.b[kDirOrder[i]];
            out.push_back(kHexUpper[(v >> 4) & 0xF]);
            out.push_back(kHexUpper[v & 0xF]);
        }
        return out;
    }

    bool guid_from_dir_name(std::string_view name, Guid* out) noexcept {
        if (out == nullptr || name.size() != kGuidDirNameChars) {
            return false;
        }
        Guid g{};
        for (std::size_t i = 0; i < 16; ++i) {
            u8 v = 0;
            if (!parse_hex_byte(name[i * 2], name[i * 2 + 1], &v)) {
                return false;
            }
            g.b[kDirOrder[i]] = v;
        }
        *out = g;
        return true;
    }

    std::string guid_to_string(const Guid& g) {
        std::string out;
        out.reserve(36);
        for (std::size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out.push_back('-');
            }
            out.push_back(kHexLower[(g.b[i] >> 4) & 0xF]);
            out.push_back(kHexLower[g.b[i] & 0xF]);
        }
        return out;
    }

    bool guid_from_string(std::string_view text, Guid* out) noexcept {
        if (out == nullptr || text.size() != 36) {
            return false;
        }
        Guid g{};
        std::size_t pos = 0;
        for (std::size_t i = 0; i < 16; ++i) {
            if (pos == 8 || pos == 13 || pos == 18 || pos == 23) {
                if (text[pos] != '-') {
                    return false;
                }
                ++pos;
            }
            if (!parse_hex_byte(text[pos], text[pos + 1], &g.b[i])) {
                return false;
            }
            pos += 2;
        }
        *out = g;
        return true;
    }

    Status guid_generate(Guid* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        const Status init = ensure_sodium();
        if (!is_ok(init)) {
            return init;
        }

        Guid g{};
        randombytes_buf(g.b.data(), g.b.size());
        g.b[6] = static_cast<u8>((g.b[6] & 0x0Fu) | 0x40u); // version 4
        g.b[8] = static_cast<u8>((g.b[8] & 0x3Fu) | 0x80u); // RFC 4122 variant
        *out = g;
        return ok_status();
    }
} // namespace wgstore::core
