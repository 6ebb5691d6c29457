#include "wgstore/codec/utf16.hpp"

#include <cstdint>

namespace wgstore::codec {
    namespace {
        constexpr char32_t kReplacement = 0xFFFD;

        void append_utf8(std::string& out, char32_t cp) {
            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        void append_utf16(std::u16string& out, char32_t cp) {
            if (cp >= 0x10000) {
                cp -= 0x10000;
                out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
                out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
            } else {
                out.push_back(static_cast<char16_t>(cp));
            }
        }

        [[nodiscard]] bool is_high(char16_t c) noexcept { return c >= 0xD800 && c <= 0xDBFF; }
        [[nodiscard]] bool is_low(char16_t c) noexcept { return c >= 0xDC00 && c <= 0xDFFF; }
    } // namespace

    std::string utf16_to_utf8(std::u16string_view s) {
        std::string out;
        out.reserve(s.size());
        for (std::size_t i = 0; i < s.size(); ++i) {
            const char16_t c = s[i];
            if (is_high(c) && i + 1 < s.size() && is_low(s[i + 1])) {
                const char32_t cp = 0x10000 + ((static_cast<char32_t>(c) - 0xD800) << 10) +
                                    (static_cast<char32_t>(s[i + 1]) - 0xDC00);
                append_utf8(out, cp);
                ++i;
            } else if (is_high(c) || is_low(c)) {
                append_utf8(out, kReplacement);
            } else {
                append_utf8(out, c);
            }
        }
        return out;
    }

    std::u16string utf8_to_utf16(std::string_view s) {
        std::u16string out;
        out.reserve(s.size());
        std::size_t i = 0;
        while (i < s.size()) {
            const auto b0 = static_cast<std::uint8_t>(s[i]);
            std::size_t len = 0;
            char32_t cp = 0;
            if (b0 < 0x80) {
                len = 1;
                cp = b0;
            } else if ((b0 & 0xE0) == 0xC0) {
                len = 2;
                cp = b0 & 0x1F;
            } else if ((b0 & 0xF0) == 0xE0) {
                len = 3;
                cp = b0 & 0x0F;
            } else if ((b0 & 0xF8) == 0xF0) {
                len = 4;
                cp = b0 & 0x07;
            } else {
                append_utf16(out, kReplacement);
                ++i;
                continue;
            }

            if (i + len > s.size()) {
                append_utf16(out, kReplacement);
                break;
            }
            bool ok = true;
            for (std::size_t k = 1; k < len; ++k) {
                const auto b = static_cast<std::uint8_t>(s[i + k]);
                if ((b & 0xC0) != 0x80) {
                    ok = false;
                    break;
                }
                cp = (cp << 6) | (b & 0x3F);
            }
            if (!ok || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                append_utf16(out, kReplacement);
                ++i;
                continue;
            }
            append_utf16(out, cp);
            i += len;
        }
        return out;
    }
} // namespace wgstore::codec
