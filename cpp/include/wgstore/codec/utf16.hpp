#pragma once

#include <string>
#include <string_view>

namespace wgstore::codec {

    // Unpaired surrogates become U+FFFD; the on-disk model keeps the raw units.
    [[nodiscard]] std::string utf16_to_utf8(std::u16string_view s);

    // Invalid UTF-8 sequences become U+FFFD.
    [[nodiscard]] std::u16string utf8_to_utf16(std::string_view s);

} // namespace wgstore::codec
