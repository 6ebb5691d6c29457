#pragma once

#include <string>
#include <string_view>

#include "wgstore/core/errors.hpp"
#include "wgstore/core/types.hpp"

namespace wgstore::core {

    inline constexpr std::size_t kGuidDirNameChars = 32;

    // Directory / blob file name for an identifier: the "bytes_le" order (first
    // three groups byte-reversed, last 8 bytes as-is) as 32 uppercase hex digits.
    // This is NOT the canonical string with the dashes removed.
    [[nodiscard]] std::string guid_to_dir_name(const Guid& g);

    // Inverse of guid_to_dir_name. Accepts upper or lower case hex.
    [[nodiscard]] bool guid_from_dir_name(std::string_view name, Guid* out) noexcept;

    // Canonical lowercase 8-4-4-4-12 form, display only.
    [[nodiscard]] std::string guid_to_string(const Guid& g);

    [[nodiscard]] bool guid_from_string(std::string_view text, Guid* out) noexcept;

    // Random version-4 identifier from libsodium's CSPRNG.
    Status guid_generate(Guid* out) noexcept;

} // namespace wgstore::core
