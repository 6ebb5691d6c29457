#pragma once

#include <type_traits>

#include "wgstore/core/errors.hpp"
#include "wgstore/core/types.hpp"

namespace wgstore::cli {
    using u8 = wgstore::core::u8;
    using u32 = wgstore::core::u32;
    using i64 = wgstore::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Store = 1,
        Wgs = 2,
        DryRun = 3,
        NoBackup = 4,
        NoVerify = 5,
        Seq = 6,
        Help = 7,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned storage; parsing fails once len would exceed cap.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Options may appear anywhere among the positional arguments; positionals
    // are collected in order into `positionals` (same cap rule). "--" ends
    // option parsing and makes the rest positional. On failure *bad_index is
    // the argv index of the offending token.
    wgstore::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        CliArgs* positionals,
        const char** positional_storage,
        u32 positional_cap,
        u32* bad_index) noexcept;

    // Last occurrence wins; nullptr when the option is absent.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    [[nodiscard]] bool has_flag(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace wgstore::cli
