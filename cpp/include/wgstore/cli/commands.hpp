#pragma once

#include <type_traits>

#include "wgstore/cli/options.hpp"
#include "wgstore/core/errors.hpp"

namespace wgstore::cli {
    using u32 = wgstore::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Inspect = 2,
        Files = 3,
        Verify = 4,
        Candidates = 5,
        Import = 6,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        const char* usage{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};     // everything after the command word
    };

    // Matches args.argv[0] against the command table. Unknown words and
    // leading options are Cli/NotFound and Cli/Invalid respectively.
    wgstore::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    [[nodiscard]] const CommandSpec* find_command(const CommandSpec* specs, u32 spec_count, CommandId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace wgstore::cli
