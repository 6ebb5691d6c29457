#include "wgstore/cli/commands.hpp"

#include <cstring>

namespace wgstore::cli {
    using wgstore::core::make_status;
    using wgstore::core::StatusCode;
    using wgstore::core::StatusDomain;

    wgstore::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const char* word = args.argv[0];
        if (word[0] == '-') {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, word) == 0) {
                out->id = specs[i].id;
                out->args = CliArgs{args.argv + 1, args.argc - 1};
                *consumed = 1;
                return wgstore::core::ok_status();
            }
        }
        return make_status(StatusDomain::Cli, StatusCode::NotFound);
    }

    const CommandSpec* find_command(const CommandSpec* specs, u32 spec_count, CommandId id) noexcept {
        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].id == id) {
                return &specs[i];
            }
        }
        return nullptr;
    }
} // namespace wgstore::cli
