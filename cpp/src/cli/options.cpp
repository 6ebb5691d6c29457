#include "wgstore/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace wgstore::cli {
    using wgstore::core::make_status;
    using wgstore::core::ok_status;
    using wgstore::core::Status;
    using wgstore::core::StatusCode;
    using wgstore::core::StatusDomain;

    namespace {
        [[nodiscard]] constexpr Status invalid() noexcept {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name,
                                                  std::size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (s == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            const auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] Status assign_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            switch (spec.type) {
                case OptionType::String:
                    opt->value.str = value;
                    return ok_status();
                case OptionType::I64: {
                    i64 v{};
                    if (!parse_i64(value, &v)) {
                        return invalid();
                    }
                    opt->value.i64v = v;
                    return ok_status();
                }
                case OptionType::Flag:
                    break;
            }
            return invalid();
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            out->data[out->len++] = opt;
            return ok_status();
        }

        [[nodiscard]] Status push_positional(CliArgs* positionals, const char** storage, u32 cap,
                                             const char* tok) noexcept {
            if (storage == nullptr || positionals->argc >= cap) {
                return invalid();
            }
            storage[positionals->argc++] = tok;
            return ok_status();
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        CliArgs* positionals,
        const char** positional_storage,
        u32 positional_cap,
        u32* bad_index) noexcept {
        if (out == nullptr || positionals == nullptr || bad_index == nullptr) {
            return invalid();
        }
        out->len = 0;
        *positionals = CliArgs{positional_storage, 0};
        *bad_index = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        bool options_done = false;
        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            *bad_index = i;
            if (tok == nullptr) {
                return invalid();
            }

            if (options_done || tok[0] != '-' || tok[1] == '\0') {
                const Status s = push_positional(positionals, positional_storage, positional_cap, tok);
                if (!wgstore::core::is_ok(s)) {
                    return s;
                }
                ++i;
                continue;
            }
            if (std::strcmp(tok, "--") == 0) {
                options_done = true;
                ++i;
                continue;
            }

            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const std::size_t name_len = eq != nullptr ? static_cast<std::size_t>(eq - name) : std::strlen(name);
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    inline_value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    inline_value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return invalid();
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;
            ++i;

            if (spec->type == OptionType::Flag) {
                if (inline_value != nullptr) {
                    return invalid();
                }
                opt.value.boolv = 1;
            } else {
                const char* value = inline_value;
                if (value == nullptr) {
                    if (i >= args.argc || args.argv[i] == nullptr) {
                        return invalid();
                    }
                    value = args.argv[i++];
                }
                const Status s = assign_value(*spec, value, &opt);
                if (!wgstore::core::is_ok(s)) {
                    return s;
                }
            }

            const Status s = push_option(out, opt);
            if (!wgstore::core::is_ok(s)) {
                return s;
            }
        }

        *bad_index = 0;
        return ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }

    bool has_flag(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* opt = find_option(opts, id);
        return opt != nullptr && opt->type == OptionType::Flag && opt->value.boolv != 0;
    }
} // namespace wgstore::cli
