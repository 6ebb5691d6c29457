#include <array>

#include <gtest/gtest.h>

#include "wgstore/cli/options.hpp"

namespace {
    const std::array<wgstore::cli::OptionSpec, 5> kSpecs = {{
        {wgstore::cli::OptionId::Store, wgstore::cli::OptionType::String, "store", 's'},
        {wgstore::cli::OptionId::Wgs, wgstore::cli::OptionType::String, "wgs", 'w'},
        {wgstore::cli::OptionId::DryRun, wgstore::cli::OptionType::Flag, "dry-run", 'n'},
        {wgstore::cli::OptionId::NoBackup, wgstore::cli::OptionType::Flag, "no-backup", '\0'},
        {wgstore::cli::OptionId::Seq, wgstore::cli::OptionType::I64, "seq", '\0'},
    }};

    struct Parsed {
        wgstore::cli::ParsedOption buf[8]{};
        wgstore::cli::ParsedOptions opts{buf, 0, 8};
        const char* pos_storage[4]{};
        wgstore::cli::CliArgs positionals{};
        wgstore::cli::u32 bad_index{99};
        wgstore::core::Status status{};
    };

    void parse(const char* const* argv, wgstore::cli::u32 argc, Parsed* p) {
        p->status = wgstore::cli::parse_options({argv, argc}, kSpecs.data(), kSpecs.size(), &p->opts, &p->positionals,
                                                p->pos_storage, 4, &p->bad_index);
    }
} // namespace

TEST(CliOptions, OptionsMayFollowPositionals) {
    const char* argv[] = {"saves/6F3A1C", "--store", "/wgs/X", "--dry-run", "extra"};
    Parsed p;
    parse(argv, 5, &p);
    ASSERT_EQ(p.status.code, wgstore::core::StatusCode::Ok);
    EXPECT_EQ(p.bad_index, 0u);

    ASSERT_EQ(p.positionals.argc, 2u);
    EXPECT_STREQ(p.positionals.argv[0], "saves/6F3A1C");
    EXPECT_STREQ(p.positionals.argv[1], "extra");

    ASSERT_EQ(p.opts.len, 2u);
    const wgstore::cli::ParsedOption* store = wgstore::cli::find_option(p.opts, wgstore::cli::OptionId::Store);
    ASSERT_NE(store, nullptr);
    EXPECT_STREQ(store->value.str, "/wgs/X");
    EXPECT_TRUE(wgstore::cli::has_flag(p.opts, wgstore::cli::OptionId::DryRun));
    EXPECT_FALSE(wgstore::cli::has_flag(p.opts, wgstore::cli::OptionId::NoBackup));
}

TEST(CliOptions, SupportsEqualsAndAttachedValue) {
    const char* argv[] = {"--wgs=/a/b", "-s/c/d", "--seq=12"};
    Parsed p;
    parse(argv, 3, &p);
    ASSERT_EQ(p.status.code, wgstore::core::StatusCode::Ok);
    ASSERT_EQ(p.opts.len, 3u);
    EXPECT_STREQ(p.opts.data[0].value.str, "/a/b");
    EXPECT_STREQ(p.opts.data[1].value.str, "/c/d");
    EXPECT_EQ(p.opts.data[2].type, wgstore::cli::OptionType::I64);
    EXPECT_EQ(p.opts.data[2].value.i64v, 12);
}

TEST(CliOptions, LastOccurrenceWins) {
    const char* argv[] = {"-s", "first", "--store", "second"};
    Parsed p;
    parse(argv, 4, &p);
    ASSERT_EQ(p.status.code, wgstore::core::StatusCode::Ok);
    EXPECT_STREQ(wgstore::cli::find_option(p.opts, wgstore::cli::OptionId::Store)->value.str, "second");
    EXPECT_EQ(wgstore::cli::find_option(p.opts, wgstore::cli::OptionId::Wgs), nullptr);
}

TEST(CliOptions, DoubleDashEndsOptions) {
    const char* argv[] = {"-n", "--", "--store", "-"};
    Parsed p;
    parse(argv, 4, &p);
    ASSERT_EQ(p.status.code, wgstore::core::StatusCode::Ok);
    ASSERT_EQ(p.opts.len, 1u);
    ASSERT_EQ(p.positionals.argc, 2u);
    EXPECT_STREQ(p.positionals.argv[0], "--store");
    EXPECT_STREQ(p.positionals.argv[1], "-");
}

TEST(CliOptions, InvalidInputReportsTheToken) {
    {
        const char* argv[] = {"x", "--nope"};
        Parsed p;
        parse(argv, 2, &p);
        EXPECT_EQ(p.status.code, wgstore::core::StatusCode::Invalid);
        EXPECT_EQ(p.status.domain, wgstore::core::StatusDomain::Cli);
        EXPECT_EQ(p.bad_index, 1u);
    }
    {
        const char* argv[] = {"--store"};
        Parsed p;
        parse(argv, 1, &p);
        EXPECT_EQ(p.status.code, wgstore::core::StatusCode::Invalid);
        EXPECT_EQ(p.bad_index, 0u);
    }
    {
        const char* argv[] = {"--seq", "12x"};
        Parsed p;
        parse(argv, 2, &p);
        EXPECT_EQ(p.status.code, wgstore::core::StatusCode::Invalid);
    }
    {
        const char* argv[] = {"--dry-run=yes"};
        Parsed p;
        parse(argv, 1, &p);
        EXPECT_EQ(p.status.code, wgstore::core::StatusCode::Invalid);
    }
}

TEST(CliOptions, PositionalCapacityIsEnforced) {
    const char* argv[] = {"a", "b", "c", "d", "e"};
    Parsed p;
    parse(argv, 5, &p);
    EXPECT_EQ(p.status.code, wgstore::core::StatusCode::Invalid);
    EXPECT_EQ(p.bad_index, 4u);
}
