#include <set>
#include <string>

#include <gtest/gtest.h>

#include "wgstore/core/guid.hpp"

using namespace wgstore::core;

namespace {
    struct DirNameVector {
        const char* canonical;
        const char* dir_name;
    };

    constexpr DirNameVector kVectors[] = {
        {"00112233-4455-6677-8899-aabbccddeeff", "33221100554477668899AABBCCDDEEFF"},
        {"12345678-9abc-def0-1234-56789abcdef0", "78563412BC9AF0DE123456789ABCDEF0"},
        {"a1b2c3d4-e5f6-4789-8abc-def012345678", "D4C3B2A1F6E589478ABCDEF012345678"},
    };

    Guid parse(const char* canonical) {
        Guid g{};
        EXPECT_TRUE(guid_from_string(canonical, &g)) << canonical;
        return g;
    }
} // namespace

TEST(Guid, DirNameMatchesFixedVectors) {
    for (const DirNameVector& v : kVectors) {
        EXPECT_EQ(guid_to_dir_name(parse(v.canonical)), v.dir_name) << v.canonical;
    }
}

TEST(Guid, DirNameIsNotDashlessCanonical) {
    const Guid g = parse(kVectors[1].canonical);
    EXPECT_NE(guid_to_dir_name(g), "123456789ABCDEF0123456789ABCDEF0");
}

TEST(Guid, DirNameInverse) {
    for (const DirNameVector& v : kVectors) {
        Guid g{};
        ASSERT_TRUE(guid_from_dir_name(v.dir_name, &g)) << v.dir_name;
        EXPECT_EQ(guid_to_string(g), v.canonical);
    }
}

TEST(Guid, DirNameAcceptsLowercase) {
    Guid g{};
    ASSERT_TRUE(guid_from_dir_name("33221100554477668899aabbccddeeff", &g));
    EXPECT_EQ(g, parse(kVectors[0].canonical));
}

TEST(Guid, DirNameRejectsMalformed) {
    Guid g{};
    EXPECT_FALSE(guid_from_dir_name("", &g));
    EXPECT_FALSE(guid_from_dir_name("33221100554477668899AABBCCDDEEF", &g));
    EXPECT_FALSE(guid_from_dir_name("33221100554477668899AABBCCDDEEFG", &g));
    EXPECT_FALSE(guid_from_dir_name("33221100554477668899AABBCCDDEEFF", nullptr));
}

TEST(Guid, CanonicalStringRejectsMalformed) {
    Guid g{};
    EXPECT_FALSE(guid_from_string("00112233445566778899aabbccddeeff", &g));
    EXPECT_FALSE(guid_from_string("00112233-4455-6677-8899_aabbccddeeff", &g));
    EXPECT_FALSE(guid_from_string("0011223z-4455-6677-8899-aabbccddeeff", &g));
}

TEST(Guid, GenerateProducesDistinctVersion4) {
    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        Guid g{};
        ASSERT_EQ(guid_generate(&g).code, StatusCode::Ok);
        EXPECT_EQ(g.b[6] & 0xF0u, 0x40u);
        EXPECT_EQ(g.b[8] & 0xC0u, 0x80u);
        EXPECT_FALSE(guid_is_nil(g));
        seen.insert(guid_to_dir_name(g));
    }
    EXPECT_EQ(seen.size(), 64u);
}

TEST(Guid, GenerateRejectsNullOut) {
    const Status s = guid_generate(nullptr);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Core);
}
