#include <gtest/gtest.h>

#include "wgstore/core/errors.hpp"

TEST(Status, DefaultIsOk){
    wgstore::core::Status s{};
    EXPECT_EQ(s.code, wgstore::core::StatusCode::Ok);
    EXPECT_EQ(s.domain, wgstore::core::StatusDomain::Core);
    EXPECT_EQ(s.aux, 0u);
    EXPECT_TRUE(wgstore::core::is_ok(s));
    EXPECT_EQ(wgstore::core::status_reason(s), wgstore::core::Reason::None);
}

TEST(Status, ReasonRidesInAux){
    const wgstore::core::Status s = wgstore::core::make_status(
        wgstore::core::StatusDomain::Codec, wgstore::core::StatusCode::Corrupt, wgstore::core::Reason::NameMismatch);
    EXPECT_EQ(wgstore::core::status_reason(s), wgstore::core::Reason::NameMismatch);

    // Io carries errno, never a reason.
    const wgstore::core::Status io =
        wgstore::core::make_status(wgstore::core::StatusDomain::Storage, wgstore::core::StatusCode::Io, 2u);
    EXPECT_EQ(wgstore::core::status_reason(io), wgstore::core::Reason::None);
}

TEST(Status, DescribeNamesFileFieldAndValues){
    wgstore::core::Diagnostic d{};
    d.path = "/x/containers.index";
    wgstore::core::diag_set(&d, "version", 14, 13);
    const wgstore::core::Status s = wgstore::core::make_status(wgstore::core::StatusDomain::Codec,
        wgstore::core::StatusCode::Unsupported, wgstore::core::Reason::UnsupportedVersion);
    EXPECT_EQ(wgstore::core::describe(s, d),
              "Unsupported/UnsupportedVersion (Codec) in /x/containers.index: field 'version' expected 14, got 13");

    EXPECT_EQ(wgstore::core::describe(wgstore::core::Status{}, wgstore::core::Diagnostic{}), "Ok (Core)");
}
