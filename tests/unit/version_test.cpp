#include <gtest/gtest.h>

#include "afc/core/result.hpp"
#include "afc/version.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(afc::Version::major, 0);
    EXPECT_EQ(afc::Version::minor, 3);
    EXPECT_EQ(afc::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(afc::Version::string, "0.3.0");
}

TEST(ResultTest, OkValue) {
    auto result = afc::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = afc::Result<int>::err(afc::Error("something failed"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "something failed");
    EXPECT_EQ(result.error().code, -1);
}

TEST(ResultTest, ValueOr) {
    auto ok = afc::Result<int>::ok(10);
    auto err = afc::Result<int>::err(afc::Error(404, "not found"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
    EXPECT_EQ(err.error().code, 404);
}

TEST(ResultTest, BoolConversion) {
    auto ok = afc::Result<int>::ok(1);
    auto err = afc::Result<int>::err(afc::Error("fail"));
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ResultVoidTest, OkAndError) {
    auto ok = afc::Result<void>::ok();
    auto err = afc::Result<void>::err(afc::Error("void error"));
    EXPECT_TRUE(ok.hasValue());
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error().message, "void error");
}
