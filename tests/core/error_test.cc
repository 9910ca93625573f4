// =============================================================================
// Flamingo - Error and Result Tests
// =============================================================================

#include "flamingo/error.h"

#include "flamingo/common.h"

#include <gtest/gtest.h>

#include <fmt/format.h>

#include <memory>
#include <string>
#include <type_traits>

namespace flamingo {
namespace {

Result<int> parsePositive(int value) {
    if (value <= 0) {
        FLAMINGO_RETURN_ERROR(ErrorCode::kInvalidInput, "not positive");
    }
    return value;
}

Result<int> doublePositive(int value) {
    int parsed = 0;
    FLAMINGO_ASSIGN_OR_RETURN(parsed, parsePositive(value));
    return parsed * 2;
}

Result<void> checkPositive(int value) {
    FLAMINGO_TRY(parsePositive(value));
    FLAMINGO_RETURN_OK();
}

TEST(ErrorTest, DefaultIsOk) {
    Error error;
    EXPECT_TRUE(error.isOk());
    EXPECT_FALSE(error.isError());
    EXPECT_EQ(error.toString(), "OK");
}

TEST(ErrorTest, ToStringIncludesCodeAndMessage) {
    Error error(ErrorCode::kMalformedLog, "unexpected quote on line 3");
    EXPECT_TRUE(error.isError());
    EXPECT_EQ(error.code(), ErrorCode::kMalformedLog);
    EXPECT_EQ(error.toString(), "MalformedLog: unexpected quote on line 3");

    EXPECT_EQ(Error(ErrorCode::kNotFound).toString(), "NotFound");
}

TEST(ErrorTest, CodeNames) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kConfigurationError), "ConfigurationError");
    EXPECT_EQ(errorCodeToString(ErrorCode::kSearchSpaceTooLarge), "SearchSpaceTooLarge");
    EXPECT_EQ(errorCodeToString(ErrorCode::kProcessLaunchFailed), "ProcessLaunchFailed");
}

TEST(ResultTest, ValueAndError) {
    auto ok = parsePositive(3);
    ASSERT_TRUE(ok);
    EXPECT_EQ(*ok, 3);
    EXPECT_EQ(ok.valueOr(7), 3);

    auto bad = parsePositive(-1);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code(), ErrorCode::kInvalidInput);
    EXPECT_EQ(bad.valueOr(7), 7);
}

TEST(ResultTest, AssignOrReturnPropagates) {
    auto ok = doublePositive(4);
    ASSERT_TRUE(ok);
    EXPECT_EQ(*ok, 8);

    auto bad = doublePositive(0);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message(), "not positive");
}

TEST(ResultTest, VoidResult) {
    EXPECT_TRUE(checkPositive(1));
    auto bad = checkPositive(-5);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code(), ErrorCode::kInvalidInput);
}

TEST(ResultTest, HoldsMoveOnlyValues) {
    Result<std::unique_ptr<std::string>> result(std::make_unique<std::string>("flamingo"));
    ASSERT_TRUE(result);
    auto owned = std::move(*result);
    EXPECT_EQ(*owned, "flamingo");
}

TEST(CommonTest, VersionStringMatchesComponents) {
    EXPECT_EQ(Version::string(),
              fmt::format("{}.{}.{}", Version::kMajor, Version::kMinor, Version::kPatch));
}

TEST(CommonTest, NonCopyableTypes) {
    struct Owner : NonCopyable {};
    EXPECT_FALSE(std::is_copy_constructible_v<Owner>);
    EXPECT_FALSE(std::is_copy_assignable_v<Owner>);
}

}  // namespace
}  // namespace flamingo
