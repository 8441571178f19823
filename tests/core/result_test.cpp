#include "blockship/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using blockship::Err;
using blockship::Ok;
using blockship::Result;

namespace {

Result<int> parse_positive(int value) {
    if (value <= 0) {
        return Err<int>(std::string("not positive"));
    }
    return Ok(value);
}

} // namespace

TEST(ResultTest, HoldsValueOrError) {
    auto ok = parse_positive(3);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 3);

    auto bad = parse_positive(-1);
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error(), "not positive");
    EXPECT_EQ(bad.value_or(7), 7);
}

TEST(ResultTest, WithContextPrefixesOnlyErrors) {
    auto wrapped = blockship::with_context(parse_positive(-5), "parse flag");
    ASSERT_TRUE(wrapped.is_error());
    EXPECT_EQ(wrapped.error(), "parse flag: not positive");

    auto untouched = blockship::with_context(parse_positive(5), "parse flag");
    ASSERT_TRUE(untouched.is_ok());
    EXPECT_EQ(untouched.value(), 5);

    Result<void> failed = Err<void>(std::string("boom"));
    EXPECT_EQ(blockship::with_context(failed, "step").error(), "step: boom");
    EXPECT_TRUE(blockship::with_context(Ok(), "step").is_ok());
}
