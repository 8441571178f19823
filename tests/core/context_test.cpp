#include "blockship/core/context.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using blockship::Context;

TEST(ContextTest, CancelIsObservedByCheck) {
    Context ctx;
    EXPECT_FALSE(ctx.cancelled());
    EXPECT_TRUE(ctx.check().is_ok());

    ctx.cancel();
    EXPECT_TRUE(ctx.cancelled());
    auto res = ctx.check();
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error(), "context canceled");
}

TEST(ContextTest, DeadlineExpires) {
    auto ctx = Context::with_timeout(std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_TRUE(ctx.cancelled());
    auto res = ctx.check();
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error(), "context deadline exceeded");
}
