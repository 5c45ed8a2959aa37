#include "tictac/util/log.hpp"
#include <gtest/gtest.h>
#include <string>

TEST(LogTest, MacrosWritePrefixedLinesToStderr) {
    testing::internal::CaptureStderr();
    TICTAC_INFO("root simulations " << 42);
    TICTAC_ERROR("worker failed: " << "boom");
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("[tictac] INFO root simulations 42\n"), std::string::npos);
    EXPECT_NE(output.find("[tictac] ERROR worker failed: boom\n"), std::string::npos);
}

TEST(LogTest, DebugLinesOnlyInDebugBuilds) {
    testing::internal::CaptureStderr();
    TICTAC_DEBUG("advanced " << 1);
    std::string output = testing::internal::GetCapturedStderr();

#ifdef NDEBUG
    EXPECT_TRUE(output.empty());
#else
    EXPECT_EQ(output, "[tictac] DEBUG advanced 1\n");
#endif
}
