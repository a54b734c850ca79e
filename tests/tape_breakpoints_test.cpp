#include "tape_breakpoints.hpp"

#include <gtest/gtest.h>

TEST(TapeBreakpoints, SetIsIdempotent) {
    TapeBreakpoints breakpoints;
    EXPECT_TRUE(breakpoints.set(0x10));
    EXPECT_FALSE(breakpoints.set(0x10));
    EXPECT_EQ(breakpoints.size(), 1u);
    EXPECT_TRUE(breakpoints.contains(0x10));
    EXPECT_FALSE(breakpoints.contains(0x11));
}

TEST(TapeBreakpoints, ClearMissingIsHarmless) {
    TapeBreakpoints breakpoints;
    EXPECT_FALSE(breakpoints.clear(0x20));
    breakpoints.set(0x20);
    EXPECT_TRUE(breakpoints.clear(0x20));
    EXPECT_FALSE(breakpoints.contains(0x20));
    EXPECT_TRUE(breakpoints.empty());
}

TEST(TapeBreakpoints, ListIsSorted) {
    TapeBreakpoints breakpoints;
    breakpoints.set(0xffff);
    breakpoints.set(0x0000);
    breakpoints.set(0x0800);
    EXPECT_EQ(breakpoints.list(), (std::vector<uint16_t>{0x0000, 0x0800, 0xffff}));
}
