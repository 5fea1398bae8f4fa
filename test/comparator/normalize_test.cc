#include <gtest/gtest.h>
#include "../../src/comparator/normalize.h"

using namespace Crosscheck;

TEST(NormalizeTest, TickerIsLowercased) {
    EXPECT_EQ(NormalizeTicker("OrDi"), "ordi");
    EXPECT_EQ(NormalizeTicker("$sats"), "$sats");
}

TEST(NormalizeTest, DecimalCanonicalForm) {
    std::string out;
    ASSERT_TRUE(NormalizeDecimal("000123.4500", out));
    EXPECT_EQ(out, "123.45");
    ASSERT_TRUE(NormalizeDecimal("1000", out));
    EXPECT_EQ(out, "1000");
    ASSERT_TRUE(NormalizeDecimal(".5", out));
    EXPECT_EQ(out, "0.5");
    ASSERT_TRUE(NormalizeDecimal("7.", out));
    EXPECT_EQ(out, "7");
    ASSERT_TRUE(NormalizeDecimal("-0.0", out));
    EXPECT_EQ(out, "0");
    ASSERT_TRUE(NormalizeDecimal("-2.50", out));
    EXPECT_EQ(out, "-2.5");
}

TEST(NormalizeTest, RejectsNonDecimal) {
    std::string out = "unchanged";
    EXPECT_FALSE(NormalizeDecimal("", out));
    EXPECT_FALSE(NormalizeDecimal("1e5", out));
    EXPECT_FALSE(NormalizeDecimal("1.2.3", out));
    EXPECT_FALSE(NormalizeDecimal("-", out));
    EXPECT_FALSE(NormalizeDecimal("abc", out));
    EXPECT_EQ(out, "unchanged");
}
