#include <gtest/gtest.h>

#include "core/quantity.hpp"

namespace {

TEST(QuantityTest, ParsesNumbers) {
    ASSERT_TRUE(core::parse_quantity("50").has_value());
    EXPECT_DOUBLE_EQ(*core::parse_quantity("50"), 50.0);
    EXPECT_DOUBLE_EQ(*core::parse_quantity(" 12.5 "), 12.5);
    EXPECT_DOUBLE_EQ(*core::parse_quantity("+7"), 7.0);
    EXPECT_DOUBLE_EQ(*core::parse_quantity("-3"), -3.0);
    EXPECT_DOUBLE_EQ(*core::parse_quantity("0"), 0.0);
}

TEST(QuantityTest, BlankAndGarbageAreAbsent) {
    EXPECT_FALSE(core::parse_quantity("").has_value());
    EXPECT_FALSE(core::parse_quantity("   ").has_value());
    EXPECT_FALSE(core::parse_quantity("abc").has_value());
    EXPECT_FALSE(core::parse_quantity("12pcs").has_value());
    EXPECT_FALSE(core::parse_quantity("nan").has_value());
    EXPECT_FALSE(core::parse_quantity("inf").has_value());
}

TEST(QuantityTest, AbsentPredicateCoversBlankAndZero) {
    EXPECT_TRUE(core::is_absent_quantity(std::nullopt));
    EXPECT_TRUE(core::is_absent_quantity(core::Quantity{0.0}));
    EXPECT_FALSE(core::is_absent_quantity(core::Quantity{1.0}));
    EXPECT_FALSE(core::is_absent_quantity(core::Quantity{-1.0}));
}

TEST(QuantityTest, FormatsShortest) {
    EXPECT_EQ(core::format_quantity(120.0), "120");
    EXPECT_EQ(core::format_quantity(12.5), "12.5");
    EXPECT_EQ(core::format_quantity(core::Quantity{}), "blank");
}

} // namespace
