#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>

#include "mcli/value.hpp"

using mcli::ArgValue;
using mcli::convertArgValue;

TEST(ValueTest, ToString) {
    EXPECT_EQ(mcli::toString(ArgValue(true)), "true");
    EXPECT_EQ(mcli::toString(ArgValue(false)), "false");
    EXPECT_EQ(mcli::toString(ArgValue(42)), "42");
    EXPECT_EQ(mcli::toString(ArgValue(std::int64_t{-7})), "-7");
    EXPECT_EQ(mcli::toString(ArgValue(0.5)), "0.5");
    EXPECT_EQ(mcli::toString(ArgValue(1234567.891)), "1234567.891");
    EXPECT_EQ(mcli::toString(ArgValue(std::string("a b"))), "a b");
}

TEST(ValueTest, Truthiness) {
    EXPECT_TRUE(mcli::isTruthy(ArgValue(true)));
    EXPECT_FALSE(mcli::isTruthy(ArgValue(false)));
    EXPECT_FALSE(mcli::isTruthy(ArgValue(std::string("no"))));
    EXPECT_FALSE(mcli::isTruthy(ArgValue(std::string("0"))));
    EXPECT_FALSE(mcli::isTruthy(ArgValue(std::string(""))));
    EXPECT_TRUE(mcli::isTruthy(ArgValue(std::string("yes"))));
    EXPECT_TRUE(mcli::isTruthy(ArgValue(std::string("file.txt"))));
    EXPECT_FALSE(mcli::isTruthy(ArgValue(0)));
    EXPECT_TRUE(mcli::isTruthy(ArgValue(3)));
}

TEST(ValueTest, BoolFromString) {
    EXPECT_TRUE(convertArgValue<bool>(ArgValue(std::string("true"))));
    EXPECT_TRUE(convertArgValue<bool>(ArgValue(std::string(" on "))));
    EXPECT_FALSE(convertArgValue<bool>(ArgValue(std::string("off"))));
    EXPECT_FALSE(convertArgValue<bool>(ArgValue(std::string(""))));
    EXPECT_THROW(convertArgValue<bool>(ArgValue(std::string("maybe"))), std::invalid_argument);
}

TEST(ValueTest, IntegersFromString) {
    EXPECT_EQ(convertArgValue<int>(ArgValue(std::string("42"))), 42);
    EXPECT_EQ(convertArgValue<int>(ArgValue(std::string(" -3 "))), -3);
    EXPECT_EQ(convertArgValue<int>(ArgValue(std::string("0x10"))), 16);
    EXPECT_EQ(convertArgValue<std::int64_t>(ArgValue(std::string("9000000000"))), 9000000000LL);
    EXPECT_EQ(convertArgValue<std::uint64_t>(ArgValue(std::string("18446744073709551615"))), UINT64_MAX);
    EXPECT_THROW(convertArgValue<int>(ArgValue(std::string("12abc"))), std::invalid_argument);
    EXPECT_THROW(convertArgValue<int>(ArgValue(std::string("9000000000"))), std::invalid_argument);
    EXPECT_THROW(convertArgValue<std::uint32_t>(ArgValue(std::string("-1"))), std::invalid_argument);
    EXPECT_THROW(convertArgValue<std::uint32_t>(ArgValue(std::string("4294967296"))), std::invalid_argument);
}

TEST(ValueTest, IntegersFromNumbers) {
    EXPECT_EQ(convertArgValue<int>(ArgValue(std::int64_t{12})), 12);
    EXPECT_EQ(convertArgValue<int>(ArgValue(true)), 1);
    EXPECT_EQ(convertArgValue<int>(ArgValue(4.0)), 4);
    EXPECT_EQ(convertArgValue<std::uint64_t>(ArgValue(7)), 7u);
    EXPECT_THROW(convertArgValue<int>(ArgValue(2.5)), std::invalid_argument);
    EXPECT_THROW(convertArgValue<std::uint64_t>(ArgValue(-1)), std::invalid_argument);
    EXPECT_THROW(convertArgValue<int>(ArgValue(std::int64_t{1} << 40)), std::invalid_argument);
}

TEST(ValueTest, FloatingPoint) {
    EXPECT_DOUBLE_EQ(convertArgValue<double>(ArgValue(std::string("2.5"))), 2.5);
    EXPECT_DOUBLE_EQ(convertArgValue<double>(ArgValue(3)), 3.0);
    EXPECT_FLOAT_EQ(convertArgValue<float>(ArgValue(std::string("1e-2"))), 0.01f);
    EXPECT_THROW(convertArgValue<double>(ArgValue(std::string("fast"))), std::invalid_argument);
}

TEST(ValueTest, DoubleTextRoundTrips) {
    const double value = 0.1 + 0.2;
    EXPECT_EQ(convertArgValue<double>(ArgValue(convertArgValue<std::string>(ArgValue(value)))), value);
}

TEST(ValueTest, StringConversionNeverFails) {
    EXPECT_EQ(convertArgValue<std::string>(ArgValue(7)), "7");
    EXPECT_EQ(convertArgValue<std::string>(ArgValue(true)), "true");
    EXPECT_EQ(convertArgValue<std::string>(ArgValue(std::string("x"))), "x");
}
