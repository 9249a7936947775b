#include <gtest/gtest.h>

#include "domain/Money.hpp"

#include <limits>

using namespace reconciliation::domain;

TEST(MoneyTest, FromString_ParsesSignedDecimals) {
    EXPECT_EQ(Money::fromString("800.00").toString(), "800.00");
    EXPECT_EQ(Money::fromString("-150.5").toString(), "-150.50");
    EXPECT_EQ(Money::fromString("+12").toString(), "12.00");
    EXPECT_EQ(Money::fromString("0.07").toString(), "0.07");
    EXPECT_EQ(Money::fromString("-0.07").toString(), "-0.07");
}

TEST(MoneyTest, FromString_RejectsGarbage) {
    EXPECT_THROW(Money::fromString(""), std::invalid_argument);
    EXPECT_THROW(Money::fromString("-"), std::invalid_argument);
    EXPECT_THROW(Money::fromString("12,50"), std::invalid_argument);
    EXPECT_THROW(Money::fromString("1.2.3"), std::invalid_argument);
    EXPECT_THROW(Money::fromString("abc"), std::invalid_argument);
    EXPECT_THROW(Money::fromString("1.0000000001"), std::invalid_argument);
}

TEST(MoneyTest, NegativeValuesKeepNanoNonNegative) {
    Money m = Money::fromString("-150.25");
    EXPECT_EQ(m.units, -151);
    EXPECT_EQ(m.nano, 750000000);
    EXPECT_TRUE(m.isNegative());
    EXPECT_EQ(m.abs().toString(), "150.25");
}

TEST(MoneyTest, ArithmeticIsExact) {
    // 0.1 + 0.2 без погрешности double
    Money sum = Money::fromString("0.10") + Money::fromString("0.20");
    EXPECT_EQ(sum, Money::fromString("0.30"));

    Money diff = Money::fromString("100.00") - Money::fromString("100.01");
    EXPECT_EQ(diff.toString(), "-0.01");
    EXPECT_TRUE(diff.isNegative());
}

TEST(MoneyTest, ComparisonIgnoresCurrency) {
    EXPECT_EQ(Money::fromString("5.00", "SGD"), Money::fromString("5", "USD"));
    EXPECT_LT(Money::fromString("-5.00"), Money::fromString("-4.99"));
    EXPECT_GT(Money::fromCents(1), Money::zero());
}

TEST(MoneyTest, IsWithin_BoundaryPasses) {
    Money a = Money::fromString("100.00");
    EXPECT_TRUE(a.isWithin(Money::fromString("100.01"), kTolerance));
    EXPECT_TRUE(a.isWithin(Money::fromString("99.99"), kTolerance));
    EXPECT_FALSE(a.isWithin(Money::fromString("100.02"), kTolerance));
    EXPECT_FALSE(a.isWithin(Money::fromString("-100.00"), kTolerance));
}

TEST(MoneyTest, IsBelow_IsStrict) {
    EXPECT_TRUE(Money::fromString("0.00").isBelow(kTolerance));
    EXPECT_TRUE(Money::fromString("-0.009").isBelow(kTolerance));
    EXPECT_FALSE(Money::fromString("0.01").isBelow(kTolerance));
    EXPECT_FALSE(Money::fromString("-0.01").isBelow(kTolerance));
}

TEST(MoneyTest, ToString_RoundsHalfAwayFromZero) {
    EXPECT_EQ(Money::fromString("2.005").toString(), "2.01");
    EXPECT_EQ(Money::fromString("-2.005").toString(), "-2.01");
    EXPECT_EQ(Money::fromString("2.004").toString(), "2.00");
    EXPECT_EQ(Money::fromString("9.999").toString(), "10.00");
}

TEST(MoneyTest, FromCents_HandlesNegatives) {
    EXPECT_EQ(Money::fromCents(-1).toString(), "-0.01");
    EXPECT_EQ(Money::fromCents(12345).toString(), "123.45");
}

TEST(MoneyTest, FromDouble_RejectsOutOfRange) {
    EXPECT_THROW(Money::fromDouble(1e300), std::invalid_argument);
    EXPECT_THROW(Money::fromDouble(-1e15), std::invalid_argument);
    EXPECT_THROW(Money::fromDouble(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    EXPECT_THROW(Money::fromDouble(std::numeric_limits<double>::infinity()), std::invalid_argument);
    EXPECT_EQ(Money::fromDouble(1200.5).toString(), "1200.50");
}
