#include <gtest/gtest.h>

#include "domain/Date.hpp"

using namespace reconciliation::domain;

TEST(DateTest, ParseAndFormat) {
    Date d = Date::fromString("2024-01-31");
    EXPECT_EQ(d.year, 2024);
    EXPECT_EQ(d.month, 1);
    EXPECT_EQ(d.day, 31);
    EXPECT_EQ(d.toString(), "2024-01-31");
}

TEST(DateTest, RejectsInvalidCalendarDates) {
    EXPECT_THROW(Date::fromString("2024-02-30"), std::invalid_argument);
    EXPECT_THROW(Date::fromString("2023-02-29"), std::invalid_argument);
    EXPECT_THROW(Date::fromString("2024-13-01"), std::invalid_argument);
    EXPECT_NO_THROW(Date::fromString("2024-02-29"));
}

TEST(DateTest, RejectsBadFormat) {
    EXPECT_THROW(Date::fromString("2024/01/31"), std::invalid_argument);
    EXPECT_THROW(Date::fromString("24-01-31"), std::invalid_argument);
    EXPECT_THROW(Date::fromString("2024-1-31"), std::invalid_argument);
    EXPECT_THROW(Date::fromString(""), std::invalid_argument);
}

TEST(DateTest, Ordering) {
    EXPECT_LT(Date::fromString("2023-12-31"), Date::fromString("2024-01-01"));
    EXPECT_LE(Date::fromString("2024-01-31"), Date::fromString("2024-01-31"));
    EXPECT_GT(Date::fromString("2024-02-01"), Date::fromString("2024-01-31"));
    EXPECT_NE(Date::fromString("2024-02-01"), Date::fromString("2024-01-02"));
}
