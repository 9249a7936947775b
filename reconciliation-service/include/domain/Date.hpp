#pragma once

#include <string>
#include <cstdio>
#include <cctype>
#include <stdexcept>

namespace reconciliation::domain {

/**
 * @brief Календарная дата без времени (дата выписки, дата операции)
 *
 * Формат обмена: YYYY-MM-DD.
 */
class Date {
public:
    int year = 1970;
    int month = 1;
    int day = 1;

    Date() = default;

    Date(int y, int m, int d) : year(y), month(m), day(d) {
        if (!isValid(y, m, d)) {
            throw std::invalid_argument("Invalid date: " + std::to_string(y) + "-" +
                                        std::to_string(m) + "-" + std::to_string(d));
        }
    }

    /**
     * @brief Разобрать дату YYYY-MM-DD
     * @throws std::invalid_argument при неверном формате или несуществующей дате
     */
    static Date fromString(const std::string& str) {
        if (str.size() != 10 || str[4] != '-' || str[7] != '-') {
            throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): " + str);
        }
        for (size_t i = 0; i < str.size(); ++i) {
            if (i == 4 || i == 7) continue;
            if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
                throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): " + str);
            }
        }

        int y = std::stoi(str.substr(0, 4));
        int m = std::stoi(str.substr(5, 2));
        int d = std::stoi(str.substr(8, 2));
        return Date(y, m, d);
    }

    std::string toString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
        return buf;
    }

    bool operator<(const Date& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }

    bool operator>(const Date& other) const { return other < *this; }
    bool operator<=(const Date& other) const { return !(other < *this); }
    bool operator>=(const Date& other) const { return !(*this < other); }

    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }

    bool operator!=(const Date& other) const { return !(*this == other); }

private:
    static bool isLeap(int y) {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    static bool isValid(int y, int m, int d) {
        static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (y < 1 || y > 9999 || m < 1 || m > 12 || d < 1) return false;
        int maxDay = kDaysInMonth[m - 1] + ((m == 2 && isLeap(y)) ? 1 : 0);
        return d <= maxDay;
    }
};

} // namespace reconciliation::domain
