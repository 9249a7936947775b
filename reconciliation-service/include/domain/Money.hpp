#pragma once

#include <string>
#include <cstdint>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace reconciliation::domain {

/**
 * @brief Денежная сумма со знаком
 *
 * Хранит целую часть и дробную часть в нано-единицах (10^-9), без double,
 * чтобы суммы выписки и учёта сравнивались точно.
 * Инвариант: 0 <= nano < 1'000'000'000, значение = units + nano / 10^9.
 * Знак суммы: плюс для поступления, минус для списания.
 */
class Money {
public:
    static constexpr int32_t kNanosPerUnit = 1000000000;

    int64_t units = 0;      // Целая часть (округление вниз)
    int32_t nano = 0;       // Дробная часть, всегда неотрицательная
    std::string currency;

    Money() = default;

    Money(int64_t u, int32_t n, const std::string& cur = "")
        : units(u), nano(n), currency(cur)
    {
        normalize();
    }

    static Money zero(const std::string& cur = "") {
        return Money(0, 0, cur);
    }

    static Money fromCents(int64_t cents, const std::string& cur = "") {
        int64_t u = cents / 100;
        int64_t rest = cents % 100;
        if (rest < 0) {
            u--;
            rest += 100;
        }
        return Money(u, static_cast<int32_t>(rest * 10000000), cur);
    }

    /**
     * @brief Разобрать десятичную строку ("800.00", "-150.5", "+12")
     * @throws std::invalid_argument если строка не является числом
     */
    static Money fromString(const std::string& str, const std::string& cur = "") {
        if (str.empty()) {
            throw std::invalid_argument("Empty amount");
        }

        size_t pos = 0;
        bool negative = false;
        if (str[pos] == '-' || str[pos] == '+') {
            negative = str[pos] == '-';
            ++pos;
        }

        int64_t whole = 0;
        size_t wholeDigits = 0;
        while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
            if (wholeDigits >= 15) {
                throw std::invalid_argument("Amount out of range: " + str);
            }
            whole = whole * 10 + (str[pos] - '0');
            ++pos;
            ++wholeDigits;
        }

        int64_t fraction = 0;
        size_t fractionDigits = 0;
        if (pos < str.size() && str[pos] == '.') {
            ++pos;
            while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
                if (fractionDigits >= 9) {
                    throw std::invalid_argument("Too many decimal places: " + str);
                }
                fraction = fraction * 10 + (str[pos] - '0');
                ++pos;
                ++fractionDigits;
            }
        }

        if (pos != str.size() || (wholeDigits == 0 && fractionDigits == 0)) {
            throw std::invalid_argument("Invalid amount: " + str);
        }

        for (size_t i = fractionDigits; i < 9; ++i) {
            fraction *= 10;
        }

        Money result(whole, static_cast<int32_t>(fraction), cur);
        return negative ? result.negated() : result;
    }

    /**
     * @brief Сумма из числа JSON, округление до центов
     * @throws std::invalid_argument для NaN, бесконечности и |value| >= 1e15
     */
    static Money fromDouble(double value, const std::string& cur = "") {
        if (!std::isfinite(value) || std::fabs(value) >= 1e15) {
            throw std::invalid_argument("Amount out of range");
        }
        double scaled = value * 100.0;
        int64_t cents = static_cast<int64_t>(scaled >= 0 ? scaled + 0.5 : scaled - 0.5);
        return fromCents(cents, cur);
    }

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    /**
     * @brief Десятичная строка с двумя знаками, округление half-away-from-zero
     */
    std::string toString() const {
        Money a = abs();
        int64_t whole = a.units;
        int64_t cents = (static_cast<int64_t>(a.nano) + 5000000) / 10000000;
        if (cents >= 100) {
            whole++;
            cents -= 100;
        }

        std::string out = (isNegative() && (whole != 0 || cents != 0)) ? "-" : "";
        out += std::to_string(whole);
        out += '.';
        if (cents < 10) out += '0';
        out += std::to_string(cents);
        return out;
    }

    bool isZero() const { return units == 0 && nano == 0; }
    bool isNegative() const { return units < 0; }
    bool isPositive() const { return !isNegative() && !isZero(); }

    Money negated() const {
        if (nano == 0) {
            return Money(-units, 0, currency);
        }
        return Money(-units - 1, kNanosPerUnit - nano, currency);
    }

    Money abs() const {
        return isNegative() ? negated() : *this;
    }

    /**
     * @brief |this - other| <= tolerance
     */
    bool isWithin(const Money& other, const Money& tolerance) const {
        return !(tolerance < (*this - other).abs());
    }

    /**
     * @brief |this| < tolerance
     */
    bool isBelow(const Money& tolerance) const {
        return abs() < tolerance;
    }

    Money operator+(const Money& other) const {
        Money result;
        result.currency = currency.empty() ? other.currency : currency;
        result.units = units + other.units;
        result.nano = nano + other.nano;

        // Нормализация
        if (result.nano >= kNanosPerUnit) {
            result.units++;
            result.nano -= kNanosPerUnit;
        }

        return result;
    }

    Money operator-(const Money& other) const {
        Money result;
        result.currency = currency.empty() ? other.currency : currency;
        result.units = units - other.units;
        result.nano = nano - other.nano;

        if (result.nano < 0) {
            result.units--;
            result.nano += kNanosPerUnit;
        }

        return result;
    }

    Money& operator+=(const Money& other) {
        *this = *this + other;
        return *this;
    }

    Money& operator-=(const Money& other) {
        *this = *this - other;
        return *this;
    }

    // Сравнение только по значению, валюта не участвует
    bool operator<(const Money& other) const {
        return units < other.units || (units == other.units && nano < other.nano);
    }

    bool operator>(const Money& other) const {
        return other < *this;
    }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

private:
    void normalize() {
        units += nano / kNanosPerUnit;
        nano %= kNanosPerUnit;
        if (nano < 0) {
            units--;
            nano += kNanosPerUnit;
        }
    }
};

/// Допуск сравнения сумм при сопоставлении и финализации
inline const Money kTolerance = Money::fromCents(1);

} // namespace reconciliation::domain
