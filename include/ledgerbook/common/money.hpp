#pragma once

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace ledgerbook {

    /// Fixed-point amount stored as a signed count of minor units (two decimal places)
    struct Money {
        static constexpr int64_t SCALE = 100;

        int64_t minor = 0;

        Money() = default;
        constexpr explicit Money(int64_t minor_units) : minor(minor_units) {}

        /// Round half away from zero to the nearest minor unit.
        /// Callers must check std::isfinite first.
        inline static Money fromDouble(double value) {
            return Money(static_cast<int64_t>(std::llround(value * static_cast<double>(SCALE))));
        }

        inline static constexpr Money fromMinor(int64_t minor_units) { return Money(minor_units); }

        inline static constexpr Money zero() { return Money(0); }

        inline double toDouble() const { return static_cast<double>(minor) / static_cast<double>(SCALE); }

        inline bool isZero() const { return minor == 0; }
        inline bool isPositive() const { return minor > 0; }
        inline bool isNegative() const { return minor < 0; }

        /// "1234.50", "-0.05"
        inline std::string toString() const {
            int64_t abs_minor = minor < 0 ? -minor : minor;
            std::string cents = std::to_string(abs_minor % SCALE);
            if (cents.size() < 2)
                cents.insert(cents.begin(), '0');
            return std::string(minor < 0 ? "-" : "") + std::to_string(abs_minor / SCALE) + "." + cents;
        }

        inline Money operator+(const Money &other) const { return Money(minor + other.minor); }
        inline Money operator-(const Money &other) const { return Money(minor - other.minor); }
        inline Money operator-() const { return Money(-minor); }
        inline Money &operator+=(const Money &other) {
            minor += other.minor;
            return *this;
        }
        inline Money &operator-=(const Money &other) {
            minor -= other.minor;
            return *this;
        }

        inline bool operator==(const Money &other) const { return minor == other.minor; }
        inline bool operator!=(const Money &other) const { return minor != other.minor; }
        inline bool operator<(const Money &other) const { return minor < other.minor; }
        inline bool operator<=(const Money &other) const { return minor <= other.minor; }
        inline bool operator>(const Money &other) const { return minor > other.minor; }
        inline bool operator>=(const Money &other) const { return minor >= other.minor; }
    };

} // namespace ledgerbook
