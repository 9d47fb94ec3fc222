#pragma once

#include <cctype>
#include <cstdio>
#include <optional>
#include <string>

namespace ledgerbook {

    inline bool isLeapYear(int year) { return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0; }

    inline int daysInMonth(int year, int month) {
        static constexpr int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month < 1 || month > 12)
            return 0;
        if (month == 2 && isLeapYear(year))
            return 29;
        return DAYS[month - 1];
    }

    namespace detail {
        // Parses exactly `width` ASCII digits starting at `pos`
        inline bool parseDigits(const std::string &text, size_t pos, size_t width, int &out) {
            if (pos + width > text.size())
                return false;
            int value = 0;
            for (size_t i = pos; i < pos + width; ++i) {
                if (!std::isdigit(static_cast<unsigned char>(text[i])))
                    return false;
                value = value * 10 + (text[i] - '0');
            }
            out = value;
            return true;
        }
    } // namespace detail

    /// Calendar month key, rendered as "YYYY-MM"
    struct YearMonth {
        int year = 0;
        int month = 0;

        YearMonth() = default;
        YearMonth(int y, int m) : year(y), month(m) {}

        inline static std::optional<YearMonth> parse(const std::string &text) {
            if (text.size() != 7 || text[4] != '-')
                return std::nullopt;
            int y = 0, m = 0;
            if (!detail::parseDigits(text, 0, 4, y) || !detail::parseDigits(text, 5, 2, m))
                return std::nullopt;
            if (m < 1 || m > 12)
                return std::nullopt;
            return YearMonth(y, m);
        }

        inline YearMonth next() const { return month == 12 ? YearMonth(year + 1, 1) : YearMonth(year, month + 1); }

        inline YearMonth previous() const {
            return month == 1 ? YearMonth(year - 1, 12) : YearMonth(year, month - 1);
        }

        inline std::string toString() const {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "%04d-%02d", year, month);
            return std::string(buf);
        }

        /// Inclusive ISO date bounds of the month, usable in text comparisons
        inline std::string firstDay() const { return toString() + "-01"; }
        inline std::string lastDay() const {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "-%02d", daysInMonth(year, month));
            return toString() + buf;
        }

        inline bool operator==(const YearMonth &other) const { return year == other.year && month == other.month; }
        inline bool operator!=(const YearMonth &other) const { return !(*this == other); }
        inline bool operator<(const YearMonth &other) const {
            return year != other.year ? year < other.year : month < other.month;
        }
    };

    /// Calendar date, rendered as "YYYY-MM-DD"
    struct Date {
        int year = 0;
        int month = 0;
        int day = 0;

        Date() = default;
        Date(int y, int m, int d) : year(y), month(m), day(d) {}

        inline static std::optional<Date> parse(const std::string &text) {
            if (text.size() != 10 || text[4] != '-' || text[7] != '-')
                return std::nullopt;
            int y = 0, m = 0, d = 0;
            if (!detail::parseDigits(text, 0, 4, y) || !detail::parseDigits(text, 5, 2, m) ||
                !detail::parseDigits(text, 8, 2, d))
                return std::nullopt;
            if (m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m))
                return std::nullopt;
            return Date(y, m, d);
        }

        inline YearMonth yearMonth() const { return YearMonth(year, month); }

        inline std::string toString() const {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
            return std::string(buf);
        }

        inline bool operator==(const Date &other) const {
            return year == other.year && month == other.month && day == other.day;
        }
        inline bool operator<(const Date &other) const {
            if (year != other.year)
                return year < other.year;
            if (month != other.month)
                return month < other.month;
            return day < other.day;
        }
    };

} // namespace ledgerbook
