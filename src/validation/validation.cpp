#include <algorithm>
#include <cctype>
#include <cmath>
#include <ledgerbook/accounting/account.hpp>
#include <ledgerbook/common/calendar.hpp>
#include <ledgerbook/common/money.hpp>
#include <ledgerbook/validation/validation.hpp>

namespace ledgerbook::validation {

    std::string trim(const std::string &text) {
        auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
        auto begin = std::find_if_not(text.begin(), text.end(), is_space);
        auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    std::string toLower(const std::string &text) {
        std::string out = text;
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    Verdict checkDate(const std::string &text) {
        if (!Date::parse(text).has_value())
            return Verdict::fail("Date '" + text + "' is not a valid YYYY-MM-DD calendar date");
        return Verdict::pass();
    }

    Verdict checkYearMonth(const std::string &text) {
        if (!YearMonth::parse(text).has_value())
            return Verdict::fail("Period '" + text + "' is not a valid YYYY-MM month");
        return Verdict::pass();
    }

    Verdict checkPositiveAmount(double value) {
        auto range = checkFiniteAmount(value);
        if (!range)
            return range;
        if (!Money::fromDouble(value).isPositive())
            return Verdict::fail("Amount must be greater than zero");
        return Verdict::pass();
    }

    Verdict checkNonNegativeAmount(double value) {
        auto range = checkFiniteAmount(value);
        if (!range)
            return range;
        if (Money::fromDouble(value).isNegative())
            return Verdict::fail("Amount must not be negative");
        return Verdict::pass();
    }

    Verdict checkFiniteAmount(double value) {
        if (!std::isfinite(value))
            return Verdict::fail("Amount must be a finite number");
        if (std::fabs(value) > MAX_AMOUNT)
            return Verdict::fail("Amount exceeds the maximum of 10000000000000");
        return Verdict::pass();
    }

    Verdict checkCategory(const std::string &text) {
        if (!accounting::categoryFromString(toLower(trim(text))).has_value())
            return Verdict::fail("Account type '" + text +
                                 "' must be one of asset, liability, equity, income, expense");
        return Verdict::pass();
    }

    Verdict checkAccountName(const std::string &name) {
        std::string cleaned = trim(name);
        if (cleaned.empty())
            return Verdict::fail("Account name must not be empty");
        if (cleaned.size() > MAX_ACCOUNT_NAME_LENGTH)
            return Verdict::fail("Account name exceeds " + std::to_string(MAX_ACCOUNT_NAME_LENGTH) + " characters");
        return Verdict::pass();
    }

    Verdict checkId(int64_t id) {
        if (id <= 0)
            return Verdict::fail("Identifier " + std::to_string(id) + " is not a positive integer");
        return Verdict::pass();
    }

} // namespace ledgerbook::validation
