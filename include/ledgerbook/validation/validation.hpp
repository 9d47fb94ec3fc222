#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace ledgerbook::validation {

    /// Outcome of a primitive check. Checks never throw; a failed check carries the reason.
    struct Verdict {
        bool ok = true;
        std::string reason;

        inline static Verdict pass() { return Verdict{true, ""}; }
        inline static Verdict fail(std::string why) { return Verdict{false, std::move(why)}; }

        explicit operator bool() const { return ok; }
    };

    constexpr size_t MAX_ACCOUNT_NAME_LENGTH = 120;

    /// Largest accepted magnitude for any amount; keeps minor units and their sums inside int64
    constexpr double MAX_AMOUNT = 1e13;

    /// YYYY-MM-DD and a real calendar date
    Verdict checkDate(const std::string &text);

    /// YYYY-MM
    Verdict checkYearMonth(const std::string &text);

    /// Finite and strictly positive after rounding to minor units, at most MAX_AMOUNT
    Verdict checkPositiveAmount(double value);

    /// Finite and not negative, at most MAX_AMOUNT
    Verdict checkNonNegativeAmount(double value);

    /// Finite with magnitude at most MAX_AMOUNT; sign unrestricted
    Verdict checkFiniteAmount(double value);

    /// One of asset, liability, equity, income, expense (case-insensitive, whitespace ignored)
    Verdict checkCategory(const std::string &text);

    Verdict checkAccountName(const std::string &name);

    Verdict checkId(int64_t id);

    /// Trim ASCII whitespace on both ends
    std::string trim(const std::string &text);

    std::string toLower(const std::string &text);

} // namespace ledgerbook::validation
