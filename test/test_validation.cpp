#include <doctest/doctest.h>

#include <cmath>
#include <limits>
#include <ledgerbook/validation/validation.hpp>

using namespace ledgerbook::validation;

TEST_SUITE("Validation") {
    TEST_CASE("Dates") {
        CHECK(checkDate("2025-10-31"));
        CHECK(checkDate("2024-02-29"));
        CHECK(checkDate("2000-02-29"));

        CHECK_FALSE(checkDate("2025-02-29"));
        CHECK_FALSE(checkDate("1900-02-29"));
        CHECK_FALSE(checkDate("2025-04-31"));
        CHECK_FALSE(checkDate("2025-13-01"));
        CHECK_FALSE(checkDate("2025-00-10"));
        CHECK_FALSE(checkDate("2025-1-05"));
        CHECK_FALSE(checkDate("2025/10/05"));
        CHECK_FALSE(checkDate("20251005"));
        CHECK_FALSE(checkDate(""));
        CHECK_FALSE(checkDate("2025-10-05 "));

        auto verdict = checkDate("yesterday");
        CHECK_FALSE(verdict.ok);
        CHECK(verdict.reason.find("yesterday") != std::string::npos);
    }

    TEST_CASE("Year-month periods") {
        CHECK(checkYearMonth("2025-10"));
        CHECK(checkYearMonth("1999-01"));
        CHECK_FALSE(checkYearMonth("2025-13"));
        CHECK_FALSE(checkYearMonth("2025-10-01"));
        CHECK_FALSE(checkYearMonth("25-10"));
        CHECK_FALSE(checkYearMonth(""));
    }

    TEST_CASE("Positive amounts") {
        CHECK(checkPositiveAmount(0.01));
        CHECK(checkPositiveAmount(1000.0));

        CHECK_FALSE(checkPositiveAmount(0.0));
        CHECK_FALSE(checkPositiveAmount(-5.0));
        CHECK_FALSE(checkPositiveAmount(0.004)); // rounds to zero minor units
        CHECK_FALSE(checkPositiveAmount(std::numeric_limits<double>::infinity()));
        CHECK_FALSE(checkPositiveAmount(std::nan("")));
    }

    TEST_CASE("Finite and non-negative amounts") {
        CHECK(checkFiniteAmount(-250.0));
        CHECK(checkFiniteAmount(0.0));
        CHECK_FALSE(checkFiniteAmount(std::numeric_limits<double>::infinity()));

        CHECK(checkNonNegativeAmount(0.0));
        CHECK(checkNonNegativeAmount(12.5));
        CHECK_FALSE(checkNonNegativeAmount(-0.01));
        CHECK_FALSE(checkNonNegativeAmount(std::nan("")));
    }

    TEST_CASE("Amounts beyond the supported range") {
        CHECK(checkFiniteAmount(MAX_AMOUNT));
        CHECK(checkFiniteAmount(-MAX_AMOUNT));
        CHECK(checkPositiveAmount(MAX_AMOUNT));

        auto verdict = checkFiniteAmount(1e17);
        CHECK_FALSE(verdict.ok);
        CHECK(verdict.reason.find("exceeds") != std::string::npos);

        CHECK_FALSE(checkFiniteAmount(-1e17));
        CHECK_FALSE(checkNonNegativeAmount(1e17));
        CHECK(checkPositiveAmount(1e17).reason.find("exceeds") != std::string::npos);
        CHECK(checkPositiveAmount(-1e17).reason.find("exceeds") != std::string::npos);
    }

    TEST_CASE("Categories fold case and ignore surrounding whitespace") {
        CHECK(checkCategory("asset"));
        CHECK(checkCategory("Liability"));
        CHECK(checkCategory("  EQUITY "));
        CHECK(checkCategory("income"));
        CHECK(checkCategory("Expense"));

        CHECK_FALSE(checkCategory("expenses"));
        CHECK_FALSE(checkCategory("commodity"));
        CHECK_FALSE(checkCategory(""));
    }

    TEST_CASE("Account names") {
        CHECK(checkAccountName("Cash"));
        CHECK(checkAccountName("  Cash  "));
        CHECK_FALSE(checkAccountName(""));
        CHECK_FALSE(checkAccountName("   "));
        CHECK(checkAccountName(std::string(MAX_ACCOUNT_NAME_LENGTH, 'x')));
        CHECK_FALSE(checkAccountName(std::string(MAX_ACCOUNT_NAME_LENGTH + 1, 'x')));
    }

    TEST_CASE("Identifiers") {
        CHECK(checkId(1));
        CHECK_FALSE(checkId(0));
        CHECK_FALSE(checkId(-7));
    }

    TEST_CASE("String helpers") {
        CHECK(trim("  a b \t\n") == "a b");
        CHECK(trim("") == "");
        CHECK(toLower("MiXeD") == "mixed");
    }
}
