#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

#include <ledgerbook/accounting/account.hpp>
#include <ledgerbook/common/money.hpp>

namespace ledgerbook::accounting {

    struct Budget {
        int64_t id = 0;
        AccountId account_id = 0;
        std::string account_name;
        AccountCategory category = AccountCategory::Expense;
        std::string period; // YYYY-MM
        Money amount;
    };

    /// Actual spend as a share of budget. Undefined when nothing was budgeted.
    struct BudgetShare {
        bool applicable = false;
        double percent = 0.0;

        inline static BudgetShare of(double pct) { return BudgetShare{true, pct}; }
        inline static BudgetShare notApplicable() { return BudgetShare{false, 0.0}; }

        /// actual / budgeted * 100, or NotApplicable for a zero budget
        inline static BudgetShare compute(Money actual, Money budgeted) {
            if (budgeted.isZero())
                return notApplicable();
            return of(static_cast<double>(actual.minor) / static_cast<double>(budgeted.minor) * 100.0);
        }

        inline bool isApplicable() const { return applicable; }

        /// "87.5%" or "n/a"
        inline std::string toString() const {
            if (!applicable)
                return "n/a";
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.1f%%", percent);
            return std::string(buf);
        }
    };

    /// One row of the budget-vs-actual report
    struct BudgetReportRow {
        AccountId account_id = 0;
        std::string category; // the account's name, e.g. "Groceries"
        AccountCategory account_category = AccountCategory::Expense;
        Money budgeted;
        Money actual;
        Money variance; // budgeted - actual
        BudgetShare pct_of_budget;
    };

    struct CopySummary {
        int64_t copied = 0; // rows created in the target period
        int64_t kept = 0;   // target rows that already existed and were left alone
    };

    /// Point-in-time totals over the balance-sheet categories
    struct FinancialSummary {
        Money total_assets;
        Money total_liabilities;
        Money total_equity;
        Money total_income;
        Money total_expenses;

        inline Money netWorth() const { return total_assets - total_liabilities; }
    };

} // namespace ledgerbook::accounting
