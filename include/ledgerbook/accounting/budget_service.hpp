#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

#include <ledgerbook/accounting/account_service.hpp>
#include <ledgerbook/accounting/budget.hpp>
#include <ledgerbook/accounting/transaction_service.hpp>
#include <ledgerbook/common/config.hpp>
#include <ledgerbook/storage/sqlite_store.hpp>

namespace ledgerbook::accounting {

    /// Monthly budgets and budget-vs-actual reporting.
    /// Reports read balances and postings through the account and transaction services.
    class BudgetService {
      public:
        BudgetService(storage::SqliteStore &store, AccountService &accounts, TransactionService &transactions,
                      const LedgerConfig &config);

        /// Insert or replace the budget for (account, period)
        dp::Result<void, dp::Error> setBudget(AccountId account_id, const std::string &period, double amount);

        /// Budgets of one period ordered by account name
        dp::Result<std::vector<Budget>, dp::Error> listBudgets(const std::string &period);

        /// Copy every budget of `from_period` into `to_period`, keeping rows the target already has
        dp::Result<CopySummary, dp::Error> copyBudgetForward(const std::string &from_period,
                                                             const std::string &to_period);

        /// One row per budgeted account, plus expense accounts with unbudgeted activity.
        /// Ordered by variance ascending (largest overspend first), ties by name.
        dp::Result<std::vector<BudgetReportRow>, dp::Error> budgetVsActual(const std::string &period);

        /// Postings behind one report row
        dp::Result<std::vector<TransactionView>, dp::Error> drillDown(const std::string &period, AccountId account_id);

        /// Category totals as of a date (today's state when omitted)
        dp::Result<FinancialSummary, dp::Error> financialSummary(const std::optional<std::string> &as_of = std::nullopt);

        /// Print the budget-vs-actual table for a period
        void printReport(const std::string &period);

      private:
        storage::SqliteStore &store_;
        AccountService &accounts_;
        TransactionService &transactions_;
        bool verbose_;
    };

} // namespace ledgerbook::accounting
