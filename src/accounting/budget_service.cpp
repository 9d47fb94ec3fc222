#include <algorithm>
#include <iomanip>
#include <iostream>
#include <ledgerbook/accounting/budget_service.hpp>
#include <ledgerbook/common/calendar.hpp>
#include <ledgerbook/validation/validation.hpp>
#include <set>

namespace ledgerbook::accounting {

    BudgetService::BudgetService(storage::SqliteStore &store, AccountService &accounts,
                                 TransactionService &transactions, const LedgerConfig &config)
        : store_(store), accounts_(accounts), transactions_(transactions), verbose_(config.verbose) {}

    dp::Result<void, dp::Error> BudgetService::setBudget(AccountId account_id, const std::string &period,
                                                         double amount) {
        using R = dp::Result<void, dp::Error>;

        auto period_check = validation::checkYearMonth(period);
        if (!period_check)
            return R::err(invalid_input(period_check.reason));
        auto amount_check = validation::checkNonNegativeAmount(amount);
        if (!amount_check)
            return R::err(invalid_amount(amount_check.reason));

        auto account = accounts_.findAccount(account_id);
        if (account.is_err())
            return R::err(account.error());

        auto tx = store_.beginTransaction();
        auto stored = store_.upsertBudget(account_id, period, Money::fromDouble(amount).minor);
        if (stored.is_err())
            return stored;
        if (!tx->commit())
            return R::err(storage_failure("Cannot commit budget: " + store_.lastError()));
        return R::ok();
    }

    dp::Result<std::vector<Budget>, dp::Error> BudgetService::listBudgets(const std::string &period) {
        using R = dp::Result<std::vector<Budget>, dp::Error>;

        auto period_check = validation::checkYearMonth(period);
        if (!period_check)
            return R::err(invalid_input(period_check.reason));

        auto records = store_.listBudgets(period);
        if (records.is_err())
            return R::err(records.error());

        std::vector<Budget> budgets;
        budgets.reserve(records.value().size());
        for (const auto &record : records.value()) {
            Budget budget;
            budget.id = record.id;
            budget.account_id = record.account_id;
            budget.account_name = record.account_name;
            budget.category = categoryFromString(record.account_category).value_or(AccountCategory::Expense);
            budget.period = record.period;
            budget.amount = Money::fromMinor(record.amount);
            budgets.push_back(std::move(budget));
        }
        return R::ok(std::move(budgets));
    }

    dp::Result<CopySummary, dp::Error> BudgetService::copyBudgetForward(const std::string &from_period,
                                                                        const std::string &to_period) {
        using R = dp::Result<CopySummary, dp::Error>;

        for (const auto &period : {from_period, to_period}) {
            auto period_check = validation::checkYearMonth(period);
            if (!period_check)
                return R::err(invalid_input(period_check.reason));
        }
        if (from_period == to_period)
            return R::err(invalid_input("Source and target period are both " + from_period));

        auto source = store_.listBudgets(from_period);
        if (source.is_err())
            return R::err(source.error());

        CopySummary summary;
        auto tx = store_.beginTransaction();
        for (const auto &row : source.value()) {
            auto inserted = store_.insertBudgetIfAbsent(row.account_id, to_period, row.amount);
            if (inserted.is_err())
                return R::err(inserted.error());
            if (inserted.value())
                ++summary.copied;
            else
                ++summary.kept;
        }
        if (!tx->commit())
            return R::err(storage_failure("Cannot commit budget copy: " + store_.lastError()));

        if (verbose_) {
            std::cout << "Budgets " << from_period << " -> " << to_period << ": " << summary.copied << " copied, "
                      << summary.kept << " kept" << std::endl;
        }
        return R::ok(summary);
    }

    dp::Result<std::vector<BudgetReportRow>, dp::Error> BudgetService::budgetVsActual(const std::string &period) {
        using R = dp::Result<std::vector<BudgetReportRow>, dp::Error>;

        auto month = YearMonth::parse(period);
        if (!month)
            return R::err(invalid_input("Period '" + period + "' is not a valid YYYY-MM month"));
        const std::string first = month->firstDay();
        const std::string last = month->lastDay();

        auto budgets = listBudgets(period);
        if (budgets.is_err())
            return R::err(budgets.error());

        std::vector<BudgetReportRow> rows;
        std::set<AccountId> budgeted;
        for (const auto &budget : budgets.value()) {
            auto actual = accounts_.getActivity(budget.account_id, first, last);
            if (actual.is_err())
                return R::err(actual.error());

            BudgetReportRow row;
            row.account_id = budget.account_id;
            row.category = budget.account_name;
            row.account_category = budget.category;
            row.budgeted = budget.amount;
            row.actual = actual.value();
            rows.push_back(row);
            budgeted.insert(budget.account_id);
        }

        // Spending on expense accounts without a budget still shows up, against a zero budget
        auto expenses = accounts_.listAccounts(AccountCategory::Expense);
        if (expenses.is_err())
            return R::err(expenses.error());
        for (const auto &account : expenses.value()) {
            if (budgeted.count(account.id))
                continue;
            auto actual = accounts_.getActivity(account.id, first, last);
            if (actual.is_err())
                return R::err(actual.error());
            if (actual.value().isZero())
                continue;

            BudgetReportRow row;
            row.account_id = account.id;
            row.category = account.name;
            row.account_category = account.category;
            row.budgeted = Money::zero();
            row.actual = actual.value();
            rows.push_back(row);
        }

        for (auto &row : rows) {
            row.variance = row.budgeted - row.actual;
            row.pct_of_budget = BudgetShare::compute(row.actual, row.budgeted);
        }

        std::sort(rows.begin(), rows.end(), [](const BudgetReportRow &a, const BudgetReportRow &b) {
            if (a.variance != b.variance)
                return a.variance < b.variance;
            if (a.category != b.category)
                return a.category < b.category;
            return a.account_id < b.account_id;
        });
        return R::ok(std::move(rows));
    }

    dp::Result<std::vector<TransactionView>, dp::Error> BudgetService::drillDown(const std::string &period,
                                                                                 AccountId account_id) {
        using R = dp::Result<std::vector<TransactionView>, dp::Error>;

        auto month = YearMonth::parse(period);
        if (!month)
            return R::err(invalid_input("Period '" + period + "' is not a valid YYYY-MM month"));
        auto account = accounts_.findAccount(account_id);
        if (account.is_err())
            return R::err(account.error());

        TransactionQuery query;
        query.account_id = account_id;
        query.date_from = month->firstDay();
        query.date_to = month->lastDay();
        query.limit = -1;
        return transactions_.searchTransactions(query);
    }

    dp::Result<FinancialSummary, dp::Error> BudgetService::financialSummary(const std::optional<std::string> &as_of) {
        using R = dp::Result<FinancialSummary, dp::Error>;

        auto balances = accounts_.listBalances(std::nullopt, as_of);
        if (balances.is_err())
            return R::err(balances.error());

        FinancialSummary summary;
        for (const auto &entry : balances.value()) {
            switch (entry.account.category) {
            case AccountCategory::Asset:
                summary.total_assets += entry.balance;
                break;
            case AccountCategory::Liability:
                summary.total_liabilities += entry.balance;
                break;
            case AccountCategory::Equity:
                summary.total_equity += entry.balance;
                break;
            case AccountCategory::Income:
                summary.total_income += entry.balance;
                break;
            case AccountCategory::Expense:
                summary.total_expenses += entry.balance;
                break;
            }
        }
        return R::ok(summary);
    }

    void BudgetService::printReport(const std::string &period) {
        auto rows = budgetVsActual(period);
        if (rows.is_err()) {
            std::cout << "Cannot build budget report: " << describe(rows.error()) << std::endl;
            return;
        }

        std::cout << "=== Budget vs Actual " << period << " ===\n";
        std::cout << std::left << std::setw(32) << "Category" << std::right << std::setw(12) << "Budget"
                  << std::setw(12) << "Actual" << std::setw(12) << "Variance" << std::setw(10) << "% Used" << "\n";
        for (const auto &row : rows.value()) {
            std::cout << std::left << std::setw(32) << row.category << std::right << std::setw(12)
                      << row.budgeted.toString() << std::setw(12) << row.actual.toString() << std::setw(12)
                      << row.variance.toString() << std::setw(10) << row.pct_of_budget.toString() << "\n";
        }
        std::cout << "Rows: " << rows.value().size() << std::endl;
    }

} // namespace ledgerbook::accounting
