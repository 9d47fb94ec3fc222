#include <doctest/doctest.h>

#include <cmath>
#include <ledgerbook/ledgerbook.hpp>

using namespace ledgerbook;
using namespace ledgerbook::accounting;

namespace {

    struct BudgetFixture {
        Ledgerbook book{LedgerConfig::inMemory()};
        AccountService &accounts = book.getAccounts();
        TransactionService &transactions = book.getTransactions();
        BudgetService &budgets = book.getBudgets();

        AccountId bank = 0;
        AccountId salary = 0;
        AccountId groceries = 0;
        AccountId rent = 0;
        AccountId transport = 0;
        AccountId gifts = 0;

        BudgetFixture() {
            REQUIRE(book.initialize().is_ok());
            bank = add("Bank", "asset");
            salary = add("Salary", "income");
            groceries = add("Groceries", "expense");
            rent = add("Rent", "expense");
            transport = add("Transport", "expense");
            gifts = add("Gifts", "expense");
        }

        AccountId add(const std::string &name, const std::string &category) {
            auto outcome = accounts.addAccount(name, category);
            REQUIRE(outcome.is_ok());
            return outcome.value().id;
        }

        void spend(const std::string &date, double amount, AccountId expense) {
            REQUIRE(transactions.addTransaction(date, amount, expense, bank).is_ok());
        }

        Money budgetOf(const std::string &period, AccountId account) {
            auto list = budgets.listBudgets(period);
            REQUIRE(list.is_ok());
            for (const auto &budget : list.value()) {
                if (budget.account_id == account)
                    return budget.amount;
            }
            FAIL("no budget for account " << account << " in " << period);
            return Money::zero();
        }

        const BudgetReportRow *rowFor(const std::vector<BudgetReportRow> &rows, AccountId account) {
            for (const auto &row : rows) {
                if (row.account_id == account)
                    return &row;
            }
            return nullptr;
        }
    };

} // namespace

TEST_SUITE("BudgetService") {
    TEST_CASE("Setting budgets") {
        BudgetFixture f;

        REQUIRE(f.budgets.setBudget(f.groceries, "2025-10", 5000.0).is_ok());
        CHECK(f.budgetOf("2025-10", f.groceries) == Money::fromDouble(5000.0));

        SUBCASE("Second set replaces the amount") {
            REQUIRE(f.budgets.setBudget(f.groceries, "2025-10", 4500.0).is_ok());
            CHECK(f.budgetOf("2025-10", f.groceries) == Money::fromDouble(4500.0));
            CHECK(f.budgets.listBudgets("2025-10").value().size() == 1);
        }

        SUBCASE("Zero is a valid budget") { CHECK(f.budgets.setBudget(f.rent, "2025-10", 0.0).is_ok()); }

        SUBCASE("Rejections") {
            CHECK(f.budgets.setBudget(f.groceries, "2025-10", -1.0).error().code == ERR_INVALID_AMOUNT);
            CHECK(f.budgets.setBudget(f.groceries, "2025-10", std::nan("")).error().code == ERR_INVALID_AMOUNT);
            CHECK(f.budgets.setBudget(f.groceries, "2025-10", 1e17).error().code == ERR_INVALID_AMOUNT);
            CHECK(f.budgets.setBudget(f.groceries, "Oct 2025", 10.0).error().code == ERR_INVALID_INPUT);
            CHECK(f.budgets.setBudget(999, "2025-10", 10.0).error().code == ERR_NOT_FOUND);
            CHECK(f.budgets.setBudget(0, "2025-10", 10.0).error().code == ERR_INVALID_INPUT);
        }

        SUBCASE("Listing is ordered by account name") {
            REQUIRE(f.budgets.setBudget(f.transport, "2025-10", 800.0).is_ok());
            REQUIRE(f.budgets.setBudget(f.gifts, "2025-10", 300.0).is_ok());
            auto list = f.budgets.listBudgets("2025-10");
            REQUIRE(list.is_ok());
            REQUIRE(list.value().size() == 3);
            CHECK(list.value()[0].account_name == "Gifts");
            CHECK(list.value()[1].account_name == "Groceries");
            CHECK(list.value()[2].account_name == "Transport");
            CHECK(list.value()[0].category == AccountCategory::Expense);
        }
    }

    TEST_CASE("Copy forward keeps rows the target already has") {
        BudgetFixture f;
        REQUIRE(f.budgets.setBudget(f.groceries, "2025-10", 5000.0).is_ok());
        REQUIRE(f.budgets.setBudget(f.rent, "2025-10", 12000.0).is_ok());
        REQUIRE(f.budgets.setBudget(f.transport, "2025-10", 800.0).is_ok());
        REQUIRE(f.budgets.setBudget(f.groceries, "2025-11", 6000.0).is_ok());

        auto summary = f.budgets.copyBudgetForward("2025-10", "2025-11");
        REQUIRE(summary.is_ok());
        CHECK(summary.value().copied == 2);
        CHECK(summary.value().kept == 1);

        CHECK(f.budgetOf("2025-11", f.groceries) == Money::fromDouble(6000.0));
        CHECK(f.budgetOf("2025-11", f.rent) == Money::fromDouble(12000.0));
        CHECK(f.budgetOf("2025-11", f.transport) == Money::fromDouble(800.0));
        CHECK(f.budgets.listBudgets("2025-10").value().size() == 3);

        SUBCASE("Running it again copies nothing") {
            auto again = f.budgets.copyBudgetForward("2025-10", "2025-11");
            REQUIRE(again.is_ok());
            CHECK(again.value().copied == 0);
            CHECK(again.value().kept == 3);
        }

        SUBCASE("Empty source is a no-op") {
            auto empty = f.budgets.copyBudgetForward("2025-08", "2025-09");
            REQUIRE(empty.is_ok());
            CHECK(empty.value().copied == 0);
            CHECK(f.budgets.listBudgets("2025-09").value().empty());
        }

        SUBCASE("Bad periods") {
            CHECK(f.budgets.copyBudgetForward("2025-10", "2025-10").error().code == ERR_INVALID_INPUT);
            CHECK(f.budgets.copyBudgetForward("2025-10", "2025-1").error().code == ERR_INVALID_INPUT);
        }
    }

    TEST_CASE("Budget vs actual") {
        BudgetFixture f;
        REQUIRE(f.transactions.addTransaction("2025-10-01", 35000.0, f.bank, f.salary).is_ok());
        REQUIRE(f.budgets.setBudget(f.groceries, "2025-10", 5000.0).is_ok());
        REQUIRE(f.budgets.setBudget(f.rent, "2025-10", 12000.0).is_ok());
        REQUIRE(f.budgets.setBudget(f.gifts, "2025-10", 0.0).is_ok());

        f.spend("2025-10-03", 3200.0, f.groceries);
        f.spend("2025-10-20", 2300.0, f.groceries);
        f.spend("2025-10-01", 12000.0, f.rent);
        f.spend("2025-10-12", 150.0, f.gifts);
        f.spend("2025-10-15", 640.0, f.transport);
        f.spend("2025-09-28", 999.0, f.groceries);
        f.spend("2025-11-01", 999.0, f.rent);

        auto report = f.budgets.budgetVsActual("2025-10");
        REQUIRE(report.is_ok());
        const auto &rows = report.value();
        REQUIRE(rows.size() == 4);

        const auto *groceries = f.rowFor(rows, f.groceries);
        REQUIRE(groceries != nullptr);
        CHECK(groceries->category == "Groceries");
        CHECK(groceries->budgeted == Money::fromDouble(5000.0));
        CHECK(groceries->actual == Money::fromDouble(5500.0));
        CHECK(groceries->variance == Money::fromDouble(-500.0));
        CHECK(groceries->pct_of_budget.percent == doctest::Approx(110.0));

        const auto *rent = f.rowFor(rows, f.rent);
        REQUIRE(rent != nullptr);
        CHECK(rent->variance == Money::zero());
        CHECK(rent->pct_of_budget.toString() == "100.0%");

        SUBCASE("Zero budget has no percentage") {
            const auto *gifts = f.rowFor(rows, f.gifts);
            REQUIRE(gifts != nullptr);
            CHECK(gifts->actual == Money::fromDouble(150.0));
            CHECK(gifts->variance == Money::fromDouble(-150.0));
            CHECK_FALSE(gifts->pct_of_budget.isApplicable());
            CHECK(gifts->pct_of_budget.toString() == "n/a");
        }

        SUBCASE("Unbudgeted spending appears against a zero budget") {
            const auto *transport = f.rowFor(rows, f.transport);
            REQUIRE(transport != nullptr);
            CHECK(transport->budgeted == Money::zero());
            CHECK(transport->actual == Money::fromDouble(640.0));
            CHECK_FALSE(transport->pct_of_budget.isApplicable());
        }

        SUBCASE("Largest overspend first") {
            CHECK(rows[0].account_id == f.transport);
            CHECK(rows[1].account_id == f.groceries);
            CHECK(rows[2].account_id == f.gifts);
            CHECK(rows[3].account_id == f.rent);
        }

        SUBCASE("Reversal in the month reduces actual") {
            auto shop = f.transactions.searchTransactions();
            REQUIRE(shop.is_ok());
            TransactionId big_shop = 0;
            for (const auto &view : shop.value()) {
                if (view.transaction.date == "2025-10-20")
                    big_shop = view.transaction.id;
            }
            REQUIRE(big_shop != 0);
            REQUIRE(f.transactions.reverseTransaction(big_shop, "2025-10-25").is_ok());

            auto updated = f.budgets.budgetVsActual("2025-10");
            REQUIRE(updated.is_ok());
            const auto *row = f.rowFor(updated.value(), f.groceries);
            REQUIRE(row != nullptr);
            CHECK(row->actual == Money::fromDouble(3200.0));
            CHECK(row->variance == Money::fromDouble(1800.0));
        }

        SUBCASE("Month without budgets or spending is empty") {
            auto quiet = f.budgets.budgetVsActual("2026-02");
            REQUIRE(quiet.is_ok());
            CHECK(quiet.value().empty());
        }

        SUBCASE("Bad period") { CHECK(f.budgets.budgetVsActual("2025-10-01").error().code == ERR_INVALID_INPUT); }
    }

    TEST_CASE("Drill down lists the postings behind a row") {
        BudgetFixture f;
        f.spend("2025-10-03", 3200.0, f.groceries);
        f.spend("2025-10-20", 2300.0, f.groceries);
        f.spend("2025-09-28", 999.0, f.groceries);
        f.spend("2025-10-15", 640.0, f.transport);

        auto postings = f.budgets.drillDown("2025-10", f.groceries);
        REQUIRE(postings.is_ok());
        REQUIRE(postings.value().size() == 2);
        CHECK(postings.value()[0].transaction.date == "2025-10-03");
        CHECK(postings.value()[1].transaction.date == "2025-10-20");
        CHECK(postings.value()[0].debit_account_name == "Groceries");

        CHECK(f.budgets.drillDown("2025-10", 4242).error().code == ERR_NOT_FOUND);
        CHECK(f.budgets.drillDown("October", f.groceries).error().code == ERR_INVALID_INPUT);
    }

    TEST_CASE("Financial summary") {
        BudgetFixture f;
        AccountId card = f.add("Credit Card", "liability");
        AccountId capital = f.add("Owner Capital", "equity");

        REQUIRE(f.accounts.setOpeningBalance(f.bank, 10000.0).is_ok());
        REQUIRE(f.accounts.setOpeningBalance(capital, 10000.0).is_ok());
        REQUIRE(f.transactions.addTransaction("2025-10-01", 35000.0, f.bank, f.salary).is_ok());
        REQUIRE(f.transactions.addTransaction("2025-10-05", 1200.0, f.groceries, card).is_ok());
        REQUIRE(f.transactions.addTransaction("2025-11-02", 800.0, f.transport, f.bank).is_ok());

        auto now = f.budgets.financialSummary();
        REQUIRE(now.is_ok());
        CHECK(now.value().total_assets == Money::fromDouble(44200.0));
        CHECK(now.value().total_liabilities == Money::fromDouble(1200.0));
        CHECK(now.value().total_equity == Money::fromDouble(10000.0));
        CHECK(now.value().total_income == Money::fromDouble(35000.0));
        CHECK(now.value().total_expenses == Money::fromDouble(2000.0));
        CHECK(now.value().netWorth() == Money::fromDouble(43000.0));

        auto october = f.budgets.financialSummary(std::string("2025-10-31"));
        REQUIRE(october.is_ok());
        CHECK(october.value().total_assets == Money::fromDouble(45000.0));
        CHECK(october.value().total_expenses == Money::fromDouble(1200.0));

        CHECK(f.budgets.financialSummary(std::string("31/10/2025")).error().code == ERR_INVALID_INPUT);
    }
}
