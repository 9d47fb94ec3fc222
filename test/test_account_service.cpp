#include <doctest/doctest.h>

#include <ledgerbook/ledgerbook.hpp>
#include <limits>

using namespace ledgerbook;
using namespace ledgerbook::accounting;

namespace {

    struct AccountsFixture {
        Ledgerbook book{LedgerConfig::inMemory()};
        AccountService &accounts = book.getAccounts();
        TransactionService &transactions = book.getTransactions();

        AccountsFixture() { REQUIRE(book.initialize().is_ok()); }

        AccountId add(const std::string &name, const std::string &category) {
            auto outcome = accounts.addAccount(name, category);
            REQUIRE(outcome.is_ok());
            return outcome.value().id;
        }
    };

    std::vector<std::pair<std::string, std::string>> namesOf(const std::vector<Account> &list) {
        std::vector<std::pair<std::string, std::string>> out;
        for (const auto &account : list)
            out.emplace_back(account.name, categoryToString(account.category));
        return out;
    }

} // namespace

TEST_SUITE("AccountService") {
    TEST_CASE("Default chart seeding is idempotent") {
        AccountsFixture f;

        auto first = f.accounts.initializeDefaultChart();
        REQUIRE(first.is_ok());
        CHECK(first.value().added == static_cast<int64_t>(defaultChart().size()));
        CHECK(first.value().existing == 0);

        auto before = f.accounts.listAccounts();
        REQUIRE(before.is_ok());

        auto second = f.accounts.initializeDefaultChart();
        REQUIRE(second.is_ok());
        CHECK(second.value().added == 0);
        CHECK(second.value().existing == static_cast<int64_t>(defaultChart().size()));

        auto after = f.accounts.listAccounts();
        REQUIRE(after.is_ok());
        CHECK(namesOf(after.value()) == namesOf(before.value()));
    }

    TEST_CASE("Balance follows the category sign convention") {
        AccountsFixture f;
        AccountId cash = f.add("Cash", "asset");
        AccountId salary = f.add("Salary", "income");
        AccountId rent = f.add("Rent", "expense");
        AccountId card = f.add("Credit Card", "liability");

        SUBCASE("Asset: opening 1000, debit 200, credit 50 gives 1150") {
            REQUIRE(f.accounts.setOpeningBalance(cash, 1000.0).is_ok());
            REQUIRE(f.transactions.addTransaction("2025-10-01", 200.0, cash, salary).is_ok());
            REQUIRE(f.transactions.addTransaction("2025-10-02", 50.0, rent, cash).is_ok());

            auto balance = f.accounts.getBalance(cash);
            REQUIRE(balance.is_ok());
            CHECK(balance.value() == Money::fromDouble(1150.0));
        }

        SUBCASE("Liability and income grow on the credit side") {
            REQUIRE(f.accounts.setOpeningBalance(card, 300.0).is_ok());
            REQUIRE(f.transactions.addTransaction("2025-10-03", 120.0, rent, card).is_ok());
            REQUIRE(f.transactions.addTransaction("2025-10-04", 100.0, card, cash).is_ok());
            REQUIRE(f.transactions.addTransaction("2025-10-05", 900.0, cash, salary).is_ok());

            CHECK(f.accounts.getBalance(card).value() == Money::fromDouble(320.0));
            CHECK(f.accounts.getBalance(salary).value() == Money::fromDouble(900.0));
            CHECK(f.accounts.getBalance(rent).value() == Money::fromDouble(120.0));
        }

        SUBCASE("Balance as of a date ignores later postings") {
            REQUIRE(f.transactions.addTransaction("2025-10-01", 200.0, cash, salary).is_ok());
            REQUIRE(f.transactions.addTransaction("2025-10-20", 75.0, cash, salary).is_ok());

            CHECK(f.accounts.getBalanceAsOf(cash, "2025-10-01").value() == Money::fromDouble(200.0));
            CHECK(f.accounts.getBalanceAsOf(cash, "2025-10-31").value() == Money::fromDouble(275.0));
            CHECK(f.accounts.getBalanceAsOf(cash, "2025-09-30").value() == Money::zero());

            auto bad = f.accounts.getBalanceAsOf(cash, "2025-10-32");
            REQUIRE(bad.is_err());
            CHECK(bad.error().code == ERR_INVALID_INPUT);
        }

        SUBCASE("Activity within a window excludes the opening balance") {
            REQUIRE(f.accounts.setOpeningBalance(cash, 1000.0).is_ok());
            REQUIRE(f.transactions.addTransaction("2025-10-01", 200.0, cash, salary).is_ok());
            REQUIRE(f.transactions.addTransaction("2025-11-01", 50.0, rent, cash).is_ok());

            auto october = f.accounts.getActivity(cash, "2025-10-01", "2025-10-31");
            REQUIRE(october.is_ok());
            CHECK(october.value() == Money::fromDouble(200.0));
        }
    }

    TEST_CASE("Opening balance policy") {
        AccountsFixture f;
        AccountId card = f.add("Credit Card", "liability");

        SUBCASE("Zero and negative values are accepted") {
            REQUIRE(f.accounts.setOpeningBalance(card, 0.0).is_ok());
            CHECK(f.accounts.getBalance(card).value() == Money::zero());

            REQUIRE(f.accounts.setOpeningBalance(card, -250.0).is_ok());
            CHECK(f.accounts.getBalance(card).value() == Money::fromDouble(-250.0));
        }

        SUBCASE("Setting twice overwrites") {
            REQUIRE(f.accounts.setOpeningBalance(card, 10.0).is_ok());
            REQUIRE(f.accounts.setOpeningBalance(card, 20.0).is_ok());
            CHECK(f.accounts.findAccount(card).value().opening_balance == Money::fromDouble(20.0));
        }

        SUBCASE("Non-finite amount is InvalidAmount") {
            auto result = f.accounts.setOpeningBalance(card, std::numeric_limits<double>::infinity());
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_INVALID_AMOUNT);
        }

        SUBCASE("Out-of-range amount is InvalidAmount and leaves the balance alone") {
            REQUIRE(f.accounts.setOpeningBalance(card, 75.0).is_ok());

            auto result = f.accounts.setOpeningBalance(card, 1e17);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_INVALID_AMOUNT);
            CHECK(f.accounts.setOpeningBalance(card, -1e17).error().code == ERR_INVALID_AMOUNT);
            CHECK(f.accounts.getBalance(card).value() == Money::fromDouble(75.0));
        }

        SUBCASE("Unknown account is NotFound") {
            auto result = f.accounts.setOpeningBalance(9999, 10.0);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_NOT_FOUND);
        }
    }

    TEST_CASE("Batch import reports each bad row and keeps going") {
        AccountsFixture f;

        std::vector<ChartRow> rows = {
            {"Cash", "asset"},
            {"Savings", "Asset"},
            {"", "expense"},          // row 3: no name
            {"Credit Card", "liability"},
            {"Salary", " income "},
            {"Gold Bars", "commodity"}, // row 6: unknown category
            {"Groceries", "expense"},
            {"Owner Capital", "EQUITY"},
        };

        auto result = f.accounts.importChart(rows);
        REQUIRE(result.is_ok());
        const auto &summary = result.value();
        CHECK(summary.status == ImportStatus::Imported);
        CHECK(summary.added == 6);
        CHECK(summary.skipped == 2);
        CHECK(summary.duplicates == 0);
        REQUIRE(summary.errors.size() == 2);
        CHECK(summary.errors[0].row == 3);
        CHECK(summary.errors[0].kind == ERR_INVALID_INPUT);
        CHECK(summary.errors[1].row == 6);
        CHECK(summary.errors[1].message.find("commodity") != std::string::npos);

        auto salary = f.accounts.findAccountByName("Salary");
        REQUIRE(salary.is_ok());
        CHECK(salary.value().category == AccountCategory::Income);
    }

    TEST_CASE("Rows flagged by a file reader keep their message and source line") {
        AccountsFixture f;
        ChartRow broken;
        broken.line = 7;
        broken.defect = "Line 7 has 3 cells, expected 2";

        ChartRow cash{"Cash", "asset"};
        cash.line = 2;

        auto result = f.accounts.importChart({cash, broken});
        REQUIRE(result.is_ok());
        CHECK(result.value().added == 1);
        CHECK(result.value().skipped == 1);
        REQUIRE(result.value().errors.size() == 1);
        CHECK(result.value().errors[0].row == 2);
        CHECK(result.value().errors[0].line == 7);
        CHECK(result.value().errors[0].message == "Line 7 has 3 cells, expected 2");

        auto nothing_valid = f.accounts.importChart({broken});
        REQUIRE(nothing_valid.is_ok());
        CHECK(nothing_valid.value().status == ImportStatus::NoValidAccounts);
        CHECK(nothing_valid.value().added == 0);
    }

    TEST_CASE("Re-importing counts duplicates as skipped, not as errors") {
        AccountsFixture f;
        std::vector<ChartRow> rows = {{"Cash", "asset"}, {"Rent", "expense"}};
        REQUIRE(f.accounts.importChart(rows).is_ok());

        rows.push_back({"Rent", "expense"});
        rows.push_back({"Bonus", "income"});
        auto again = f.accounts.importChart(rows);
        REQUIRE(again.is_ok());
        CHECK(again.value().added == 1);
        CHECK(again.value().duplicates == 3);
        CHECK(again.value().skipped == 3);
        CHECK(again.value().errors.empty());
        CHECK(again.value().status == ImportStatus::Imported);

        CHECK(f.book.getAccountCount() == 3);
    }

    TEST_CASE("Import with no valid rows is a distinguished result") {
        AccountsFixture f;

        SUBCASE("Empty input") {
            auto result = f.accounts.importChart({});
            REQUIRE(result.is_ok());
            CHECK(result.value().noValidAccounts());
            CHECK(result.value().added == 0);
        }

        SUBCASE("Every row malformed") {
            auto result = f.accounts.importChart({{"", "asset"}, {"Thing", "stuff"}});
            REQUIRE(result.is_ok());
            CHECK(result.value().noValidAccounts());
            CHECK(result.value().errors.size() == 2);
            CHECK(result.value().skipped == 2);
        }
    }

    TEST_CASE("Adding a single account") {
        AccountsFixture f;

        auto created = f.accounts.addAccount("  Pet Care ", "Expense");
        REQUIRE(created.is_ok());
        CHECK(created.value().created);

        auto again = f.accounts.addAccount("Pet Care", "expense");
        REQUIRE(again.is_ok());
        CHECK_FALSE(again.value().created);
        CHECK(again.value().id == created.value().id);

        auto account = f.accounts.findAccount(created.value().id);
        REQUIRE(account.is_ok());
        CHECK(account.value().name == "Pet Care");

        CHECK(f.accounts.addAccount("", "asset").error().code == ERR_INVALID_INPUT);
        CHECK(f.accounts.addAccount("Cash", "wallet").error().code == ERR_INVALID_INPUT);
    }

    TEST_CASE("Listing orders by category, then name") {
        AccountsFixture f;
        f.add("Zebra Fund", "asset");
        f.add("Rent", "expense");
        f.add("Apple Bank", "asset");
        f.add("Salary", "income");
        f.add("Loan", "liability");
        f.add("Capital", "equity");

        auto all = f.accounts.listAccounts();
        REQUIRE(all.is_ok());
        std::vector<std::pair<std::string, std::string>> expected = {
            {"Apple Bank", "asset"},  {"Zebra Fund", "asset"}, {"Loan", "liability"},
            {"Capital", "equity"},    {"Salary", "income"},    {"Rent", "expense"},
        };
        CHECK(namesOf(all.value()) == expected);

        auto assets = f.accounts.listAccounts(AccountCategory::Asset);
        REQUIRE(assets.is_ok());
        CHECK(assets.value().size() == 2);
    }

    TEST_CASE("Finding accounts") {
        AccountsFixture f;
        AccountId cash = f.add("Cash", "asset");
        f.add("Refunds", "income");
        f.add("Refunds", "expense");

        CHECK(f.accounts.findAccount(cash).value().name == "Cash");
        CHECK(f.accounts.findAccount(0).error().code == ERR_INVALID_INPUT);
        CHECK(f.accounts.findAccount(4242).error().code == ERR_NOT_FOUND);

        CHECK(f.accounts.findAccountByName(" Cash ").value().id == cash);
        CHECK(f.accounts.findAccountByName("cash").error().code == ERR_NOT_FOUND);
        CHECK(f.accounts.findAccountByName("Refunds").error().code == ERR_INVALID_INPUT);
        CHECK(f.accounts.findAccountByName("Refunds", AccountCategory::Expense).value().category ==
              AccountCategory::Expense);
    }
}
