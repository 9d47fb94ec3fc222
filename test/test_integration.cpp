#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <ledgerbook.hpp>
#include <sstream>

// Integration tests combining the services behind one Ledgerbook

using namespace ledgerbook;
using namespace ledgerbook::accounting;

namespace {

    // On-disk ledger plus scratch files, all removed afterwards
    struct LedgerFiles {
        std::string db_path;
        std::vector<std::string> extra;

        explicit LedgerFiles(const std::string &name) : db_path(name + ".db") { cleanup(); }
        ~LedgerFiles() { cleanup(); }

        std::string scratch(const std::string &file) {
            extra.push_back(file);
            return file;
        }

        void cleanup() {
            for (const auto &path : {db_path, db_path + "-wal", db_path + "-shm"}) {
                if (std::filesystem::exists(path)) {
                    std::filesystem::remove(path);
                }
            }
            for (const auto &path : extra) {
                if (std::filesystem::exists(path)) {
                    std::filesystem::remove(path);
                }
            }
        }
    };

    std::string readAll(const std::string &path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    AccountId idOf(Ledgerbook &book, const std::string &name) {
        auto account = book.getAccounts().findAccountByName(name);
        REQUIRE(account.is_ok());
        return account.value().id;
    }

} // namespace

TEST_SUITE("Integration Tests") {
    TEST_CASE("A month of household bookkeeping") {
        LedgerFiles files("test_integration_month");
        const std::string chart_path = files.scratch("test_integration_chart.csv");
        const std::string export_path = files.scratch("test_integration_export.csv");
        {
            std::ofstream chart(chart_path);
            chart << "name,type\n"
                  << "Household Bank,asset\n"
                  << "Day Job,income\n"
                  << "Weekly Shop,expense\n"
                  << ",expense\n"
                  << "Holiday Fund,asset\n";
        }

        LedgerConfig config;
        config.db_path = files.db_path;
        {
            Ledgerbook book(config);
            REQUIRE(book.initialize().is_ok());
            CHECK(book.isInitialized());

            auto seeded = book.getAccounts().initializeDefaultChart();
            REQUIRE(seeded.is_ok());
            CHECK(seeded.value().added == static_cast<int64_t>(defaultChart().size()));

            auto imported = book.importChartFile(chart_path);
            REQUIRE(imported.is_ok());
            CHECK(imported.value().added == 4);
            CHECK(imported.value().skipped == 1);
            REQUIRE(imported.value().errors.size() == 1);
            CHECK(imported.value().errors[0].row == 4);
            CHECK(imported.value().errors[0].line == 5);

            AccountId bank = idOf(book, "Household Bank");
            AccountId job = idOf(book, "Day Job");
            AccountId shop = idOf(book, "Weekly Shop");
            AccountId holiday = idOf(book, "Holiday Fund");

            auto &txns = book.getTransactions();
            REQUIRE(book.getAccounts().setOpeningBalance(bank, 2500.0).is_ok());
            REQUIRE(txns.addTransaction("2025-10-01", 42000.0, bank, job, "Salary October").is_ok());
            REQUIRE(txns.addTransaction("2025-10-04", 1800.0, shop, bank, "Shop, week 1").is_ok());
            REQUIRE(txns.addTransaction("2025-10-11", 2100.0, shop, bank, "Shop, week 2").is_ok());
            REQUIRE(txns.addTransaction("2025-10-15", 5000.0, holiday, bank, "Savings").is_ok());
            auto mistake = txns.addTransaction("2025-10-20", 900.0, shop, bank, "Double charged");
            REQUIRE(mistake.is_ok());

            REQUIRE(book.getBudgets().setBudget(shop, "2025-10", 4000.0).is_ok());
            REQUIRE(txns.lockPeriod("2025-10").is_ok());

            CHECK(txns.deleteTransaction(mistake.value()).error().code == ERR_PERIOD_LOCKED);
            REQUIRE(txns.reverseTransaction(mistake.value(), "2025-11-02", "Refund of double charge").is_ok());

            auto october = book.getBudgets().budgetVsActual("2025-10");
            REQUIRE(october.is_ok());
            REQUIRE(october.value().size() == 1);
            CHECK(october.value()[0].actual == Money::fromDouble(4800.0));
            CHECK(october.value()[0].variance == Money::fromDouble(-800.0));

            REQUIRE(book.getBudgets().copyBudgetForward("2025-10", "2025-11").is_ok());
            auto november = book.getBudgets().budgetVsActual("2025-11");
            REQUIRE(november.is_ok());
            REQUIRE(november.value().size() == 1);
            CHECK(november.value()[0].actual == Money::fromDouble(-900.0));

            CHECK(book.getAccounts().getBalance(bank).value() == Money::fromDouble(35600.0));
            CHECK(txns.ledgerTotals().value().balanced());

            TransactionQuery shop_only;
            shop_only.account_id = shop;
            auto exported = book.exportTransactions(export_path, shop_only);
            REQUIRE(exported.is_ok());
            CHECK(exported.value() == 4);
        }

        auto lines = io::parseCsv(readAll(export_path));
        REQUIRE(lines.size() == 5);
        CHECK(lines[1][0] == "2025-10-04");
        CHECK(lines[1][4] == "Shop, week 1");
        CHECK(lines[4][0] == "2025-11-02");
        CHECK(lines[4][2] == "Household Bank");
        CHECK(lines[4][3] == "Weekly Shop");

        // Everything survives a reopen
        Ledgerbook reopened(config);
        REQUIRE(reopened.initialize().is_ok());
        CHECK(reopened.getTransactionCount() == 6);
        CHECK(reopened.getAccountCount() == static_cast<int64_t>(defaultChart().size()) + 4);
        CHECK(reopened.getTransactions().isPeriodLocked("2025-10").value());
        CHECK(reopened.getBudgets().listBudgets("2025-11").value().size() == 1);

        auto summary = reopened.getBudgets().financialSummary();
        REQUIRE(summary.is_ok());
        CHECK(summary.value().total_income == Money::fromDouble(42000.0));
        CHECK(summary.value().total_expenses == Money::fromDouble(3900.0));
    }

    TEST_CASE("Initialization failures surface as storage errors") {
        LedgerConfig config;
        config.db_path = "no_such_directory/ledger.db";
        Ledgerbook book(config);

        auto opened = book.initialize();
        REQUIRE(opened.is_err());
        CHECK(opened.error().code == ERR_STORAGE_FAILURE);
        CHECK_FALSE(book.isInitialized());
    }

    TEST_CASE("Import of a missing chart file") {
        Ledgerbook book(LedgerConfig::inMemory());
        REQUIRE(book.initialize().is_ok());

        auto imported = book.importChartFile("test_integration_missing.json");
        REQUIRE(imported.is_err());
        CHECK(imported.error().code == ERR_INVALID_INPUT);
        CHECK(book.getAccountCount() == 0);
    }
}
