/**
 * Example: a month of household bookkeeping with Ledgerbook
 *
 * This demo shows how to:
 * 1. Open a ledger (LEDGERBOOK_DB_PATH, defaults to an in-memory database here)
 * 2. Seed the default chart of accounts and set opening balances
 * 3. Post double-entry transactions, lock a month and correct it with a reversal
 * 4. Budget a month and compare it with actual spending
 */

#include <cstdlib>
#include <iostream>
#include <ledgerbook.hpp>

using namespace ledgerbook;
using namespace ledgerbook::accounting;

namespace {

    AccountId requireAccount(AccountService &accounts, const std::string &name) {
        auto account = accounts.findAccountByName(name);
        if (account.is_err()) {
            std::cerr << describe(account.error()) << std::endl;
            std::exit(1);
        }
        return account.value().id;
    }

    void report(const std::string &step, const dp::Result<TransactionId, dp::Error> &result) {
        if (result.is_ok())
            std::cout << "  " << step << " -> transaction #" << result.value() << std::endl;
        else
            std::cout << "  " << step << " -> " << describe(result.error()) << std::endl;
    }

    void check(const std::string &step, const dp::Result<void, dp::Error> &result) {
        if (result.is_err())
            std::cout << "  " << step << " failed: " << describe(result.error()) << std::endl;
    }

} // namespace

int main() {
    std::cout << "=== Ledgerbook Demo ===" << std::endl;

    LedgerConfig config = LedgerConfig::fromEnvironment();
    if (std::getenv("LEDGERBOOK_DB_PATH") == nullptr)
        config.db_path = ":memory:";

    Ledgerbook book(config);
    auto opened = book.initialize();
    if (opened.is_err()) {
        std::cerr << "Cannot open ledger: " << describe(opened.error()) << std::endl;
        return 1;
    }

    auto &accounts = book.getAccounts();
    auto &transactions = book.getTransactions();
    auto &budgets = book.getBudgets();

    // ===========================================
    // Step 1: Chart of accounts
    // ===========================================
    std::cout << "\n--- Step 1: Chart of accounts ---" << std::endl;
    auto seeded = accounts.initializeDefaultChart();
    if (seeded.is_err()) {
        std::cerr << describe(seeded.error()) << std::endl;
        return 1;
    }
    std::cout << "  Seeded " << seeded.value().added << " accounts (" << seeded.value().existing
              << " already present)" << std::endl;

    auto imported = accounts.importChart({{"Pet Care", "Expense"}, {"Side Project", "income"}, {"", "asset"},
                                          {"Cash", "asset"}, {"Crypto Wallet", "commodity"}});
    if (imported.is_ok()) {
        std::cout << "  Import: " << imported.value().added << " added, " << imported.value().skipped
                  << " skipped" << std::endl;
        for (const auto &error : imported.value().errors)
            std::cout << "    row " << error.row << ": " << error.message << std::endl;
    }

    const AccountId cash = requireAccount(accounts, "Cash");
    const AccountId bank = requireAccount(accounts, "Bank - KBank");
    const AccountId card = requireAccount(accounts, "Credit Card - KBank");
    const AccountId salary = requireAccount(accounts, "Salary");
    const AccountId groceries = requireAccount(accounts, "Groceries");
    const AccountId dining = requireAccount(accounts, "Food & Dining");
    const AccountId transport = requireAccount(accounts, "Transportation");

    check("setOpeningBalance", accounts.setOpeningBalance(cash, 1500.00));
    check("setOpeningBalance", accounts.setOpeningBalance(bank, 42000.00));
    check("setOpeningBalance", accounts.setOpeningBalance(card, 3200.00));

    // ===========================================
    // Step 2: Postings
    // ===========================================
    std::cout << "\n--- Step 2: Postings ---" << std::endl;
    report("Salary", transactions.addTransaction("2025-10-01", 35000.00, bank, salary, "October salary"));
    report("Groceries", transactions.addTransaction("2025-10-03", 1280.50, groceries, card, "Big C weekly shop"));
    report("Lunch", transactions.addTransaction("2025-10-04", 145.00, dining, cash, "Khao man gai"));
    auto taxi = transactions.addTransaction("2025-10-05", 320.00, transport, cash, "Taxi to airport");
    report("Taxi", taxi);
    report("Same account", transactions.addTransaction("2025-10-06", 10.00, cash, cash));
    report("Credit an expense", transactions.addTransaction("2025-10-06", 10.00, cash, groceries));

    // ===========================================
    // Step 3: Close October, correct it in November
    // ===========================================
    std::cout << "\n--- Step 3: Period lock and reversal ---" << std::endl;
    check("lockPeriod", transactions.lockPeriod("2025-10"));
    if (taxi.is_ok()) {
        auto removed = transactions.deleteTransaction(taxi.value());
        std::cout << "  Delete locked taxi: " << (removed.is_ok() ? "ok" : describe(removed.error())) << std::endl;
        report("Reversal", transactions.reverseTransaction(taxi.value(), "2025-11-01", "Taxi refunded"));
    }

    // ===========================================
    // Step 4: Budgets
    // ===========================================
    std::cout << "\n--- Step 4: Budgets ---" << std::endl;
    check("setBudget", budgets.setBudget(groceries, "2025-10", 5000.00));
    check("setBudget", budgets.setBudget(dining, "2025-10", 100.00));
    check("setBudget", budgets.setBudget(transport, "2025-10", 0.00));
    budgets.printReport("2025-10");

    auto copied = budgets.copyBudgetForward("2025-10", "2025-11");
    if (copied.is_ok())
        std::cout << "  Copied " << copied.value().copied << " budgets to 2025-11" << std::endl;

    auto summary = budgets.financialSummary();
    if (summary.is_ok()) {
        std::cout << "  Assets: " << summary.value().total_assets.toString()
                  << "  Liabilities: " << summary.value().total_liabilities.toString()
                  << "  Net worth: " << summary.value().netWorth().toString() << std::endl;
    }

    std::cout << std::endl;
    book.printSummary();
    return 0;
}
