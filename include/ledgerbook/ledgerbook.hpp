#pragma once

#include <datapod/datapod.hpp>
#include <iostream>
#include <string>

#include <ledgerbook/accounting/account_service.hpp>
#include <ledgerbook/accounting/budget_service.hpp>
#include <ledgerbook/accounting/transaction_service.hpp>
#include <ledgerbook/common/config.hpp>
#include <ledgerbook/common/error.hpp>
#include <ledgerbook/io/chart_import.hpp>
#include <ledgerbook/io/transaction_export.hpp>
#include <ledgerbook/storage/sqlite_store.hpp>

namespace ledgerbook {

    // ===========================================
    // Ledgerbook - store plus the three services
    // ===========================================

    /// High-level API: opens the ledger database and wires the services to it.
    /// Services keep a reference to the store, so a Ledgerbook stays where it was built.
    class Ledgerbook {
      public:
        explicit Ledgerbook(const LedgerConfig &config = LedgerConfig{})
            : config_(config), accounts_(store_, config_), transactions_(store_, accounts_, config_),
              budgets_(store_, accounts_, transactions_, config_) {}
        ~Ledgerbook() = default;

        Ledgerbook(const Ledgerbook &) = delete;
        Ledgerbook &operator=(const Ledgerbook &) = delete;
        Ledgerbook(Ledgerbook &&) = delete;
        Ledgerbook &operator=(Ledgerbook &&) = delete;

        /// Open the database named by the config and bring its schema up to date
        inline dp::Result<void, dp::Error> initialize() {
            auto opened = store_.open(config_.db_path, config_.open_options);
            if (opened.is_err())
                return opened;

            auto schema = store_.initializeCoreSchema();
            if (schema.is_err()) {
                store_.close();
                return schema;
            }

            if (config_.verbose) {
                std::cout << "Ledger opened: " << config_.db_path << " (schema v" << store_.schemaVersion() << ")"
                          << std::endl;
            }
            return dp::Result<void, dp::Error>::ok();
        }

        inline bool isInitialized() const { return store_.isOpen(); }

        inline accounting::AccountService &getAccounts() { return accounts_; }
        inline accounting::TransactionService &getTransactions() { return transactions_; }
        inline accounting::BudgetService &getBudgets() { return budgets_; }
        inline storage::SqliteStore &getStorage() { return store_; }
        inline const LedgerConfig &getConfig() const { return config_; }

        // ===========================================
        // File import / export
        // ===========================================

        /// Load a CSV or JSON chart file and import its rows
        inline dp::Result<accounting::ImportSummary, dp::Error> importChartFile(const std::string &path) {
            auto rows = io::loadChartFile(path);
            if (rows.is_err())
                return dp::Result<accounting::ImportSummary, dp::Error>::err(rows.error());
            return accounts_.importChart(rows.value());
        }

        /// Write every transaction matching `query` to a CSV file, in search order
        inline dp::Result<size_t, dp::Error>
        exportTransactions(const std::string &path,
                           const accounting::TransactionQuery &query = accounting::TransactionQuery{}) {
            accounting::TransactionQuery all = query;
            if (!all.limit)
                all.limit = -1;

            auto views = transactions_.searchTransactions(all);
            if (views.is_err())
                return dp::Result<size_t, dp::Error>::err(views.error());

            auto written = io::writeTransactionsCsv(path, views.value());
            if (written.is_err())
                return dp::Result<size_t, dp::Error>::err(written.error());
            return dp::Result<size_t, dp::Error>::ok(views.value().size());
        }

        // ===========================================
        // Statistics
        // ===========================================

        inline int64_t getAccountCount() {
            auto count = store_.countAccounts();
            return count.is_ok() ? count.value() : 0;
        }

        inline int64_t getTransactionCount() {
            auto count = store_.countTransactions();
            return count.is_ok() ? count.value() : 0;
        }

        inline void printSummary() {
            std::cout << "=== Ledgerbook Summary ===\n";
            std::cout << "Database: " << config_.db_path << "\n";
            std::cout << "Accounts: " << getAccountCount() << "\n";
            std::cout << "Transactions: " << getTransactionCount() << "\n";

            auto totals = transactions_.ledgerTotals();
            if (totals.is_ok()) {
                std::cout << "Total Debits: " << totals.value().total_debits.toString() << "\n";
                std::cout << "Total Credits: " << totals.value().total_credits.toString() << "\n";
                std::cout << "Balanced: " << (totals.value().balanced() ? "YES" : "NO") << "\n";
            }

            auto locked = transactions_.lockedPeriods();
            if (locked.is_ok() && !locked.value().empty()) {
                std::cout << "Locked Periods:";
                for (const auto &period : locked.value())
                    std::cout << " " << period;
                std::cout << "\n";
            }
            std::cout << "==========================" << std::endl;
        }

      private:
        LedgerConfig config_;
        storage::SqliteStore store_;
        accounting::AccountService accounts_;
        accounting::TransactionService transactions_;
        accounting::BudgetService budgets_;
    };

} // namespace ledgerbook
