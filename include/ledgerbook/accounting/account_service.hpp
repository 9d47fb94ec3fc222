#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

#include <ledgerbook/accounting/account.hpp>
#include <ledgerbook/common/config.hpp>
#include <ledgerbook/common/error.hpp>
#include <ledgerbook/common/money.hpp>
#include <ledgerbook/storage/sqlite_store.hpp>

namespace ledgerbook::accounting {

    /// Chart-of-accounts lifecycle and balance derivation
    class AccountService {
      public:
        AccountService(storage::SqliteStore &store, const LedgerConfig &config);

        /// Seed the built-in chart. Safe to call repeatedly.
        dp::Result<SeedSummary, dp::Error> initializeDefaultChart();

        /// Import candidate rows one by one; bad rows are reported, never fatal.
        /// Each accepted row is committed on its own, so a storage failure keeps earlier rows.
        dp::Result<ImportSummary, dp::Error> importChart(const std::vector<ChartRow> &rows);

        /// Add one account; an existing (name, category) returns its id with created = false
        dp::Result<AddAccountOutcome, dp::Error> addAccount(const std::string &name, const std::string &category);

        /// Overwrite the opening balance. Any finite value is accepted, in the account's normal direction.
        dp::Result<void, dp::Error> setOpeningBalance(AccountId id, double amount);

        dp::Result<Money, dp::Error> getBalance(AccountId id);

        /// Balance including only transactions dated on or before `date`
        dp::Result<Money, dp::Error> getBalanceAsOf(AccountId id, const std::string &date);

        /// Net movement in the account's normal direction for transactions within [date_from, date_to]
        dp::Result<Money, dp::Error> getActivity(AccountId id, const std::string &date_from,
                                                 const std::string &date_to);

        /// Ordered by category (asset, liability, equity, income, expense), then name
        dp::Result<std::vector<Account>, dp::Error>
        listAccounts(std::optional<AccountCategory> category = std::nullopt);

        /// Accounts with their current balances, same order as listAccounts
        dp::Result<std::vector<AccountBalance>, dp::Error>
        listBalances(std::optional<AccountCategory> category = std::nullopt,
                     const std::optional<std::string> &as_of = std::nullopt);

        dp::Result<Account, dp::Error> findAccount(AccountId id);

        /// Exact (trimmed) name match. A name used in several categories needs the category to disambiguate.
        dp::Result<Account, dp::Error> findAccountByName(const std::string &name,
                                                        std::optional<AccountCategory> category = std::nullopt);

        /// Print the chart with balances
        void printSummary();

      private:
        storage::SqliteStore &store_;
        bool verbose_;

        dp::Result<Money, dp::Error> balanceWithin(const Account &account, const std::optional<std::string> &from,
                                                   const std::optional<std::string> &to, bool include_opening);
    };

    /// Store row to domain account
    Account toAccount(const storage::AccountRecord &record);

} // namespace ledgerbook::accounting
