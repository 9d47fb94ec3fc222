#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include <ledgerbook/accounting/account_service.hpp>
#include <ledgerbook/accounting/transaction.hpp>
#include <ledgerbook/common/config.hpp>
#include <ledgerbook/storage/sqlite_store.hpp>

namespace ledgerbook::accounting {

    /// Double-entry posting, modification, deletion, reversal, search and period locks.
    ///
    /// Posting checks run in a fixed order so callers see a predictable error kind:
    ///   1. same account on both sides          -> InvalidPosting
    ///   2. malformed id / unknown account      -> InvalidInput / NotFound
    ///   3. bad date or amount                  -> InvalidInput
    ///   4. credit to expense, debit to income  -> InvalidPosting
    ///   5. date inside a locked month          -> PeriodLocked
    class TransactionService {
      public:
        TransactionService(storage::SqliteStore &store, AccountService &accounts, const LedgerConfig &config);

        /// @return id of the new transaction
        dp::Result<TransactionId, dp::Error> addTransaction(const std::string &date, double amount,
                                                            AccountId debit_account_id, AccountId credit_account_id,
                                                            const std::string &notes = "");

        /// Apply the supplied fields and revalidate the merged posting.
        /// Blocked when either the stored date or the new date is in a locked month.
        /// A reversal is exempt from the category rule only while it still mirrors its original.
        dp::Result<Transaction, dp::Error> modifyTransaction(TransactionId id, const TransactionUpdate &update);

        dp::Result<void, dp::Error> deleteTransaction(TransactionId id);

        /// Post the mirror image of `id` (debit and credit swapped, same amount) dated `date`.
        /// The original may sit in a locked month; `date` may not.
        /// A posting is reversed at most once, and a reversal cannot itself be reversed (InvalidPosting).
        dp::Result<TransactionId, dp::Error> reverseTransaction(TransactionId id, const std::string &date,
                                                                const std::string &notes = "");

        dp::Result<Transaction, dp::Error> getTransaction(TransactionId id);

        /// Matches ordered by date, then insertion order. Every match unless a limit is given
        /// (per query, or through LedgerConfig::search_limit).
        dp::Result<std::vector<TransactionView>, dp::Error>
        searchTransactions(const TransactionQuery &query = TransactionQuery{});

        dp::Result<void, dp::Error> lockPeriod(const std::string &year_month);
        dp::Result<void, dp::Error> unlockPeriod(const std::string &year_month);
        dp::Result<bool, dp::Error> isPeriodLocked(const std::string &year_month);
        dp::Result<std::vector<std::string>, dp::Error> lockedPeriods();

        /// Sum of every debit leg and every credit leg; equal on a consistent ledger
        dp::Result<LedgerTotals, dp::Error> ledgerTotals();

      private:
        storage::SqliteStore &store_;
        AccountService &accounts_;
        bool verbose_;
        int32_t search_limit_;

        /// Checks 1-4 of the posting order
        dp::Result<void, dp::Error> validatePosting(const std::string &date, double amount, AccountId debit_account_id,
                                                    AccountId credit_account_id, bool enforce_category_rule);

        /// Check 5: PeriodLocked when the month containing `date` is locked
        dp::Result<void, dp::Error> ensureOpen(const std::string &date);

        dp::Result<void, dp::Error> setLock(const std::string &year_month, bool locked);

        void reject(const std::string &operation, const dp::Error &error) const;
    };

    /// Store row to domain transaction
    Transaction toTransaction(const storage::TransactionRecord &record);

} // namespace ledgerbook::accounting
