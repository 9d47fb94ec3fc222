#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace ledgerbook::storage {

    // ===========================================
    // Row types
    // ===========================================

    /// Row of the accounts table
    struct AccountRecord {
        int64_t id = 0;
        std::string name;
        std::string category;
        int64_t opening_balance = 0; // minor units
        int64_t created_at = 0;
    };

    /// Row of the transactions table
    struct TransactionRecord {
        int64_t id = 0;
        std::string date; // YYYY-MM-DD
        int64_t amount = 0; // minor units, always > 0
        int64_t debit_account_id = 0;
        int64_t credit_account_id = 0;
        std::string notes;
        std::optional<int64_t> reversal_of;
        int64_t created_at = 0;
        int64_t modified_at = 0;
    };

    /// Transaction joined with the names of both accounts
    struct TransactionRow {
        TransactionRecord record;
        std::string debit_account_name;
        std::string credit_account_name;
    };

    /// Row of the budgets table joined with its account
    struct BudgetRecord {
        int64_t id = 0;
        int64_t account_id = 0;
        std::string account_name;
        std::string account_category;
        std::string period; // YYYY-MM
        int64_t amount = 0; // minor units
    };

    /// Debit and credit totals, in minor units
    struct MovementTotals {
        int64_t debits = 0;
        int64_t credits = 0;
    };

    /// Filter for transaction queries. Date bounds are inclusive ISO dates.
    struct TransactionFilter {
        std::optional<std::string> text; // case-insensitive match over notes and account names
        std::optional<std::string> date_from;
        std::optional<std::string> date_to;
        std::optional<int64_t> account_id; // either side
        std::optional<int64_t> debit_account_id;
        std::optional<int64_t> credit_account_id;
        int32_t limit = -1; // -1 = no limit
        int32_t offset = 0;

        TransactionFilter() = default;
    };

    /// SQLite database configuration
    struct OpenOptions {
        bool enable_wal = true;
        bool enable_foreign_keys = true;
        int32_t busy_timeout_ms = 5000;
        int32_t cache_size_kb = 20000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;

        OpenOptions() = default;
    };

    // ===========================================
    // SqliteStore - ledger persistence boundary
    // ===========================================

    class SqliteStore {
      public:
        SqliteStore();
        ~SqliteStore();

        // Non-copyable, movable
        SqliteStore(const SqliteStore &) = delete;
        SqliteStore &operator=(const SqliteStore &) = delete;
        SqliteStore(SqliteStore &&) noexcept;
        SqliteStore &operator=(SqliteStore &&) noexcept;

        /// Open or create database at given path (":memory:" for a private in-memory ledger)
        /// @param path Database file path
        /// @param opts Configuration options
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        /// Close database connection
        void close();

        /// Check if database is open
        bool isOpen() const;

        /// Create ledger tables and run pending migrations. Idempotent.
        dp::Result<void, dp::Error> initializeCoreSchema();

        /// Current schema version (0 before initialization)
        int32_t schemaVersion();

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        class TxGuard {
          public:
            explicit TxGuard(SqliteStore &store);
            ~TxGuard();

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            /// @return true if the unit of work is now durable
            bool commit();
            void rollback();

            bool isActive() const { return active_; }

          private:
            SqliteStore &store_;
            bool active_;
            bool committed_;
        };

        std::unique_ptr<TxGuard> beginTransaction();

        // ===========================================
        // Accounts
        // ===========================================

        /// Insert unless (name, category) exists
        /// @return new id, or nullopt when the account was already present
        dp::Result<std::optional<int64_t>, dp::Error> insertAccountIfAbsent(const std::string &name,
                                                                           const std::string &category);

        dp::Result<std::optional<AccountRecord>, dp::Error> getAccount(int64_t id);

        dp::Result<std::optional<AccountRecord>, dp::Error> getAccountByName(const std::string &name,
                                                                            const std::string &category);

        /// All accounts with this exact name, any category
        dp::Result<std::vector<AccountRecord>, dp::Error> findAccountsByName(const std::string &name);

        /// Accounts in insertion order, optionally restricted to one category
        dp::Result<std::vector<AccountRecord>, dp::Error>
        listAccounts(const std::optional<std::string> &category = std::nullopt);

        dp::Result<void, dp::Error> updateOpeningBalance(int64_t id, int64_t amount);

        dp::Result<int64_t, dp::Error> countAccounts();

        // ===========================================
        // Transactions
        // ===========================================

        /// @return id of the inserted row
        dp::Result<int64_t, dp::Error> insertTransaction(const TransactionRecord &record);

        dp::Result<std::optional<TransactionRecord>, dp::Error> getTransaction(int64_t id);

        /// Id of the posting that reverses `id`, if any
        dp::Result<std::optional<int64_t>, dp::Error> findReversalOf(int64_t id);

        /// Overwrite all mutable columns of an existing row
        dp::Result<void, dp::Error> updateTransaction(const TransactionRecord &record);

        dp::Result<void, dp::Error> deleteTransaction(int64_t id);

        /// Matching transactions ordered by date, then id
        dp::Result<std::vector<TransactionRow>, dp::Error> queryTransactions(const TransactionFilter &filter);

        /// Debits to and credits from one account, optionally within inclusive date bounds
        dp::Result<MovementTotals, dp::Error> sumMovements(int64_t account_id,
                                                           const std::optional<std::string> &date_from = std::nullopt,
                                                           const std::optional<std::string> &date_to = std::nullopt);

        /// Ledger-wide totals: every debit leg and every credit leg
        dp::Result<MovementTotals, dp::Error> sumAllPostings();

        dp::Result<int64_t, dp::Error> countTransactions();

        // ===========================================
        // Budgets
        // ===========================================

        /// Insert or replace the amount for (account, period)
        dp::Result<void, dp::Error> upsertBudget(int64_t account_id, const std::string &period, int64_t amount);

        /// @return true if inserted, false if the (account, period) row already existed
        dp::Result<bool, dp::Error> insertBudgetIfAbsent(int64_t account_id, const std::string &period,
                                                         int64_t amount);

        /// Budgets for a period ordered by account name
        dp::Result<std::vector<BudgetRecord>, dp::Error> listBudgets(const std::string &period);

        // ===========================================
        // Period locks
        // ===========================================

        dp::Result<void, dp::Error> setPeriodLocked(const std::string &period, bool locked);

        dp::Result<bool, dp::Error> isPeriodLocked(const std::string &period);

        /// Locked periods in ascending order
        dp::Result<std::vector<std::string>, dp::Error> lockedPeriods();

        // ===========================================
        // Diagnostics & raw access
        // ===========================================

        /// Run SQLite integrity check
        bool quickCheck();

        /// Execute raw SQL statement
        bool executeSql(const std::string &sql);

        /// Last error reported by the SQLite connection
        std::string lastError() const;

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;

        void applyPragmas(const OpenOptions &opts);
        bool createCoreSchemaV1();
        bool tableExists(const std::string &table_name);
        bool setSchemaVersion(int32_t version);
        dp::Error failure(const std::string &context) const;
        dp::Result<std::optional<AccountRecord>, dp::Error> fetchOneAccount(sqlite3_stmt *stmt);
        dp::Result<std::vector<AccountRecord>, dp::Error> fetchAccounts(sqlite3_stmt *stmt);

        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *ACCOUNTS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS accounts (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL,
                category TEXT NOT NULL
                    CHECK (category IN ('asset','liability','equity','income','expense')),
                opening_balance INTEGER NOT NULL DEFAULT 0,
                created_at INTEGER NOT NULL,
                UNIQUE (name, category)
            )
        )";

        static constexpr const char *TRANSACTIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS transactions (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                date TEXT NOT NULL,
                amount INTEGER NOT NULL CHECK (amount > 0),
                debit_account_id INTEGER NOT NULL REFERENCES accounts(id),
                credit_account_id INTEGER NOT NULL REFERENCES accounts(id),
                notes TEXT NOT NULL DEFAULT '',
                reversal_of INTEGER REFERENCES transactions(id) ON DELETE SET NULL,
                created_at INTEGER NOT NULL,
                modified_at INTEGER NOT NULL,
                CHECK (debit_account_id <> credit_account_id)
            )
        )";

        static constexpr const char *BUDGETS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS budgets (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                account_id INTEGER NOT NULL REFERENCES accounts(id),
                period TEXT NOT NULL,
                amount INTEGER NOT NULL CHECK (amount >= 0),
                UNIQUE (account_id, period)
            )
        )";

        static constexpr const char *PERIOD_LOCKS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS period_locks (
                period TEXT PRIMARY KEY,
                locked INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *IDX_TX_DATE = "CREATE INDEX IF NOT EXISTS idx_tx_date ON transactions(date)";
        static constexpr const char *IDX_TX_DEBIT =
            "CREATE INDEX IF NOT EXISTS idx_tx_debit ON transactions(debit_account_id)";
        static constexpr const char *IDX_TX_CREDIT =
            "CREATE INDEX IF NOT EXISTS idx_tx_credit ON transactions(credit_account_id)";
        static constexpr const char *IDX_TX_REVERSAL =
            "CREATE INDEX IF NOT EXISTS idx_tx_reversal ON transactions(reversal_of)";
        static constexpr const char *IDX_BUDGETS_PERIOD =
            "CREATE INDEX IF NOT EXISTS idx_budgets_period ON budgets(period)";
    };

    // ===========================================
    // Utility functions
    // ===========================================

    /// Get current Unix timestamp in seconds
    int64_t currentTimestamp();

    /// Escape LIKE wildcards so user text matches literally (escape character '\')
    std::string escapeLike(const std::string &text);

} // namespace ledgerbook::storage

#include "sqlite_store_impl.hpp"
