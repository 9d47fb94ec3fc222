#pragma once

#include "sqlite_store.hpp"
#include <cctype>
#include <chrono>
#include <ledgerbook/common/error.hpp>
#include <sqlite3.h>

namespace ledgerbook::storage {

    // ===========================================
    // Utility functions implementation
    // ===========================================

    inline int64_t currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    inline std::string escapeLike(const std::string &text) {
        std::string out;
        out.reserve(text.size());
        for (char c : text) {
            if (c == '%' || c == '_' || c == '\\')
                out.push_back('\\');
            out.push_back(c);
        }
        return out;
    }

    namespace detail {
        inline std::string columnText(sqlite3_stmt *stmt, int col) {
            const unsigned char *text = sqlite3_column_text(stmt, col);
            return text ? reinterpret_cast<const char *>(text) : "";
        }

        inline void bindText(sqlite3_stmt *stmt, int index, const std::string &value) {
            sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
        }

        inline TransactionRecord readTransaction(sqlite3_stmt *stmt) {
            TransactionRecord record;
            record.id = sqlite3_column_int64(stmt, 0);
            record.date = columnText(stmt, 1);
            record.amount = sqlite3_column_int64(stmt, 2);
            record.debit_account_id = sqlite3_column_int64(stmt, 3);
            record.credit_account_id = sqlite3_column_int64(stmt, 4);
            record.notes = columnText(stmt, 5);
            if (sqlite3_column_type(stmt, 6) != SQLITE_NULL)
                record.reversal_of = sqlite3_column_int64(stmt, 6);
            record.created_at = sqlite3_column_int64(stmt, 7);
            record.modified_at = sqlite3_column_int64(stmt, 8);
            return record;
        }
    } // namespace detail

    // ===========================================
    // SqliteStore implementation
    // ===========================================

    inline SqliteStore::SqliteStore() : db_(nullptr), is_open_(false) {}

    inline SqliteStore::~SqliteStore() { close(); }

    inline SqliteStore::SqliteStore(SqliteStore &&other) noexcept
        : db_(other.db_), db_path_(std::move(other.db_path_)), is_open_(other.is_open_) {
        other.db_ = nullptr;
        other.is_open_ = false;
    }

    inline SqliteStore &SqliteStore::operator=(SqliteStore &&other) noexcept {
        if (this != &other) {
            close();
            db_ = other.db_;
            db_path_ = std::move(other.db_path_);
            is_open_ = other.is_open_;
            other.db_ = nullptr;
            other.is_open_ = false;
        }
        return *this;
    }

    inline dp::Result<void, dp::Error> SqliteStore::open(const std::string &path, const OpenOptions &opts) {
        close();
        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(
                dp::Error{ERR_STORAGE_FAILURE, dp::String(("Cannot open " + path + ": " + reason).c_str())});
        }

        db_path_ = path;
        is_open_ = true;
        applyPragmas(opts);
        return dp::Result<void, dp::Error>::ok();
    }

    inline void SqliteStore::close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
        }
    }

    inline bool SqliteStore::isOpen() const { return is_open_; }

    inline std::string SqliteStore::lastError() const { return db_ ? sqlite3_errmsg(db_) : "database not open"; }

    inline dp::Error SqliteStore::failure(const std::string &context) const {
        return dp::Error{ERR_STORAGE_FAILURE, dp::String((context + ": " + lastError()).c_str())};
    }

    inline void SqliteStore::applyPragmas(const OpenOptions &opts) {
        if (!db_)
            return;

        if (opts.enable_wal) {
            sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        }

        if (opts.enable_foreign_keys) {
            sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
        }

        std::string busy_timeout = "PRAGMA busy_timeout=" + std::to_string(opts.busy_timeout_ms) + ";";
        sqlite3_exec(db_, busy_timeout.c_str(), nullptr, nullptr, nullptr);

        std::string cache_size = "PRAGMA cache_size=-" + std::to_string(opts.cache_size_kb) + ";";
        sqlite3_exec(db_, cache_size.c_str(), nullptr, nullptr, nullptr);

        std::string sync_mode;
        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case OpenOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case OpenOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        sqlite3_exec(db_, sync_mode.c_str(), nullptr, nullptr, nullptr);
    }

    inline dp::Result<void, dp::Error> SqliteStore::initializeCoreSchema() {
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(failure("Cannot initialize schema"));

        auto tx = beginTransaction();

        if (!executeSql(SCHEMA_MIGRATIONS_TABLE))
            return dp::Result<void, dp::Error>::err(failure("Cannot create schema_migrations"));

        int32_t current_version = schemaVersion();

        if (current_version < 1) {
            if (!createCoreSchemaV1())
                return dp::Result<void, dp::Error>::err(failure("Cannot create ledger schema"));
            if (!setSchemaVersion(1))
                return dp::Result<void, dp::Error>::err(failure("Cannot record schema version"));
        }

        if (!tx->commit())
            return dp::Result<void, dp::Error>::err(failure("Cannot commit schema"));
        return dp::Result<void, dp::Error>::ok();
    }

    inline bool SqliteStore::createCoreSchemaV1() {
        return executeSql(ACCOUNTS_TABLE) && executeSql(TRANSACTIONS_TABLE) && executeSql(BUDGETS_TABLE) &&
               executeSql(PERIOD_LOCKS_TABLE) && executeSql(IDX_TX_DATE) && executeSql(IDX_TX_DEBIT) &&
               executeSql(IDX_TX_CREDIT) && executeSql(IDX_TX_REVERSAL) && executeSql(IDX_BUDGETS_PERIOD);
    }

    inline bool SqliteStore::tableExists(const std::string &table_name) {
        if (!db_)
            return false;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        detail::bindText(stmt, 1, table_name);

        bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
        sqlite3_finalize(stmt);

        return exists;
    }

    inline int32_t SqliteStore::schemaVersion() {
        if (!tableExists("schema_migrations"))
            return 0;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT MAX(version) FROM schema_migrations";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        int32_t version = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            version = sqlite3_column_int(stmt, 0);
        }

        sqlite3_finalize(stmt);
        return version;
    }

    inline bool SqliteStore::setSchemaVersion(int32_t version) {
        sqlite3_stmt *stmt;
        const char *sql = "INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_int(stmt, 1, version);
        sqlite3_bind_int64(stmt, 2, currentTimestamp());

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        return success;
    }

    // ===========================================
    // Transaction Guard
    // ===========================================

    inline SqliteStore::TxGuard::TxGuard(SqliteStore &store) : store_(store), active_(false), committed_(false) {
        if (store_.db_) {
            active_ = (sqlite3_exec(store_.db_, "BEGIN TRANSACTION", nullptr, nullptr, nullptr) == SQLITE_OK);
        }
    }

    inline SqliteStore::TxGuard::~TxGuard() {
        if (active_ && !committed_) {
            sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    inline bool SqliteStore::TxGuard::commit() {
        if (active_ && !committed_) {
            if (sqlite3_exec(store_.db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
                return false;
            }
            committed_ = true;
            active_ = false;
            return true;
        }
        return committed_;
    }

    inline void SqliteStore::TxGuard::rollback() {
        if (active_ && !committed_) {
            sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
            committed_ = true;
            active_ = false;
        }
    }

    inline std::unique_ptr<SqliteStore::TxGuard> SqliteStore::beginTransaction() {
        return std::make_unique<TxGuard>(*this);
    }

    // ===========================================
    // Accounts
    // ===========================================

    inline dp::Result<std::optional<AccountRecord>, dp::Error> SqliteStore::fetchOneAccount(sqlite3_stmt *stmt) {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            AccountRecord record;
            record.id = sqlite3_column_int64(stmt, 0);
            record.name = detail::columnText(stmt, 1);
            record.category = detail::columnText(stmt, 2);
            record.opening_balance = sqlite3_column_int64(stmt, 3);
            record.created_at = sqlite3_column_int64(stmt, 4);
            sqlite3_finalize(stmt);
            return dp::Result<std::optional<AccountRecord>, dp::Error>::ok(std::optional<AccountRecord>(record));
        }

        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
            return dp::Result<std::optional<AccountRecord>, dp::Error>::err(failure("Account lookup failed"));
        return dp::Result<std::optional<AccountRecord>, dp::Error>::ok(std::optional<AccountRecord>());
    }

    inline dp::Result<std::vector<AccountRecord>, dp::Error> SqliteStore::fetchAccounts(sqlite3_stmt *stmt) {
        std::vector<AccountRecord> accounts;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            AccountRecord record;
            record.id = sqlite3_column_int64(stmt, 0);
            record.name = detail::columnText(stmt, 1);
            record.category = detail::columnText(stmt, 2);
            record.opening_balance = sqlite3_column_int64(stmt, 3);
            record.created_at = sqlite3_column_int64(stmt, 4);
            accounts.push_back(std::move(record));
        }

        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
            return dp::Result<std::vector<AccountRecord>, dp::Error>::err(failure("Account listing failed"));
        return dp::Result<std::vector<AccountRecord>, dp::Error>::ok(std::move(accounts));
    }

    inline dp::Result<std::optional<int64_t>, dp::Error> SqliteStore::insertAccountIfAbsent(const std::string &name,
                                                                                           const std::string &category) {
        using R = dp::Result<std::optional<int64_t>, dp::Error>;
        if (!db_ || !is_open_)
            return R::err(failure("Cannot insert account"));

        sqlite3_stmt *stmt;
        const char *sql = "INSERT INTO accounts (name, category, opening_balance, created_at) "
                          "VALUES (?, ?, 0, ?) ON CONFLICT(name, category) DO NOTHING";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return R::err(failure("Cannot insert account"));
        }

        detail::bindText(stmt, 1, name);
        detail::bindText(stmt, 2, category);
        sqlite3_bind_int64(stmt, 3, currentTimestamp());

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE)
            return R::err(failure("Cannot insert account '" + name + "'"));
        if (sqlite3_changes(db_) == 0)
            return R::ok(std::optional<int64_t>());
        return R::ok(std::optional<int64_t>(sqlite3_last_insert_rowid(db_)));
    }

    inline dp::Result<std::optional<AccountRecord>, dp::Error> SqliteStore::getAccount(int64_t id) {
        if (!db_ || !is_open_)
            return dp::Result<std::optional<AccountRecord>, dp::Error>::err(failure("Account lookup failed"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT id, name, category, opening_balance, created_at FROM accounts WHERE id = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<std::optional<AccountRecord>, dp::Error>::err(failure("Account lookup failed"));
        }

        sqlite3_bind_int64(stmt, 1, id);
        return fetchOneAccount(stmt);
    }

    inline dp::Result<std::optional<AccountRecord>, dp::Error>
    SqliteStore::getAccountByName(const std::string &name, const std::string &category) {
        if (!db_ || !is_open_)
            return dp::Result<std::optional<AccountRecord>, dp::Error>::err(failure("Account lookup failed"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT id, name, category, opening_balance, created_at FROM accounts "
                          "WHERE name = ? AND category = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<std::optional<AccountRecord>, dp::Error>::err(failure("Account lookup failed"));
        }

        detail::bindText(stmt, 1, name);
        detail::bindText(stmt, 2, category);
        return fetchOneAccount(stmt);
    }

    inline dp::Result<std::vector<AccountRecord>, dp::Error> SqliteStore::findAccountsByName(const std::string &name) {
        if (!db_ || !is_open_)
            return dp::Result<std::vector<AccountRecord>, dp::Error>::err(failure("Account lookup failed"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT id, name, category, opening_balance, created_at FROM accounts "
                          "WHERE name = ? ORDER BY id";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<std::vector<AccountRecord>, dp::Error>::err(failure("Account lookup failed"));
        }

        detail::bindText(stmt, 1, name);
        return fetchAccounts(stmt);
    }

    inline dp::Result<std::vector<AccountRecord>, dp::Error>
    SqliteStore::listAccounts(const std::optional<std::string> &category) {
        if (!db_ || !is_open_)
            return dp::Result<std::vector<AccountRecord>, dp::Error>::err(failure("Account listing failed"));

        sqlite3_stmt *stmt;
        std::string sql = "SELECT id, name, category, opening_balance, created_at FROM accounts";
        if (category)
            sql += " WHERE category = ?";
        sql += " ORDER BY id";

        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<std::vector<AccountRecord>, dp::Error>::err(failure("Account listing failed"));
        }

        if (category)
            detail::bindText(stmt, 1, *category);
        return fetchAccounts(stmt);
    }

    inline dp::Result<void, dp::Error> SqliteStore::updateOpeningBalance(int64_t id, int64_t amount) {
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(failure("Cannot update opening balance"));

        sqlite3_stmt *stmt;
        const char *sql = "UPDATE accounts SET opening_balance = ? WHERE id = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(failure("Cannot update opening balance"));
        }

        sqlite3_bind_int64(stmt, 1, amount);
        sqlite3_bind_int64(stmt, 2, id);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(failure("Cannot update opening balance"));
        return dp::Result<void, dp::Error>::ok();
    }

    inline dp::Result<int64_t, dp::Error> SqliteStore::countAccounts() {
        if (!db_ || !is_open_)
            return dp::Result<int64_t, dp::Error>::err(failure("Cannot count accounts"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT COUNT(*) FROM accounts";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<int64_t, dp::Error>::err(failure("Cannot count accounts"));
        }

        int64_t count = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int64(stmt, 0);
        }

        sqlite3_finalize(stmt);
        return dp::Result<int64_t, dp::Error>::ok(count);
    }

    // ===========================================
    // Transactions
    // ===========================================

    inline dp::Result<int64_t, dp::Error> SqliteStore::insertTransaction(const TransactionRecord &record) {
        if (!db_ || !is_open_)
            return dp::Result<int64_t, dp::Error>::err(failure("Cannot insert transaction"));

        sqlite3_stmt *stmt;
        const char *sql = "INSERT INTO transactions (date, amount, debit_account_id, credit_account_id, notes, "
                          "reversal_of, created_at, modified_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<int64_t, dp::Error>::err(failure("Cannot insert transaction"));
        }

        int64_t now = currentTimestamp();
        detail::bindText(stmt, 1, record.date);
        sqlite3_bind_int64(stmt, 2, record.amount);
        sqlite3_bind_int64(stmt, 3, record.debit_account_id);
        sqlite3_bind_int64(stmt, 4, record.credit_account_id);
        detail::bindText(stmt, 5, record.notes);
        if (record.reversal_of)
            sqlite3_bind_int64(stmt, 6, *record.reversal_of);
        else
            sqlite3_bind_null(stmt, 6);
        sqlite3_bind_int64(stmt, 7, now);
        sqlite3_bind_int64(stmt, 8, now);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE)
            return dp::Result<int64_t, dp::Error>::err(failure("Cannot insert transaction"));
        return dp::Result<int64_t, dp::Error>::ok(sqlite3_last_insert_rowid(db_));
    }

    inline dp::Result<std::optional<TransactionRecord>, dp::Error> SqliteStore::getTransaction(int64_t id) {
        using R = dp::Result<std::optional<TransactionRecord>, dp::Error>;
        if (!db_ || !is_open_)
            return R::err(failure("Transaction lookup failed"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT id, date, amount, debit_account_id, credit_account_id, notes, reversal_of, "
                          "created_at, modified_at FROM transactions WHERE id = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return R::err(failure("Transaction lookup failed"));
        }

        sqlite3_bind_int64(stmt, 1, id);

        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            TransactionRecord record = detail::readTransaction(stmt);
            sqlite3_finalize(stmt);
            return R::ok(std::optional<TransactionRecord>(record));
        }

        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
            return R::err(failure("Transaction lookup failed"));
        return R::ok(std::optional<TransactionRecord>());
    }

    inline dp::Result<std::optional<int64_t>, dp::Error> SqliteStore::findReversalOf(int64_t id) {
        using R = dp::Result<std::optional<int64_t>, dp::Error>;
        if (!db_ || !is_open_)
            return R::err(failure("Reversal lookup failed"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT id FROM transactions WHERE reversal_of = ? ORDER BY id LIMIT 1";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return R::err(failure("Reversal lookup failed"));
        }

        sqlite3_bind_int64(stmt, 1, id);

        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            int64_t reversal_id = sqlite3_column_int64(stmt, 0);
            sqlite3_finalize(stmt);
            return R::ok(std::optional<int64_t>(reversal_id));
        }

        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
            return R::err(failure("Reversal lookup failed"));
        return R::ok(std::optional<int64_t>());
    }

    inline dp::Result<void, dp::Error> SqliteStore::updateTransaction(const TransactionRecord &record) {
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(failure("Cannot update transaction"));

        sqlite3_stmt *stmt;
        const char *sql = "UPDATE transactions SET date = ?, amount = ?, debit_account_id = ?, "
                          "credit_account_id = ?, notes = ?, modified_at = ? WHERE id = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(failure("Cannot update transaction"));
        }

        detail::bindText(stmt, 1, record.date);
        sqlite3_bind_int64(stmt, 2, record.amount);
        sqlite3_bind_int64(stmt, 3, record.debit_account_id);
        sqlite3_bind_int64(stmt, 4, record.credit_account_id);
        detail::bindText(stmt, 5, record.notes);
        sqlite3_bind_int64(stmt, 6, currentTimestamp());
        sqlite3_bind_int64(stmt, 7, record.id);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(failure("Cannot update transaction"));
        return dp::Result<void, dp::Error>::ok();
    }

    inline dp::Result<void, dp::Error> SqliteStore::deleteTransaction(int64_t id) {
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(failure("Cannot delete transaction"));

        sqlite3_stmt *stmt;
        const char *sql = "DELETE FROM transactions WHERE id = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(failure("Cannot delete transaction"));
        }

        sqlite3_bind_int64(stmt, 1, id);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(failure("Cannot delete transaction"));
        return dp::Result<void, dp::Error>::ok();
    }

    inline dp::Result<std::vector<TransactionRow>, dp::Error>
    SqliteStore::queryTransactions(const TransactionFilter &filter) {
        using R = dp::Result<std::vector<TransactionRow>, dp::Error>;
        std::vector<TransactionRow> rows;
        if (!db_ || !is_open_)
            return R::err(failure("Transaction query failed"));

        std::string sql = "SELECT t.id, t.date, t.amount, t.debit_account_id, t.credit_account_id, t.notes, "
                          "t.reversal_of, t.created_at, t.modified_at, d.name, c.name "
                          "FROM transactions t "
                          "JOIN accounts d ON d.id = t.debit_account_id "
                          "JOIN accounts c ON c.id = t.credit_account_id WHERE 1=1";

        if (filter.text) {
            sql += " AND (LOWER(t.notes) LIKE ? ESCAPE '\\' OR LOWER(d.name) LIKE ? ESCAPE '\\'"
                   " OR LOWER(c.name) LIKE ? ESCAPE '\\')";
        }
        if (filter.date_from) {
            sql += " AND t.date >= ?";
        }
        if (filter.date_to) {
            sql += " AND t.date <= ?";
        }
        if (filter.account_id) {
            sql += " AND (t.debit_account_id = ? OR t.credit_account_id = ?)";
        }
        if (filter.debit_account_id) {
            sql += " AND t.debit_account_id = ?";
        }
        if (filter.credit_account_id) {
            sql += " AND t.credit_account_id = ?";
        }

        sql += " ORDER BY t.date, t.id LIMIT ? OFFSET ?";

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            return R::err(failure("Transaction query failed"));
        }

        int index = 1;
        if (filter.text) {
            std::string pattern = "%";
            for (char c : escapeLike(*filter.text))
                pattern.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            pattern += "%";
            detail::bindText(stmt, index++, pattern);
            detail::bindText(stmt, index++, pattern);
            detail::bindText(stmt, index++, pattern);
        }
        if (filter.date_from) {
            detail::bindText(stmt, index++, *filter.date_from);
        }
        if (filter.date_to) {
            detail::bindText(stmt, index++, *filter.date_to);
        }
        if (filter.account_id) {
            sqlite3_bind_int64(stmt, index++, *filter.account_id);
            sqlite3_bind_int64(stmt, index++, *filter.account_id);
        }
        if (filter.debit_account_id) {
            sqlite3_bind_int64(stmt, index++, *filter.debit_account_id);
        }
        if (filter.credit_account_id) {
            sqlite3_bind_int64(stmt, index++, *filter.credit_account_id);
        }
        sqlite3_bind_int(stmt, index++, filter.limit);
        sqlite3_bind_int(stmt, index++, filter.offset);

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            TransactionRow row;
            row.record = detail::readTransaction(stmt);
            row.debit_account_name = detail::columnText(stmt, 9);
            row.credit_account_name = detail::columnText(stmt, 10);
            rows.push_back(std::move(row));
        }

        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
            return R::err(failure("Transaction query failed"));
        return R::ok(std::move(rows));
    }

    inline dp::Result<MovementTotals, dp::Error> SqliteStore::sumMovements(int64_t account_id,
                                                                           const std::optional<std::string> &date_from,
                                                                           const std::optional<std::string> &date_to) {
        if (!db_ || !is_open_)
            return dp::Result<MovementTotals, dp::Error>::err(failure("Balance aggregation failed"));

        std::string sql = "SELECT "
                          "COALESCE(SUM(CASE WHEN debit_account_id = ?1 THEN amount ELSE 0 END), 0), "
                          "COALESCE(SUM(CASE WHEN credit_account_id = ?1 THEN amount ELSE 0 END), 0) "
                          "FROM transactions WHERE (debit_account_id = ?1 OR credit_account_id = ?1)";
        if (date_from)
            sql += " AND date >= ?2";
        if (date_to)
            sql += " AND date <= ?3";

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<MovementTotals, dp::Error>::err(failure("Balance aggregation failed"));
        }

        sqlite3_bind_int64(stmt, 1, account_id);
        if (date_from)
            detail::bindText(stmt, 2, *date_from);
        if (date_to)
            detail::bindText(stmt, 3, *date_to);

        MovementTotals totals;
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            totals.debits = sqlite3_column_int64(stmt, 0);
            totals.credits = sqlite3_column_int64(stmt, 1);
        }

        sqlite3_finalize(stmt);
        if (rc != SQLITE_ROW)
            return dp::Result<MovementTotals, dp::Error>::err(failure("Balance aggregation failed"));
        return dp::Result<MovementTotals, dp::Error>::ok(totals);
    }

    inline dp::Result<MovementTotals, dp::Error> SqliteStore::sumAllPostings() {
        if (!db_ || !is_open_)
            return dp::Result<MovementTotals, dp::Error>::err(failure("Ledger aggregation failed"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT "
                          "(SELECT COALESCE(SUM(t.amount), 0) FROM transactions t "
                          "   JOIN accounts a ON a.id = t.debit_account_id), "
                          "(SELECT COALESCE(SUM(t.amount), 0) FROM transactions t "
                          "   JOIN accounts a ON a.id = t.credit_account_id)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<MovementTotals, dp::Error>::err(failure("Ledger aggregation failed"));
        }

        MovementTotals totals;
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            totals.debits = sqlite3_column_int64(stmt, 0);
            totals.credits = sqlite3_column_int64(stmt, 1);
        }

        sqlite3_finalize(stmt);
        if (rc != SQLITE_ROW)
            return dp::Result<MovementTotals, dp::Error>::err(failure("Ledger aggregation failed"));
        return dp::Result<MovementTotals, dp::Error>::ok(totals);
    }

    inline dp::Result<int64_t, dp::Error> SqliteStore::countTransactions() {
        if (!db_ || !is_open_)
            return dp::Result<int64_t, dp::Error>::err(failure("Cannot count transactions"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT COUNT(*) FROM transactions";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<int64_t, dp::Error>::err(failure("Cannot count transactions"));
        }

        int64_t count = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int64(stmt, 0);
        }

        sqlite3_finalize(stmt);
        return dp::Result<int64_t, dp::Error>::ok(count);
    }

    // ===========================================
    // Budgets
    // ===========================================

    inline dp::Result<void, dp::Error> SqliteStore::upsertBudget(int64_t account_id, const std::string &period,
                                                                 int64_t amount) {
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(failure("Cannot store budget"));

        sqlite3_stmt *stmt;
        const char *sql = "INSERT INTO budgets (account_id, period, amount) VALUES (?, ?, ?) "
                          "ON CONFLICT(account_id, period) DO UPDATE SET amount = excluded.amount";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(failure("Cannot store budget"));
        }

        sqlite3_bind_int64(stmt, 1, account_id);
        detail::bindText(stmt, 2, period);
        sqlite3_bind_int64(stmt, 3, amount);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(failure("Cannot store budget"));
        return dp::Result<void, dp::Error>::ok();
    }

    inline dp::Result<bool, dp::Error> SqliteStore::insertBudgetIfAbsent(int64_t account_id, const std::string &period,
                                                                         int64_t amount) {
        if (!db_ || !is_open_)
            return dp::Result<bool, dp::Error>::err(failure("Cannot copy budget"));

        sqlite3_stmt *stmt;
        const char *sql = "INSERT INTO budgets (account_id, period, amount) VALUES (?, ?, ?) "
                          "ON CONFLICT(account_id, period) DO NOTHING";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<bool, dp::Error>::err(failure("Cannot copy budget"));
        }

        sqlite3_bind_int64(stmt, 1, account_id);
        detail::bindText(stmt, 2, period);
        sqlite3_bind_int64(stmt, 3, amount);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE)
            return dp::Result<bool, dp::Error>::err(failure("Cannot copy budget"));
        return dp::Result<bool, dp::Error>::ok(sqlite3_changes(db_) > 0);
    }

    inline dp::Result<std::vector<BudgetRecord>, dp::Error> SqliteStore::listBudgets(const std::string &period) {
        using R = dp::Result<std::vector<BudgetRecord>, dp::Error>;
        std::vector<BudgetRecord> budgets;
        if (!db_ || !is_open_)
            return R::err(failure("Budget listing failed"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT b.id, b.account_id, a.name, a.category, b.period, b.amount "
                          "FROM budgets b JOIN accounts a ON a.id = b.account_id "
                          "WHERE b.period = ? ORDER BY a.name, b.account_id";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return R::err(failure("Budget listing failed"));
        }

        detail::bindText(stmt, 1, period);

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            BudgetRecord record;
            record.id = sqlite3_column_int64(stmt, 0);
            record.account_id = sqlite3_column_int64(stmt, 1);
            record.account_name = detail::columnText(stmt, 2);
            record.account_category = detail::columnText(stmt, 3);
            record.period = detail::columnText(stmt, 4);
            record.amount = sqlite3_column_int64(stmt, 5);
            budgets.push_back(std::move(record));
        }

        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
            return R::err(failure("Budget listing failed"));
        return R::ok(std::move(budgets));
    }

    // ===========================================
    // Period locks
    // ===========================================

    inline dp::Result<void, dp::Error> SqliteStore::setPeriodLocked(const std::string &period, bool locked) {
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(failure("Cannot change period lock"));

        sqlite3_stmt *stmt;
        const char *sql = "INSERT INTO period_locks (period, locked, updated_at) VALUES (?, ?, ?) "
                          "ON CONFLICT(period) DO UPDATE SET locked = excluded.locked, updated_at = excluded.updated_at";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(failure("Cannot change period lock"));
        }

        detail::bindText(stmt, 1, period);
        sqlite3_bind_int(stmt, 2, locked ? 1 : 0);
        sqlite3_bind_int64(stmt, 3, currentTimestamp());

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(failure("Cannot change period lock"));
        return dp::Result<void, dp::Error>::ok();
    }

    inline dp::Result<bool, dp::Error> SqliteStore::isPeriodLocked(const std::string &period) {
        if (!db_ || !is_open_)
            return dp::Result<bool, dp::Error>::err(failure("Period lock lookup failed"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT locked FROM period_locks WHERE period = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<bool, dp::Error>::err(failure("Period lock lookup failed"));
        }

        detail::bindText(stmt, 1, period);

        bool locked = false;
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            locked = sqlite3_column_int(stmt, 0) != 0;
        }

        sqlite3_finalize(stmt);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE)
            return dp::Result<bool, dp::Error>::err(failure("Period lock lookup failed"));
        return dp::Result<bool, dp::Error>::ok(locked);
    }

    inline dp::Result<std::vector<std::string>, dp::Error> SqliteStore::lockedPeriods() {
        using R = dp::Result<std::vector<std::string>, dp::Error>;
        std::vector<std::string> periods;
        if (!db_ || !is_open_)
            return R::err(failure("Period lock listing failed"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT period FROM period_locks WHERE locked = 1 ORDER BY period";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return R::err(failure("Period lock listing failed"));
        }

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            periods.push_back(detail::columnText(stmt, 0));
        }

        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
            return R::err(failure("Period lock listing failed"));
        return R::ok(std::move(periods));
    }

    // ===========================================
    // Diagnostics & raw access
    // ===========================================

    inline bool SqliteStore::quickCheck() {
        if (!db_ || !is_open_)
            return false;

        sqlite3_stmt *stmt;
        const char *sql = "PRAGMA quick_check";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        bool ok = false;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            ok = (detail::columnText(stmt, 0) == "ok");
        }

        sqlite3_finalize(stmt);
        return ok;
    }

    inline bool SqliteStore::executeSql(const std::string &sql) {
        if (!db_ || !is_open_)
            return false;

        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);

        if (rc != SQLITE_OK) {
            if (errmsg) {
                sqlite3_free(errmsg);
            }
            return false;
        }

        return true;
    }

} // namespace ledgerbook::storage
