#include <iostream>
#include <ledgerbook/accounting/transaction_service.hpp>
#include <ledgerbook/common/calendar.hpp>
#include <ledgerbook/validation/validation.hpp>

namespace ledgerbook::accounting {

    Transaction toTransaction(const storage::TransactionRecord &record) {
        Transaction txn;
        txn.id = record.id;
        txn.date = record.date;
        txn.amount = Money::fromMinor(record.amount);
        txn.debit_account_id = record.debit_account_id;
        txn.credit_account_id = record.credit_account_id;
        txn.notes = record.notes;
        txn.reversal_of = record.reversal_of;
        txn.created_at = record.created_at;
        txn.modified_at = record.modified_at;
        return txn;
    }

    TransactionService::TransactionService(storage::SqliteStore &store, AccountService &accounts,
                                           const LedgerConfig &config)
        : store_(store), accounts_(accounts), verbose_(config.verbose), search_limit_(config.search_limit) {}

    void TransactionService::reject(const std::string &operation, const dp::Error &error) const {
        if (verbose_) {
            std::cout << operation << " rejected: " << describe(error) << std::endl;
        }
    }

    dp::Result<void, dp::Error> TransactionService::validatePosting(const std::string &date, double amount,
                                                                    AccountId debit_account_id,
                                                                    AccountId credit_account_id,
                                                                    bool enforce_category_rule) {
        using R = dp::Result<void, dp::Error>;

        if (debit_account_id == credit_account_id)
            return R::err(invalid_posting("Debit and credit accounts must differ"));

        auto debit = accounts_.findAccount(debit_account_id);
        if (debit.is_err())
            return R::err(debit.error());
        auto credit = accounts_.findAccount(credit_account_id);
        if (credit.is_err())
            return R::err(credit.error());

        auto date_check = validation::checkDate(date);
        if (!date_check)
            return R::err(invalid_input(date_check.reason));
        auto amount_check = validation::checkPositiveAmount(amount);
        if (!amount_check)
            return R::err(invalid_input(amount_check.reason));

        if (enforce_category_rule) {
            if (credit.value().category == AccountCategory::Expense)
                return R::err(invalid_posting("Expense account '" + credit.value().name + "' cannot be credited"));
            if (debit.value().category == AccountCategory::Income)
                return R::err(invalid_posting("Income account '" + debit.value().name + "' cannot be debited"));
        }
        return R::ok();
    }

    dp::Result<void, dp::Error> TransactionService::ensureOpen(const std::string &date) {
        auto parsed = Date::parse(date);
        if (!parsed)
            return dp::Result<void, dp::Error>::err(invalid_input("Date '" + date + "' is not a valid date"));

        const std::string period = parsed->yearMonth().toString();
        auto locked = store_.isPeriodLocked(period);
        if (locked.is_err())
            return dp::Result<void, dp::Error>::err(locked.error());
        if (locked.value())
            return dp::Result<void, dp::Error>::err(period_locked("Period " + period + " is locked"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<TransactionId, dp::Error> TransactionService::addTransaction(const std::string &date, double amount,
                                                                            AccountId debit_account_id,
                                                                            AccountId credit_account_id,
                                                                            const std::string &notes) {
        using R = dp::Result<TransactionId, dp::Error>;

        auto valid = validatePosting(date, amount, debit_account_id, credit_account_id, true);
        if (valid.is_err()) {
            reject("Posting", valid.error());
            return R::err(valid.error());
        }
        auto open = ensureOpen(date);
        if (open.is_err()) {
            reject("Posting", open.error());
            return R::err(open.error());
        }

        storage::TransactionRecord record;
        record.date = date;
        record.amount = Money::fromDouble(amount).minor;
        record.debit_account_id = debit_account_id;
        record.credit_account_id = credit_account_id;
        record.notes = notes;

        auto tx = store_.beginTransaction();
        auto inserted = store_.insertTransaction(record);
        if (inserted.is_err())
            return R::err(inserted.error());
        if (!tx->commit())
            return R::err(storage_failure("Cannot commit transaction: " + store_.lastError()));
        return R::ok(inserted.value());
    }

    dp::Result<Transaction, dp::Error> TransactionService::getTransaction(TransactionId id) {
        auto id_check = validation::checkId(id);
        if (!id_check)
            return dp::Result<Transaction, dp::Error>::err(invalid_input(id_check.reason));

        auto record = store_.getTransaction(id);
        if (record.is_err())
            return dp::Result<Transaction, dp::Error>::err(record.error());
        if (!record.value().has_value())
            return dp::Result<Transaction, dp::Error>::err(
                not_found("Transaction " + std::to_string(id) + " does not exist"));
        return dp::Result<Transaction, dp::Error>::ok(toTransaction(*record.value()));
    }

    dp::Result<Transaction, dp::Error> TransactionService::modifyTransaction(TransactionId id,
                                                                             const TransactionUpdate &update) {
        using R = dp::Result<Transaction, dp::Error>;

        auto existing = getTransaction(id);
        if (existing.is_err())
            return existing;
        const Transaction current = existing.value();

        auto old_open = ensureOpen(current.date);
        if (old_open.is_err()) {
            reject("Modify", old_open.error());
            return R::err(old_open.error());
        }
        if (update.empty())
            return R::ok(current);

        const std::string date = update.date.value_or(current.date);
        const double amount = update.amount.value_or(current.amount.toDouble());
        const AccountId debit_id = update.debit_account_id.value_or(current.debit_account_id);
        const AccountId credit_id = update.credit_account_id.value_or(current.credit_account_id);

        // A reversal skips the category rule only while it still mirrors the posting it reverses
        bool enforce_category_rule = true;
        if (current.reversal_of) {
            auto reversed = store_.getTransaction(*current.reversal_of);
            if (reversed.is_err())
                return R::err(reversed.error());
            if (reversed.value().has_value()) {
                const storage::TransactionRecord &source = *reversed.value();
                const bool mirrors = validation::checkFiniteAmount(amount) &&
                                     debit_id == source.credit_account_id && credit_id == source.debit_account_id &&
                                     Money::fromDouble(amount).minor == source.amount;
                enforce_category_rule = !mirrors;
            }
        }

        auto valid = validatePosting(date, amount, debit_id, credit_id, enforce_category_rule);
        if (valid.is_err()) {
            reject("Modify", valid.error());
            return R::err(valid.error());
        }
        auto new_open = ensureOpen(date);
        if (new_open.is_err()) {
            reject("Modify", new_open.error());
            return R::err(new_open.error());
        }

        storage::TransactionRecord record;
        record.id = id;
        record.date = date;
        record.amount = Money::fromDouble(amount).minor;
        record.debit_account_id = debit_id;
        record.credit_account_id = credit_id;
        record.notes = update.notes.value_or(current.notes);

        auto tx = store_.beginTransaction();
        auto updated = store_.updateTransaction(record);
        if (updated.is_err())
            return R::err(updated.error());
        if (!tx->commit())
            return R::err(storage_failure("Cannot commit transaction update: " + store_.lastError()));

        return getTransaction(id);
    }

    dp::Result<void, dp::Error> TransactionService::deleteTransaction(TransactionId id) {
        auto existing = getTransaction(id);
        if (existing.is_err())
            return dp::Result<void, dp::Error>::err(existing.error());

        auto open = ensureOpen(existing.value().date);
        if (open.is_err()) {
            reject("Delete", open.error());
            return open;
        }

        auto tx = store_.beginTransaction();
        auto removed = store_.deleteTransaction(id);
        if (removed.is_err())
            return removed;
        if (!tx->commit())
            return dp::Result<void, dp::Error>::err(
                storage_failure("Cannot commit transaction delete: " + store_.lastError()));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<TransactionId, dp::Error> TransactionService::reverseTransaction(TransactionId id,
                                                                                const std::string &date,
                                                                                const std::string &notes) {
        using R = dp::Result<TransactionId, dp::Error>;

        auto original = getTransaction(id);
        if (original.is_err())
            return R::err(original.error());
        const Transaction &source = original.value();

        if (source.isReversal()) {
            auto error = invalid_posting("Transaction " + std::to_string(id) + " is itself a reversal");
            reject("Reversal", error);
            return R::err(error);
        }
        auto prior = store_.findReversalOf(id);
        if (prior.is_err())
            return R::err(prior.error());
        if (prior.value().has_value()) {
            auto error = invalid_posting("Transaction " + std::to_string(id) + " is already reversed by #" +
                                         std::to_string(*prior.value()));
            reject("Reversal", error);
            return R::err(error);
        }

        auto valid = validatePosting(date, source.amount.toDouble(), source.credit_account_id,
                                     source.debit_account_id, false);
        if (valid.is_err()) {
            reject("Reversal", valid.error());
            return R::err(valid.error());
        }
        auto open = ensureOpen(date);
        if (open.is_err()) {
            reject("Reversal", open.error());
            return R::err(open.error());
        }

        storage::TransactionRecord record;
        record.date = date;
        record.amount = source.amount.minor;
        record.debit_account_id = source.credit_account_id;
        record.credit_account_id = source.debit_account_id;
        record.notes = notes.empty() ? "Reversal of #" + std::to_string(id) : notes;
        record.reversal_of = id;

        auto tx = store_.beginTransaction();
        auto inserted = store_.insertTransaction(record);
        if (inserted.is_err())
            return R::err(inserted.error());
        if (!tx->commit())
            return R::err(storage_failure("Cannot commit reversal: " + store_.lastError()));

        if (verbose_) {
            std::cout << "Transaction " << id << " reversed by " << inserted.value() << " on " << date << std::endl;
        }
        return R::ok(inserted.value());
    }

    dp::Result<std::vector<TransactionView>, dp::Error>
    TransactionService::searchTransactions(const TransactionQuery &query) {
        using R = dp::Result<std::vector<TransactionView>, dp::Error>;

        for (const auto *bound : {&query.date_from, &query.date_to}) {
            if (*bound) {
                auto date_check = validation::checkDate(**bound);
                if (!date_check)
                    return R::err(invalid_input(date_check.reason));
            }
        }
        if (query.offset < 0)
            return R::err(invalid_input("Offset must not be negative"));

        storage::TransactionFilter filter;
        if (query.text && !validation::trim(*query.text).empty())
            filter.text = validation::trim(*query.text);
        filter.date_from = query.date_from;
        filter.date_to = query.date_to;
        filter.account_id = query.account_id;
        filter.debit_account_id = query.debit_account_id;
        filter.credit_account_id = query.credit_account_id;
        filter.limit = query.limit.value_or(search_limit_);
        if (filter.limit < 0)
            filter.limit = -1;
        filter.offset = query.offset;

        auto rows = store_.queryTransactions(filter);
        if (rows.is_err())
            return R::err(rows.error());

        std::vector<TransactionView> views;
        views.reserve(rows.value().size());
        for (const auto &row : rows.value()) {
            views.push_back(TransactionView{toTransaction(row.record), row.debit_account_name,
                                            row.credit_account_name});
        }
        return R::ok(std::move(views));
    }

    dp::Result<void, dp::Error> TransactionService::setLock(const std::string &year_month, bool locked) {
        auto period_check = validation::checkYearMonth(year_month);
        if (!period_check)
            return dp::Result<void, dp::Error>::err(invalid_input(period_check.reason));

        auto tx = store_.beginTransaction();
        auto stored = store_.setPeriodLocked(year_month, locked);
        if (stored.is_err())
            return stored;
        if (!tx->commit())
            return dp::Result<void, dp::Error>::err(storage_failure("Cannot commit period lock: " + store_.lastError()));

        if (verbose_) {
            std::cout << "Period " << year_month << (locked ? " locked" : " unlocked") << std::endl;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> TransactionService::lockPeriod(const std::string &year_month) {
        return setLock(year_month, true);
    }

    dp::Result<void, dp::Error> TransactionService::unlockPeriod(const std::string &year_month) {
        return setLock(year_month, false);
    }

    dp::Result<bool, dp::Error> TransactionService::isPeriodLocked(const std::string &year_month) {
        auto period_check = validation::checkYearMonth(year_month);
        if (!period_check)
            return dp::Result<bool, dp::Error>::err(invalid_input(period_check.reason));
        return store_.isPeriodLocked(year_month);
    }

    dp::Result<std::vector<std::string>, dp::Error> TransactionService::lockedPeriods() {
        return store_.lockedPeriods();
    }

    dp::Result<LedgerTotals, dp::Error> TransactionService::ledgerTotals() {
        using R = dp::Result<LedgerTotals, dp::Error>;

        auto sums = store_.sumAllPostings();
        if (sums.is_err())
            return R::err(sums.error());
        auto count = store_.countTransactions();
        if (count.is_err())
            return R::err(count.error());

        LedgerTotals totals;
        totals.total_debits = Money::fromMinor(sums.value().debits);
        totals.total_credits = Money::fromMinor(sums.value().credits);
        totals.transaction_count = count.value();
        return R::ok(totals);
    }

} // namespace ledgerbook::accounting
