#include <algorithm>
#include <iomanip>
#include <iostream>
#include <ledgerbook/accounting/account_service.hpp>
#include <ledgerbook/validation/validation.hpp>

namespace ledgerbook::accounting {

    Account toAccount(const storage::AccountRecord &record) {
        Account account;
        account.id = record.id;
        account.name = record.name;
        account.category = categoryFromString(record.category).value_or(AccountCategory::Asset);
        account.opening_balance = Money::fromMinor(record.opening_balance);
        account.created_at = record.created_at;
        return account;
    }

    AccountService::AccountService(storage::SqliteStore &store, const LedgerConfig &config)
        : store_(store), verbose_(config.verbose) {}

    dp::Result<SeedSummary, dp::Error> AccountService::initializeDefaultChart() {
        using R = dp::Result<SeedSummary, dp::Error>;
        SeedSummary summary;

        auto tx = store_.beginTransaction();
        for (const auto &row : defaultChart()) {
            auto inserted = store_.insertAccountIfAbsent(row.name, row.category);
            if (inserted.is_err())
                return R::err(inserted.error());
            if (inserted.value().has_value())
                ++summary.added;
            else
                ++summary.existing;
        }
        if (!tx->commit())
            return R::err(storage_failure("Cannot commit default chart: " + store_.lastError()));

        if (verbose_) {
            std::cout << "Default chart seeded: " << summary.added << " added, " << summary.existing
                      << " already present" << std::endl;
        }
        return R::ok(summary);
    }

    dp::Result<ImportSummary, dp::Error> AccountService::importChart(const std::vector<ChartRow> &rows) {
        using R = dp::Result<ImportSummary, dp::Error>;
        ImportSummary summary;

        for (size_t i = 0; i < rows.size(); ++i) {
            const size_t position = i + 1;
            const size_t line = rows[i].line;
            const std::string name = validation::trim(rows[i].name);

            if (!rows[i].defect.empty()) {
                summary.errors.push_back(ImportError{position, ERR_INVALID_INPUT, rows[i].defect, line});
                ++summary.skipped;
                continue;
            }

            auto name_check = validation::checkAccountName(name);
            if (!name_check) {
                summary.errors.push_back(ImportError{position, ERR_INVALID_INPUT, name_check.reason, line});
                ++summary.skipped;
                continue;
            }

            auto category_check = validation::checkCategory(rows[i].category);
            if (!category_check) {
                summary.errors.push_back(ImportError{position, ERR_INVALID_INPUT, category_check.reason, line});
                ++summary.skipped;
                continue;
            }
            const std::string category = validation::toLower(validation::trim(rows[i].category));

            auto tx = store_.beginTransaction();
            auto inserted = store_.insertAccountIfAbsent(name, category);
            if (inserted.is_err())
                return R::err(inserted.error());
            if (!tx->commit())
                return R::err(storage_failure("Cannot commit account '" + name + "': " + store_.lastError()));

            if (inserted.value().has_value()) {
                ++summary.added;
            } else {
                ++summary.duplicates;
                ++summary.skipped;
                if (verbose_) {
                    std::cout << "Row " << position << ": account '" << name << "' (" << category
                              << ") already exists, skipped" << std::endl;
                }
            }
        }

        if (summary.added + summary.duplicates == 0) {
            summary.status = ImportStatus::NoValidAccounts;
        }

        if (verbose_) {
            std::cout << "Chart import: " << summary.added << " added, " << summary.skipped << " skipped ("
                      << summary.duplicates << " duplicates, " << summary.errors.size() << " errors)" << std::endl;
            for (const auto &error : summary.errors) {
                std::cout << "  row " << error.row;
                if (error.line > 0)
                    std::cout << " (line " << error.line << ")";
                std::cout << ": " << error.message << std::endl;
            }
        }
        return R::ok(summary);
    }

    dp::Result<AddAccountOutcome, dp::Error> AccountService::addAccount(const std::string &name,
                                                                       const std::string &category) {
        using R = dp::Result<AddAccountOutcome, dp::Error>;
        const std::string clean_name = validation::trim(name);

        auto name_check = validation::checkAccountName(clean_name);
        if (!name_check)
            return R::err(invalid_input(name_check.reason));
        auto category_check = validation::checkCategory(category);
        if (!category_check)
            return R::err(invalid_input(category_check.reason));
        const std::string clean_category = validation::toLower(validation::trim(category));

        auto tx = store_.beginTransaction();
        auto inserted = store_.insertAccountIfAbsent(clean_name, clean_category);
        if (inserted.is_err())
            return R::err(inserted.error());

        AddAccountOutcome outcome;
        if (inserted.value().has_value()) {
            outcome.id = *inserted.value();
            outcome.created = true;
        } else {
            auto existing = store_.getAccountByName(clean_name, clean_category);
            if (existing.is_err())
                return R::err(existing.error());
            if (!existing.value().has_value())
                return R::err(storage_failure("Account '" + clean_name + "' vanished during insert"));
            outcome.id = existing.value()->id;
            outcome.created = false;
        }

        if (!tx->commit())
            return R::err(storage_failure("Cannot commit account '" + clean_name + "': " + store_.lastError()));
        return R::ok(outcome);
    }

    dp::Result<void, dp::Error> AccountService::setOpeningBalance(AccountId id, double amount) {
        auto amount_check = validation::checkFiniteAmount(amount);
        if (!amount_check)
            return dp::Result<void, dp::Error>::err(invalid_amount(amount_check.reason));

        auto account = findAccount(id);
        if (account.is_err())
            return dp::Result<void, dp::Error>::err(account.error());

        auto tx = store_.beginTransaction();
        auto updated = store_.updateOpeningBalance(id, Money::fromDouble(amount).minor);
        if (updated.is_err())
            return updated;
        if (!tx->commit())
            return dp::Result<void, dp::Error>::err(
                storage_failure("Cannot commit opening balance: " + store_.lastError()));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Money, dp::Error> AccountService::balanceWithin(const Account &account,
                                                               const std::optional<std::string> &from,
                                                               const std::optional<std::string> &to,
                                                               bool include_opening) {
        auto totals = store_.sumMovements(account.id, from, to);
        if (totals.is_err())
            return dp::Result<Money, dp::Error>::err(totals.error());

        Money opening = include_opening ? account.opening_balance : Money::zero();
        return dp::Result<Money, dp::Error>::ok(normalBalance(account.category, opening,
                                                              Money::fromMinor(totals.value().debits),
                                                              Money::fromMinor(totals.value().credits)));
    }

    dp::Result<Money, dp::Error> AccountService::getBalance(AccountId id) {
        auto account = findAccount(id);
        if (account.is_err())
            return dp::Result<Money, dp::Error>::err(account.error());
        return balanceWithin(account.value(), std::nullopt, std::nullopt, true);
    }

    dp::Result<Money, dp::Error> AccountService::getBalanceAsOf(AccountId id, const std::string &date) {
        auto date_check = validation::checkDate(date);
        if (!date_check)
            return dp::Result<Money, dp::Error>::err(invalid_input(date_check.reason));

        auto account = findAccount(id);
        if (account.is_err())
            return dp::Result<Money, dp::Error>::err(account.error());
        return balanceWithin(account.value(), std::nullopt, date, true);
    }

    dp::Result<Money, dp::Error> AccountService::getActivity(AccountId id, const std::string &date_from,
                                                             const std::string &date_to) {
        for (const auto &date : {date_from, date_to}) {
            auto date_check = validation::checkDate(date);
            if (!date_check)
                return dp::Result<Money, dp::Error>::err(invalid_input(date_check.reason));
        }

        auto account = findAccount(id);
        if (account.is_err())
            return dp::Result<Money, dp::Error>::err(account.error());
        return balanceWithin(account.value(), date_from, date_to, false);
    }

    dp::Result<std::vector<Account>, dp::Error> AccountService::listAccounts(std::optional<AccountCategory> category) {
        using R = dp::Result<std::vector<Account>, dp::Error>;

        std::optional<std::string> filter;
        if (category)
            filter = categoryToString(*category);

        auto records = store_.listAccounts(filter);
        if (records.is_err())
            return R::err(records.error());

        std::vector<Account> accounts;
        accounts.reserve(records.value().size());
        for (const auto &record : records.value()) {
            accounts.push_back(toAccount(record));
        }

        std::stable_sort(accounts.begin(), accounts.end(), [](const Account &a, const Account &b) {
            if (a.category != b.category)
                return static_cast<uint8_t>(a.category) < static_cast<uint8_t>(b.category);
            return a.name < b.name;
        });
        return R::ok(std::move(accounts));
    }

    dp::Result<std::vector<AccountBalance>, dp::Error>
    AccountService::listBalances(std::optional<AccountCategory> category, const std::optional<std::string> &as_of) {
        using R = dp::Result<std::vector<AccountBalance>, dp::Error>;

        if (as_of) {
            auto date_check = validation::checkDate(*as_of);
            if (!date_check)
                return R::err(invalid_input(date_check.reason));
        }

        auto accounts = listAccounts(category);
        if (accounts.is_err())
            return R::err(accounts.error());

        std::vector<AccountBalance> balances;
        balances.reserve(accounts.value().size());
        for (const auto &account : accounts.value()) {
            auto balance = balanceWithin(account, std::nullopt, as_of, true);
            if (balance.is_err())
                return R::err(balance.error());
            balances.push_back(AccountBalance{account, balance.value()});
        }
        return R::ok(std::move(balances));
    }

    dp::Result<Account, dp::Error> AccountService::findAccount(AccountId id) {
        auto id_check = validation::checkId(id);
        if (!id_check)
            return dp::Result<Account, dp::Error>::err(invalid_input(id_check.reason));

        auto record = store_.getAccount(id);
        if (record.is_err())
            return dp::Result<Account, dp::Error>::err(record.error());
        if (!record.value().has_value())
            return dp::Result<Account, dp::Error>::err(not_found("Account " + std::to_string(id) + " does not exist"));
        return dp::Result<Account, dp::Error>::ok(toAccount(*record.value()));
    }

    dp::Result<Account, dp::Error> AccountService::findAccountByName(const std::string &name,
                                                                     std::optional<AccountCategory> category) {
        using R = dp::Result<Account, dp::Error>;
        const std::string clean_name = validation::trim(name);

        if (category) {
            auto record = store_.getAccountByName(clean_name, categoryToString(*category));
            if (record.is_err())
                return R::err(record.error());
            if (!record.value().has_value())
                return R::err(not_found("No " + categoryToString(*category) + " account named '" + clean_name + "'"));
            return R::ok(toAccount(*record.value()));
        }

        auto records = store_.findAccountsByName(clean_name);
        if (records.is_err())
            return R::err(records.error());
        if (records.value().empty())
            return R::err(not_found("No account named '" + clean_name + "'"));
        if (records.value().size() > 1)
            return R::err(invalid_input("Account name '" + clean_name + "' is used by several categories"));
        return R::ok(toAccount(records.value().front()));
    }

    void AccountService::printSummary() {
        auto balances = listBalances();
        if (balances.is_err()) {
            std::cout << "Cannot list accounts: " << describe(balances.error()) << std::endl;
            return;
        }

        std::cout << "=== Chart of Accounts ===\n";
        std::cout << "Total Accounts: " << balances.value().size() << "\n";

        std::optional<AccountCategory> current;
        for (const auto &entry : balances.value()) {
            if (!current || *current != entry.account.category) {
                current = entry.account.category;
                std::cout << "\n[" << categoryToString(*current) << "]\n";
            }
            std::cout << "  " << std::setw(5) << entry.account.id << "  " << std::left << std::setw(42)
                      << entry.account.name << std::right << std::setw(14) << entry.balance.toString() << "\n";
        }
        std::cout << "=========================" << std::endl;
    }

} // namespace ledgerbook::accounting
