#pragma once

#include <cstdint>
#include <cstdlib>
#include <datapod/datapod.hpp>
#include <map>
#include <optional>
#include <string>

#include <ledgerbook/accounting/account.hpp>
#include <ledgerbook/common/error.hpp>
#include <ledgerbook/common/money.hpp>

namespace ledgerbook::accounting {

    using TransactionId = int64_t;

    /// A posted double-entry transaction: debits one account, credits another, same amount
    struct Transaction {
        TransactionId id = 0;
        std::string date; // YYYY-MM-DD
        Money amount;
        AccountId debit_account_id = 0;
        AccountId credit_account_id = 0;
        std::string notes;
        std::optional<TransactionId> reversal_of; // set on reversal postings
        int64_t created_at = 0;
        int64_t modified_at = 0;

        inline bool isReversal() const { return reversal_of.has_value(); }
    };

    /// Transaction together with the names of the accounts it touches
    struct TransactionView {
        Transaction transaction;
        std::string debit_account_name;
        std::string credit_account_name;
    };

    /// Closed set of modifiable fields; an empty slot leaves the stored value unchanged
    struct TransactionUpdate {
        std::optional<double> amount;
        std::optional<std::string> date;
        std::optional<AccountId> debit_account_id;
        std::optional<AccountId> credit_account_id;
        std::optional<std::string> notes;

        inline bool empty() const {
            return !amount && !date && !debit_account_id && !credit_account_id && !notes;
        }

        /// Build from loose key/value pairs (form fields, CLI flags).
        /// Keys: amount, date, debit_account_id, credit_account_id, notes.
        inline static dp::Result<TransactionUpdate, dp::Error>
        fromFields(const std::map<std::string, std::string> &fields) {
            using R = dp::Result<TransactionUpdate, dp::Error>;
            TransactionUpdate update;
            for (const auto &[key, value] : fields) {
                if (key == "amount") {
                    auto parsed = parseNumber(value);
                    if (!parsed)
                        return R::err(invalid_input("Field 'amount' is not a number: '" + value + "'"));
                    update.amount = *parsed;
                } else if (key == "date") {
                    update.date = value;
                } else if (key == "debit_account_id" || key == "credit_account_id") {
                    auto parsed = parseId(value);
                    if (!parsed)
                        return R::err(invalid_input("Field '" + key + "' is not an integer: '" + value + "'"));
                    if (key == "debit_account_id")
                        update.debit_account_id = *parsed;
                    else
                        update.credit_account_id = *parsed;
                } else if (key == "notes") {
                    update.notes = value;
                } else {
                    return R::err(invalid_field("Field '" + key + "' cannot be modified"));
                }
            }
            return R::ok(update);
        }

      private:
        inline static std::optional<double> parseNumber(const std::string &text) {
            if (text.empty())
                return std::nullopt;
            char *end = nullptr;
            double value = std::strtod(text.c_str(), &end);
            if (end != text.c_str() + text.size())
                return std::nullopt;
            return value;
        }

        inline static std::optional<int64_t> parseId(const std::string &text) {
            if (text.empty())
                return std::nullopt;
            char *end = nullptr;
            long long value = std::strtoll(text.c_str(), &end, 10);
            if (end != text.c_str() + text.size())
                return std::nullopt;
            return static_cast<int64_t>(value);
        }
    };

    /// Search criteria. Every set field narrows the result; date bounds are inclusive.
    struct TransactionQuery {
        std::optional<std::string> text; // case-insensitive, over notes and both account names
        std::optional<std::string> date_from;
        std::optional<std::string> date_to;
        std::optional<AccountId> account_id; // debit or credit side
        std::optional<AccountId> debit_account_id;
        std::optional<AccountId> credit_account_id;
        std::optional<int32_t> limit; // unset = LedgerConfig::search_limit (all matches by default)
        int32_t offset = 0;
    };

    /// Ledger-wide sums of both sides of every posting
    struct LedgerTotals {
        Money total_debits;
        Money total_credits;
        int64_t transaction_count = 0;

        inline bool balanced() const { return total_debits == total_credits; }
    };

} // namespace ledgerbook::accounting
