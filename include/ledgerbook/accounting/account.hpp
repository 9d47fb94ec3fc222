#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <ledgerbook/common/money.hpp>

namespace ledgerbook::accounting {

    using AccountId = int64_t;

    /// Account categories, in chart order
    enum class AccountCategory : uint8_t {
        Asset = 0,
        Liability = 1,
        Equity = 2,
        Income = 3,
        Expense = 4,
    };

    inline std::string categoryToString(AccountCategory category) {
        switch (category) {
        case AccountCategory::Asset:
            return "asset";
        case AccountCategory::Liability:
            return "liability";
        case AccountCategory::Equity:
            return "equity";
        case AccountCategory::Income:
            return "income";
        case AccountCategory::Expense:
            return "expense";
        default:
            return "unknown";
        }
    }

    /// Exact lowercase match; callers fold case and trim first
    inline std::optional<AccountCategory> categoryFromString(const std::string &text) {
        if (text == "asset")
            return AccountCategory::Asset;
        if (text == "liability")
            return AccountCategory::Liability;
        if (text == "equity")
            return AccountCategory::Equity;
        if (text == "income")
            return AccountCategory::Income;
        if (text == "expense")
            return AccountCategory::Expense;
        return std::nullopt;
    }

    /// Asset and expense accounts grow on the debit side; the rest grow on the credit side
    inline bool isDebitNormal(AccountCategory category) {
        return category == AccountCategory::Asset || category == AccountCategory::Expense;
    }

    /// Signed balance for a category: opening plus movement in the normal direction
    inline Money normalBalance(AccountCategory category, Money opening, Money debits, Money credits) {
        return isDebitNormal(category) ? opening + debits - credits : opening + credits - debits;
    }

    struct Account {
        AccountId id = 0;
        std::string name;
        AccountCategory category = AccountCategory::Asset;
        Money opening_balance;
        int64_t created_at = 0;
    };

    /// One candidate row of an external chart of accounts (CSV line, JSON item)
    struct ChartRow {
        std::string name;
        std::string category;
        size_t line = 0;    // 1-based source line when read from a file, 0 otherwise
        std::string defect; // set by readers when the source row could not be split into fields
    };

    /// An account together with its derived balance
    struct AccountBalance {
        Account account;
        Money balance;
    };

    struct SeedSummary {
        int64_t added = 0;
        int64_t existing = 0;
    };

    struct AddAccountOutcome {
        AccountId id = 0;
        bool created = false;
    };

    struct ImportError {
        size_t row = 0; // 1-based position in the input sequence
        uint32_t kind = 0;
        std::string message;
        size_t line = 0; // source line of the row, 0 when not read from a file
    };

    enum class ImportStatus : uint8_t {
        Imported = 0,
        NoValidAccounts = 1,
    };

    struct ImportSummary {
        ImportStatus status = ImportStatus::Imported;
        int64_t added = 0;
        int64_t skipped = 0;    // malformed rows plus duplicates
        int64_t duplicates = 0; // rows naming an account that already exists
        std::vector<ImportError> errors;

        inline bool noValidAccounts() const { return status == ImportStatus::NoValidAccounts; }
    };

    /// Built-in chart seeded by AccountService::initializeDefaultChart()
    inline const std::vector<ChartRow> &defaultChart() {
        static const std::vector<ChartRow> chart = {
            // Assets (cash, banks, e-wallets)
            {"Cash", "asset"},
            {"Bank - KBank", "asset"},
            {"Bank - SCB", "asset"},
            {"Bank - Krungthai (KTB)", "asset"},
            {"Bank - Krungsri (BAY)", "asset"},
            {"Bank - Bangkok Bank (BBL)", "asset"},
            {"Bank - TMBThanachart (TTB)", "asset"},
            {"Bank - UOB Thailand", "asset"},
            {"Bank - CIMB Thai", "asset"},
            {"Bank - KKP", "asset"},
            {"Bank - GSB", "asset"},
            {"Bank - Other", "asset"},
            {"Wallet - TrueMoney", "asset"},
            {"Wallet - Rabbit LINE Pay", "asset"},
            {"Wallet - AirPay", "asset"},
            {"Wallet - PromptPay", "asset"},
            {"Wallet - PayPal", "asset"},
            {"Wallet - Alipay", "asset"},
            {"Wallet - WeChat Pay", "asset"},
            {"Wallet - ShopeePay", "asset"},
            {"Wallet - GrabPay", "asset"},
            {"Wallet - Other", "asset"},
            // Liabilities (credit cards)
            {"Credit Card - KBank", "liability"},
            {"Credit Card - SCB", "liability"},
            {"Credit Card - Krungsri (BAY/FirstChoice)", "liability"},
            {"Credit Card - KTC", "liability"},
            {"Credit Card - BBL", "liability"},
            {"Credit Card - UOB", "liability"},
            {"Credit Card - AEON", "liability"},
            {"Credit Card - Citi", "liability"},
            {"Credit Card - Other", "liability"},
            // Equity
            {"Opening Balance Equity", "equity"},
            // Income
            {"Salary", "income"},
            {"Allowance", "income"},
            {"Freelance / Side Income", "income"},
            {"Interest / Dividends", "income"},
            {"Gifts / Other Income", "income"},
            {"Refunds / Reimbursements", "income"},
            {"Sale of Assets", "income"},
            {"Tax Refund", "income"},
            {"Bonuses / Commissions", "income"},
            {"Investment Income", "income"},
            {"Rental Income", "income"},
            {"Royalties", "income"},
            {"Grants / Scholarships", "income"},
            {"Pension / Retirement", "income"},
            {"Insurance Payouts", "income"},
            {"Lottery / Gambling Winnings", "income"},
            {"Crowdfunding / Donations", "income"},
            {"Cashback / Rewards", "income"},
            {"Selling Personal Items", "income"},
            {"Other Miscellaneous Income", "income"},
            // Expenses
            {"Food & Dining", "expense"},
            {"Transportation", "expense"},
            {"Rent", "expense"},
            {"Utilities", "expense"},
            {"Groceries", "expense"},
            {"Shopping", "expense"},
            {"Health & Fitness", "expense"},
            {"Entertainment", "expense"},
            {"Travel", "expense"},
        };
        return chart;
    }

} // namespace ledgerbook::accounting
