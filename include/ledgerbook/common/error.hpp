#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace ledgerbook {

    // ===========================================
    // Ledger error codes (200+)
    // ===========================================

    constexpr dp::u32 ERR_INVALID_INPUT = 200;
    constexpr dp::u32 ERR_INVALID_AMOUNT = 201;
    constexpr dp::u32 ERR_INVALID_POSTING = 202;
    constexpr dp::u32 ERR_NOT_FOUND = 203;
    constexpr dp::u32 ERR_PERIOD_LOCKED = 204;
    constexpr dp::u32 ERR_DUPLICATE_ACCOUNT = 205; // reported as ImportSummary::duplicates, never raised
    constexpr dp::u32 ERR_INVALID_FIELD = 206;
    constexpr dp::u32 ERR_NO_VALID_ACCOUNTS = 207; // reported as ImportStatus::NoValidAccounts, never raised
    constexpr dp::u32 ERR_STORAGE_FAILURE = 250;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error invalid_input(const std::string &msg = "Invalid input") {
        return dp::Error{ERR_INVALID_INPUT, dp::String(msg.c_str())};
    }

    inline dp::Error invalid_amount(const std::string &msg = "Invalid amount") {
        return dp::Error{ERR_INVALID_AMOUNT, dp::String(msg.c_str())};
    }

    inline dp::Error invalid_posting(const std::string &msg = "Invalid posting") {
        return dp::Error{ERR_INVALID_POSTING, dp::String(msg.c_str())};
    }

    inline dp::Error not_found(const std::string &msg = "Not found") {
        return dp::Error{ERR_NOT_FOUND, dp::String(msg.c_str())};
    }

    inline dp::Error period_locked(const std::string &msg = "Period is locked") {
        return dp::Error{ERR_PERIOD_LOCKED, dp::String(msg.c_str())};
    }

    inline dp::Error invalid_field(const std::string &msg = "Unknown field") {
        return dp::Error{ERR_INVALID_FIELD, dp::String(msg.c_str())};
    }

    inline dp::Error storage_failure(const std::string &msg = "Storage operation failed") {
        return dp::Error{ERR_STORAGE_FAILURE, dp::String(msg.c_str())};
    }

    /// Stable name for an error code, used in reports and CLI output
    inline std::string errorKindName(dp::u32 code) {
        switch (code) {
        case ERR_INVALID_INPUT:
            return "InvalidInput";
        case ERR_INVALID_AMOUNT:
            return "InvalidAmount";
        case ERR_INVALID_POSTING:
            return "InvalidPosting";
        case ERR_NOT_FOUND:
            return "NotFound";
        case ERR_PERIOD_LOCKED:
            return "PeriodLocked";
        case ERR_DUPLICATE_ACCOUNT:
            return "DuplicateAccount";
        case ERR_INVALID_FIELD:
            return "InvalidField";
        case ERR_NO_VALID_ACCOUNTS:
            return "NoValidAccounts";
        case ERR_STORAGE_FAILURE:
            return "StorageFailure";
        default:
            return "Unknown";
        }
    }

    /// "Kind: message" rendering of an error
    inline std::string describe(const dp::Error &error) {
        return errorKindName(error.code) + ": " + std::string(error.message.c_str());
    }

} // namespace ledgerbook
