#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>

#include <ledgerbook/storage/sqlite_store.hpp>

namespace ledgerbook {

    /// Runtime configuration for a Ledgerbook session
    struct LedgerConfig {
        std::string db_path = "ledgerbook.db"; // ":memory:" for a throwaway ledger
        storage::OpenOptions open_options;
        bool verbose = false;       // diagnostic lines on std::cout
        int32_t search_limit = -1; // default page size for searchTransactions; negative = every match

        LedgerConfig() = default;

        /// In-memory ledger with diagnostics off
        inline static LedgerConfig inMemory() {
            LedgerConfig config;
            config.db_path = ":memory:";
            return config;
        }

        /// Defaults overridden by LEDGERBOOK_DB_PATH and LEDGERBOOK_VERBOSE
        inline static LedgerConfig fromEnvironment() {
            LedgerConfig config;
            if (const char *path = std::getenv("LEDGERBOOK_DB_PATH"); path && *path) {
                config.db_path = path;
            }
            if (const char *verbose = std::getenv("LEDGERBOOK_VERBOSE"); verbose) {
                std::string flag(verbose);
                config.verbose = (flag == "1" || flag == "true" || flag == "yes" || flag == "on");
            }
            return config;
        }
    };

} // namespace ledgerbook
