#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include <ledgerbook/accounting/transaction.hpp>

namespace ledgerbook::io {

    /// Header line of exported transaction files
    constexpr const char *TRANSACTION_CSV_HEADER = "date,amount,debit_account,credit_account,notes";

    /// One line per transaction, in the given order
    std::string exportTransactionsCsv(const std::vector<accounting::TransactionView> &views);

    dp::Result<void, dp::Error> writeTransactionsCsv(const std::string &path,
                                                     const std::vector<accounting::TransactionView> &views);

} // namespace ledgerbook::io
