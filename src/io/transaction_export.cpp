#include <fstream>
#include <ledgerbook/common/error.hpp>
#include <ledgerbook/io/csv.hpp>
#include <ledgerbook/io/transaction_export.hpp>

namespace ledgerbook::io {

    std::string exportTransactionsCsv(const std::vector<accounting::TransactionView> &views) {
        std::string out = TRANSACTION_CSV_HEADER;
        out += "\n";
        for (const auto &view : views) {
            const auto &txn = view.transaction;
            out += quoteCsvField(txn.date);
            out += ",";
            out += txn.amount.toString();
            out += ",";
            out += quoteCsvField(view.debit_account_name);
            out += ",";
            out += quoteCsvField(view.credit_account_name);
            out += ",";
            out += quoteCsvField(txn.notes);
            out += "\n";
        }
        return out;
    }

    dp::Result<void, dp::Error> writeTransactionsCsv(const std::string &path,
                                                     const std::vector<accounting::TransactionView> &views) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file)
            return dp::Result<void, dp::Error>::err(storage_failure("Cannot open export file: " + path));

        file << exportTransactionsCsv(views);
        file.close();
        if (file.fail())
            return dp::Result<void, dp::Error>::err(storage_failure("Cannot write export file: " + path));
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace ledgerbook::io
