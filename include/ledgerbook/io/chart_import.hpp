#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include <ledgerbook/accounting/account.hpp>

namespace ledgerbook::io {

    /// CSV with a `name,type` header (any column order, header case ignored).
    /// Every row carries its source line. Rows with the wrong cell count come back with a defect
    /// message instead of fields, so the import reports them in place.
    dp::Result<std::vector<accounting::ChartRow>, dp::Error> readChartCsv(const std::string &text);

    /// JSON array of {"name": ..., "type": ...} objects.
    /// Items that are not objects come back with a defect; missing or non-string values stay empty.
    dp::Result<std::vector<accounting::ChartRow>, dp::Error> readChartJson(const std::string &text);

    /// Read a chart file: `.csv` (case-insensitive) as CSV, anything else as JSON
    dp::Result<std::vector<accounting::ChartRow>, dp::Error> loadChartFile(const std::string &path);

} // namespace ledgerbook::io
