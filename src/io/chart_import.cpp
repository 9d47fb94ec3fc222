#include <fstream>
#include <ledgerbook/common/error.hpp>
#include <ledgerbook/io/chart_import.hpp>
#include <ledgerbook/io/csv.hpp>
#include <ledgerbook/validation/validation.hpp>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace ledgerbook::io {

    using ChartRows = std::vector<accounting::ChartRow>;

    dp::Result<ChartRows, dp::Error> readChartCsv(const std::string &text) {
        auto records = parseCsvLines(text);
        ChartRows rows;
        if (records.empty())
            return dp::Result<ChartRows, dp::Error>::ok(rows);

        const CsvRecord &header = records.front().cells;
        int name_col = -1;
        int type_col = -1;
        for (size_t col = 0; col < header.size(); ++col) {
            std::string label = validation::toLower(validation::trim(header[col]));
            if (label == "name")
                name_col = static_cast<int>(col);
            else if (label == "type")
                type_col = static_cast<int>(col);
        }
        if (name_col < 0 || type_col < 0)
            return dp::Result<ChartRows, dp::Error>::err(
                invalid_input("Chart CSV header must contain 'name' and 'type' columns"));

        for (size_t i = 1; i < records.size(); ++i) {
            const CsvRecord &cells = records[i].cells;
            accounting::ChartRow row;
            row.line = records[i].line;
            if (cells.size() != header.size()) {
                row.defect = "Line " + std::to_string(row.line) + " has " + std::to_string(cells.size()) +
                             " cells, expected " + std::to_string(header.size());
            } else {
                row.name = cells[name_col];
                row.category = cells[type_col];
            }
            rows.push_back(std::move(row));
        }
        return dp::Result<ChartRows, dp::Error>::ok(std::move(rows));
    }

    dp::Result<ChartRows, dp::Error> readChartJson(const std::string &text) {
        json document;
        try {
            document = json::parse(text);
        } catch (const json::parse_error &e) {
            return dp::Result<ChartRows, dp::Error>::err(invalid_input(std::string("Malformed chart JSON: ") + e.what()));
        }

        if (!document.is_array())
            return dp::Result<ChartRows, dp::Error>::err(invalid_input("Chart JSON must be an array of accounts"));

        ChartRows rows;
        rows.reserve(document.size());
        for (const auto &item : document) {
            accounting::ChartRow row;
            if (item.is_object()) {
                if (item.contains("name") && item["name"].is_string())
                    row.name = item["name"].get<std::string>();
                if (item.contains("type") && item["type"].is_string())
                    row.category = item["type"].get<std::string>();
            } else {
                row.defect = std::string("Item is a JSON ") + item.type_name() + ", expected an object";
            }
            rows.push_back(std::move(row));
        }
        return dp::Result<ChartRows, dp::Error>::ok(std::move(rows));
    }

    dp::Result<ChartRows, dp::Error> loadChartFile(const std::string &path) {
        std::ifstream file(path, std::ios::binary);
        if (!file)
            return dp::Result<ChartRows, dp::Error>::err(invalid_input("Cannot open chart file: " + path));

        std::stringstream buffer;
        buffer << file.rdbuf();

        std::string lowered = validation::toLower(path);
        if (lowered.size() >= 4 && lowered.compare(lowered.size() - 4, 4, ".csv") == 0)
            return readChartCsv(buffer.str());
        return readChartJson(buffer.str());
    }

} // namespace ledgerbook::io
