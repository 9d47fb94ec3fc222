#pragma once

#include <string>
#include <vector>

namespace ledgerbook::io {

    using CsvRecord = std::vector<std::string>;

    /// A record together with the 1-based line it starts on
    struct CsvLine {
        size_t line = 0;
        CsvRecord cells;
    };

    /// Split RFC-4180 text into records. Quoted fields may hold commas, doubled quotes and line breaks.
    /// Accepts LF and CRLF line endings and a leading UTF-8 byte order mark. Blank lines are skipped
    /// but still counted.
    inline std::vector<CsvLine> parseCsvLines(const std::string &text) {
        std::vector<CsvLine> records;
        CsvRecord record;
        std::string field;
        bool in_quotes = false;
        bool record_started = false;
        size_t line = 1;
        size_t record_line = 1;

        size_t i = 0;
        if (text.compare(0, 3, "\xEF\xBB\xBF") == 0)
            i = 3;

        for (; i < text.size(); ++i) {
            char c = text[i];
            if (in_quotes) {
                if (c == '"') {
                    if (i + 1 < text.size() && text[i + 1] == '"') {
                        field.push_back('"');
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    if (c == '\n')
                        ++line;
                    field.push_back(c);
                }
                continue;
            }

            if (!record_started && field.empty())
                record_line = line;

            if (c == '"') {
                in_quotes = true;
                record_started = true;
            } else if (c == ',') {
                record.push_back(field);
                field.clear();
                record_started = true;
            } else if (c == '\n' || c == '\r') {
                if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
                    ++i;
                if (record_started || !field.empty()) {
                    record.push_back(field);
                    records.push_back(CsvLine{record_line, record});
                }
                record.clear();
                field.clear();
                record_started = false;
                ++line;
            } else {
                field.push_back(c);
                record_started = true;
            }
        }

        if (record_started || !field.empty()) {
            record.push_back(field);
            records.push_back(CsvLine{record_line, record});
        }
        return records;
    }

    inline std::vector<CsvRecord> parseCsv(const std::string &text) {
        std::vector<CsvRecord> records;
        for (auto &entry : parseCsvLines(text))
            records.push_back(std::move(entry.cells));
        return records;
    }

    /// Quote a field when it holds a comma, quote or line break
    inline std::string quoteCsvField(const std::string &field) {
        if (field.find_first_of(",\"\r\n") == std::string::npos)
            return field;
        std::string out = "\"";
        for (char c : field) {
            if (c == '"')
                out.push_back('"');
            out.push_back(c);
        }
        out.push_back('"');
        return out;
    }

} // namespace ledgerbook::io
