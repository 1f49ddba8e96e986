#ifndef PIIANON_UTIL_CSV_HPP
#define PIIANON_UTIL_CSV_HPP

#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file csv.hpp
 * @brief RFC 4180 reading and writing for the CSV batch processor.
 *
 * Quoted fields may contain commas, doubled quotes and line breaks.
 * Records end at LF or CRLF. Writing quotes a field only when it has to.
 */

namespace piianon {
namespace util {
namespace csv {

using Record = std::vector<std::string>;

/**
 * @brief Parse a whole CSV document.
 * @throw std::runtime_error on an unterminated quoted field or stray quote.
 */
inline std::vector<Record> parse(const std::string &data)
{
    std::vector<Record> records;
    Record record;
    std::string field;
    bool inQuotes = false;
    bool fieldWasQuoted = false;
    bool recordHasContent = false;
    size_t line = 1;

    auto endField = [&]() {
        record.push_back(field);
        field.clear();
        fieldWasQuoted = false;
    };
    auto endRecord = [&]() {
        endField();
        records.push_back(std::move(record));
        record.clear();
        recordHasContent = false;
    };

    for (size_t i = 0; i < data.size(); ++i) {
        char c = data[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < data.size() && data[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                if (!field.empty() || fieldWasQuoted) {
                    throw std::runtime_error("csv::parse: unexpected quote on line " + std::to_string(line));
                }
                inQuotes = true;
                fieldWasQuoted = true;
                recordHasContent = true;
                break;
            case ',':
                endField();
                recordHasContent = true;
                break;
            case '\r':
                if (i + 1 < data.size() && data[i + 1] == '\n') {
                    break;
                }
                field.push_back(c);
                recordHasContent = true;
                break;
            case '\n':
                if (recordHasContent || !field.empty()) {
                    endRecord();
                }
                ++line;
                break;
            default:
                if (fieldWasQuoted) {
                    throw std::runtime_error("csv::parse: text after closing quote on line " + std::to_string(line));
                }
                field.push_back(c);
                recordHasContent = true;
                break;
        }
    }

    if (inQuotes) {
        throw std::runtime_error("csv::parse: unterminated quoted field");
    }
    if (recordHasContent || !field.empty()) {
        endRecord();
    }
    return records;
}

inline std::string quoteField(const std::string &field)
{
    bool needsQuotes = field.find_first_of(",\"\r\n") != std::string::npos ||
                       (!field.empty() && (field.front() == ' ' || field.back() == ' '));
    if (!needsQuotes) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') {
            out += "\"\"";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('"');
    return out;
}

/**
 * @brief One record as a CSV line terminated by CRLF.
 */
inline std::string formatRecord(const Record &record)
{
    std::string out;
    for (size_t i = 0; i < record.size(); ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        out += quoteField(record[i]);
    }
    out += "\r\n";
    return out;
}

} // namespace csv
} // namespace util
} // namespace piianon

#endif // PIIANON_UTIL_CSV_HPP
