#include "chunkrelay/storage/table.hpp"
#include <algorithm>
#include <sstream>

namespace chunkrelay::storage {

using transfer::TransferResult;

namespace {

// Splits records per RFC 4180: quoted fields may hold delimiters, doubled
// quotes and line breaks.
TransferResult split_records(std::span<const uint8_t> data,
                             const Table::CsvOptions& options,
                             std::vector<std::vector<std::string>>& records) {
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;
    size_t line = 1;

    size_t start = 0;
    // UTF-8 byte order mark
    if (data.size() >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
        start = 3;
    }

    auto end_record = [&] {
        record.push_back(std::move(field));
        field.clear();
        field_started = false;
        records.push_back(std::move(record));
        record.clear();
    };

    for (size_t i = start; i < data.size(); ++i) {
        char c = static_cast<char>(data[i]);

        if (in_quotes) {
            if (c == options.quote) {
                if (i + 1 < data.size() && static_cast<char>(data[i + 1]) == options.quote) {
                    field += c;
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line;
                field += c;
            }
            continue;
        }

        if (c == options.quote && !field_started) {
            in_quotes = true;
            field_started = true;
        } else if (c == options.delimiter) {
            record.push_back(std::move(field));
            field.clear();
            field_started = false;
        } else if (c == '\r') {
            // Dropped; "\r\n" ends the record at the '\n'.
        } else if (c == '\n') {
            end_record();
            ++line;
        } else {
            field += c;
            field_started = true;
        }
    }

    if (in_quotes) {
        return TransferResult::permanent("Unterminated quoted field at line " + std::to_string(line));
    }

    if (field_started || !field.empty() || !record.empty()) {
        end_record();
    }

    return TransferResult::ok();
}

}

TransferResult Table::parse_csv(std::span<const uint8_t> data, const CsvOptions& options, Table& table) {
    std::vector<std::vector<std::string>> records;
    auto result = split_records(data, options, records);
    if (!result) {
        return result;
    }

    // Blank lines carry no data.
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [](const auto& r) { return r.size() == 1 && r[0].empty(); }),
                  records.end());

    Table parsed;
    size_t first_row = 0;

    if (options.has_header && !records.empty()) {
        parsed.columns_ = records.front();
        first_row = 1;
    } else {
        size_t width = 0;
        for (const auto& record : records) {
            width = std::max(width, record.size());
        }
        for (size_t i = 0; i < width; ++i) {
            parsed.columns_.push_back("column_" + std::to_string(i + 1));
        }
    }

    for (size_t i = first_row; i < records.size(); ++i) {
        auto& record = records[i];
        if (record.size() > parsed.columns_.size()) {
            return TransferResult::permanent("Row " + std::to_string(i + 1) + " has " +
                                             std::to_string(record.size()) + " fields, expected " +
                                             std::to_string(parsed.columns_.size()));
        }
        record.resize(parsed.columns_.size());
        parsed.rows_.push_back(std::move(record));
    }

    table = std::move(parsed);
    return TransferResult::ok();
}

std::optional<size_t> Table::column_index(const std::string& name) const {
    auto it = std::find(columns_.begin(), columns_.end(), name);
    if (it == columns_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - columns_.begin());
}

std::string Table::preview(size_t max_rows) const {
    constexpr size_t MAX_WIDTH = 24;

    size_t shown = std::min(max_rows, rows_.size());
    std::vector<size_t> widths(columns_.size());
    for (size_t c = 0; c < columns_.size(); ++c) {
        widths[c] = std::min(MAX_WIDTH, columns_[c].size());
        for (size_t r = 0; r < shown; ++r) {
            widths[c] = std::min(MAX_WIDTH, std::max(widths[c], rows_[r][c].size()));
        }
    }

    auto cell = [&](const std::string& text, size_t width) {
        std::string value = text.size() > width ? text.substr(0, width - 1) + "~" : text;
        value.resize(width, ' ');
        return value;
    };

    std::ostringstream oss;
    for (size_t c = 0; c < columns_.size(); ++c) {
        oss << (c ? " | " : "") << cell(columns_[c], widths[c]);
    }
    oss << "\n";
    for (size_t c = 0; c < columns_.size(); ++c) {
        oss << (c ? "-+-" : "") << std::string(widths[c], '-');
    }
    oss << "\n";
    for (size_t r = 0; r < shown; ++r) {
        for (size_t c = 0; c < columns_.size(); ++c) {
            oss << (c ? " | " : "") << cell(rows_[r][c], widths[c]);
        }
        oss << "\n";
    }
    oss << "[" << rows_.size() << " rows x " << columns_.size() << " columns]\n";
    return oss.str();
}

} // namespace chunkrelay::storage
