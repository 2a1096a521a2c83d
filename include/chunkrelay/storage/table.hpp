#pragma once

#include "../transfer/transfer_types.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chunkrelay::storage {

// Small in-memory table materialized from a delimited text file.
class Table {
public:
    struct CsvOptions {
        char delimiter = ',';
        char quote = '"';
        bool has_header = true;
    };

    // Rows shorter than the header are padded with empty cells; longer rows
    // are an error.
    static transfer::TransferResult parse_csv(std::span<const uint8_t> data,
                                              const CsvOptions& options,
                                              Table& table);

    const std::vector<std::string>& columns() const { return columns_; }
    const std::vector<std::vector<std::string>>& rows() const { return rows_; }

    size_t row_count() const { return rows_.size(); }
    size_t column_count() const { return columns_.size(); }

    std::optional<size_t> column_index(const std::string& name) const;
    const std::string& at(size_t row, size_t column) const { return rows_.at(row).at(column); }

    // Fixed-width text rendering of the first max_rows rows.
    std::string preview(size_t max_rows = 10) const;

private:
    std::vector<std::string> columns_;
    std::vector<std::vector<std::string>> rows_;
};

} // namespace chunkrelay::storage
