#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace core {

// Raw tabular input as produced by a loader: one header row plus string cells.
// Rows may be shorter than the header; missing cells read as empty.
struct Table {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;

    std::size_t column_count() const noexcept { return headers.size(); }
    std::size_t row_count() const noexcept { return rows.size(); }

    const std::string& cell(std::size_t row, std::size_t col) const noexcept {
        static const std::string empty;
        const auto& r = rows[row];
        return col < r.size() ? r[col] : empty;
    }
};

} // namespace core
