#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

#include "core/records.hpp"
#include "core/table.hpp"

namespace persist {

inline constexpr std::string_view status_column = "Status";

// Quotes a cell when it holds a comma, quote, CR or LF.
std::string escape_csv_cell(std::string_view cell);

// Writes the target table's header and rows as loaded, plus a trailing
// Status column carrying each record's outcome text. Records are matched to
// rows through DemandRecord::row_index. When the target already has a column
// whose cleaned name is "status", that column is overwritten instead.
void write_annotated_csv(std::ostream& out, const core::Table& target, const core::DemandBatch& demand);

bool write_annotated_csv(const std::filesystem::path& path,
                         const core::Table& target,
                         const core::DemandBatch& demand,
                         std::string& error);

} // namespace persist
