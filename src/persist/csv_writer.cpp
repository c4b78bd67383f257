#include "persist/csv_writer.hpp"

#include <fstream>
#include <optional>
#include <vector>

#include "core/normalizer.hpp"

namespace persist {

std::string escape_csv_cell(std::string_view cell) {
    if (cell.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(cell);
    }
    std::string out;
    out.reserve(cell.size() + 2);
    out.push_back('"');
    for (char c : cell) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void write_annotated_csv(std::ostream& out, const core::Table& target, const core::DemandBatch& demand) {
    std::vector<std::string> status(target.row_count(), core::status_text(core::Outcome{}));
    for (const auto& rec : demand.records) {
        if (rec.row_index < status.size()) {
            status[rec.row_index] = core::status_text(rec.outcome);
        }
    }

    // A status column left by an earlier run is overwritten in place.
    std::optional<std::size_t> existing;
    for (std::size_t c = 0; c < target.headers.size(); ++c) {
        if (core::clean_column_name(target.headers[c]) == core::clean_column_name(status_column)) {
            existing = c;
            break;
        }
    }

    for (std::size_t c = 0; c < target.headers.size(); ++c) {
        if (c != 0) {
            out << ',';
        }
        out << escape_csv_cell(target.headers[c]);
    }
    if (!existing) {
        out << (target.headers.empty() ? "" : ",") << status_column;
    }
    out << "\n";

    for (std::size_t r = 0; r < target.row_count(); ++r) {
        for (std::size_t c = 0; c < target.column_count(); ++c) {
            if (c != 0) {
                out << ',';
            }
            out << escape_csv_cell(existing && *existing == c ? std::string_view(status[r]) : target.cell(r, c));
        }
        if (!existing) {
            out << (target.column_count() == 0 ? "" : ",") << escape_csv_cell(status[r]);
        }
        out << "\n";
    }
}

bool write_annotated_csv(const std::filesystem::path& path,
                         const core::Table& target,
                         const core::DemandBatch& demand,
                         std::string& error) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "Failed to open output file: " + path.string();
        return false;
    }
    write_annotated_csv(out, target, demand);
    out.flush();
    if (!out) {
        error = "Failed to write output file: " + path.string();
        return false;
    }
    return true;
}

} // namespace persist
