#include "ingest/csv_reader.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

namespace ingest {
namespace {

constexpr std::string_view utf8_bom = "\xEF\xBB\xBF";

bool is_blank_row(const std::vector<std::string>& row) noexcept {
    return row.size() == 1 && row.front().empty();
}

} // namespace

CsvResult parse_csv(std::string_view data, core::Table& out) {
    out = core::Table{};
    if (data.substr(0, utf8_bom.size()) == utf8_bom) {
        data.remove_prefix(utf8_bom.size());
    }

    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;

    const auto end_field = [&] {
        row.push_back(std::move(field));
        field.clear();
        field_quoted = false;
    };
    const auto end_row = [&] {
        end_field();
        if (!is_blank_row(row)) {
            rows.push_back(std::move(row));
        }
        row.clear();
    };

    std::size_t i = 0;
    while (i < data.size()) {
        const char c = data[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < data.size() && data[i + 1] == '"') {
                    field.push_back('"');
                    i += 2;
                    continue;
                }
                in_quotes = false;
            } else {
                field.push_back(c);
            }
            ++i;
            continue;
        }

        switch (c) {
        case '"':
            if (field.empty() && !field_quoted) {
                in_quotes = true;
                field_quoted = true;
            } else {
                field.push_back(c); // stray quote inside an unquoted cell
            }
            break;
        case ',':
            end_field();
            break;
        case '\r':
            if (i + 1 < data.size() && data[i + 1] == '\n') {
                ++i;
            }
            end_row();
            break;
        case '\n':
            end_row();
            break;
        default:
            field.push_back(c);
            break;
        }
        ++i;
    }

    if (in_quotes) {
        return CsvResult::UnterminatedQuote;
    }
    if (!field.empty() || field_quoted || !row.empty()) {
        end_row();
    }
    if (rows.empty()) {
        return CsvResult::Empty;
    }

    out.headers = std::move(rows.front());
    out.rows.reserve(rows.size() - 1);
    for (std::size_t r = 1; r < rows.size(); ++r) {
        auto& cells = rows[r];
        if (cells.size() < out.headers.size()) {
            cells.resize(out.headers.size());
        }
        out.rows.push_back(std::move(cells));
    }
    return CsvResult::Ok;
}

bool load_csv(const std::filesystem::path& path, core::Table& out, std::string& error) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        error = "File does not exist: " + path.string();
        return false;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "File is not readable: " + path.string();
        return false;
    }
    in.seekg(0, std::ios::end);
    const auto len = in.tellg();
    if (len < 0) {
        error = "Failed to size file: " + path.string();
        return false;
    }
    std::string contents(static_cast<std::size_t>(len), '\0');
    in.seekg(0, std::ios::beg);
    if (!contents.empty() && !in.read(contents.data(), static_cast<std::streamsize>(contents.size()))) {
        error = "Failed to read file: " + path.string();
        return false;
    }

    const CsvResult res = parse_csv(contents, out);
    switch (res) {
    case CsvResult::Ok:
        return true;
    case CsvResult::Empty:
        error = "No header row in file: " + path.string();
        return false;
    case CsvResult::UnterminatedQuote:
        error = "Unterminated quoted field in file: " + path.string();
        return false;
    }
    error = "Failed to parse file: " + path.string();
    return false;
}

} // namespace ingest
