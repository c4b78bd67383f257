#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/table.hpp"

namespace ingest {

enum class CsvResult : std::uint8_t { Ok, Empty, UnterminatedQuote };

inline const char* csv_result_name(CsvResult r) noexcept {
    switch (r) {
    case CsvResult::Ok: return "Ok";
    case CsvResult::Empty: return "Empty";
    case CsvResult::UnterminatedQuote: return "UnterminatedQuote";
    }
    return "Unknown";
}

// Comma separated, RFC 4180 quoting ("" escapes a quote), LF or CRLF line
// ends, optional UTF-8 BOM. The first non-blank row is the header; blank
// lines are skipped and short rows are padded to the header width.
CsvResult parse_csv(std::string_view data, core::Table& out);

// Reads and parses a CSV file. Returns false with a message on a missing or
// unreadable file or malformed content.
bool load_csv(const std::filesystem::path& path, core::Table& out, std::string& error);

} // namespace ingest
