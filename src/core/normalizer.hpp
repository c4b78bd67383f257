#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "core/records.hpp"
#include "core/table.hpp"

namespace core {

// Canonical column names (after clean_column_name).
inline constexpr std::string_view col_job_no = "jobno";
inline constexpr std::string_view col_po_number = "ponumber";
inline constexpr std::string_view col_style_ref_no = "stylerefno";
inline constexpr std::string_view col_color = "color";
inline constexpr std::string_view col_buyer = "buyer";
inline constexpr std::string_view col_exfactory_qty = "exfactoryqty";
inline constexpr std::string_view col_available_qty = "availableqty"; // alias of exfactoryqty
inline constexpr std::string_view col_ship_qty = "shipqty";
inline constexpr std::string_view col_requested_qty = "requestedqty"; // alias of shipqty

// Raised before any matching when either batch lacks required columns.
// Lists every missing column of both batches.
class MissingColumnsError : public std::runtime_error {
public:
    MissingColumnsError(std::vector<std::string> missing_source, std::vector<std::string> missing_target);

    const std::vector<std::string>& missing_source() const noexcept { return missing_source_; }
    const std::vector<std::string>& missing_target() const noexcept { return missing_target_; }

private:
    std::vector<std::string> missing_source_;
    std::vector<std::string> missing_target_;
};

// Trim, lowercase, drop spaces, underscores and hyphens: "PO Number" -> "ponumber".
std::string clean_column_name(std::string_view name);

// Trim and upper-case an identity value. Integral numbers exported with a
// zero fraction ("100.0") collapse to their integral text ("100").
std::string normalize_key_value(std::string_view value);

// Last four characters of an already normalised job number (whole value if shorter).
std::string job_last4(std::string_view job_no);

// Column positions of one batch after canonicalisation. Quantity is the
// exfactory/ship column (or its alias); buyer is optional on both sides.
struct ColumnLayout {
    std::optional<std::size_t> job_no;
    std::optional<std::size_t> po_number;
    std::optional<std::size_t> style_ref_no;
    std::optional<std::size_t> color;
    std::optional<std::size_t> quantity;
    std::optional<std::size_t> buyer;
};

ColumnLayout resolve_source_layout(const Table& source);
ColumnLayout resolve_target_layout(const Table& target);

// Names of required columns absent from a resolved layout, in canonical form.
std::vector<std::string> missing_source_columns(const ColumnLayout& layout);
std::vector<std::string> missing_target_columns(const ColumnLayout& layout);

// Throws MissingColumnsError when either table is deficient.
void validate_required_columns(const Table& source, const Table& target);

struct NormalizedInput {
    SupplyBatch supply;
    DemandBatch demand;
};

// Validates both tables, then builds the record batches. Throws MissingColumnsError.
NormalizedInput normalize_inputs(const Table& source, const Table& target);

} // namespace core
