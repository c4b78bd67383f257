#include "core/normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "core/quantity.hpp"

namespace core {
namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += items[i];
    }
    return out;
}

std::string build_message(const std::vector<std::string>& source, const std::vector<std::string>& target) {
    std::string msg;
    if (!source.empty()) {
        msg = "Missing columns in source: " + join(source);
    }
    if (!target.empty()) {
        if (!msg.empty()) {
            msg += "; ";
        }
        msg += "Missing columns in target: " + join(target);
    }
    return msg;
}

std::optional<std::size_t> find_column(const std::vector<std::string>& canonical, std::string_view name) {
    const auto it = std::find(canonical.begin(), canonical.end(), name);
    if (it == canonical.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - canonical.begin());
}

ColumnLayout resolve_layout(const Table& table, std::string_view qty_primary, std::string_view qty_alias) {
    std::vector<std::string> canonical;
    canonical.reserve(table.headers.size());
    for (const auto& h : table.headers) {
        canonical.push_back(clean_column_name(h));
    }

    ColumnLayout layout;
    layout.job_no = find_column(canonical, col_job_no);
    layout.po_number = find_column(canonical, col_po_number);
    layout.style_ref_no = find_column(canonical, col_style_ref_no);
    layout.color = find_column(canonical, col_color);
    layout.quantity = find_column(canonical, qty_primary);
    if (!layout.quantity) {
        layout.quantity = find_column(canonical, qty_alias);
    }
    layout.buyer = find_column(canonical, col_buyer);
    return layout;
}

std::vector<std::string> missing_columns(const ColumnLayout& layout, std::string_view qty_name) {
    std::vector<std::string> missing;
    if (!layout.job_no) missing.emplace_back(col_job_no);
    if (!layout.po_number) missing.emplace_back(col_po_number);
    if (!layout.quantity) missing.emplace_back(qty_name);
    if (!layout.style_ref_no) missing.emplace_back(col_style_ref_no);
    if (!layout.color) missing.emplace_back(col_color);
    return missing;
}

std::string key_cell(const Table& table, std::size_t row, const std::optional<std::size_t>& col) {
    return col ? normalize_key_value(table.cell(row, *col)) : std::string{};
}

SupplyBatch build_supply(const Table& table, const ColumnLayout& layout) {
    SupplyBatch batch;
    batch.has_buyer = layout.buyer.has_value();
    batch.records.reserve(table.row_count());
    for (std::size_t r = 0; r < table.row_count(); ++r) {
        SupplyRecord rec;
        rec.job_no = key_cell(table, r, layout.job_no);
        rec.job_last4 = job_last4(rec.job_no);
        rec.po_number = key_cell(table, r, layout.po_number);
        rec.style_ref_no = key_cell(table, r, layout.style_ref_no);
        rec.color = key_cell(table, r, layout.color);
        rec.buyer = key_cell(table, r, layout.buyer);
        rec.available_qty = parse_quantity(table.cell(r, *layout.quantity));
        rec.row_index = r;
        batch.records.push_back(std::move(rec));
    }
    return batch;
}

DemandBatch build_demand(const Table& table, const ColumnLayout& layout) {
    DemandBatch batch;
    batch.has_buyer = layout.buyer.has_value();
    batch.records.reserve(table.row_count());
    for (std::size_t r = 0; r < table.row_count(); ++r) {
        DemandRecord rec;
        rec.job_no = key_cell(table, r, layout.job_no);
        rec.job_last4 = job_last4(rec.job_no);
        rec.po_number = key_cell(table, r, layout.po_number);
        rec.style_ref_no = key_cell(table, r, layout.style_ref_no);
        rec.color = key_cell(table, r, layout.color);
        rec.buyer = key_cell(table, r, layout.buyer);
        rec.requested_qty = parse_quantity(table.cell(r, *layout.quantity));
        rec.row_index = r;
        batch.records.push_back(std::move(rec));
    }
    return batch;
}

} // namespace

MissingColumnsError::MissingColumnsError(std::vector<std::string> missing_source,
                                         std::vector<std::string> missing_target)
    : std::runtime_error(build_message(missing_source, missing_target)),
      missing_source_(std::move(missing_source)),
      missing_target_(std::move(missing_target)) {}

std::string clean_column_name(std::string_view name) {
    const std::string_view trimmed = trim_view(name);
    std::string out;
    out.reserve(trimmed.size());
    for (char c : trimmed) {
        if (c == ' ' || c == '_' || c == '-') {
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string normalize_key_value(std::string_view value) {
    const std::string_view trimmed = trim_view(value);
    std::string out;
    out.reserve(trimmed.size());
    for (char c : trimmed) {
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    const auto dot = out.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == out.size()) {
        return out;
    }
    const std::size_t int_begin = (out[0] == '-' || out[0] == '+') ? 1 : 0;
    if (int_begin == dot) {
        return out;
    }
    const bool int_digits = std::all_of(out.begin() + static_cast<std::ptrdiff_t>(int_begin),
                                        out.begin() + static_cast<std::ptrdiff_t>(dot),
                                        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    const bool zero_fraction = std::all_of(out.begin() + static_cast<std::ptrdiff_t>(dot + 1), out.end(),
                                           [](char c) { return c == '0'; });
    if (int_digits && zero_fraction) {
        out.erase(dot);
    }
    return out;
}

std::string job_last4(std::string_view job_no) {
    const std::string_view trimmed = trim_view(job_no);
    if (trimmed.size() <= 4) {
        return std::string(trimmed);
    }
    return std::string(trimmed.substr(trimmed.size() - 4));
}

ColumnLayout resolve_source_layout(const Table& source) {
    return resolve_layout(source, col_exfactory_qty, col_available_qty);
}

ColumnLayout resolve_target_layout(const Table& target) {
    return resolve_layout(target, col_ship_qty, col_requested_qty);
}

std::vector<std::string> missing_source_columns(const ColumnLayout& layout) {
    return missing_columns(layout, col_exfactory_qty);
}

std::vector<std::string> missing_target_columns(const ColumnLayout& layout) {
    return missing_columns(layout, col_ship_qty);
}

void validate_required_columns(const Table& source, const Table& target) {
    auto missing_src = missing_source_columns(resolve_source_layout(source));
    auto missing_tgt = missing_target_columns(resolve_target_layout(target));
    if (!missing_src.empty() || !missing_tgt.empty()) {
        throw MissingColumnsError(std::move(missing_src), std::move(missing_tgt));
    }
}

NormalizedInput normalize_inputs(const Table& source, const Table& target) {
    validate_required_columns(source, target);

    NormalizedInput out;
    out.supply = build_supply(source, resolve_source_layout(source));
    out.demand = build_demand(target, resolve_target_layout(target));
    return out;
}

} // namespace core
