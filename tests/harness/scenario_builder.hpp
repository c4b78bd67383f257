#pragma once

#include <string>
#include <vector>

#include "core/table.hpp"

namespace test {

// Fluent API for constructing source/target tables the way a loader would
// hand them to the engine (display-style headers, raw string cells).
class ReconScenarioBuilder {
public:
    ReconScenarioBuilder() = default;

    ReconScenarioBuilder& supply(const std::string& job_no,
                                 const std::string& po_number,
                                 const std::string& style_ref_no,
                                 const std::string& color,
                                 const std::string& exfactory_qty) {
        source_.rows.push_back({job_no, po_number, style_ref_no, color, exfactory_qty});
        return *this;
    }

    ReconScenarioBuilder& demand(const std::string& job_no,
                                 const std::string& po_number,
                                 const std::string& style_ref_no,
                                 const std::string& color,
                                 const std::string& ship_qty,
                                 const std::string& buyer = "") {
        demand_rows_.push_back({job_no, po_number, style_ref_no, color, ship_qty, buyer});
        return *this;
    }

    // Shorthands for the common single-key cases.
    ReconScenarioBuilder& supply_po(const std::string& po_number, const std::string& qty) {
        return supply("", po_number, "", "", qty);
    }

    ReconScenarioBuilder& demand_po(const std::string& po_number, const std::string& qty) {
        return demand("", po_number, "", "", qty);
    }

    // Target batch carries a Buyer column (required for buyer-specific matching).
    ReconScenarioBuilder& with_buyer_column(bool enabled = true) {
        buyer_column_ = enabled;
        return *this;
    }

    core::Table source_table() const {
        core::Table t = source_;
        t.headers = {"Job No", "PO Number", "Style Ref No", "Color", "ExFactory Qty"};
        return t;
    }

    core::Table target_table() const {
        core::Table t;
        t.headers = {"Job_No", "PONumber", "style-ref-no", "COLOR", "Ship Qty"};
        if (buyer_column_) {
            t.headers.push_back("Buyer");
        }
        for (const auto& row : demand_rows_) {
            std::vector<std::string> cells(row.begin(), row.begin() + 5);
            if (buyer_column_) {
                cells.push_back(row[5]);
            }
            t.rows.push_back(std::move(cells));
        }
        return t;
    }

    std::size_t demand_count() const noexcept { return demand_rows_.size(); }

private:
    core::Table source_{};
    std::vector<std::vector<std::string>> demand_rows_{};
    bool buyer_column_{false};
};

} // namespace test
