#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/outcome.hpp"
#include "core/quantity.hpp"

namespace core {

// Identity fields hold normalised text (trimmed, upper-cased). job_last4 is
// derived once at load time.
struct SupplyRecord {
    std::string job_no;
    std::string job_last4;
    std::string po_number;
    std::string style_ref_no;
    std::string color;
    std::string buyer;
    Quantity available_qty{};
    std::size_t row_index{0};
};

struct DemandRecord {
    std::string job_no;
    std::string job_last4;
    std::string po_number;
    std::string style_ref_no;
    std::string color;
    std::string buyer;
    Quantity requested_qty{};
    std::size_t row_index{0};

    Outcome outcome{};

    bool resolved() const noexcept { return is_terminal(outcome.kind); }
};

struct SupplyBatch {
    std::vector<SupplyRecord> records;
    bool has_buyer{false};
};

struct DemandBatch {
    std::vector<DemandRecord> records;
    bool has_buyer{false};
};

// Write-once transition NotChecked -> terminal. Returns false and leaves the
// record untouched when it is already resolved or when next is not terminal.
inline bool apply_outcome(DemandRecord& rec, const Outcome& next) noexcept {
    if (rec.resolved() || !is_terminal(next.kind)) {
        return false;
    }
    rec.outcome = next;
    return true;
}

} // namespace core
