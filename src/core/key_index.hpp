#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

#include "core/outcome.hpp"
#include "core/recon_config.hpp"
#include "core/records.hpp"

namespace core {

// Composite key of a record under a strategy. Empty optional when a key
// component is blank: such records neither feed nor query that strategy.
std::optional<std::string> supply_key(MatchStrategy strategy, const SupplyRecord& rec, const ReconConfig& cfg);
std::optional<std::string> demand_key(MatchStrategy strategy, const DemandRecord& rec, const ReconConfig& cfg);

// SupplyIndex maps one strategy's composite key to the summed available
// quantity of every supply row sharing it. Built once, read-only afterwards.
// Blank quantities add zero but still create the key, so find() tells
// "no supply" (empty optional) apart from "supply with nothing to ship" (0).
class SupplyIndex {
public:
    // Throws std::invalid_argument for MatchStrategy::None.
    SupplyIndex(const SupplyBatch& supply, MatchStrategy strategy, const ReconConfig& cfg);

    std::optional<double> find(const std::string& key) const;
    std::optional<double> find(const DemandRecord& rec) const;

    MatchStrategy strategy() const noexcept { return strategy_; }
    std::size_t size() const noexcept { return totals_.size(); }
    std::size_t rows_indexed() const noexcept { return rows_indexed_; }
    std::size_t rows_skipped() const noexcept { return rows_skipped_; }

private:
    MatchStrategy strategy_;
    ReconConfig cfg_;
    std::unordered_map<std::string, double> totals_;
    std::size_t rows_indexed_{0};
    std::size_t rows_skipped_{0};
};

} // namespace core
