#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "core/key_index.hpp"
#include "core/outcome.hpp"
#include "core/progress_sink.hpp"
#include "core/recon_config.hpp"
#include "core/records.hpp"

namespace core {

enum class Cascade : std::uint8_t { Standard, Buyer };

struct MatchCounters {
    std::uint64_t records{0};
    std::uint64_t buyer_records{0};
    // Records resolved by each strategy, indexed by MatchStrategy.
    std::array<std::uint64_t, match_strategy_count> strategy_hits{};
    std::uint64_t no_match_found{0};
    std::uint64_t no_match_buyer{0};
    // Attempts to resolve an already resolved record. Stays 0 for a correct cascade.
    std::uint64_t rejected_overwrites{0};
    bool buyer_mode_disabled{false};
};

// CascadeMatcher resolves every demand record against the supply batch.
// Each strategy pass walks the full record list and only touches records
// still NotChecked in the pass's cascade; the first hit wins and later passes
// skip the record. A final sweep assigns NoMatchFound to anything left over.
//
// Supply indices are built in the constructor and are read-only during run().
// The supply batch is not retained.
class CascadeMatcher {
public:
    CascadeMatcher(const SupplyBatch& supply, const ReconConfig& cfg, IProgressSink& sink);

    CascadeMatcher(const CascadeMatcher&) = delete;
    CascadeMatcher& operator=(const CascadeMatcher&) = delete;

    void run(DemandBatch& demand);

    const MatchCounters& counters() const noexcept { return counters_; }

    static const std::vector<MatchStrategy>& standard_order();
    static const std::vector<MatchStrategy>& buyer_order();

private:
    Cascade cascade_of(const DemandRecord& rec, bool buyer_active) const;
    const SupplyIndex& index_for(MatchStrategy strategy) const;

    void run_strategy_pass(DemandBatch& demand, MatchStrategy strategy, Cascade cascade,
                           const std::vector<Cascade>& membership, OutcomeKind miss_outcome);
    void run_final_sweep(DemandBatch& demand);
    bool resolve(DemandRecord& rec, const Outcome& outcome) noexcept;
    void report_progress(const char* pass_name, std::size_t visited, std::size_t total) noexcept;

    ReconConfig cfg_;
    IProgressSink& sink_;
    std::array<std::unique_ptr<SupplyIndex>, match_strategy_count> indices_{};
    MatchCounters counters_{};
};

} // namespace core
