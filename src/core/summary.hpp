#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "core/outcome.hpp"
#include "core/records.hpp"

namespace core {

struct MatchSummary {
    // Indexed by OutcomeKind / MatchStrategy.
    std::array<std::uint64_t, outcome_kind_count> label_counts{};
    std::array<std::uint64_t, match_strategy_count> strategy_counts{};
    std::uint64_t total{0};

    std::uint64_t count(OutcomeKind k) const noexcept { return label_counts[static_cast<std::size_t>(k)]; }
    std::uint64_t count(MatchStrategy s) const noexcept { return strategy_counts[static_cast<std::size_t>(s)]; }

    std::uint64_t quantity_mismatches() const noexcept {
        return count(OutcomeKind::OverShipment) + count(OutcomeKind::LessShipment);
    }

    // True when every record carries a terminal label and the labels add up to total.
    bool consistent() const noexcept;

    bool operator==(const MatchSummary& other) const noexcept = default;
};

MatchSummary summarize(const DemandBatch& demand) noexcept;

// Text report printed after a run.
std::string format_summary(const MatchSummary& summary);

} // namespace core
