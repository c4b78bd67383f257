#include "core/summary.hpp"

#include <cstdio>

namespace core {

bool MatchSummary::consistent() const noexcept {
    if (count(OutcomeKind::NotChecked) != 0) {
        return false;
    }
    std::uint64_t sum = 0;
    for (auto c : label_counts) {
        sum += c;
    }
    return sum == total;
}

MatchSummary summarize(const DemandBatch& demand) noexcept {
    MatchSummary s{};
    s.total = demand.records.size();
    for (const auto& rec : demand.records) {
        ++s.label_counts[static_cast<std::size_t>(rec.outcome.kind)];
        if (rec.outcome.strategy != MatchStrategy::None) {
            ++s.strategy_counts[static_cast<std::size_t>(rec.outcome.strategy)];
        }
    }
    return s;
}

std::string format_summary(const MatchSummary& summary) {
    std::string out;
    char line[128];
    const auto add = [&](const char* label, std::uint64_t value) {
        std::snprintf(line, sizeof(line), "%s: %llu\n", label, static_cast<unsigned long long>(value));
        out += line;
    };

    out += "=== Matching Summary ===\n";
    add("Perfect Matches", summary.count(OutcomeKind::Ok));
    add("Less Shipment Cases", summary.count(OutcomeKind::LessShipment));
    add("Over Shipment Cases", summary.count(OutcomeKind::OverShipment));
    add("No Shipment Cases", summary.count(OutcomeKind::NoShipment));
    add("No Matches Found", summary.count(OutcomeKind::NoMatchFound));
    add("No Buyer-Specific Matches", summary.count(OutcomeKind::NoMatchBuyer));
    add("Quantity Mismatches", summary.quantity_mismatches());
    add("Total Records Processed", summary.total);

    out += "\n=== Matches by Strategy ===\n";
    for (std::size_t i = 0; i < match_strategy_count; ++i) {
        const auto s = static_cast<MatchStrategy>(i);
        if (s == MatchStrategy::None) {
            continue;
        }
        add(strategy_name(s), summary.count(s));
    }
    return out;
}

} // namespace core
