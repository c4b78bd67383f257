#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "core/quantity.hpp"

namespace core {

enum class MatchStrategy : std::uint8_t {
    None,        // Not produced by a lookup (NotChecked, NoMatchFound, NoMatchBuyer)
    PoOnly,      // poNumber
    JobPo,       // jobLast4 + poNumber
    PoJob,       // poNumber + jobLast4, buyer-specific cascade
    Combined,    // styleRefNo-poNumber, buyer-specific cascade
    StyleColor   // styleRefNo + color
};

inline constexpr std::size_t match_strategy_count = 6;

enum class OutcomeKind : std::uint8_t {
    NotChecked,
    Ok,
    NoShipment,   // Supply key exists but carries no usable quantity
    OverShipment, // available < requested
    LessShipment, // available > requested
    NoMatchFound,
    NoMatchBuyer
};

inline constexpr std::size_t outcome_kind_count = 7;

struct Outcome {
    OutcomeKind kind{OutcomeKind::NotChecked};
    MatchStrategy strategy{MatchStrategy::None};
    Quantity available{};
    Quantity requested{};
};

inline constexpr bool is_terminal(OutcomeKind k) noexcept {
    return k != OutcomeKind::NotChecked;
}

inline const char* strategy_name(MatchStrategy s) noexcept {
    switch (s) {
    case MatchStrategy::None: return "None";
    case MatchStrategy::PoOnly: return "PO-only";
    case MatchStrategy::JobPo: return "Job+PO";
    case MatchStrategy::PoJob: return "PO+Job";
    case MatchStrategy::Combined: return "Combined";
    case MatchStrategy::StyleColor: return "Style+Color";
    }
    return "Unknown";
}

inline const char* outcome_kind_name(OutcomeKind k) noexcept {
    switch (k) {
    case OutcomeKind::NotChecked: return "NotChecked";
    case OutcomeKind::Ok: return "Ok";
    case OutcomeKind::NoShipment: return "NoShipment";
    case OutcomeKind::OverShipment: return "OverShipment";
    case OutcomeKind::LessShipment: return "LessShipment";
    case OutcomeKind::NoMatchFound: return "NoMatchFound";
    case OutcomeKind::NoMatchBuyer: return "NoMatchBuyer";
    }
    return "Unknown";
}

namespace detail {

// Tag used in "Ok (<tag> Match)" and "No Shipment (<tag> Match)".
inline const char* strategy_match_tag(MatchStrategy s) noexcept {
    switch (s) {
    case MatchStrategy::PoOnly: return "PO";
    case MatchStrategy::JobPo: return "Job+PO";
    case MatchStrategy::PoJob: return "PO+Job";
    case MatchStrategy::Combined: return "Combined";
    case MatchStrategy::StyleColor: return "Style+Color";
    case MatchStrategy::None: break;
    }
    return "Unknown";
}

// Tag used in the quantity mismatch texts; only PO keeps the "Match" suffix.
inline const char* strategy_compare_tag(MatchStrategy s) noexcept {
    return s == MatchStrategy::PoOnly ? "PO Match" : strategy_match_tag(s);
}

} // namespace detail

// Human-readable status written to the output Status column,
// e.g. "Over Shipment (PO Match: 120 vs 150)".
inline std::string status_text(const Outcome& o) {
    switch (o.kind) {
    case OutcomeKind::NotChecked:
        return "Not Checked";
    case OutcomeKind::Ok:
        return std::string("Ok (") + detail::strategy_match_tag(o.strategy) + " Match)";
    case OutcomeKind::NoShipment:
        return std::string("No Shipment (") + detail::strategy_match_tag(o.strategy) + " Match)";
    case OutcomeKind::OverShipment:
        return std::string("Over Shipment (") + detail::strategy_compare_tag(o.strategy) + ": " +
               format_quantity(o.available) + " vs " + format_quantity(o.requested) + ")";
    case OutcomeKind::LessShipment:
        return std::string("Less Shipment (") + detail::strategy_compare_tag(o.strategy) + ": " +
               format_quantity(o.available) + " vs " + format_quantity(o.requested) + ")";
    case OutcomeKind::NoMatchFound:
        return "No Match Found";
    case OutcomeKind::NoMatchBuyer:
        return "No Match Found (Buyer-Specific)";
    }
    return "Unknown";
}

} // namespace core
