#pragma once

#include "core/outcome.hpp"
#include "core/quantity.hpp"

namespace core {

// Priority order: NoShipment > Ok > OverShipment > LessShipment.
// Equality is exact; there is no tolerance. A blank or unparseable requested
// quantity compares as zero.
inline OutcomeKind classify_quantity(const Quantity& available, const Quantity& requested) noexcept {
    if (is_absent_quantity(available)) {
        return OutcomeKind::NoShipment;
    }
    const double avail = *available;
    const double req = requested.value_or(0.0);
    if (avail == req) {
        return OutcomeKind::Ok;
    }
    if (avail < req) {
        return OutcomeKind::OverShipment;
    }
    return OutcomeKind::LessShipment;
}

inline Outcome classify_match(MatchStrategy strategy, const Quantity& available, const Quantity& requested) noexcept {
    Outcome out{};
    out.kind = classify_quantity(available, requested);
    out.strategy = strategy;
    out.available = available;
    out.requested = requested;
    return out;
}

} // namespace core
