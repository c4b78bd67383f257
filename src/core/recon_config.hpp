#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

namespace core {

// Which batch carries the raw PO that gets prefixed with the style reference
// for the Combined strategy. The other batch is expected to hold the combined
// "STYLE-PO" text in its PO column already.
enum class CombineSide : std::uint8_t { Source, Target };

struct ReconConfig {
    // Route records of flagged buyers through the PO+Job / Combined cascade.
    // Disabled for the whole run when the target batch has no buyer column.
    bool buyer_specific{false};
    CombineSide combine_po_in{CombineSide::Source};

    // Normalised (trimmed, upper-cased) buyer names.
    std::set<std::string> flagged_buyers{};

    // Emit a progress line every N visited records per pass (0 = pass starts only).
    std::size_t progress_interval{1000};
};

[[nodiscard]] inline ReconConfig default_recon_config() {
    return ReconConfig{};
}

inline const char* combine_side_name(CombineSide side) noexcept {
    return side == CombineSide::Source ? "source" : "target";
}

} // namespace core
