#pragma once

#include <cstdint>
#include <string>

#include "core/cascade_matcher.hpp"
#include "core/progress_sink.hpp"
#include "core/recon_config.hpp"
#include "core/records.hpp"
#include "core/summary.hpp"
#include "core/table.hpp"

namespace core {

enum class ReconError : std::uint8_t {
    None,
    MissingColumns, // Required columns absent; nothing was matched
    Unexpected      // Any other failure during normalisation or matching
};

inline const char* recon_error_name(ReconError e) noexcept {
    switch (e) {
    case ReconError::None: return "None";
    case ReconError::MissingColumns: return "MissingColumns";
    case ReconError::Unexpected: return "Unexpected";
    }
    return "Unknown";
}

// Result of one reconciliation. On error demand, summary and counters are
// left empty; a run either produces every outcome or none.
struct ReconRun {
    ReconError error{ReconError::None};
    std::string message;
    DemandBatch demand;
    MatchSummary summary;
    MatchCounters counters;

    bool ok() const noexcept { return error == ReconError::None; }
};

// Normalizer -> Key Aggregator -> Cascade Matcher -> Summary Aggregator.
// Holds no state between calls; identical inputs give identical results.
ReconRun run_recon(const Table& source, const Table& target, const ReconConfig& cfg, IProgressSink& sink);
ReconRun run_recon(const Table& source, const Table& target, const ReconConfig& cfg);

} // namespace core
