#include "core/recon_engine.hpp"

#include <exception>
#include <utility>

#include "core/normalizer.hpp"
#include "util/log.hpp"

namespace core {
namespace {

ReconRun failed(ReconError error, std::string message) {
    ReconRun run;
    run.error = error;
    run.message = std::move(message);
    return run;
}

} // namespace

ReconRun run_recon(const Table& source, const Table& target, const ReconConfig& cfg, IProgressSink& sink) {
    try {
        NormalizedInput input = normalize_inputs(source, target);
        LOG_INFO("Reconciling %zu target records against %zu source records (buyer_specific=%d combine_po_in=%s)",
                 input.demand.records.size(), input.supply.records.size(), cfg.buyer_specific ? 1 : 0,
                 combine_side_name(cfg.combine_po_in));

        CascadeMatcher matcher(input.supply, cfg, sink);
        matcher.run(input.demand);

        ReconRun run;
        run.summary = summarize(input.demand);
        run.counters = matcher.counters();
        run.demand = std::move(input.demand);
        if (!run.summary.consistent()) {
            return failed(ReconError::Unexpected, "Outcome counts do not add up to the record count");
        }
        LOG_INFO("Reconciliation completed: ok=%llu mismatches=%llu no_match=%llu total=%llu",
                 static_cast<unsigned long long>(run.summary.count(OutcomeKind::Ok)),
                 static_cast<unsigned long long>(run.summary.quantity_mismatches()),
                 static_cast<unsigned long long>(run.summary.count(OutcomeKind::NoMatchFound) +
                                                 run.summary.count(OutcomeKind::NoMatchBuyer)),
                 static_cast<unsigned long long>(run.summary.total));
        return run;
    } catch (const MissingColumnsError& e) {
        LOG_ERROR("%s", e.what());
        return failed(ReconError::MissingColumns, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Error during processing: %s", e.what());
        return failed(ReconError::Unexpected, std::string("Error during processing: ") + e.what());
    }
}

ReconRun run_recon(const Table& source, const Table& target, const ReconConfig& cfg) {
    NullProgressSink sink;
    return run_recon(source, target, cfg, sink);
}

} // namespace core
