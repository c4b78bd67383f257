#include "core/cascade_matcher.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/classifier.hpp"
#include "core/normalizer.hpp"
#include "util/log.hpp"

namespace core {
namespace {

std::size_t slot(MatchStrategy s) noexcept { return static_cast<std::size_t>(s); }

} // namespace

const std::vector<MatchStrategy>& CascadeMatcher::standard_order() {
    static const std::vector<MatchStrategy> order{
        MatchStrategy::PoOnly, MatchStrategy::JobPo, MatchStrategy::StyleColor};
    return order;
}

const std::vector<MatchStrategy>& CascadeMatcher::buyer_order() {
    static const std::vector<MatchStrategy> order{MatchStrategy::PoJob, MatchStrategy::Combined};
    return order;
}

CascadeMatcher::CascadeMatcher(const SupplyBatch& supply, const ReconConfig& cfg, IProgressSink& sink)
    : cfg_(cfg), sink_(sink) {
    // Demand buyers are normalized keys; compare flagged names the same way.
    std::set<std::string> flagged;
    for (const auto& name : cfg_.flagged_buyers) {
        auto key = normalize_key_value(name);
        if (!key.empty()) {
            flagged.insert(std::move(key));
        }
    }
    cfg_.flagged_buyers = std::move(flagged);

    for (MatchStrategy s : standard_order()) {
        indices_[slot(s)] = std::make_unique<SupplyIndex>(supply, s, cfg_);
    }
    if (cfg_.buyer_specific) {
        for (MatchStrategy s : buyer_order()) {
            indices_[slot(s)] = std::make_unique<SupplyIndex>(supply, s, cfg_);
        }
    }
    for (const auto& idx : indices_) {
        if (idx) {
            LOG_DEBUG("Indexed %s: keys=%zu rows=%zu skipped=%zu", strategy_name(idx->strategy()), idx->size(),
                      idx->rows_indexed(), idx->rows_skipped());
        }
    }
}

const SupplyIndex& CascadeMatcher::index_for(MatchStrategy strategy) const {
    const auto& idx = indices_[slot(strategy)];
    if (!idx) {
        throw std::logic_error(std::string("No supply index built for strategy ") + strategy_name(strategy));
    }
    return *idx;
}

Cascade CascadeMatcher::cascade_of(const DemandRecord& rec, bool buyer_active) const {
    if (buyer_active && !rec.buyer.empty() && cfg_.flagged_buyers.count(rec.buyer) != 0) {
        return Cascade::Buyer;
    }
    return Cascade::Standard;
}

bool CascadeMatcher::resolve(DemandRecord& rec, const Outcome& outcome) noexcept {
    if (!apply_outcome(rec, outcome)) {
        ++counters_.rejected_overwrites;
        return false;
    }
    if (outcome.strategy != MatchStrategy::None) {
        ++counters_.strategy_hits[slot(outcome.strategy)];
    } else if (outcome.kind == OutcomeKind::NoMatchFound) {
        ++counters_.no_match_found;
    } else if (outcome.kind == OutcomeKind::NoMatchBuyer) {
        ++counters_.no_match_buyer;
    }
    return true;
}

void CascadeMatcher::report_progress(const char* pass_name, std::size_t visited, std::size_t total) noexcept {
    if (cfg_.progress_interval != 0 && visited % cfg_.progress_interval == 0) {
        sink_.progress(pass_name, visited, total);
    }
}

void CascadeMatcher::run_strategy_pass(DemandBatch& demand, MatchStrategy strategy, Cascade cascade,
                                       const std::vector<Cascade>& membership, OutcomeKind miss_outcome) {
    const char* name = strategy_name(strategy);
    const SupplyIndex& index = index_for(strategy);
    const std::size_t total = demand.records.size();
    sink_.pass_started(name, total);

    std::size_t hits = 0;
    std::size_t misses = 0;
    for (std::size_t i = 0; i < total; ++i) {
        DemandRecord& rec = demand.records[i];
        if (membership[i] == cascade && !rec.resolved()) {
            const auto available = index.find(rec);
            if (available) {
                if (resolve(rec, classify_match(strategy, available, rec.requested_qty))) {
                    ++hits;
                }
            } else if (is_terminal(miss_outcome)) {
                Outcome miss{};
                miss.kind = miss_outcome;
                miss.requested = rec.requested_qty;
                if (resolve(rec, miss)) {
                    ++misses;
                }
            }
        }
        report_progress(name, i + 1, total);
    }
    LOG_DEBUG("Pass %s: resolved=%zu unmatched=%zu", name, hits, misses);
}

void CascadeMatcher::run_final_sweep(DemandBatch& demand) {
    const std::size_t total = demand.records.size();
    sink_.pass_started("Final sweep", total);
    std::size_t swept = 0;
    for (std::size_t i = 0; i < total; ++i) {
        DemandRecord& rec = demand.records[i];
        if (!rec.resolved()) {
            Outcome miss{};
            miss.kind = OutcomeKind::NoMatchFound;
            miss.requested = rec.requested_qty;
            if (resolve(rec, miss)) {
                ++swept;
            }
        }
        report_progress("Final sweep", i + 1, total);
    }
    LOG_DEBUG("Final sweep: unmatched=%zu", swept);
}

void CascadeMatcher::run(DemandBatch& demand) {
    counters_ = MatchCounters{};
    counters_.records = demand.records.size();

    bool buyer_active = cfg_.buyer_specific;
    if (buyer_active && !demand.has_buyer) {
        buyer_active = false;
        counters_.buyer_mode_disabled = true;
        sink_.note("Buyer-specific matching disabled: target batch has no buyer column");
        LOG_WARN("Buyer-specific matching requested but target batch has no buyer column; "
                 "using standard matching for all records");
    }

    std::vector<Cascade> membership;
    membership.reserve(demand.records.size());
    for (const auto& rec : demand.records) {
        const Cascade c = cascade_of(rec, buyer_active);
        if (c == Cascade::Buyer) {
            ++counters_.buyer_records;
        }
        membership.push_back(c);
    }

    const auto& standard = standard_order();
    for (std::size_t i = 0; i < standard.size(); ++i) {
        const bool last = i + 1 == standard.size();
        run_strategy_pass(demand, standard[i], Cascade::Standard, membership,
                          last ? OutcomeKind::NoMatchFound : OutcomeKind::NotChecked);
    }

    if (buyer_active) {
        const auto& buyer = buyer_order();
        for (std::size_t i = 0; i < buyer.size(); ++i) {
            const bool last = i + 1 == buyer.size();
            run_strategy_pass(demand, buyer[i], Cascade::Buyer, membership,
                              last ? OutcomeKind::NoMatchBuyer : OutcomeKind::NotChecked);
        }
    }

    run_final_sweep(demand);
}

} // namespace core
