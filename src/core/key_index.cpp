#include "core/key_index.hpp"

#include <stdexcept>
#include <string>

namespace core {
namespace {

constexpr char job_po_sep = '_';
constexpr char combined_sep = '-';
constexpr char style_color_sep = '|';

struct KeyFields {
    const std::string& job_last4;
    const std::string& po_number;
    const std::string& style_ref_no;
    const std::string& color;
};

std::optional<std::string> join_key(const std::string& a, char sep, const std::string& b) {
    if (a.empty() || b.empty()) {
        return std::nullopt;
    }
    std::string key;
    key.reserve(a.size() + 1 + b.size());
    key += a;
    key.push_back(sep);
    key += b;
    return key;
}

// Length of the first component goes in front so that a separator inside
// either field cannot make two different field pairs collide.
std::optional<std::string> pair_key(const std::string& a, char sep, const std::string& b) {
    auto joined = join_key(a, sep, b);
    if (!joined) {
        return std::nullopt;
    }
    return std::to_string(a.size()) + ':' + *joined;
}

// combine_here: this side holds the raw PO and gets the style prefix.
std::optional<std::string> make_key(MatchStrategy strategy, const KeyFields& f, bool combine_here) {
    switch (strategy) {
    case MatchStrategy::PoOnly:
        if (f.po_number.empty()) {
            return std::nullopt;
        }
        return f.po_number;
    case MatchStrategy::JobPo:
        return pair_key(f.job_last4, job_po_sep, f.po_number);
    case MatchStrategy::PoJob:
        return pair_key(f.po_number, job_po_sep, f.job_last4);
    case MatchStrategy::Combined:
        if (combine_here) {
            return join_key(f.style_ref_no, combined_sep, f.po_number);
        }
        if (f.po_number.empty()) {
            return std::nullopt;
        }
        return f.po_number;
    case MatchStrategy::StyleColor:
        return pair_key(f.style_ref_no, style_color_sep, f.color);
    case MatchStrategy::None:
        break;
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> supply_key(MatchStrategy strategy, const SupplyRecord& rec, const ReconConfig& cfg) {
    const KeyFields f{rec.job_last4, rec.po_number, rec.style_ref_no, rec.color};
    return make_key(strategy, f, cfg.combine_po_in == CombineSide::Source);
}

std::optional<std::string> demand_key(MatchStrategy strategy, const DemandRecord& rec, const ReconConfig& cfg) {
    const KeyFields f{rec.job_last4, rec.po_number, rec.style_ref_no, rec.color};
    return make_key(strategy, f, cfg.combine_po_in == CombineSide::Target);
}

SupplyIndex::SupplyIndex(const SupplyBatch& supply, MatchStrategy strategy, const ReconConfig& cfg)
    : strategy_(strategy), cfg_(cfg) {
    if (strategy == MatchStrategy::None) {
        throw std::invalid_argument("SupplyIndex requires a concrete match strategy");
    }

    totals_.reserve(supply.records.size());
    for (const auto& rec : supply.records) {
        auto key = supply_key(strategy_, rec, cfg_);
        if (!key) {
            ++rows_skipped_;
            continue;
        }
        totals_[std::move(*key)] += rec.available_qty.value_or(0.0);
        ++rows_indexed_;
    }
}

std::optional<double> SupplyIndex::find(const std::string& key) const {
    const auto it = totals_.find(key);
    if (it == totals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> SupplyIndex::find(const DemandRecord& rec) const {
    const auto key = demand_key(strategy_, rec, cfg_);
    if (!key) {
        return std::nullopt;
    }
    return find(*key);
}

} // namespace core
