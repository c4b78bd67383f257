#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "core/recon_config.hpp"

namespace persist {

// Parses a reconciliation config object:
//   {"buyer_specific": true,
//    "combine_po_in": "source" | "target",
//    "flagged_buyers": ["ACME", ...],
//    "progress_interval": 1000}
// Every key is optional; absent keys keep the value already in out.
// Unknown keys are rejected. Buyer names are trimmed and upper-cased.
bool parse_recon_config(std::string_view json, core::ReconConfig& out, std::string& error) noexcept;

bool load_recon_config(const std::filesystem::path& path, core::ReconConfig& out, std::string& error) noexcept;

// Accepts "source"/"target" in any letter case.
std::optional<core::CombineSide> combine_side_from_string(std::string_view s) noexcept;

} // namespace persist
