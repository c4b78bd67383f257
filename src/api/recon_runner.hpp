#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/recon_config.hpp"

namespace api {

struct ReconJobConfig {
    std::filesystem::path source_path{};
    std::filesystem::path target_path{};
    std::filesystem::path output_path{};   // default: <target stem>_checked.csv beside the target
    std::filesystem::path config_path{};   // optional JSON config
    std::filesystem::path log_file{};

    // Command line overrides, applied on top of the config file.
    std::optional<bool> buyer_specific{};
    std::optional<core::CombineSide> combine_po_in{};
    std::vector<std::string> flagged_buyers{};
    std::optional<std::size_t> progress_interval{};

    bool quiet{false};
    bool verbose{false};
};

enum ExitCode : int {
    exit_ok = 0,
    exit_usage = 1,
    exit_load_error = 2,
    exit_validation_error = 3,
    exit_failure = 4
};

std::filesystem::path default_output_path(const std::filesystem::path& target_path);

// Non-negative decimal integer with nothing after it; empty optional otherwise.
std::optional<std::size_t> parse_progress_interval(std::string_view text) noexcept;

// Builds the effective ReconConfig: defaults, then the config file, then overrides.
bool resolve_recon_config(const ReconJobConfig& job, core::ReconConfig& out, std::string& error);

// Loads both CSV files, reconciles, writes the annotated target file and
// prints the summary to stdout. A log file opened for the job is closed
// before returning. Returns an ExitCode.
int run_recon_job(const ReconJobConfig& job);

} // namespace api
