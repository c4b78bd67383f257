#include "api/recon_runner.hpp"

#include <charconv>
#include <iostream>
#include <system_error>

#include "api/log_progress_sink.hpp"
#include "core/normalizer.hpp"
#include "core/recon_engine.hpp"
#include "ingest/csv_reader.hpp"
#include "persist/csv_writer.hpp"
#include "persist/recon_config_file.hpp"
#include "util/log.hpp"

namespace api {

std::filesystem::path default_output_path(const std::filesystem::path& target_path) {
    std::filesystem::path out = target_path.parent_path();
    out /= target_path.stem().string() + "_checked.csv";
    return out;
}

bool resolve_recon_config(const ReconJobConfig& job, core::ReconConfig& out, std::string& error) {
    core::ReconConfig cfg = core::default_recon_config();
    if (!job.config_path.empty() && !persist::load_recon_config(job.config_path, cfg, error)) {
        return false;
    }
    if (job.buyer_specific) {
        cfg.buyer_specific = *job.buyer_specific;
    }
    if (job.combine_po_in) {
        cfg.combine_po_in = *job.combine_po_in;
    }
    for (const auto& buyer : job.flagged_buyers) {
        std::string name = core::normalize_key_value(buyer);
        if (!name.empty()) {
            cfg.flagged_buyers.insert(std::move(name));
        }
    }
    if (job.progress_interval) {
        cfg.progress_interval = *job.progress_interval;
    }
    out = std::move(cfg);
    return true;
}

std::optional<std::size_t> parse_progress_interval(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    std::size_t value = 0;
    const auto conv = std::from_chars(text.data(), text.data() + text.size(), value);
    if (conv.ec != std::errc() || conv.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

namespace {

int run_job_body(const ReconJobConfig& job) {
    core::ReconConfig cfg;
    std::string error;
    if (!resolve_recon_config(job, cfg, error)) {
        LOG_ERROR("Config error: %s", error.c_str());
        return exit_load_error;
    }

    LOG_INFO("Starting comparison between %s and %s", job.source_path.string().c_str(),
             job.target_path.string().c_str());

    core::Table source;
    core::Table target;
    if (!ingest::load_csv(job.source_path, source, error) || !ingest::load_csv(job.target_path, target, error)) {
        LOG_ERROR("%s", error.c_str());
        return exit_load_error;
    }

    LogProgressSink sink;
    const core::ReconRun run = core::run_recon(source, target, cfg, sink);
    if (!run.ok()) {
        std::cerr << "ERROR: " << run.message << "\n";
        return run.error == core::ReconError::MissingColumns ? exit_validation_error : exit_failure;
    }

    const std::filesystem::path out_path =
        job.output_path.empty() ? default_output_path(job.target_path) : job.output_path;
    if (!persist::write_annotated_csv(out_path, target, run.demand, error)) {
        LOG_ERROR("%s", error.c_str());
        return exit_failure;
    }

    std::cout << core::format_summary(run.summary);
    std::cout << "\nFile saved successfully at:\n" << out_path.string() << "\n";
    LOG_INFO("Results written to %s", out_path.string().c_str());
    return exit_ok;
}

} // namespace

int run_recon_job(const ReconJobConfig& job) {
    if (job.verbose) {
        util::set_log_level(util::LogLevel::Debug);
    } else if (job.quiet) {
        util::set_log_level(util::LogLevel::Warn);
    }
    const bool own_log_file = !job.log_file.empty() && util::open_log_file(job.log_file.string());
    if (!job.log_file.empty() && !own_log_file) {
        LOG_WARN("Cannot open log file %s; logging to stderr only", job.log_file.string().c_str());
    }

    const int rc = run_job_body(job);
    if (own_log_file) {
        util::close_log_file();
    }
    return rc;
}

} // namespace api
