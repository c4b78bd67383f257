#include <iostream>
#include <string>

#include "api/recon_runner.hpp"
#include "persist/recon_config_file.hpp"

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --source <csv> --target <csv> [options]\n"
              << "Options:\n"
              << "  --out <path>                Annotated target output (default <target>_checked.csv)\n"
              << "  --config <path>             JSON reconciliation config\n"
              << "  --buyer-specific            Enable buyer-specific matching for flagged buyers\n"
              << "  --buyer <name>              Flag a buyer for buyer-specific matching (repeatable)\n"
              << "  --combine-po-in <side>      Batch whose PO is prefixed with StyleRefNo: source|target\n"
              << "  --progress-interval <N>     Progress line every N records per pass (0 = off)\n"
              << "  --log-file <path>           Also append log lines to this file\n"
              << "  --quiet                     Only log warnings and errors\n"
              << "  --verbose                   Enable debug logging\n";
}

} // namespace

int main(int argc, char** argv) {
    api::ReconJobConfig job;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--source" && i + 1 < argc) {
            job.source_path = argv[++i];
        } else if (arg == "--target" && i + 1 < argc) {
            job.target_path = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            job.output_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            job.config_path = argv[++i];
        } else if (arg == "--buyer-specific") {
            job.buyer_specific = true;
        } else if (arg == "--buyer" && i + 1 < argc) {
            job.flagged_buyers.emplace_back(argv[++i]);
        } else if (arg == "--combine-po-in" && i + 1 < argc) {
            const auto side = persist::combine_side_from_string(argv[++i]);
            if (!side) {
                print_usage(argv[0]);
                return api::exit_usage;
            }
            job.combine_po_in = *side;
        } else if (arg == "--progress-interval" && i + 1 < argc) {
            const auto interval = api::parse_progress_interval(argv[++i]);
            if (!interval) {
                std::cerr << "Invalid --progress-interval value: " << argv[i] << "\n";
                print_usage(argv[0]);
                return api::exit_usage;
            }
            job.progress_interval = *interval;
        } else if (arg == "--log-file" && i + 1 < argc) {
            job.log_file = argv[++i];
        } else if (arg == "--quiet") {
            job.quiet = true;
        } else if (arg == "--verbose") {
            job.verbose = true;
        } else {
            print_usage(argv[0]);
            return api::exit_usage;
        }
    }

    if (job.source_path.empty() || job.target_path.empty()) {
        std::cerr << "Please select both source and target files\n";
        print_usage(argv[0]);
        return api::exit_usage;
    }

    return api::run_recon_job(job);
}
