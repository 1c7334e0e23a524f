#include "star_miner/cli/options.hpp"
#include "star_miner/io/pattern_library.hpp"
#include "star_miner/miner.hpp"
#include <chrono>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

const char* const DEFAULT_FAMILIES =
    "A1_rowBand_regionBudget,A2_colBand_regionBudget,C2_cages_regionQuota";

bool g_print_stats = false;
bool g_verbose = false;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options]\n";
    std::cerr << "  --board-size N        Board size (default: 10)\n";
    std::cerr << "  --stars N             Stars per row/column/region (default: 2)\n";
    std::cerr << "  --families A,B,...    Family ids to mine\n";
    std::cerr << "                        (default: " << DEFAULT_FAMILIES << ")\n";
    std::cerr << "  --output DIR          Output directory (default: ./output)\n";
    std::cerr << "  --windows WxH,...     Window sizes (default: depends on --stars)\n";
    std::cerr << "  --max-per-window N    Pattern cap per window (default: 10)\n";
    std::cerr << "  -s                    Print mining statistics to stderr\n";
    std::cerr << "  -v                    Verbose mode (print progress)\n";
    std::cerr << "  -h, --help            Show this help\n";
}

void print_stats(const star_miner::MinerStats& s) {
    if (!g_print_stats) return;
    std::cerr << "% Stats: windows=" << s.windows_tested
              << " layouts=" << s.layouts_built
              << " precondition_rejects=" << s.precondition_rejects
              << " unsolvable_layouts=" << s.unsolvable_layouts
              << " configurations=" << s.configurations_tried
              << " unsolvable_configurations=" << s.unsolvable_configurations
              << " truncated=" << s.truncated_verifications
              << "\n";
    std::cerr << "% Solver: runs=" << s.solver_runs
              << " nodes=" << s.solver_nodes
              << " patterns=" << s.patterns_found
              << " after_dedup=" << s.patterns_after_dedup
              << "\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using star_miner::cli::parse_int;
    using star_miner::cli::parse_size;
    using star_miner::cli::parse_windows;

    star_miner::MinerConfig config;
    std::string families = DEFAULT_FAMILIES;
    std::string output_dir = "./output";

    try {
        // Parse command line arguments
        for (int i = 1; i < argc; ++i) {
            bool has_value = i + 1 < argc;
            if (std::strcmp(argv[i], "--board-size") == 0 && has_value) {
                config.board_size = parse_size("--board-size", argv[++i]);
            } else if (std::strcmp(argv[i], "--stars") == 0 && has_value) {
                config.stars_per_unit = parse_int("--stars", argv[++i]);
            } else if (std::strcmp(argv[i], "--families") == 0 && has_value) {
                families = argv[++i];
            } else if (std::strcmp(argv[i], "--output") == 0 && has_value) {
                output_dir = argv[++i];
            } else if (std::strcmp(argv[i], "--windows") == 0 && has_value) {
                config.window_sizes = parse_windows(argv[++i]);
            } else if (std::strcmp(argv[i], "--max-per-window") == 0 && has_value) {
                config.patterns_per_window = parse_size("--max-per-window", argv[++i]);
            } else if (std::strcmp(argv[i], "-s") == 0) {
                g_print_stats = true;
            } else if (std::strcmp(argv[i], "-v") == 0) {
                g_verbose = true;
            } else if (std::strcmp(argv[i], "-h") == 0 ||
                       std::strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        auto family_ids = star_miner::cli::split(families, ',');
        if (family_ids.empty()) {
            throw std::invalid_argument("--families needs at least one family id");
        }

        star_miner::PatternMiner miner(config, star_miner::FamilyRegistry::with_builtin_families());
        miner.set_verbose(g_verbose);

        if (g_verbose) {
            std::cerr << "% [verbose] pattern mining for " << config.board_size << "x" << config.board_size
                      << " boards with " << config.stars_per_unit << " star(s) per unit\n";
        }

        auto start = std::chrono::steady_clock::now();
        size_t total = 0;
        for (const auto& id : family_ids) {
            auto result = miner.mine_family(id);
            auto path = star_miner::io::write_pattern_library(
                result, config.board_size, config.stars_per_unit, config.stars_per_unit, output_dir);
            std::cout << "Wrote " << result.patterns.size() << " patterns to " << path << "\n";
            total += result.patterns.size();
        }

        if (g_verbose) {
            std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
            std::cerr << "% [verbose] total: " << total << " patterns in " << elapsed.count() << "s\n";
        }
        print_stats(miner.stats());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
