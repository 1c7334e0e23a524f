#include "star_miner/miner.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <set>
#include <stdexcept>

namespace star_miner {

// ============================================================================
// MinerConfig
// ============================================================================

std::vector<WindowSize> default_window_sizes(int stars_per_unit) {
    // 星2つ以上では小さいウィンドウはほぼ解を持たない
    if (stars_per_unit >= 2) {
        return {{8, 8}, {9, 9}, {10, 10}};
    }
    return {{4, 4}, {5, 5}, {6, 6}};
}

void MinerConfig::validate() const {
    if (board_size == 0) {
        throw std::invalid_argument("board_size must be positive");
    }
    if (stars_per_unit < 1) {
        throw std::invalid_argument("stars_per_unit must be at least 1");
    }
    for (const auto& size : window_sizes) {
        if (size.width == 0 || size.height == 0) {
            throw std::invalid_argument("window sides must be positive");
        }
    }
    if (probe_max_completions == 0 || verify_max_completions == 0) {
        throw std::invalid_argument("completion caps must be positive");
    }
}

std::vector<WindowSize> MinerConfig::effective_window_sizes() const {
    return window_sizes.empty() ? default_window_sizes(stars_per_unit) : window_sizes;
}

// ============================================================================
// 検証
// ============================================================================

VerificationResult verify_pattern(ExactSolver& solver,
                                  const Board& board,
                                  const Window& window,
                                  size_t max_completions,
                                  std::chrono::milliseconds timeout) {
    VerificationResult result;
    auto analysis = solver.enumerate_completions(board, max_completions, timeout);
    result.completions = analysis.total_completions;
    result.truncated = analysis.truncated();

    // 補完なしの分類は全て Variable なので信用しない
    if (analysis.inconclusive()) {
        return result;
    }

    std::vector<int64_t> stars;
    std::vector<int64_t> empties;
    const size_t limit = std::min(window.num_cells(), board.num_cells());
    for (size_t i = 0; i < limit; ++i) {
        if (board.cell(i) != CellValue::Unknown) continue;
        switch (analysis.result(i)) {
            case CellClass::AlwaysMarked:
                stars.push_back(static_cast<int64_t>(i));
                break;
            case CellClass::AlwaysUnmarked:
                empties.push_back(static_cast<int64_t>(i));
                break;
            case CellClass::Variable:
                break;
        }
    }

    if (!stars.empty()) {
        result.deductions.push_back(Deduction{DeductionKind::ForceStar, std::move(stars)});
    }
    if (!empties.empty()) {
        result.deductions.push_back(Deduction{DeductionKind::ForceEmpty, std::move(empties)});
    }
    result.verified = !result.deductions.empty();
    return result;
}

// ============================================================================
// PatternMiner
// ============================================================================

PatternMiner::PatternMiner(MinerConfig config, FamilyRegistry registry)
    : config_(std::move(config))
    , registry_(std::move(registry)) {
    config_.validate();
}

std::chrono::milliseconds PatternMiner::probe_timeout_for(const SchemaFamily& family,
                                                          const Window& window) const {
    if (window.width >= config_.large_window_side || window.height >= config_.large_window_side) {
        return config_.large_window_probe_timeout;
    }
    return family.constructs_own_precondition() ? config_.constructive_probe_timeout
                                                : config_.probe_timeout;
}

bool PatternMiner::probe(const Board& board, std::chrono::milliseconds timeout) {
    auto analysis = solver_.enumerate_completions(board, config_.probe_max_completions, timeout);
    stats_.solver_runs++;
    stats_.solver_nodes += solver_.stats().nodes;
    return analysis.total_completions > 0;
}

VerificationResult PatternMiner::verify(const Board& board, const Window& window) {
    auto result = verify_pattern(solver_, board, window,
                                 config_.verify_max_completions, config_.verify_timeout);
    stats_.solver_runs++;
    stats_.solver_nodes += solver_.stats().nodes;
    return result;
}

std::vector<Pattern> PatternMiner::mine_layout(const SchemaFamily& family,
                                               const Window& window,
                                               const RegionMap& regions,
                                               size_t& next_id,
                                               size_t budget) {
    std::vector<Pattern> patterns;
    if (budget == 0) return patterns;

    Board board = build_window_board(window, config_.board_size, config_.stars_per_unit, regions);
    stats_.layouts_built++;

    auto precondition = family.test_preconditions(board, window);
    if (!precondition.holds && !family.constructs_own_precondition()) {
        stats_.precondition_rejects++;
        return patterns;
    }

    // 近似クォータのため解を持たない配置は頻繁に出る
    const auto probe_timeout = probe_timeout_for(family, window);
    if (!probe(board, probe_timeout)) {
        stats_.unsolvable_layouts++;
        return patterns;
    }

    auto configs = family.generate_configurations(board, window, precondition,
                                                  config_.stars_per_unit);
    std::set<int> settled_groups;

    for (const auto& config : configs) {
        if (patterns.size() >= budget) break;
        if (config.alternative_group >= 0 && settled_groups.count(config.alternative_group)) {
            continue;
        }
        stats_.configurations_tried++;

        Board clued = apply_fixed_clues(board, config.marked, config.unmarked);
        if (!probe(clued, probe_timeout)) {
            stats_.unsolvable_configurations++;
            continue;
        }

        PatternData data;
        if (family.constructs_own_precondition()) {
            if (!family.test_preconditions(clued, window).holds) {
                stats_.precondition_rejects++;
                continue;
            }
        } else {
            data = precondition.data;
        }

        auto verification = verify(clued, window);
        if (verification.truncated) {
            stats_.truncated_verifications++;
            if (!config_.accept_truncated) continue;
        }
        if (!verification.verified) continue;

        data.merge(config.data);
        data.set("forced_stars", config.marked);
        data.set("forced_empties", config.unmarked);

        Pattern pattern;
        pattern.id = make_pattern_id(family.id(), next_id++);
        pattern.family_id = family.id();
        pattern.window_width = window.width;
        pattern.window_height = window.height;
        pattern.data = std::move(data);
        pattern.deductions = std::move(verification.deductions);
        patterns.push_back(canonicalize_pattern(std::move(pattern)));
        stats_.patterns_found++;

        if (config.alternative_group >= 0) {
            settled_groups.insert(config.alternative_group);
        }
    }
    return patterns;
}

FamilyPatternSet PatternMiner::mine_family(const std::string& family_id) {
    auto family = registry_.resolve(family_id);
    auto start = std::chrono::steady_clock::now();

    if (verbose_) {
        std::cerr << "% [verbose] mining " << family_id
                  << (registry_.contains(family_id) ? "" : " (generic fallback)") << "...\n";
    }

    std::vector<Pattern> all_patterns;
    size_t next_id = 0;

    for (const auto& size : config_.effective_window_sizes()) {
        auto windows = enumerate_windows(config_.board_size, size.width, size.height);
        if (verbose_) {
            std::cerr << "% [verbose]   testing " << windows.size() << " windows of size "
                      << size.width << "x" << size.height << "...\n";
        }

        size_t found_for_size = 0;
        size_t tested = 0;
        for (const auto& window : windows) {
            stats_.windows_tested++;
            tested++;

            size_t budget = config_.patterns_per_window;
            for (const auto& regions : family->region_layouts(window, config_.board_size)) {
                if (budget == 0) break;
                auto found = mine_layout(*family, window, regions, next_id, budget);
                budget -= found.size();
                found_for_size += found.size();
                all_patterns.insert(all_patterns.end(),
                                    std::make_move_iterator(found.begin()),
                                    std::make_move_iterator(found.end()));
            }

            if (verbose_ && tested % 100 == 0) {
                std::cerr << "% [verbose]   progress: " << tested << "/" << windows.size()
                          << " windows, " << found_for_size << " patterns found\n";
            }
        }

        if (verbose_) {
            std::cerr << "% [verbose]   " << size.width << "x" << size.height << ": found "
                      << found_for_size << " patterns\n";
        }
    }

    FamilyPatternSet result;
    result.family_id = family->id();
    result.patterns = deduplicate_patterns(all_patterns);
    stats_.patterns_after_dedup += result.patterns.size();

    if (verbose_) {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
        std::cerr << "% [verbose] completed " << family_id << " in " << std::fixed << std::setprecision(1)
                  << elapsed.count() << "s: " << result.patterns.size() << " patterns ("
                  << all_patterns.size() << " before deduplication)\n";
    }
    return result;
}

std::vector<FamilyPatternSet> PatternMiner::mine_all(const std::vector<std::string>& family_ids) {
    std::vector<FamilyPatternSet> results;
    results.reserve(family_ids.size());
    for (const auto& id : family_ids) {
        results.push_back(mine_family(id));
    }
    return results;
}

} // namespace star_miner
