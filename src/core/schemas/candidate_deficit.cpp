#include "star_miner/schemas/families.hpp"
#include <algorithm>
#include <set>

namespace star_miner {

// ============================================================================
// CandidateDeficitFamily implementation
// ============================================================================

PreconditionResult CandidateDeficitFamily::test_preconditions(const Board& board,
                                                              const Window& /*window*/) const {
    PreconditionResult result;
    for (const Group* g : board.all_groups()) {
        int remaining = remaining_quota(board, *g);
        if (remaining <= 0) continue;
        auto candidates = unknown_cells(board, *g);
        if (candidates.size() != static_cast<size_t>(remaining)) continue;

        result.holds = true;
        result.data.set("group_type", group_kind_name(g->kind));
        result.data.set("group_id", static_cast<int64_t>(g->id));
        result.data.set("remaining_stars", static_cast<int64_t>(remaining));
        result.data.set("candidates", candidates);
        break;
    }
    return result;
}

std::vector<ClueConfiguration> CandidateDeficitFamily::generate_configurations(
    const Board& board, const Window& window,
    const PreconditionResult& /*precondition*/, int stars_per_unit) const {
    std::vector<ClueConfiguration> configs;
    const bool large = window.width >= 10 || window.height >= 10;
    int group = 0;

    for (const auto& row : board.rows()) {
        size_t n = unknown_cells(board, row).size();
        int remaining = remaining_quota(board, row);
        if (remaining < 0 || n <= static_cast<size_t>(remaining)) {
            ++group;
            continue;
        }
        size_t empties = n - static_cast<size_t>(remaining);
        size_t max_attempts = stars_per_unit >= 2
            ? std::min<size_t>(large ? 50 : 30, n / 2)
            : std::min<size_t>(5, n - empties + 1);
        add_line_attempts(board, row, max_attempts, stars_per_unit, group++, configs);
    }

    for (const auto& col : board.columns()) {
        size_t n = unknown_cells(board, col).size();
        int remaining = remaining_quota(board, col);
        if (remaining < 0 || n <= static_cast<size_t>(remaining)) {
            ++group;
            continue;
        }
        size_t empties = n - static_cast<size_t>(remaining);
        size_t max_attempts = stars_per_unit >= 2
            ? std::min<size_t>(25, n / 2)
            : std::min<size_t>(3, n - empties + 1);
        add_line_attempts(board, col, max_attempts, stars_per_unit, group++, configs);
    }

    return configs;
}

void CandidateDeficitFamily::add_line_attempts(const Board& board, const Group& line,
                                               size_t max_attempts, int stars_per_unit,
                                               int alternative_group,
                                               std::vector<ClueConfiguration>& configs) const {
    auto candidates = unknown_cells(board, line);
    const size_t n = candidates.size();
    const size_t empties = n - static_cast<size_t>(remaining_quota(board, line));
    std::set<std::vector<size_t>> tried;

    for (size_t attempt = 0; attempt < max_attempts; ++attempt) {
        std::vector<size_t> forced;

        if (stars_per_unit >= 2) {
            // 空を間隔を空けて置き、残りの候補に余裕を持たせる
            size_t step = std::max<size_t>(1, n / empties);
            for (size_t i = 0; i < empties && forced.size() < empties; ++i) {
                size_t cell = candidates[(attempt + i * step) % n];
                if (std::find(forced.begin(), forced.end(), cell) == forced.end()) {
                    forced.push_back(cell);
                }
            }
            for (size_t cell : candidates) {
                if (forced.size() >= empties) break;
                if (std::find(forced.begin(), forced.end(), cell) == forced.end()) {
                    forced.push_back(cell);
                }
            }
        } else {
            for (size_t i = 0; i < empties; ++i) {
                forced.push_back(candidates[(attempt + i) % n]);
            }
        }

        if (forced.size() != empties) continue;
        auto key = forced;
        std::sort(key.begin(), key.end());
        if (!tried.insert(key).second) continue;

        ClueConfiguration config;
        config.unmarked = forced;
        config.alternative_group = alternative_group;
        config.data.set("group_type", group_kind_name(line.kind));
        config.data.set("group_id", static_cast<int64_t>(line.id));
        config.data.set("forced_empties", forced);
        configs.push_back(std::move(config));
    }
}

} // namespace star_miner
