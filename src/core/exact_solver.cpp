#include "star_miner/exact_solver.hpp"
#include <iostream>

namespace star_miner {

namespace {

constexpr uint8_t bit_of(CellValue value) {
    return static_cast<uint8_t>(1u << static_cast<uint8_t>(value));
}

constexpr uint8_t MARKED_BIT = bit_of(CellValue::Marked);
constexpr uint8_t UNMARKED_BIT = bit_of(CellValue::Unmarked);

}  // namespace

// ============================================================================
// SearchContext
// ============================================================================

SearchContext::SearchContext(const Board& board, size_t max_completions,
                             std::chrono::milliseconds timeout)
    : values(board.cells())
    , observed(board.num_cells(), 0)
    , cell_groups(board.num_cells())
    , cell_neighbors(board.num_cells())
    , max_completions(max_completions)
    , deadline(Clock::now() + timeout) {
    for (const Group* g : board.all_groups()) {
        size_t gi = group_quota.size();
        int marked = 0;
        int unknown = 0;
        for (size_t idx : g->cells) {
            cell_groups[idx].push_back(gi);
            if (values[idx] == CellValue::Marked) marked++;
            else if (values[idx] == CellValue::Unknown) unknown++;
        }
        group_quota.push_back(g->quota);
        group_marked.push_back(marked);
        group_unknown.push_back(unknown);
    }
    for (size_t i = 0; i < values.size(); ++i) {
        cell_neighbors[i] = board.neighbors(i);
    }
}

bool SearchContext::should_stop() {
    if (timed_out) return true;
    if (Clock::now() > deadline) {
        timed_out = true;
        return true;
    }
    if (completions >= max_completions) {
        capped = true;
        return true;
    }
    return false;
}

// ============================================================================
// ExactSolver
// ============================================================================

CompletionAnalysis ExactSolver::enumerate_completions(const Board& board,
                                                      size_t max_completions,
                                                      std::chrono::milliseconds timeout) {
    stats_ = ExactSolverStats{};
    SearchContext ctx(board, max_completions, timeout);

    if (verbose_) {
        std::cerr << "% [verbose] exact_solver: enumerate " << board.width() << "x" << board.height()
                  << " cap=" << max_completions
                  << " timeout=" << timeout.count() << "ms\n";
    }

    if (root_is_consistent(ctx)) {
        search(ctx, 0, 0);
    } else if (verbose_) {
        std::cerr << "% [verbose] exact_solver: initial assignment is inconsistent\n";
    }

    stats_.completions = ctx.completions;
    if (verbose_) {
        std::cerr << "% [verbose] exact_solver: completions=" << ctx.completions
                  << " nodes=" << stats_.nodes
                  << (ctx.timed_out ? " (timeout)" : "") << "\n";
    }
    return build_analysis(ctx);
}

bool ExactSolver::is_solvable(const Board& board, std::chrono::milliseconds timeout) {
    return enumerate_completions(board, 1, timeout).total_completions > 0;
}

void ExactSolver::search(SearchContext& ctx, size_t cursor, size_t depth) {
    stats_.nodes++;
    if (depth > stats_.max_depth) stats_.max_depth = depth;

    if (ctx.should_stop()) return;

    // 最小インデックスの Unknown セル（cursor より前は全て確定済み）
    size_t next = cursor;
    while (next < ctx.values.size() && ctx.values[next] != CellValue::Unknown) {
        ++next;
    }

    if (next == ctx.values.size()) {
        if (verify_completion(ctx)) {
            record_completion(ctx);
        }
        return;
    }

    for (CellValue value : {CellValue::Marked, CellValue::Unmarked}) {
        if (assign(ctx, next, value)) {
            search(ctx, next + 1, depth + 1);
            unassign(ctx, next, value);
        } else {
            stats_.pruned++;
        }
    }
}

bool ExactSolver::assign(SearchContext& ctx, size_t idx, CellValue value) {
    if (value == CellValue::Marked) {
        for (size_t n : ctx.cell_neighbors[idx]) {
            if (ctx.values[n] == CellValue::Marked) return false;
        }
    }

    ctx.values[idx] = value;
    for (size_t g : ctx.cell_groups[idx]) {
        ctx.group_unknown[g]--;
        if (value == CellValue::Marked) ctx.group_marked[g]++;
    }

    // 変化したのはこのセルを含むグループだけ
    for (size_t g : ctx.cell_groups[idx]) {
        int marked = ctx.group_marked[g];
        if (marked > ctx.group_quota[g] ||
            marked + ctx.group_unknown[g] < ctx.group_quota[g]) {
            unassign(ctx, idx, value);
            return false;
        }
    }
    return true;
}

void ExactSolver::unassign(SearchContext& ctx, size_t idx, CellValue value) {
    for (size_t g : ctx.cell_groups[idx]) {
        ctx.group_unknown[g]++;
        if (value == CellValue::Marked) ctx.group_marked[g]--;
    }
    ctx.values[idx] = CellValue::Unknown;
}

bool ExactSolver::root_is_consistent(const SearchContext& ctx) const {
    for (size_t g = 0; g < ctx.group_quota.size(); ++g) {
        if (ctx.group_marked[g] > ctx.group_quota[g]) return false;
        if (ctx.group_marked[g] + ctx.group_unknown[g] < ctx.group_quota[g]) return false;
    }
    for (size_t i = 0; i < ctx.values.size(); ++i) {
        if (ctx.values[i] != CellValue::Marked) continue;
        for (size_t n : ctx.cell_neighbors[i]) {
            if (ctx.values[n] == CellValue::Marked) return false;
        }
    }
    return true;
}

bool ExactSolver::verify_completion(const SearchContext& ctx) const {
    for (size_t g = 0; g < ctx.group_quota.size(); ++g) {
        if (ctx.group_unknown[g] != 0) return false;
        if (ctx.group_marked[g] != ctx.group_quota[g]) return false;
    }
    return true;
}

void ExactSolver::record_completion(SearchContext& ctx) {
    for (size_t i = 0; i < ctx.values.size(); ++i) {
        ctx.observed[i] |= bit_of(ctx.values[i]);
    }
    ctx.completions++;
}

CompletionAnalysis ExactSolver::build_analysis(const SearchContext& ctx) const {
    CompletionAnalysis analysis;
    analysis.total_completions = ctx.completions;
    analysis.max_completions = ctx.max_completions;
    analysis.timed_out = ctx.timed_out;
    analysis.capped = ctx.capped;
    analysis.cell_results.reserve(ctx.observed.size());

    for (uint8_t seen : ctx.observed) {
        if (seen == MARKED_BIT) {
            analysis.cell_results.push_back(CellClass::AlwaysMarked);
        } else if (seen == UNMARKED_BIT) {
            analysis.cell_results.push_back(CellClass::AlwaysUnmarked);
        } else {
            // 未観測（補完なし）または両方観測
            analysis.cell_results.push_back(CellClass::Variable);
        }
    }
    return analysis;
}

} // namespace star_miner
