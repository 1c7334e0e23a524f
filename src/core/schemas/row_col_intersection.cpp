#include "star_miner/schemas/families.hpp"

namespace star_miner {

// ============================================================================
// RowColIntersectionFamily implementation
// ============================================================================

PreconditionResult RowColIntersectionFamily::test_preconditions(const Board& board,
                                                                const Window& /*window*/) const {
    PreconditionResult result;
    size_t best_score = 0;

    for (const auto& row : board.rows()) {
        if (remaining_quota(board, row) <= 0) continue;
        size_t row_candidates = unknown_cells(board, row).size();

        for (const auto& col : board.columns()) {
            if (remaining_quota(board, col) <= 0) continue;
            if (row.id < 0 || col.id < 0) continue;
            auto r = static_cast<size_t>(row.id);
            auto c = static_cast<size_t>(col.id);
            if (r >= board.height() || c >= board.width()) continue;
            if (board.cell(board.index_of(r, c)) != CellValue::Unknown) continue;

            size_t col_candidates = unknown_cells(board, col).size();
            size_t score = row_candidates + col_candidates;
            // 候補の合計が最小の組（同点なら走査順で先）
            if (result.holds && score >= best_score) continue;

            best_score = score;
            result.holds = true;
            result.data = PatternData{};
            result.data.set("row", static_cast<int64_t>(r));
            result.data.set("col", static_cast<int64_t>(c));
            result.data.set("row_candidates", static_cast<int64_t>(row_candidates));
            result.data.set("col_candidates", static_cast<int64_t>(col_candidates));
        }
    }
    return result;
}

std::vector<ClueConfiguration> RowColIntersectionFamily::generate_configurations(
    const Board& board, const Window& /*window*/,
    const PreconditionResult& precondition, int /*stars_per_unit*/) const {
    std::vector<ClueConfiguration> configs(1);

    auto row = precondition.data.get_int("row");
    auto col = precondition.data.get_int("col");
    if (!precondition.holds || !row || !col) return configs;

    size_t cell = board.index_of(static_cast<size_t>(*row), static_cast<size_t>(*col));

    ClueConfiguration star;
    add_star_with_halo(board, star, cell);
    star.data.set("intersection", static_cast<int64_t>(cell));
    configs.push_back(std::move(star));

    ClueConfiguration empty;
    empty.unmarked.push_back(cell);
    empty.data.set("intersection", static_cast<int64_t>(cell));
    configs.push_back(std::move(empty));

    return configs;
}

} // namespace star_miner
