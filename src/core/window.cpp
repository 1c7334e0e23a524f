#include "star_miner/window.hpp"
#include <set>

namespace star_miner {

std::vector<Window> enumerate_windows(size_t board_size, size_t width, size_t height) {
    std::vector<Window> windows;
    if (width == 0 || height == 0 || width > board_size || height > board_size) {
        return windows;
    }
    windows.reserve((board_size - height + 1) * (board_size - width + 1));
    for (size_t r = 0; r + height <= board_size; ++r) {
        for (size_t c = 0; c + width <= board_size; ++c) {
            windows.push_back(Window{width, height, r, c});
        }
    }
    return windows;
}

Board build_window_board(const Window& window,
                         size_t board_size,
                         int stars_per_unit,
                         const RegionMap& regions) {
    Board board = Board::with_lines(window.width, window.height, stars_per_unit);

    for (const auto& [region_id, abs_cells] : regions) {
        std::vector<size_t> rel_cells;
        std::set<size_t> rows_spanned;
        for (size_t abs_idx : abs_cells) {
            size_t abs_row = abs_idx / board_size;
            size_t abs_col = abs_idx % board_size;
            // ウィンドウ外のセルは黙って捨てる
            if (abs_row < window.origin_row || abs_col < window.origin_col) continue;
            size_t rel_row = abs_row - window.origin_row;
            size_t rel_col = abs_col - window.origin_col;
            if (rel_row >= window.height || rel_col >= window.width) continue;
            rel_cells.push_back(rel_row * window.width + rel_col);
            rows_spanned.insert(rel_row);
        }
        if (rel_cells.empty()) continue;

        int quota = stars_per_unit;
        std::set<size_t> distinct(rel_cells.begin(), rel_cells.end());
        if (distinct.size() == window.num_cells()) {
            quota = static_cast<int>(window.height) * stars_per_unit;
        } else if (rows_spanned.size() > 1) {
            quota = static_cast<int>(rows_spanned.size()) * stars_per_unit;
        }
        board.add_region(region_id, std::move(rel_cells), quota);
    }

    return board;
}

Board build_window_board(const Window& window, size_t board_size, int stars_per_unit) {
    std::vector<size_t> cells;
    cells.reserve(window.num_cells());
    for (size_t r = 0; r < window.height; ++r) {
        for (size_t c = 0; c < window.width; ++c) {
            cells.push_back((window.origin_row + r) * board_size + window.origin_col + c);
        }
    }
    RegionMap regions;
    regions.emplace(1, std::move(cells));
    return build_window_board(window, board_size, stars_per_unit, regions);
}

Board apply_fixed_clues(const Board& board,
                        const std::vector<size_t>& marked,
                        const std::vector<size_t>& unmarked) {
    Board result = board;
    for (size_t idx : marked) {
        result.set_cell(idx, CellValue::Marked);
    }
    for (size_t idx : unmarked) {
        result.set_cell(idx, CellValue::Unmarked);
    }
    return result;
}

} // namespace star_miner
