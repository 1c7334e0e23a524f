#include "star_miner/schemas/layouts.hpp"
#include <algorithm>
#include <functional>

namespace star_miner {
namespace layouts {

namespace {

/**
 * @brief 行を並べて帯を作るための軸
 *
 * line は行番号、k は行の中の位置。
 * line がウィンドウ外（extent 以上）でも盤面内なら絶対座標を返す。
 */
struct Axis {
    size_t extent;      // ウィンドウの高さ
    size_t span;        // ウィンドウの幅
    size_t room;        // ウィンドウの下に残っている盤面の行数
    std::function<size_t(size_t, size_t)> cell;
};

Axis row_axis(const Window& w, size_t n) {
    return Axis{w.height, w.width, n - (w.origin_row + w.height),
                [&w, n](size_t line, size_t k) {
                    return (w.origin_row + line) * n + w.origin_col + k;
                }};
}

void append_lines(const Axis& axis, size_t first, size_t last, std::vector<size_t>& cells) {
    for (size_t line = first; line < last; ++line) {
        for (size_t k = 0; k < axis.span; ++k) {
            cells.push_back(axis.cell(line, k));
        }
    }
}

RegionMap single_lines(const Axis& axis) {
    RegionMap regions;
    for (size_t line = 0; line < axis.extent; ++line) {
        std::vector<size_t> cells;
        append_lines(axis, line, line + 1, cells);
        regions.emplace(static_cast<int>(line) + 1, std::move(cells));
    }
    return regions;
}

RegionMap paired_lines(const Axis& axis) {
    RegionMap regions;
    int id = 1;
    for (size_t line = 0; line < axis.extent; line += 2) {
        std::vector<size_t> cells;
        append_lines(axis, line, std::min(line + 2, axis.extent), cells);
        regions.emplace(id++, std::move(cells));
    }
    return regions;
}

RegionMap mixed_lines(const Axis& axis) {
    RegionMap regions;
    // 盤面に余地があれば1行分ウィンドウの外へ延ばす
    size_t tail = axis.extent + (axis.room > 0 ? 1 : 0);

    std::vector<size_t> first;
    append_lines(axis, 0, std::min<size_t>(2, axis.extent), first);
    regions.emplace(1, std::move(first));

    if (axis.extent >= 2) {
        std::vector<size_t> second;
        append_lines(axis, 1, tail, second);
        regions.emplace(2, std::move(second));
    }
    if (axis.extent >= 3) {
        std::vector<size_t> third;
        append_lines(axis, 2, tail, third);
        regions.emplace(3, std::move(third));
    }
    return regions;
}

}  // namespace

RegionMap row_regions(const Window& window, size_t board_size) {
    return single_lines(row_axis(window, board_size));
}

RegionMap block_regions(const Window& window, size_t board_size) {
    RegionMap regions;
    int id = 1;
    for (size_t r = 0; r < window.height; r += 2) {
        for (size_t c = 0; c < window.width; c += 2) {
            std::vector<size_t> cells;
            for (size_t dr = 0; dr < 2 && r + dr < window.height; ++dr) {
                for (size_t dc = 0; dc < 2 && c + dc < window.width; ++dc) {
                    cells.push_back((window.origin_row + r + dr) * board_size +
                                    window.origin_col + c + dc);
                }
            }
            regions.emplace(id++, std::move(cells));
        }
    }
    return regions;
}

RegionMap row_band_regions(const Window& window, size_t board_size) {
    return paired_lines(row_axis(window, board_size));
}

RegionMap mixed_row_band_regions(const Window& window, size_t board_size) {
    return mixed_lines(row_axis(window, board_size));
}

RegionMap column_head_regions(const Window& window, size_t board_size,
                              size_t band_start, size_t band_width) {
    RegionMap regions;
    if (window.height == 0 || band_start >= window.width) return regions;
    const size_t band_end = std::min(band_start + band_width, window.width);

    std::vector<size_t> head;
    for (size_t c = band_start; c < band_end; ++c) {
        head.push_back(window.origin_row * board_size + window.origin_col + c);
    }
    regions.emplace(1, std::move(head));

    // 1 行目以降は1行1領域
    auto axis = row_axis(window, board_size);
    for (size_t line = 1; line < axis.extent; ++line) {
        std::vector<size_t> cells;
        append_lines(axis, line, line + 1, cells);
        regions.emplace(static_cast<int>(line) + 1, std::move(cells));
    }
    return regions;
}

} // namespace layouts
} // namespace star_miner
