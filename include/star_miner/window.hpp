/**
 * @file window.hpp
 * @brief ウィンドウ（大きな盤面の部分矩形）と盤面構築
 */
#ifndef STAR_MINER_WINDOW_HPP
#define STAR_MINER_WINDOW_HPP

#include "star_miner/board.hpp"
#include <map>
#include <vector>

namespace star_miner {

/**
 * @brief ウィンドウ
 *
 * 一辺 board_size の盤面上の width x height の矩形。
 * origin は盤面上の左上セルの位置。
 */
struct Window {
    size_t width;
    size_t height;
    size_t origin_row;
    size_t origin_col;

    size_t num_cells() const { return width * height; }

    bool operator==(const Window& other) const {
        return width == other.width && height == other.height &&
               origin_row == other.origin_row && origin_col == other.origin_col;
    }
};

/**
 * @brief ウィンドウの寸法
 */
struct WindowSize {
    size_t width;
    size_t height;
};

/**
 * @brief 領域ID -> 盤面上の絶対セルインデックス（row * board_size + col）
 */
using RegionMap = std::map<int, std::vector<size_t>>;

/**
 * @brief 指定サイズのウィンドウを全位置について列挙（行優先）
 *
 * ウィンドウが盤面より大きければ空のリストを返す。
 */
std::vector<Window> enumerate_windows(size_t board_size, size_t width, size_t height);

/**
 * @brief ウィンドウに制限した盤面を構築
 *
 * 行・列はウィンドウ寸法から作り、クォータは stars_per_unit。
 * 領域の各セルはウィンドウ相対座標に変換され、ウィンドウ外のセルは捨てる。
 * ウィンドウ内にセルが残らない領域は追加しない。
 *
 * 領域クォータは断片からは分からないため近似する:
 * - ウィンドウ全体を覆う: height * stars_per_unit
 * - k 行にまたがる: k * stars_per_unit
 * - それ以外: stars_per_unit
 * この近似で過剰・過少制約になるウィンドウは解なしとして扱われる。
 *
 * @param window 対象ウィンドウ
 * @param board_size 元の盤面の一辺
 * @param stars_per_unit 行・列あたりの星の数
 * @param regions 絶対座標の領域マップ
 */
Board build_window_board(const Window& window,
                         size_t board_size,
                         int stars_per_unit,
                         const RegionMap& regions);

/**
 * @brief ウィンドウ全体を1領域とした盤面を構築
 */
Board build_window_board(const Window& window, size_t board_size, int stars_per_unit);

/**
 * @brief 手がかりを適用した新しい盤面を返す
 *
 * marked を Marked、unmarked を Unmarked に設定する（unmarked が後勝ち）。
 * それ以外のセルは変更しない。
 *
 * @throws std::invalid_argument 範囲外のセルインデックス
 */
Board apply_fixed_clues(const Board& board,
                        const std::vector<size_t>& marked,
                        const std::vector<size_t>& unmarked);

} // namespace star_miner

#endif // STAR_MINER_WINDOW_HPP
