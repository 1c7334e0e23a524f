/**
 * @file layouts.hpp
 * @brief マイニング用の領域配置（絶対座標の RegionMap を生成）
 */
#ifndef STAR_MINER_SCHEMAS_LAYOUTS_HPP
#define STAR_MINER_SCHEMAS_LAYOUTS_HPP

#include "star_miner/window.hpp"

namespace star_miner {
namespace layouts {

/**
 * @brief 1行1領域（ID は 1 から）
 */
RegionMap row_regions(const Window& window, size_t board_size);

/**
 * @brief 2x2 ブロック領域（行優先で ID を振る）
 *
 * 両辺が偶数でなければ端のブロックは欠ける。
 */
RegionMap block_regions(const Window& window, size_t board_size);

/**
 * @brief 2行ずつの帯領域（奇数行なら最後は1行の領域）
 */
RegionMap row_band_regions(const Window& window, size_t board_size);

/**
 * @brief 混在配置
 *
 * 領域1: 0-1 行（ウィンドウ内に完全に収まる）
 * 領域2: 1 行目以降、盤面に余地があればウィンドウ下の1行まで延長
 * 領域3: 2 行目以降（高さ3以上のとき）、同様に延長
 * 領域1と2は1行目で重なる。
 */
RegionMap mixed_row_band_regions(const Window& window, size_t board_size);

/**
 * @brief 列帯の頭に小さな領域を置く配置
 *
 * 領域1: 0 行目のうち band_start 列から band_width 列分（列帯に完全に収まる）
 * 領域2以降: 1 行目以降の各行（列帯に部分的に掛かる）
 *
 * 列に沿って伸びる領域は行数分のクォータになり解を持たないため、
 * 列帯の配置は全て1行以内の領域で作る。
 */
RegionMap column_head_regions(const Window& window, size_t board_size,
                              size_t band_start, size_t band_width);

} // namespace layouts
} // namespace star_miner

#endif // STAR_MINER_SCHEMAS_LAYOUTS_HPP
