#include "star_miner/schemas/families.hpp"
#include "star_miner/schemas/layouts.hpp"
#include <algorithm>

namespace star_miner {

// ============================================================================
// BandRegionBudgetFamily implementation
// ============================================================================

std::vector<RegionMap> BandRegionBudgetFamily::region_layouts(const Window& window,
                                                              size_t board_size) const {
    if (by_rows_) {
        return {layouts::row_regions(window, board_size),
                layouts::row_band_regions(window, board_size),
                layouts::mixed_row_band_regions(window, board_size)};
    }
    // 左端と右端の半分幅の列帯
    const size_t half = std::max<size_t>(1, window.width / 2);
    return {layouts::column_head_regions(window, board_size, 0, half),
            layouts::column_head_regions(window, board_size, window.width - half, half)};
}

PreconditionResult BandRegionBudgetFamily::test_preconditions(const Board& board,
                                                              const Window& /*window*/) const {
    PreconditionResult result;
    const size_t extent = by_rows_ ? board.height() : board.width();
    if (extent < 2 || board.regions().size() < 2) {
        return result;
    }

    // 狭い帯から順に調べる
    for (size_t len = 1; len <= extent; ++len) {
        for (size_t start = 0; start + len <= extent; ++start) {
            std::vector<int64_t> full_inside;
            std::vector<int64_t> partial;
            int full_quota = 0;

            for (const auto& region : board.regions()) {
                size_t in_band = 0;
                size_t outside = 0;
                size_t open_in_band = 0;
                for (size_t idx : region.cells) {
                    size_t line = line_of(board, idx);
                    if (line >= start && line < start + len) {
                        in_band++;
                        if (board.cell(idx) == CellValue::Unknown) open_in_band++;
                    } else {
                        outside++;
                    }
                }
                if (in_band == 0) continue;
                if (outside == 0) {
                    full_inside.push_back(region.id);
                    full_quota += region.quota;
                } else if (open_in_band > 0) {
                    partial.push_back(region.id);
                }
            }

            if (full_inside.empty() || partial.empty()) continue;

            int band_quota = 0;
            const auto& lines = by_rows_ ? board.rows() : board.columns();
            std::vector<int64_t> band;
            for (const auto& line : lines) {
                if (line.id >= static_cast<int>(start) && line.id < static_cast<int>(start + len)) {
                    band_quota += line.quota;
                    band.push_back(line.id);
                }
            }

            result.holds = true;
            result.data.set(by_rows_ ? "row_band" : "col_band", band);
            result.data.set("full_inside_regions", full_inside);
            result.data.set("partial_regions", partial);
            result.data.set("band_quota", static_cast<int64_t>(band_quota));
            result.data.set("full_inside_quota", static_cast<int64_t>(full_quota));
            return result;
        }
    }
    return result;
}

std::vector<ClueConfiguration> BandRegionBudgetFamily::generate_configurations(
    const Board& board, const Window& /*window*/,
    const PreconditionResult& precondition, int /*stars_per_unit*/) const {
    std::vector<ClueConfiguration> configs(1);

    auto full_inside = precondition.data.get_ints("full_inside_regions");
    if (!precondition.holds || !full_inside || full_inside->empty()) return configs;

    // 完全に内側の領域の先頭セルに星を置いて予算を圧迫する
    std::vector<size_t> heads;
    std::vector<int64_t> head_regions;
    for (int64_t region_id : *full_inside) {
        const Group* region = board.find_region(static_cast<int>(region_id));
        if (region == nullptr || region->cells.empty()) continue;
        heads.push_back(region->cells.front());
        head_regions.push_back(region_id);
        if (heads.size() == 2) break;
    }
    if (heads.empty()) return configs;

    ClueConfiguration single;
    add_star_with_halo(board, single, heads[0]);
    single.data.set("star_regions", std::vector<int64_t>{head_regions[0]});
    configs.push_back(std::move(single));

    if (heads.size() == 2 && heads[0] != heads[1]) {
        auto around = board.neighbors(heads[0]);
        if (std::find(around.begin(), around.end(), heads[1]) == around.end()) {
            ClueConfiguration pair;
            add_star_with_halo(board, pair, heads[0]);
            add_star_with_halo(board, pair, heads[1]);
            pair.data.set("star_regions", head_regions);
            configs.push_back(std::move(pair));
        }
    }
    return configs;
}

} // namespace star_miner
