#include "star_miner/schemas/families.hpp"
#include "star_miner/schemas/layouts.hpp"
#include <algorithm>
#include <stdexcept>

namespace star_miner {

namespace {

// 1つの帯で縮約を試すケージ数の上限
constexpr size_t MAX_REDUCED_CAGES = 4;

std::vector<RegionMap> cage_layouts(const Window& window, size_t board_size) {
    std::vector<RegionMap> result;
    result.push_back(layouts::row_regions(window, board_size));
    result.push_back(layouts::row_band_regions(window, board_size));
    if (window.width >= 4 && window.height >= 4 &&
        window.width % 2 == 0 && window.height % 2 == 0) {
        result.push_back(layouts::block_regions(window, board_size));
    }
    return result;
}

std::vector<size_t> cage_heads(const CageBand& band, const std::vector<size_t>& cage_ids) {
    std::vector<size_t> heads;
    for (size_t i : cage_ids) {
        heads.push_back(band.cages[i].front());
    }
    return heads;
}

/**
 * @brief ケージの候補を1つだけ残す配置
 *
 * 帯の各ケージに星がちょうど1つ入るので、残した候補が星に強制される。
 */
void add_reduced_cages(const Board& board, const CageBand& band,
                       const std::vector<size_t>& cage_ids,
                       std::vector<ClueConfiguration>& configs) {
    size_t tried = 0;
    for (size_t i : cage_ids) {
        if (tried >= MAX_REDUCED_CAGES) break;
        std::vector<size_t> open;
        for (size_t idx : band.cages[i]) {
            if (board.cell(idx) == CellValue::Unknown) open.push_back(idx);
        }
        if (open.size() < 2) continue;

        ClueConfiguration config;
        size_t kept = open.back();
        open.pop_back();
        config.unmarked = open;
        config.data.set("band_start", static_cast<int64_t>(band.band_start));
        config.data.set("cage", band.cages[i]);
        config.data.set("kept_cell", static_cast<int64_t>(kept));
        configs.push_back(std::move(config));
        ++tried;
    }
}

}  // namespace

// ============================================================================
// CageBand
// ============================================================================

CageBand compute_cage_band(const Board& board, size_t band_start) {
    if (band_start + 1 >= board.height()) {
        throw std::invalid_argument("Cage band needs two rows");
    }

    CageBand band;
    band.band_start = band_start;
    const size_t w = board.width();
    for (size_t c = 0; c < w; c += 2) {
        std::vector<size_t> cage;
        for (size_t r = band_start; r <= band_start + 1; ++r) {
            cage.push_back(board.index_of(r, c));
            if (c + 1 < w) cage.push_back(board.index_of(r, c + 1));
        }
        band.cages.push_back(std::move(cage));
    }

    for (size_t i = 0; i < band.cages.size(); ++i) {
        bool has_unknown = false;
        bool has_mark = false;
        for (size_t idx : band.cages[i]) {
            auto v = board.cell(idx);
            if (v == CellValue::Unknown) has_unknown = true;
            if (v == CellValue::Marked) has_mark = true;
        }
        if (has_unknown && !has_mark) band.available.push_back(i);
    }

    for (const auto& row : board.rows()) {
        if (row.id == static_cast<int>(band_start) || row.id == static_cast<int>(band_start + 1)) {
            band.remaining += remaining_quota(board, row);
        }
    }
    return band;
}

// ============================================================================
// ExactCagesFamily implementation
// ============================================================================

std::vector<RegionMap> ExactCagesFamily::region_layouts(const Window& window,
                                                        size_t board_size) const {
    return cage_layouts(window, board_size);
}

PreconditionResult ExactCagesFamily::test_preconditions(const Board& board,
                                                        const Window& /*window*/) const {
    PreconditionResult result;
    for (size_t r = 0; r + 1 < board.height(); ++r) {
        auto band = compute_cage_band(board, r);
        if (!band.exact()) continue;

        result.holds = true;
        result.data.set("band_start", static_cast<int64_t>(r));
        result.data.set("valid_blocks", static_cast<int64_t>(band.available.size()));
        result.data.set("remaining_stars", static_cast<int64_t>(band.remaining));
        result.data.set("blocks", cage_heads(band, band.available));
        break;
    }
    return result;
}

std::vector<ClueConfiguration> ExactCagesFamily::generate_configurations(
    const Board& board, const Window& /*window*/,
    const PreconditionResult& precondition, int /*stars_per_unit*/) const {
    std::vector<ClueConfiguration> configs(1);

    auto band_start = precondition.data.get_int("band_start");
    if (!precondition.holds || !band_start) return configs;

    auto band = compute_cage_band(board, static_cast<size_t>(*band_start));
    add_reduced_cages(board, band, band.available, configs);
    return configs;
}

// ============================================================================
// CagesRegionQuotaFamily implementation
// ============================================================================

std::vector<RegionMap> CagesRegionQuotaFamily::region_layouts(const Window& window,
                                                              size_t board_size) const {
    return cage_layouts(window, board_size);
}

PreconditionResult CagesRegionQuotaFamily::test_preconditions(const Board& board,
                                                              const Window& /*window*/) const {
    PreconditionResult result;
    for (size_t r = 0; r + 1 < board.height(); ++r) {
        auto band = compute_cage_band(board, r);
        if (!band.exact()) continue;

        for (const auto& region : board.regions()) {
            std::vector<size_t> covered;
            for (size_t i : band.available) {
                const auto& cage = band.cages[i];
                bool inside = std::all_of(cage.begin(), cage.end(), [&region](size_t idx) {
                    return std::find(region.cells.begin(), region.cells.end(), idx) !=
                           region.cells.end();
                });
                if (inside) covered.push_back(i);
            }
            if (covered.empty()) continue;

            result.holds = true;
            result.data.set("band_start", static_cast<int64_t>(r));
            result.data.set("valid_blocks", static_cast<int64_t>(band.available.size()));
            result.data.set("remaining_stars", static_cast<int64_t>(band.remaining));
            result.data.set("region_id", static_cast<int64_t>(region.id));
            result.data.set("region_quota", static_cast<int64_t>(region.quota));
            result.data.set("covered_blocks", cage_heads(band, covered));
            return result;
        }
    }
    return result;
}

std::vector<ClueConfiguration> CagesRegionQuotaFamily::generate_configurations(
    const Board& board, const Window& /*window*/,
    const PreconditionResult& precondition, int /*stars_per_unit*/) const {
    std::vector<ClueConfiguration> configs(1);

    auto band_start = precondition.data.get_int("band_start");
    auto covered_heads = precondition.data.get_ints("covered_blocks");
    if (!precondition.holds || !band_start || !covered_heads) return configs;

    auto band = compute_cage_band(board, static_cast<size_t>(*band_start));
    std::vector<size_t> covered;
    for (size_t i = 0; i < band.cages.size(); ++i) {
        auto head = static_cast<int64_t>(band.cages[i].front());
        if (std::find(covered_heads->begin(), covered_heads->end(), head) != covered_heads->end()) {
            covered.push_back(i);
        }
    }
    add_reduced_cages(board, band, covered, configs);
    return configs;
}

} // namespace star_miner
