#include "star_miner/schema.hpp"
#include "star_miner/schemas/families.hpp"
#include "star_miner/schemas/layouts.hpp"
#include <algorithm>
#include <stdexcept>

namespace star_miner {

// ============================================================================
// 共通ヘルパー
// ============================================================================

void add_star_with_halo(const Board& board, ClueConfiguration& config, size_t idx) {
    auto contains = [](const std::vector<size_t>& v, size_t x) {
        return std::find(v.begin(), v.end(), x) != v.end();
    };

    if (!contains(config.marked, idx)) {
        config.marked.push_back(idx);
    }
    // 新しい星が以前の halo に含まれていたら取り除く
    config.unmarked.erase(std::remove(config.unmarked.begin(), config.unmarked.end(), idx),
                          config.unmarked.end());
    for (size_t n : board.neighbors(idx)) {
        if (!contains(config.marked, n) && !contains(config.unmarked, n)) {
            config.unmarked.push_back(n);
        }
    }
}

std::vector<size_t> unknown_cells(const Board& board, const Group& group) {
    std::vector<size_t> result;
    for (size_t idx : group.cells) {
        if (board.cell(idx) == CellValue::Unknown) {
            result.push_back(idx);
        }
    }
    return result;
}

int remaining_quota(const Board& board, const Group& group) {
    return group.quota - static_cast<int>(board.count(group, CellValue::Marked));
}

const char* group_kind_name(GroupKind kind) {
    switch (kind) {
        case GroupKind::Row:
            return "row";
        case GroupKind::Column:
            return "column";
        case GroupKind::Region:
            return "region";
    }
    return "region";
}

// ============================================================================
// SchemaFamily
// ============================================================================

std::vector<RegionMap> SchemaFamily::region_layouts(const Window& window,
                                                    size_t board_size) const {
    return {layouts::row_regions(window, board_size)};
}

// ============================================================================
// FamilyRegistry
// ============================================================================

FamilyRegistry FamilyRegistry::with_builtin_families() {
    FamilyRegistry registry;
    registry.add(std::make_shared<CandidateDeficitFamily>());
    registry.add(std::make_shared<ExactCagesFamily>());
    registry.add(std::make_shared<CagesRegionQuotaFamily>());
    registry.add(std::make_shared<RowColIntersectionFamily>());
    registry.add(std::make_shared<BandRegionBudgetFamily>(true));
    registry.add(std::make_shared<BandRegionBudgetFamily>(false));
    return registry;
}

void FamilyRegistry::add(SchemaFamilyPtr family) {
    if (!family) {
        throw std::invalid_argument("Cannot register a null schema family");
    }
    auto id = family->id();
    if (!families_.emplace(id, std::move(family)).second) {
        throw std::invalid_argument("Schema family already registered: " + id);
    }
}

bool FamilyRegistry::contains(const std::string& id) const {
    return families_.count(id) > 0;
}

SchemaFamilyPtr FamilyRegistry::resolve(const std::string& id) const {
    auto it = families_.find(id);
    if (it != families_.end()) {
        return it->second;
    }
    return std::make_shared<GenericFamily>(id);
}

std::vector<std::string> FamilyRegistry::ids() const {
    std::vector<std::string> result;
    result.reserve(families_.size());
    for (const auto& entry : families_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace star_miner
