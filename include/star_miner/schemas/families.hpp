/**
 * @file families.hpp
 * @brief 組み込みスキーマファミリー
 */
#ifndef STAR_MINER_SCHEMAS_FAMILIES_HPP
#define STAR_MINER_SCHEMAS_FAMILIES_HPP

#include "star_miner/schema.hpp"

namespace star_miner {

// ============================================================================
// 2x2 ケージ帯（C1, C2 共通）
// ============================================================================

/**
 * @brief 2行帯を 2x2 ケージに分割した状態
 *
 * 2x2 ケージには隣接ルールにより星が高々1つしか入らない。
 * 星を受け入れ可能なケージ数が帯の残り星数と等しければ、各ケージにちょうど1つ入る。
 */
struct CageBand {
    size_t band_start = 0;
    std::vector<std::vector<size_t>> cages;     // 左から順、幅が奇数なら最後は 2x1
    std::vector<size_t> available;              // Unknown を含み星を含まないケージの番号
    int remaining = 0;                          // 帯の2行に残っている必要な星の数

    bool exact() const {
        return remaining > 0 && available.size() == static_cast<size_t>(remaining);
    }
};

/**
 * @brief band_start 行目と次の行からなる帯を計算
 * @throws std::invalid_argument band_start + 1 が盤面の高さ以上
 */
CageBand compute_cage_band(const Board& board, size_t band_start);

// ============================================================================
// E1: 候補不足
// ============================================================================

/**
 * @brief E1_candidateDeficit
 *
 * ある行・列・領域の Unknown セル数が残りクォータにちょうど等しい。
 * 1本のラインに空を置いてこの状態を作り出す（前提条件を自分で構築する）。
 */
class CandidateDeficitFamily : public SchemaFamily {
public:
    static constexpr const char* ID = "E1_candidateDeficit";

    FamilyKind kind() const override { return FamilyKind::CandidateDeficit; }
    std::string id() const override { return ID; }
    PreconditionResult test_preconditions(const Board& board, const Window& window) const override;
    std::vector<ClueConfiguration> generate_configurations(
        const Board& board, const Window& window,
        const PreconditionResult& precondition, int stars_per_unit) const override;
    bool constructs_own_precondition() const override { return true; }

private:
    void add_line_attempts(const Board& board, const Group& line, size_t max_attempts,
                           int stars_per_unit, int alternative_group,
                           std::vector<ClueConfiguration>& configs) const;
};

// ============================================================================
// C1: ケージ数一致
// ============================================================================

/**
 * @brief C1_exactCages
 */
class ExactCagesFamily : public SchemaFamily {
public:
    static constexpr const char* ID = "C1_exactCages";

    FamilyKind kind() const override { return FamilyKind::ExactCages; }
    std::string id() const override { return ID; }
    std::vector<RegionMap> region_layouts(const Window& window, size_t board_size) const override;
    PreconditionResult test_preconditions(const Board& board, const Window& window) const override;
    std::vector<ClueConfiguration> generate_configurations(
        const Board& board, const Window& window,
        const PreconditionResult& precondition, int stars_per_unit) const override;
};

// ============================================================================
// C2: ケージと領域クォータ
// ============================================================================

/**
 * @brief C2_cages_regionQuota
 *
 * C1 の条件に加え、帯と交わる領域が受け入れ可能なケージを1つ以上完全に含む。
 */
class CagesRegionQuotaFamily : public SchemaFamily {
public:
    static constexpr const char* ID = "C2_cages_regionQuota";

    FamilyKind kind() const override { return FamilyKind::CagesRegionQuota; }
    std::string id() const override { return ID; }
    std::vector<RegionMap> region_layouts(const Window& window, size_t board_size) const override;
    PreconditionResult test_preconditions(const Board& board, const Window& window) const override;
    std::vector<ClueConfiguration> generate_configurations(
        const Board& board, const Window& window,
        const PreconditionResult& precondition, int stars_per_unit) const override;
};

// ============================================================================
// D1: 行と列の交点
// ============================================================================

/**
 * @brief D1_rowColIntersection
 */
class RowColIntersectionFamily : public SchemaFamily {
public:
    static constexpr const char* ID = "D1_rowColIntersection";

    FamilyKind kind() const override { return FamilyKind::RowColIntersection; }
    std::string id() const override { return ID; }
    PreconditionResult test_preconditions(const Board& board, const Window& window) const override;
    std::vector<ClueConfiguration> generate_configurations(
        const Board& board, const Window& window,
        const PreconditionResult& precondition, int stars_per_unit) const override;
};

// ============================================================================
// A1 / A2: 帯と領域の予算
// ============================================================================

/**
 * @brief A1_rowBand_regionBudget / A2_colBand_regionBudget
 *
 * 連続する行（列）の帯に、完全に内側の領域が1つ以上、部分的に内側で
 * 帯内に Unknown セルを持つ領域が1つ以上ある。
 */
class BandRegionBudgetFamily : public SchemaFamily {
public:
    static constexpr const char* ROW_ID = "A1_rowBand_regionBudget";
    static constexpr const char* COLUMN_ID = "A2_colBand_regionBudget";

    /**
     * @param by_rows true なら行帯（A1）、false なら列帯（A2）
     */
    explicit BandRegionBudgetFamily(bool by_rows) : by_rows_(by_rows) {}

    FamilyKind kind() const override {
        return by_rows_ ? FamilyKind::RowBandRegionBudget : FamilyKind::ColBandRegionBudget;
    }
    std::string id() const override { return by_rows_ ? ROW_ID : COLUMN_ID; }
    std::vector<RegionMap> region_layouts(const Window& window, size_t board_size) const override;
    PreconditionResult test_preconditions(const Board& board, const Window& window) const override;
    std::vector<ClueConfiguration> generate_configurations(
        const Board& board, const Window& window,
        const PreconditionResult& precondition, int stars_per_unit) const override;

private:
    size_t line_of(const Board& board, size_t idx) const {
        return by_rows_ ? board.row_of(idx) : board.col_of(idx);
    }

    bool by_rows_;
};

// ============================================================================
// 汎用（未登録ID）
// ============================================================================

/**
 * @brief 未登録IDのフォールバック
 *
 * 領域が1つでもあれば成立し、空の手がかり配置だけを生成する。
 */
class GenericFamily : public SchemaFamily {
public:
    explicit GenericFamily(std::string family_id) : family_id_(std::move(family_id)) {}

    FamilyKind kind() const override { return FamilyKind::Generic; }
    std::string id() const override { return family_id_; }
    PreconditionResult test_preconditions(const Board& board, const Window& window) const override;
    std::vector<ClueConfiguration> generate_configurations(
        const Board& board, const Window& window,
        const PreconditionResult& precondition, int stars_per_unit) const override;

private:
    std::string family_id_;
};

} // namespace star_miner

#endif // STAR_MINER_SCHEMAS_FAMILIES_HPP
