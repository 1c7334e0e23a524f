/**
 * @file schema.hpp
 * @brief スキーマファミリー基底クラスとファミリー登録
 */
#ifndef STAR_MINER_SCHEMA_HPP
#define STAR_MINER_SCHEMA_HPP

#include "star_miner/board.hpp"
#include "star_miner/pattern.hpp"
#include "star_miner/window.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace star_miner {

/**
 * @brief ファミリーの種類（閉じた集合）
 */
enum class FamilyKind {
    CandidateDeficit,       // E1
    ExactCages,             // C1
    CagesRegionQuota,       // C2
    RowColIntersection,     // D1
    RowBandRegionBudget,    // A1
    ColBandRegionBudget,    // A2
    Generic                 // 未登録IDのフォールバック
};

/**
 * @brief 前提条件テストの結果
 *
 * data にはどの行・列・領域が条件を満たしたかを記録する。
 * 手がかり生成器はこれを読んで配置を決める。
 */
struct PreconditionResult {
    bool holds = false;
    PatternData data;
};

/**
 * @brief 候補となる手がかり配置
 *
 * alternative_group が 0 以上の配置は同じグループ内の代替案であり、
 * いずれか1つがパターンとして採用されたら残りは試さない。
 */
struct ClueConfiguration {
    std::vector<size_t> marked;
    std::vector<size_t> unmarked;
    PatternData data;
    int alternative_group = -1;

    bool empty() const { return marked.empty() && unmarked.empty(); }
};

/**
 * @brief セルを星にし、その8近傍を空にする
 *
 * 既に marked に含まれる近傍は unmarked に加えない。重複は除く。
 */
void add_star_with_halo(const Board& board, ClueConfiguration& config, size_t idx);

/**
 * @brief グループ内の Unknown セル
 */
std::vector<size_t> unknown_cells(const Board& board, const Group& group);

/**
 * @brief グループに残っている必要な星の数（quota - marked）
 */
int remaining_quota(const Board& board, const Group& group);

/**
 * @brief "row" / "column" / "region"
 */
const char* group_kind_name(GroupKind kind);

/**
 * @brief スキーマファミリーの基底クラス
 *
 * 前提条件テストと手がかり生成器の組。生成器は提案が解を持つことを仮定しない
 * （パイプライン側で再確認する）。
 */
class SchemaFamily {
public:
    virtual ~SchemaFamily() = default;

    virtual FamilyKind kind() const = 0;

    /**
     * @brief ファミリーID（出力ファイル名・パターンIDに使う）
     */
    virtual std::string id() const = 0;

    /**
     * @brief ウィンドウに対して試す領域配置（絶対座標）
     *
     * デフォルトは1行1領域の配置のみ。
     */
    virtual std::vector<RegionMap> region_layouts(const Window& window, size_t board_size) const;

    /**
     * @brief 前提条件をテスト
     */
    virtual PreconditionResult test_preconditions(const Board& board, const Window& window) const = 0;

    /**
     * @brief 手がかり配置の候補を生成
     * @param board 手がかり適用前の盤面
     * @param window 対象ウィンドウ
     * @param precondition 前提条件テストの結果（holds でない場合もある）
     * @param stars_per_unit 行・列あたりの星の数
     */
    virtual std::vector<ClueConfiguration> generate_configurations(
        const Board& board, const Window& window,
        const PreconditionResult& precondition, int stars_per_unit) const = 0;

    /**
     * @brief 前提条件を自分で作り出すファミリーか
     *
     * true なら手がかり適用前の前提条件で絞り込まず、適用後に再テストする。
     */
    virtual bool constructs_own_precondition() const { return false; }
};

using SchemaFamilyPtr = std::shared_ptr<const SchemaFamily>;

/**
 * @brief ファミリー登録（ID の完全一致で検索）
 */
class FamilyRegistry {
public:
    FamilyRegistry() = default;

    /**
     * @brief 組み込みファミリーを全て登録したレジストリ
     */
    static FamilyRegistry with_builtin_families();

    /**
     * @brief ファミリーを登録
     * @throws std::invalid_argument 同じIDが登録済み
     */
    void add(SchemaFamilyPtr family);

    bool contains(const std::string& id) const;

    /**
     * @brief IDからファミリーを取得
     *
     * 未登録のIDには、領域が1つでもあれば成立し、手がかりを強制しない
     * 汎用ファミリーを返す（エラーにはしない）。
     */
    SchemaFamilyPtr resolve(const std::string& id) const;

    std::vector<std::string> ids() const;

private:
    std::map<std::string, SchemaFamilyPtr> families_;
};

} // namespace star_miner

#endif // STAR_MINER_SCHEMA_HPP
