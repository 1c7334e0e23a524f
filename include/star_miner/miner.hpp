/**
 * @file miner.hpp
 * @brief パターン探索・検証・重複除去パイプライン
 */
#ifndef STAR_MINER_MINER_HPP
#define STAR_MINER_MINER_HPP

#include "star_miner/exact_solver.hpp"
#include "star_miner/pattern.hpp"
#include "star_miner/schema.hpp"
#include "star_miner/window.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace star_miner {

/**
 * @brief マイニング設定
 */
struct MinerConfig {
    size_t board_size = 10;
    int stars_per_unit = 2;

    /// 空なら stars_per_unit から default_window_sizes() で決める
    std::vector<WindowSize> window_sizes;

    /// ウィンドウあたりの採用パターン数の上限
    size_t patterns_per_window = 10;

    // 解の有無の確認（上限1）
    size_t probe_max_completions = 1;
    std::chrono::milliseconds probe_timeout{2000};
    std::chrono::milliseconds constructive_probe_timeout{3000};
    std::chrono::milliseconds large_window_probe_timeout{10000};
    size_t large_window_side = 10;

    // 検証（全列挙）
    size_t verify_max_completions = 1000;
    std::chrono::milliseconds verify_timeout{5000};

    /// 打ち切られた検証からもパターンを作るか
    bool accept_truncated = false;

    /**
     * @brief 設定を検証
     * @throws std::invalid_argument 不正な設定
     */
    void validate() const;

    /**
     * @brief 実際に使うウィンドウサイズ
     */
    std::vector<WindowSize> effective_window_sizes() const;
};

/**
 * @brief stars_per_unit に応じた既定のウィンドウサイズ
 *
 * 2以上: 8x8, 9x9, 10x10 / 1: 4x4, 5x5, 6x6
 */
std::vector<WindowSize> default_window_sizes(int stars_per_unit);

/**
 * @brief 検証結果
 */
struct VerificationResult {
    bool verified = false;
    bool truncated = false;
    size_t completions = 0;
    std::vector<Deduction> deductions;
};

/**
 * @brief 盤面を全列挙し、ウィンドウ内で強制されたセルを推論として返す
 *
 * 入力で既に確定していたセル（手がかり）は推論に含めない。
 * 補完が0なら verified=false。
 */
VerificationResult verify_pattern(ExactSolver& solver,
                                  const Board& board,
                                  const Window& window,
                                  size_t max_completions,
                                  std::chrono::milliseconds timeout);

/**
 * @brief マイニング統計情報
 */
struct MinerStats {
    size_t windows_tested = 0;
    size_t layouts_built = 0;
    size_t precondition_rejects = 0;
    size_t unsolvable_layouts = 0;
    size_t configurations_tried = 0;
    size_t unsolvable_configurations = 0;
    size_t truncated_verifications = 0;
    size_t solver_runs = 0;
    size_t solver_nodes = 0;
    size_t patterns_found = 0;
    size_t patterns_after_dedup = 0;
};

/**
 * @brief パターンマイナー
 *
 * ファミリー × ウィンドウサイズ × ウィンドウ位置 × 領域配置 × 手がかり配置を
 * 逐次に試し、強制セルが見つかった配置をパターンとして記録する。
 */
class PatternMiner {
public:
    /**
     * @throws std::invalid_argument 不正な設定
     */
    PatternMiner(MinerConfig config, FamilyRegistry registry);

    /**
     * @brief 1ファミリーをマイニング（重複除去済み）
     */
    FamilyPatternSet mine_family(const std::string& family_id);

    /**
     * @brief 全ファミリーをマイニング
     */
    std::vector<FamilyPatternSet> mine_all(const std::vector<std::string>& family_ids);

    /**
     * @brief 1つのウィンドウ・領域配置についてパターンを探す
     * @param next_id パターンIDの通し番号（採用ごとに進める）
     * @return 採用されたパターン（重複除去前）
     */
    std::vector<Pattern> mine_layout(const SchemaFamily& family,
                                     const Window& window,
                                     const RegionMap& regions,
                                     size_t& next_id,
                                     size_t budget);

    const MinerConfig& config() const { return config_; }
    const MinerStats& stats() const { return stats_; }

    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    std::chrono::milliseconds probe_timeout_for(const SchemaFamily& family,
                                                const Window& window) const;

    /**
     * @brief 上限 probe_max_completions で解の有無を確認
     */
    bool probe(const Board& board, std::chrono::milliseconds timeout);

    VerificationResult verify(const Board& board, const Window& window);

    MinerConfig config_;
    FamilyRegistry registry_;
    ExactSolver solver_;
    MinerStats stats_;
    bool verbose_ = false;
};

} // namespace star_miner

#endif // STAR_MINER_MINER_HPP
