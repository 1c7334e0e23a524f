/**
 * @file exact_solver.hpp
 * @brief 完全列挙ソルバー（全補完を数え上げてセルを分類する）
 */
#ifndef STAR_MINER_EXACT_SOLVER_HPP
#define STAR_MINER_EXACT_SOLVER_HPP

#include "star_miner/board.hpp"
#include <chrono>
#include <vector>

namespace star_miner {

/**
 * @brief セルの分類結果
 */
enum class CellClass {
    AlwaysMarked,
    AlwaysUnmarked,
    Variable
};

/**
 * @brief 補完列挙の結果
 *
 * 分類は「記録された」補完についてのみ正しい。
 * truncated() が true の場合、AlwaysMarked/AlwaysUnmarked は
 * 真の補完集合に対して保証されない。
 * total_completions == 0 の場合は全セル Variable（充足不能または打ち切り）。
 */
struct CompletionAnalysis {
    std::vector<CellClass> cell_results;
    size_t total_completions = 0;
    size_t max_completions = 0;
    bool timed_out = false;
    bool capped = false;

    /**
     * @brief 上限に達した後も未探索の枝が残っていたか
     *
     * ちょうど上限個の補完で探索し尽くした場合は false。
     */
    bool hit_cap() const { return capped; }

    /**
     * @brief 探索が途中で打ち切られたか
     */
    bool truncated() const { return timed_out || hit_cap(); }

    /**
     * @brief 補完が1つもない（分類は信用できない）
     */
    bool inconclusive() const { return total_completions == 0; }

    CellClass result(size_t idx) const { return cell_results.at(idx); }
};

/**
 * @brief ソルバー統計情報
 */
struct ExactSolverStats {
    size_t nodes = 0;
    size_t max_depth = 0;
    size_t pruned = 0;
    size_t completions = 0;
};

/**
 * @brief 探索状態
 *
 * 再帰呼び出しに明示的に渡す。ソルバーや呼び出し元以外とは共有しない。
 * セル値は置いて戻す（mutate/undo）方式で管理し、
 * グループごとの Marked/Unknown 数を差分更新する。
 */
struct SearchContext {
    using Clock = std::chrono::steady_clock;

    std::vector<CellValue> values;
    std::vector<uint8_t> observed;              // セルごとの観測値ビット集合
    std::vector<int> group_quota;
    std::vector<int> group_marked;
    std::vector<int> group_unknown;
    std::vector<std::vector<size_t>> cell_groups;      // セル -> 所属グループ（重複あり）
    std::vector<std::vector<size_t>> cell_neighbors;
    size_t completions = 0;
    size_t max_completions = 0;
    Clock::time_point deadline;
    bool timed_out = false;
    bool capped = false;                        // 上限到達後に未探索の節点があった

    /**
     * @brief 盤面から探索状態を初期化
     */
    SearchContext(const Board& board, size_t max_completions,
                  std::chrono::milliseconds timeout);

    bool should_stop();
};

/**
 * @brief 完全列挙ソルバー
 *
 * 最小インデックスの Unknown セルに Marked → Unmarked の順で値を置き、
 * 部分割当が妥当な枝だけを深さ優先で探索する。
 * 上限 max_completions またはタイムアウトで打ち切るが、それまでの記録は保持する。
 */
class ExactSolver {
public:
    ExactSolver() = default;

    /**
     * @brief 全補完を列挙してセルを分類
     * @param board 盤面（一部セルが確定していてもよい）
     * @param max_completions 記録する補完の最大数
     * @param timeout 壁時計タイムアウト
     */
    CompletionAnalysis enumerate_completions(const Board& board,
                                             size_t max_completions,
                                             std::chrono::milliseconds timeout);

    /**
     * @brief 1つでも補完があるか（上限1で列挙）
     */
    bool is_solvable(const Board& board, std::chrono::milliseconds timeout);

    const ExactSolverStats& stats() const { return stats_; }

    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    void search(SearchContext& ctx, size_t cursor, size_t depth);

    bool assign(SearchContext& ctx, size_t idx, CellValue value);
    void unassign(SearchContext& ctx, size_t idx, CellValue value);

    bool root_is_consistent(const SearchContext& ctx) const;
    bool verify_completion(const SearchContext& ctx) const;
    void record_completion(SearchContext& ctx);

    CompletionAnalysis build_analysis(const SearchContext& ctx) const;

    ExactSolverStats stats_;
    bool verbose_ = false;
};

} // namespace star_miner

#endif // STAR_MINER_EXACT_SOLVER_HPP
