/**
 * @file board.hpp
 * @brief 制約盤面クラス（行・列・領域のクォータと8近傍隣接ルール）
 */
#ifndef STAR_MINER_BOARD_HPP
#define STAR_MINER_BOARD_HPP

#include <vector>
#include <cstddef>
#include <cstdint>

namespace star_miner {

/**
 * @brief セルの値
 */
enum class CellValue : uint8_t {
    Unknown = 0,
    Marked = 1,    // 星
    Unmarked = 2   // 空
};

/**
 * @brief グループの種類
 */
enum class GroupKind {
    Row,
    Column,
    Region
};

/**
 * @brief 行・列・領域の共通表現
 *
 * cells はセルインデックス（row * width + col）のリスト。
 * 領域は盤面全体を覆う必要はなく、互いに素である必要もない。
 */
struct Group {
    GroupKind kind;
    int id;                     // 行番号・列番号・領域ID
    std::vector<size_t> cells;
    int quota;                  // 必要な星の数
};

/**
 * @brief 制約盤面
 *
 * width x height のセルと3種類のグループ集合を保持する。
 * 隣接計算は width をストライドとして行い、盤面外は切り捨てる。
 * セルインデックスが [0, width*height) の外であれば std::invalid_argument を送出する。
 */
class Board {
public:
    /**
     * @brief 全セル Unknown、グループなしの盤面を作成
     */
    Board(size_t width, size_t height);

    /**
     * @brief 全行・全列に同じクォータを持つ盤面を作成（領域なし）
     */
    static Board with_lines(size_t width, size_t height, int quota_per_line);

    size_t width() const { return width_; }
    size_t height() const { return height_; }
    size_t num_cells() const { return cells_.size(); }

    /**
     * @brief 大きい方の辺の長さ
     *
     * 出力用の寸法。隣接計算には使わない。
     */
    size_t effective_size() const { return width_ > height_ ? width_ : height_; }

    // ===== セル =====

    /**
     * @brief セルの値を取得
     * @throws std::invalid_argument インデックスが範囲外
     */
    CellValue cell(size_t idx) const;

    /**
     * @brief セルの値を設定
     * @throws std::invalid_argument インデックスが範囲外
     */
    void set_cell(size_t idx, CellValue value);

    const std::vector<CellValue>& cells() const { return cells_; }

    size_t index_of(size_t row, size_t col) const;
    size_t row_of(size_t idx) const { return idx / width_; }
    size_t col_of(size_t idx) const { return idx % width_; }

    /**
     * @brief 8近傍のセルインデックスを取得（自身を除く、盤面端で切り捨て）
     * @throws std::invalid_argument インデックスが範囲外
     */
    std::vector<size_t> neighbors(size_t idx) const;

    // ===== グループ =====

    /**
     * @brief 行を追加
     * @throws std::invalid_argument cells に範囲外のインデックスが含まれる
     */
    void add_row(int row_index, std::vector<size_t> cells, int quota);
    void add_column(int col_index, std::vector<size_t> cells, int quota);
    void add_region(int region_id, std::vector<size_t> cells, int quota);

    const std::vector<Group>& rows() const { return rows_; }
    const std::vector<Group>& columns() const { return columns_; }
    const std::vector<Group>& regions() const { return regions_; }

    /**
     * @brief 領域IDで検索
     * @return 見つからなければ nullptr
     */
    const Group* find_region(int region_id) const;

    /**
     * @brief 全グループ（行 → 列 → 領域の順）
     */
    std::vector<const Group*> all_groups() const;

    // ===== 検証 =====

    size_t count(const Group& group, CellValue value) const;

    /**
     * @brief 探索途中の割当として妥当か
     *
     * 各グループで marked <= quota かつ marked + unknown >= quota、
     * かつ隣接する星がないこと。
     */
    bool is_valid_partial() const;

    /**
     * @brief 完全割当として妥当か（Unknown が残っていれば false）
     */
    bool is_valid_completion() const;

    bool is_complete() const;

    bool operator==(const Board& other) const;
    bool operator!=(const Board& other) const { return !(*this == other); }

private:
    void check_index(size_t idx) const;
    void check_cells(const std::vector<size_t>& cells) const;
    bool has_adjacent_marks() const;

    size_t width_;
    size_t height_;
    std::vector<CellValue> cells_;
    std::vector<Group> rows_;
    std::vector<Group> columns_;
    std::vector<Group> regions_;
};

} // namespace star_miner

#endif // STAR_MINER_BOARD_HPP
