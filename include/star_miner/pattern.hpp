/**
 * @file pattern.hpp
 * @brief パターン（検証済みの強制配置）と重複除去
 */
#ifndef STAR_MINER_PATTERN_HPP
#define STAR_MINER_PATTERN_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

namespace star_miner {

/**
 * @brief ファミリー固有データの値（整数・文字列・整数リスト）
 */
using DataValue = std::variant<int64_t, std::string, std::vector<int64_t>>;

/**
 * @brief ファミリー固有データ（挿入順を保持するキー・値リスト）
 *
 * コアからは不透明。出力時にそのまま JSON オブジェクトになる。
 */
class PatternData {
public:
    using Entry = std::pair<std::string, DataValue>;

    /**
     * @brief 値を設定（同じキーがあれば上書き）
     */
    void set(const std::string& key, DataValue value);
    void set(const std::string& key, const std::vector<size_t>& cells);

    bool contains(const std::string& key) const;

    std::optional<int64_t> get_int(const std::string& key) const;
    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<std::vector<int64_t>> get_ints(const std::string& key) const;

    /**
     * @brief other のエントリを末尾に追加（同じキーは上書き）
     */
    void merge(const PatternData& other);

    const std::vector<Entry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }

    bool operator==(const PatternData& other) const { return entries_ == other.entries_; }

private:
    std::vector<Entry> entries_;
};

/**
 * @brief 推論の種類
 */
enum class DeductionKind {
    ForceStar,
    ForceEmpty
};

/**
 * @brief JSON 上の名前（"forceStar" / "forceEmpty"）
 */
const char* deduction_kind_name(DeductionKind kind);

/**
 * @brief 名前から種類を取得
 * @return 不明な名前なら std::nullopt
 */
std::optional<DeductionKind> parse_deduction_kind(const std::string& name);

/**
 * @brief 推論（ウィンドウ相対のセルIDの集合に同じ値を強制）
 */
struct Deduction {
    DeductionKind kind;
    std::vector<int64_t> relative_cell_ids;

    bool operator==(const Deduction& other) const {
        return kind == other.kind && relative_cell_ids == other.relative_cell_ids;
    }
};

/**
 * @brief 検証済みパターン
 */
struct Pattern {
    std::string id;
    std::string family_id;
    size_t window_width = 0;
    size_t window_height = 0;
    PatternData data;
    std::vector<Deduction> deductions;
};

/**
 * @brief ファミリーごとのパターン集合
 */
struct FamilyPatternSet {
    std::string family_id;
    std::vector<Pattern> patterns;
};

/**
 * @brief 重複除去用の正規キー
 *
 * (幅, 高さ, ファミリーID, 推論集合)。各推論のセルIDはソート済み、
 * 推論リストは種類 → セルリストの順でソート済み。
 * 回転・鏡映による同一視は行わない。
 */
struct PatternKey {
    size_t width;
    size_t height;
    std::string family_id;
    std::vector<std::pair<DeductionKind, std::vector<int64_t>>> deductions;

    bool operator==(const PatternKey& other) const {
        return std::tie(width, height, family_id, deductions) ==
               std::tie(other.width, other.height, other.family_id, other.deductions);
    }
    bool operator<(const PatternKey& other) const {
        return std::tie(width, height, family_id, deductions) <
               std::tie(other.width, other.height, other.family_id, other.deductions);
    }
};

PatternKey make_pattern_key(const Pattern& pattern);

/**
 * @brief 各推論のセルIDを昇順に並べたパターンを返す
 */
Pattern canonicalize_pattern(Pattern pattern);

/**
 * @brief 正規キーが等しいパターンを除去（最初の出現を残し、順序を保持）
 */
std::vector<Pattern> deduplicate_patterns(const std::vector<Pattern>& patterns);

/**
 * @brief パターンID "<family>_pattern_<NNNN>"
 */
std::string make_pattern_id(const std::string& family_id, size_t index);

} // namespace star_miner

#endif // STAR_MINER_PATTERN_HPP
