/**
 * @file pattern_library.hpp
 * @brief パターンライブラリ（JSON）の書き出しと読み込み
 */
#ifndef STAR_MINER_IO_PATTERN_LIBRARY_HPP
#define STAR_MINER_IO_PATTERN_LIBRARY_HPP

#include "star_miner/pattern.hpp"
#include <string>
#include <vector>

namespace star_miner {
namespace io {

/**
 * @brief ライブラリファイルの内容
 */
struct PatternLibrary {
    size_t board_size = 0;
    int stars_per_row = 0;
    int stars_per_column = 0;
    FamilyPatternSet family;
};

/**
 * @brief 出力ファイル名 "<N>x<N>-<family>-patterns.json"
 */
std::string library_file_name(size_t board_size, const std::string& family_id);

/**
 * @brief ライブラリを JSON 文字列に変換（整形済み）
 */
std::string pattern_library_to_json(const PatternLibrary& library);

/**
 * @brief JSON 文字列からライブラリを読み込む
 * @throws std::runtime_error 構文エラーまたは必須フィールドの欠落
 */
PatternLibrary pattern_library_from_json(const std::string& json);

/**
 * @brief 1ファミリー分のライブラリを書き出す
 *
 * output_dir が無ければ作成する。
 * @return 書き出したファイルのパス
 * @throws std::runtime_error ディレクトリ作成・ファイル書き込みの失敗
 */
std::string write_pattern_library(const FamilyPatternSet& family,
                                  size_t board_size,
                                  int stars_per_row,
                                  int stars_per_column,
                                  const std::string& output_dir);

std::vector<std::string> write_all_pattern_libraries(const std::vector<FamilyPatternSet>& families,
                                                     size_t board_size,
                                                     int stars_per_unit,
                                                     const std::string& output_dir);

/**
 * @brief ファイルからライブラリを読み込む
 * @throws std::runtime_error ファイルが開けない、または内容が不正
 */
PatternLibrary read_pattern_library(const std::string& path);

} // namespace io
} // namespace star_miner

#endif // STAR_MINER_IO_PATTERN_LIBRARY_HPP
