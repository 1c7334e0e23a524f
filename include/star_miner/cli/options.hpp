/**
 * @file options.hpp
 * @brief コマンドライン引数の値の解析
 */
#ifndef STAR_MINER_CLI_OPTIONS_HPP
#define STAR_MINER_CLI_OPTIONS_HPP

#include "star_miner/miner.hpp"
#include <string>
#include <vector>

namespace star_miner {
namespace cli {

/**
 * @brief sep で区切る（空の要素は捨てる）
 */
std::vector<std::string> split(const std::string& text, char sep);

/**
 * @brief 非負整数を解析
 * @throws std::invalid_argument 数値でない、負、または末尾に余分な文字がある
 */
size_t parse_size(const char* option, const std::string& text);

/**
 * @brief int に収まる非負整数を解析
 * @throws std::invalid_argument parse_size と同じ条件、または INT_MAX を超える
 */
int parse_int(const char* option, const std::string& text);

/**
 * @brief "8x8,10x6" 形式のウィンドウサイズ列を解析
 */
std::vector<WindowSize> parse_windows(const std::string& text);

} // namespace cli
} // namespace star_miner

#endif // STAR_MINER_CLI_OPTIONS_HPP
