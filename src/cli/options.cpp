#include "star_miner/cli/options.hpp"
#include <limits>
#include <sstream>
#include <stdexcept>

namespace star_miner {
namespace cli {

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, sep)) {
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

size_t parse_size(const char* option, const std::string& text) {
    size_t pos = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != text.size() || text[0] == '-') {
        throw std::invalid_argument(std::string("invalid value for ") + option + ": " + text);
    }
    return static_cast<size_t>(value);
}

int parse_int(const char* option, const std::string& text) {
    size_t value = parse_size(option, text);
    if (value > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument(std::string("value out of range for ") + option + ": " + text);
    }
    return static_cast<int>(value);
}

std::vector<WindowSize> parse_windows(const std::string& text) {
    std::vector<WindowSize> sizes;
    for (const auto& item : split(text, ',')) {
        auto x = item.find_first_of("xX");
        if (x == std::string::npos) {
            throw std::invalid_argument("invalid window size: " + item);
        }
        sizes.push_back({parse_size("--windows", item.substr(0, x)),
                         parse_size("--windows", item.substr(x + 1))});
    }
    if (sizes.empty()) {
        throw std::invalid_argument("--windows needs at least one size");
    }
    return sizes;
}

} // namespace cli
} // namespace star_miner
