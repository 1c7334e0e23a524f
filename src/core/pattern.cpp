#include "star_miner/pattern.hpp"
#include <algorithm>
#include <iomanip>
#include <set>
#include <sstream>

namespace star_miner {

// ============================================================================
// PatternData
// ============================================================================

void PatternData::set(const std::string& key, DataValue value) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(key, std::move(value));
}

void PatternData::set(const std::string& key, const std::vector<size_t>& cells) {
    set(key, DataValue(std::vector<int64_t>(cells.begin(), cells.end())));
}

bool PatternData::contains(const std::string& key) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&key](const Entry& e) { return e.first == key; });
}

std::optional<int64_t> PatternData::get_int(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.first != key) continue;
        if (const auto* v = std::get_if<int64_t>(&entry.second)) return *v;
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<std::string> PatternData::get_string(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.first != key) continue;
        if (const auto* v = std::get_if<std::string>(&entry.second)) return *v;
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<std::vector<int64_t>> PatternData::get_ints(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.first != key) continue;
        if (const auto* v = std::get_if<std::vector<int64_t>>(&entry.second)) return *v;
        return std::nullopt;
    }
    return std::nullopt;
}

void PatternData::merge(const PatternData& other) {
    for (const auto& entry : other.entries_) {
        set(entry.first, entry.second);
    }
}

// ============================================================================
// Deduction
// ============================================================================

const char* deduction_kind_name(DeductionKind kind) {
    switch (kind) {
        case DeductionKind::ForceStar:
            return "forceStar";
        case DeductionKind::ForceEmpty:
            return "forceEmpty";
    }
    return "forceEmpty";
}

std::optional<DeductionKind> parse_deduction_kind(const std::string& name) {
    if (name == "forceStar") return DeductionKind::ForceStar;
    if (name == "forceEmpty") return DeductionKind::ForceEmpty;
    return std::nullopt;
}

// ============================================================================
// 正規化・重複除去
// ============================================================================

PatternKey make_pattern_key(const Pattern& pattern) {
    PatternKey key{pattern.window_width, pattern.window_height, pattern.family_id, {}};
    key.deductions.reserve(pattern.deductions.size());
    for (const auto& ded : pattern.deductions) {
        auto cells = ded.relative_cell_ids;
        std::sort(cells.begin(), cells.end());
        key.deductions.emplace_back(ded.kind, std::move(cells));
    }
    std::sort(key.deductions.begin(), key.deductions.end());
    return key;
}

Pattern canonicalize_pattern(Pattern pattern) {
    for (auto& ded : pattern.deductions) {
        std::sort(ded.relative_cell_ids.begin(), ded.relative_cell_ids.end());
    }
    return pattern;
}

std::vector<Pattern> deduplicate_patterns(const std::vector<Pattern>& patterns) {
    std::set<PatternKey> seen;
    std::vector<Pattern> unique;
    for (const auto& pattern : patterns) {
        if (seen.insert(make_pattern_key(pattern)).second) {
            unique.push_back(pattern);
        }
    }
    return unique;
}

std::string make_pattern_id(const std::string& family_id, size_t index) {
    std::ostringstream oss;
    oss << family_id << "_pattern_" << std::setw(4) << std::setfill('0') << index;
    return oss.str();
}

} // namespace star_miner
