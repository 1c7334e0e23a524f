#include "star_miner/board.hpp"
#include <stdexcept>
#include <string>

namespace star_miner {

namespace {

bool same_groups(const std::vector<Group>& a, const std::vector<Group>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].kind != b[i].kind || a[i].id != b[i].id ||
            a[i].quota != b[i].quota || a[i].cells != b[i].cells) {
            return false;
        }
    }
    return true;
}

}  // namespace

Board::Board(size_t width, size_t height)
    : width_(width)
    , height_(height)
    , cells_(width * height, CellValue::Unknown) {
    if (width == 0 || height == 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }
}

Board Board::with_lines(size_t width, size_t height, int quota_per_line) {
    Board board(width, height);
    for (size_t r = 0; r < height; ++r) {
        std::vector<size_t> cells;
        cells.reserve(width);
        for (size_t c = 0; c < width; ++c) {
            cells.push_back(r * width + c);
        }
        board.add_row(static_cast<int>(r), std::move(cells), quota_per_line);
    }
    for (size_t c = 0; c < width; ++c) {
        std::vector<size_t> cells;
        cells.reserve(height);
        for (size_t r = 0; r < height; ++r) {
            cells.push_back(r * width + c);
        }
        board.add_column(static_cast<int>(c), std::move(cells), quota_per_line);
    }
    return board;
}

void Board::check_index(size_t idx) const {
    if (idx >= cells_.size()) {
        throw std::invalid_argument("Cell index " + std::to_string(idx) +
                                    " out of range for " + std::to_string(width_) +
                                    "x" + std::to_string(height_) + " board");
    }
}

void Board::check_cells(const std::vector<size_t>& cells) const {
    for (size_t idx : cells) {
        check_index(idx);
    }
}

CellValue Board::cell(size_t idx) const {
    check_index(idx);
    return cells_[idx];
}

void Board::set_cell(size_t idx, CellValue value) {
    check_index(idx);
    cells_[idx] = value;
}

size_t Board::index_of(size_t row, size_t col) const {
    if (row >= height_ || col >= width_) {
        throw std::invalid_argument("Cell (" + std::to_string(row) + ", " +
                                    std::to_string(col) + ") out of range");
    }
    return row * width_ + col;
}

std::vector<size_t> Board::neighbors(size_t idx) const {
    check_index(idx);
    const auto row = static_cast<long>(row_of(idx));
    const auto col = static_cast<long>(col_of(idx));
    const auto h = static_cast<long>(height_);
    const auto w = static_cast<long>(width_);

    std::vector<size_t> result;
    result.reserve(8);
    for (long dr = -1; dr <= 1; ++dr) {
        for (long dc = -1; dc <= 1; ++dc) {
            if (dr == 0 && dc == 0) continue;
            long r = row + dr;
            long c = col + dc;
            if (r >= 0 && r < h && c >= 0 && c < w) {
                result.push_back(static_cast<size_t>(r * w + c));
            }
        }
    }
    return result;
}

void Board::add_row(int row_index, std::vector<size_t> cells, int quota) {
    check_cells(cells);
    rows_.push_back(Group{GroupKind::Row, row_index, std::move(cells), quota});
}

void Board::add_column(int col_index, std::vector<size_t> cells, int quota) {
    check_cells(cells);
    columns_.push_back(Group{GroupKind::Column, col_index, std::move(cells), quota});
}

void Board::add_region(int region_id, std::vector<size_t> cells, int quota) {
    check_cells(cells);
    regions_.push_back(Group{GroupKind::Region, region_id, std::move(cells), quota});
}

const Group* Board::find_region(int region_id) const {
    for (const auto& region : regions_) {
        if (region.id == region_id) return &region;
    }
    return nullptr;
}

std::vector<const Group*> Board::all_groups() const {
    std::vector<const Group*> groups;
    groups.reserve(rows_.size() + columns_.size() + regions_.size());
    for (const auto& g : rows_) groups.push_back(&g);
    for (const auto& g : columns_) groups.push_back(&g);
    for (const auto& g : regions_) groups.push_back(&g);
    return groups;
}

size_t Board::count(const Group& group, CellValue value) const {
    size_t n = 0;
    for (size_t idx : group.cells) {
        if (cells_[idx] == value) n++;
    }
    return n;
}

bool Board::has_adjacent_marks() const {
    for (size_t i = 0; i < cells_.size(); ++i) {
        if (cells_[i] != CellValue::Marked) continue;
        for (size_t n : neighbors(i)) {
            if (cells_[n] == CellValue::Marked) return true;
        }
    }
    return false;
}

bool Board::is_valid_partial() const {
    for (const Group* g : all_groups()) {
        auto marked = static_cast<int>(count(*g, CellValue::Marked));
        auto unknown = static_cast<int>(count(*g, CellValue::Unknown));
        if (marked > g->quota) return false;
        if (marked + unknown < g->quota) return false;
    }
    return !has_adjacent_marks();
}

bool Board::is_complete() const {
    for (auto v : cells_) {
        if (v == CellValue::Unknown) return false;
    }
    return true;
}

bool Board::is_valid_completion() const {
    if (!is_complete()) return false;
    for (const Group* g : all_groups()) {
        if (static_cast<int>(count(*g, CellValue::Marked)) != g->quota) return false;
    }
    return !has_adjacent_marks();
}

bool Board::operator==(const Board& other) const {
    return width_ == other.width_ && height_ == other.height_ &&
           cells_ == other.cells_ &&
           same_groups(rows_, other.rows_) &&
           same_groups(columns_, other.columns_) &&
           same_groups(regions_, other.regions_);
}

} // namespace star_miner
