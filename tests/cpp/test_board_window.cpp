#include <catch2/catch_test_macros.hpp>
#include "star_miner/board.hpp"
#include "star_miner/window.hpp"
#include "star_miner/schemas/layouts.hpp"
#include <algorithm>
#include <stdexcept>

using namespace star_miner;

namespace {

std::vector<size_t> sorted(std::vector<size_t> v) {
    std::sort(v.begin(), v.end());
    return v;
}

}  // namespace

// ============================================================================
// Board tests
// ============================================================================

TEST_CASE("Board construction", "[board]") {
    SECTION("cells start unknown") {
        Board board(3, 2);
        REQUIRE(board.width() == 3);
        REQUIRE(board.height() == 2);
        REQUIRE(board.num_cells() == 6);
        for (size_t i = 0; i < board.num_cells(); ++i) {
            REQUIRE(board.cell(i) == CellValue::Unknown);
        }
        REQUIRE(board.rows().empty());
        REQUIRE(board.columns().empty());
        REQUIRE(board.regions().empty());
    }

    SECTION("zero dimension is rejected") {
        REQUIRE_THROWS_AS(Board(0, 3), std::invalid_argument);
        REQUIRE_THROWS_AS(Board(3, 0), std::invalid_argument);
    }

    SECTION("effective size is the longer side") {
        REQUIRE(Board(4, 2).effective_size() == 4);
        REQUIRE(Board(2, 5).effective_size() == 5);
    }
}

TEST_CASE("Board with_lines", "[board]") {
    auto board = Board::with_lines(3, 2, 1);

    REQUIRE(board.rows().size() == 2);
    REQUIRE(board.columns().size() == 3);
    REQUIRE(board.rows()[1].cells == std::vector<size_t>{3, 4, 5});
    REQUIRE(board.columns()[2].cells == std::vector<size_t>{2, 5});
    REQUIRE(board.rows()[0].quota == 1);
    REQUIRE(board.columns()[0].kind == GroupKind::Column);

    auto groups = board.all_groups();
    REQUIRE(groups.size() == 5);
    REQUIRE(groups.front()->kind == GroupKind::Row);
    REQUIRE(groups.back()->kind == GroupKind::Column);
}

TEST_CASE("Board cell access out of range", "[board]") {
    Board board(2, 2);

    REQUIRE_THROWS_AS(board.cell(4), std::invalid_argument);
    REQUIRE_THROWS_AS(board.set_cell(4, CellValue::Marked), std::invalid_argument);
    REQUIRE_THROWS_AS(board.index_of(2, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(board.neighbors(9), std::invalid_argument);
    REQUIRE_THROWS_AS(board.add_region(1, {0, 7}, 1), std::invalid_argument);

    board.set_cell(3, CellValue::Marked);
    REQUIRE(board.cell(3) == CellValue::Marked);
}

TEST_CASE("Board neighbors", "[board]") {
    Board board(3, 3);

    SECTION("corner") {
        REQUIRE(sorted(board.neighbors(0)) == std::vector<size_t>{1, 3, 4});
    }

    SECTION("center has eight neighbors") {
        REQUIRE(sorted(board.neighbors(4)) == std::vector<size_t>{0, 1, 2, 3, 5, 6, 7, 8});
    }

    SECTION("non-square board uses width as stride") {
        Board wide(4, 2);
        REQUIRE(sorted(wide.neighbors(3)) == std::vector<size_t>{2, 6, 7});
        REQUIRE(sorted(wide.neighbors(4)) == std::vector<size_t>{0, 1, 5});
    }
}

TEST_CASE("Board validity checks", "[board]") {
    auto board = Board::with_lines(2, 2, 1);

    SECTION("empty board is a valid partial") {
        REQUIRE(board.is_valid_partial());
        REQUIRE_FALSE(board.is_complete());
        REQUIRE_FALSE(board.is_valid_completion());
    }

    SECTION("adjacent marks are invalid") {
        board.set_cell(0, CellValue::Marked);
        board.set_cell(3, CellValue::Marked);
        REQUIRE_FALSE(board.is_valid_partial());
    }

    SECTION("too few candidates left is invalid") {
        board.set_cell(0, CellValue::Unmarked);
        board.set_cell(1, CellValue::Unmarked);
        REQUIRE_FALSE(board.is_valid_partial());
    }

    SECTION("complete assignment meeting quotas") {
        Board line(3, 1);
        line.add_row(0, {0, 1, 2}, 2);
        line.set_cell(0, CellValue::Marked);
        line.set_cell(1, CellValue::Unmarked);
        line.set_cell(2, CellValue::Marked);
        REQUIRE(line.is_complete());
        REQUIRE(line.is_valid_completion());
    }
}

TEST_CASE("Board equality", "[board]") {
    auto a = Board::with_lines(3, 3, 1);
    auto b = Board::with_lines(3, 3, 1);
    REQUIRE(a == b);

    b.set_cell(4, CellValue::Unmarked);
    REQUIRE(a != b);

    auto c = Board::with_lines(3, 3, 1);
    c.add_region(1, {0, 1, 2}, 1);
    REQUIRE(a != c);
}

// ============================================================================
// Window tests
// ============================================================================

TEST_CASE("enumerate_windows", "[window]") {
    SECTION("row-major placements") {
        auto windows = enumerate_windows(5, 3, 2);
        REQUIRE(windows.size() == 12);
        REQUIRE(windows[0] == Window{3, 2, 0, 0});
        REQUIRE(windows[1] == Window{3, 2, 0, 1});
        REQUIRE(windows[3] == Window{3, 2, 1, 0});
        REQUIRE(windows.back() == Window{3, 2, 3, 2});
    }

    SECTION("window as large as the board") {
        auto windows = enumerate_windows(4, 4, 4);
        REQUIRE(windows.size() == 1);
        REQUIRE(windows[0].num_cells() == 16);
    }

    SECTION("oversized or empty window has no placements") {
        REQUIRE(enumerate_windows(4, 5, 5).empty());
        REQUIRE(enumerate_windows(4, 5, 2).empty());
        REQUIRE(enumerate_windows(4, 0, 2).empty());
    }
}

TEST_CASE("build_window_board region translation", "[window]") {
    Window window{3, 3, 1, 1};
    const size_t n = 5;

    RegionMap regions;
    regions[1] = {5, 6, 7, 8, 9};                 // 盤面の1行目全体
    regions[3] = {5, 6, 10, 11};                  // 2行×2列、左の列はウィンドウ外
    regions[4] = {0, 1, 2};                       // 完全にウィンドウ外
    for (size_t r = 1; r <= 3; ++r) {
        for (size_t c = 1; c <= 3; ++c) {
            regions[2].push_back(r * n + c);
        }
    }

    auto board = build_window_board(window, n, 1, regions);

    REQUIRE(board.width() == 3);
    REQUIRE(board.height() == 3);
    REQUIRE(board.rows().size() == 3);
    REQUIRE(board.columns().size() == 3);
    REQUIRE(board.regions().size() == 3);
    REQUIRE(board.find_region(4) == nullptr);

    SECTION("single row region gets the line quota") {
        const Group* region = board.find_region(1);
        REQUIRE(region != nullptr);
        REQUIRE(region->cells == std::vector<size_t>{0, 1, 2});
        REQUIRE(region->quota == 1);
    }

    SECTION("region covering the window gets height times quota") {
        const Group* region = board.find_region(2);
        REQUIRE(region != nullptr);
        REQUIRE(region->cells.size() == 9);
        REQUIRE(region->quota == 3);
    }

    SECTION("partial region spanning rows gets rows times quota") {
        const Group* region = board.find_region(3);
        REQUIRE(region != nullptr);
        REQUIRE(region->cells == std::vector<size_t>{0, 3});
        REQUIRE(region->quota == 2);
    }
}

TEST_CASE("build_window_board default region", "[window]") {
    auto board = build_window_board(Window{4, 4, 0, 0}, 6, 2);

    REQUIRE(board.regions().size() == 1);
    REQUIRE(board.regions()[0].id == 1);
    REQUIRE(board.regions()[0].cells.size() == 16);
    REQUIRE(board.regions()[0].quota == 8);
    REQUIRE(board.rows()[0].quota == 2);
}

TEST_CASE("build_window_board block layout quotas", "[window]") {
    Window window{4, 4, 0, 0};
    auto board = build_window_board(window, 4, 1, layouts::block_regions(window, 4));

    REQUIRE(board.regions().size() == 4);
    for (const auto& region : board.regions()) {
        REQUIRE(region.cells.size() == 4);
        REQUIRE(region.quota == 2);
    }
}

TEST_CASE("apply_fixed_clues", "[window]") {
    auto board = build_window_board(Window{3, 3, 0, 0}, 3, 1);

    SECTION("empty clue set leaves the board unchanged") {
        auto result = apply_fixed_clues(board, {}, {});
        REQUIRE(result == board);
    }

    SECTION("clues are copied into a new board") {
        auto result = apply_fixed_clues(board, {4}, {0, 8});
        REQUIRE(result.cell(4) == CellValue::Marked);
        REQUIRE(result.cell(0) == CellValue::Unmarked);
        REQUIRE(result.cell(8) == CellValue::Unmarked);
        REQUIRE(result.cell(1) == CellValue::Unknown);
        REQUIRE(board.cell(4) == CellValue::Unknown);
    }

    SECTION("out of range clue is rejected") {
        REQUIRE_THROWS_AS(apply_fixed_clues(board, {9}, {}), std::invalid_argument);
        REQUIRE_THROWS_AS(apply_fixed_clues(board, {}, {12}), std::invalid_argument);
    }
}

// ============================================================================
// Layout tests
// ============================================================================

TEST_CASE("region layouts use absolute cells", "[window][layout]") {
    Window window{2, 2, 1, 1};

    SECTION("row regions") {
        auto regions = layouts::row_regions(window, 4);
        REQUIRE(regions.size() == 2);
        REQUIRE(regions.at(1) == std::vector<size_t>{5, 6});
        REQUIRE(regions.at(2) == std::vector<size_t>{9, 10});
    }

    SECTION("column head regions") {
        auto regions = layouts::column_head_regions(window, 4, 1, 1);
        REQUIRE(regions.size() == 2);
        REQUIRE(regions.at(1) == std::vector<size_t>{6});
        REQUIRE(regions.at(2) == std::vector<size_t>{9, 10});
    }
}

TEST_CASE("band layouts", "[window][layout]") {
    SECTION("odd height leaves a single last row") {
        auto regions = layouts::row_band_regions(Window{2, 3, 0, 0}, 4);
        REQUIRE(regions.size() == 2);
        REQUIRE(regions.at(1) == std::vector<size_t>{0, 1, 4, 5});
        REQUIRE(regions.at(2) == std::vector<size_t>{8, 9});
    }

    SECTION("block regions are numbered row-major") {
        auto regions = layouts::block_regions(Window{4, 4, 0, 0}, 4);
        REQUIRE(regions.size() == 4);
        REQUIRE(regions.at(2) == std::vector<size_t>{2, 3, 6, 7});
        REQUIRE(regions.at(3) == std::vector<size_t>{8, 9, 12, 13});
    }

    SECTION("mixed layout extends past the window when the board has room") {
        Window window{2, 3, 0, 0};
        auto regions = layouts::mixed_row_band_regions(window, 5);
        REQUIRE(regions.size() == 3);
        REQUIRE(regions.at(1) == std::vector<size_t>{0, 1, 5, 6});
        REQUIRE(regions.at(2) == std::vector<size_t>{5, 6, 10, 11, 15, 16});
        REQUIRE(regions.at(3) == std::vector<size_t>{10, 11, 15, 16});

        auto board = build_window_board(window, 5, 1, regions);
        REQUIRE(board.find_region(2)->cells == std::vector<size_t>{2, 3, 4, 5});
        REQUIRE(board.find_region(2)->quota == 2);
    }

    SECTION("mixed layout stays inside at the board edge") {
        auto regions = layouts::mixed_row_band_regions(Window{2, 3, 1, 0}, 4);
        REQUIRE(regions.size() == 3);
        REQUIRE(regions.at(1) == std::vector<size_t>{4, 5, 8, 9});
        REQUIRE(regions.at(3) == std::vector<size_t>{12, 13});
    }

    SECTION("column head layout keeps every region within one row") {
        Window window{4, 3, 1, 1};
        auto regions = layouts::column_head_regions(window, 6, 2, 2);
        REQUIRE(regions.size() == 3);
        REQUIRE(regions.at(1) == std::vector<size_t>{9, 10});
        REQUIRE(regions.at(2) == std::vector<size_t>{13, 14, 15, 16});
        REQUIRE(regions.at(3) == std::vector<size_t>{19, 20, 21, 22});

        auto board = build_window_board(window, 6, 2, regions);
        REQUIRE(board.find_region(1)->cells == std::vector<size_t>{2, 3});
        REQUIRE(board.find_region(1)->quota == 2);
        REQUIRE(board.find_region(3)->quota == 2);
    }

    SECTION("column head band is clipped to the window") {
        auto regions = layouts::column_head_regions(Window{4, 2, 0, 0}, 4, 3, 2);
        REQUIRE(regions.at(1) == std::vector<size_t>{3});
        REQUIRE(layouts::column_head_regions(Window{4, 2, 0, 0}, 4, 4, 2).empty());
    }
}
