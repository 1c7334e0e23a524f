#include <catch2/catch_test_macros.hpp>
#include "star_miner/pattern.hpp"

using namespace star_miner;

namespace {

Pattern make_pattern(const std::string& family, size_t w, size_t h,
                     std::vector<Deduction> deductions) {
    Pattern p;
    p.family_id = family;
    p.window_width = w;
    p.window_height = h;
    p.deductions = std::move(deductions);
    return p;
}

}  // namespace

// ============================================================================
// PatternData tests
// ============================================================================

TEST_CASE("PatternData keeps insertion order", "[pattern]") {
    PatternData data;
    data.set("band_start", int64_t{2});
    data.set("group_type", std::string("row"));
    data.set("cells", std::vector<size_t>{3, 1, 2});

    REQUIRE(data.entries().size() == 3);
    REQUIRE(data.entries()[0].first == "band_start");
    REQUIRE(data.entries()[2].first == "cells");

    REQUIRE(data.get_int("band_start") == 2);
    REQUIRE(data.get_string("group_type") == std::string("row"));
    REQUIRE(data.get_ints("cells") == std::vector<int64_t>{3, 1, 2});
}

TEST_CASE("PatternData typed access", "[pattern]") {
    PatternData data;
    data.set("n", int64_t{5});

    REQUIRE(data.contains("n"));
    REQUIRE_FALSE(data.contains("m"));
    REQUIRE_FALSE(data.get_int("m").has_value());
    REQUIRE_FALSE(data.get_string("n").has_value());
    REQUIRE_FALSE(data.get_ints("n").has_value());
}

TEST_CASE("PatternData set overwrites in place", "[pattern]") {
    PatternData data;
    data.set("a", int64_t{1});
    data.set("b", int64_t{2});
    data.set("a", int64_t{3});

    REQUIRE(data.entries().size() == 2);
    REQUIRE(data.entries()[0].first == "a");
    REQUIRE(data.get_int("a") == 3);
}

TEST_CASE("PatternData merge", "[pattern]") {
    PatternData base;
    base.set("row", int64_t{1});
    base.set("col", int64_t{2});

    PatternData extra;
    extra.set("col", int64_t{7});
    extra.set("intersection", int64_t{9});

    base.merge(extra);
    REQUIRE(base.entries().size() == 3);
    REQUIRE(base.get_int("col") == 7);
    REQUIRE(base.entries()[2].first == "intersection");
}

// ============================================================================
// Deduction tests
// ============================================================================

TEST_CASE("Deduction kind names", "[pattern]") {
    REQUIRE(std::string(deduction_kind_name(DeductionKind::ForceStar)) == "forceStar");
    REQUIRE(std::string(deduction_kind_name(DeductionKind::ForceEmpty)) == "forceEmpty");
    REQUIRE(parse_deduction_kind("forceStar") == DeductionKind::ForceStar);
    REQUIRE(parse_deduction_kind("forceEmpty") == DeductionKind::ForceEmpty);
    REQUIRE_FALSE(parse_deduction_kind("forceMaybe").has_value());
}

TEST_CASE("make_pattern_id", "[pattern]") {
    REQUIRE(make_pattern_id("C1_exactCages", 7) == "C1_exactCages_pattern_0007");
    REQUIRE(make_pattern_id("A1_rowBand_regionBudget", 0) == "A1_rowBand_regionBudget_pattern_0000");
    REQUIRE(make_pattern_id("X", 12345) == "X_pattern_12345");
}

// ============================================================================
// 正規化・重複除去
// ============================================================================

TEST_CASE("canonicalize_pattern sorts cell ids", "[pattern]") {
    auto p = make_pattern("F", 4, 4, {{DeductionKind::ForceEmpty, {9, 2, 5}}});
    auto c = canonicalize_pattern(p);
    REQUIRE(c.deductions[0].relative_cell_ids == std::vector<int64_t>{2, 5, 9});
}

TEST_CASE("make_pattern_key ignores cell and deduction order", "[pattern]") {
    auto a = make_pattern("F", 4, 4, {{DeductionKind::ForceStar, {3, 1}},
                                      {DeductionKind::ForceEmpty, {0, 2}}});
    auto b = make_pattern("F", 4, 4, {{DeductionKind::ForceEmpty, {2, 0}},
                                      {DeductionKind::ForceStar, {1, 3}}});
    REQUIRE(make_pattern_key(a) == make_pattern_key(b));

    SECTION("window size is part of the key") {
        auto c = make_pattern("F", 4, 5, a.deductions);
        REQUIRE_FALSE(make_pattern_key(a) == make_pattern_key(c));
    }

    SECTION("family is part of the key") {
        auto c = make_pattern("G", 4, 4, a.deductions);
        REQUIRE_FALSE(make_pattern_key(a) == make_pattern_key(c));
    }

    SECTION("deduction kind is part of the key") {
        auto c = make_pattern("F", 4, 4, {{DeductionKind::ForceEmpty, {1, 3}},
                                          {DeductionKind::ForceEmpty, {0, 2}}});
        REQUIRE_FALSE(make_pattern_key(a) == make_pattern_key(c));
    }
}

TEST_CASE("deduplicate_patterns keeps the first occurrence", "[pattern]") {
    auto a = make_pattern("F", 4, 4, {{DeductionKind::ForceStar, {1, 3}}});
    a.id = "first";
    auto b = make_pattern("F", 4, 4, {{DeductionKind::ForceStar, {3, 1}}});
    b.id = "second";
    auto c = make_pattern("F", 4, 4, {{DeductionKind::ForceEmpty, {1, 3}}});
    c.id = "third";

    auto unique = deduplicate_patterns({a, b, c, a});
    REQUIRE(unique.size() == 2);
    REQUIRE(unique[0].id == "first");
    REQUIRE(unique[1].id == "third");

    SECTION("idempotent") {
        auto again = deduplicate_patterns(unique);
        REQUIRE(again.size() == unique.size());
    }

    SECTION("mirrored patterns are not folded") {
        // 4x4 の 0 と 3 は左右反転で重なるが区別する
        auto left = make_pattern("F", 4, 4, {{DeductionKind::ForceStar, {0}}});
        auto right = make_pattern("F", 4, 4, {{DeductionKind::ForceStar, {3}}});
        REQUIRE(deduplicate_patterns({left, right}).size() == 2);
    }
}
