#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include "declutter/greedy_selector.h"
#include "declutter/intersection_index.h"

using core::Glyph;

namespace {

bool contains(const std::vector<std::string>& v, const std::string& id) {
    return std::find(v.begin(), v.end(), id) != v.end();
}

std::vector<Glyph> grid(int rows, int cols, double step) {
    std::vector<Glyph> out;
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            out.emplace_back("g" + std::to_string(r) + "_" + std::to_string(c),
                             52.37 + r * step, 4.89 + c * step * 1.3);
        }
    }
    return out;
}

} // namespace

TEST(GreedySelectorTest, EmptyInputGivesEmptyResult) {
    GreedySelector selector;
    SelectionResult r = selector.select({}, 15.0);
    EXPECT_TRUE(r.empty());
    EXPECT_TRUE(r.hidden_count_by_visible.empty());
}

TEST(GreedySelectorTest, SingleGlyphIsVisible) {
    std::vector<Glyph> glyphs = {{"only", 10.0, 10.0}};
    SelectionResult r = GreedySelector().select(glyphs, 15.0);
    EXPECT_EQ(r.visible, std::vector<std::string>{"only"});
    EXPECT_TRUE(r.hidden.empty());
    EXPECT_TRUE(r.hidden_count_by_visible.empty());
}

TEST(GreedySelectorTest, NonOverlappingGlyphsAllStayVisible) {
    std::vector<Glyph> glyphs = {
        {"a", 0.0, 0.0}, {"b", 0.0, 1.0}, {"c", 0.0, 2.0}, {"d", 0.0, 3.0},
    };
    SelectionResult r = GreedySelector().select(glyphs, 15.0);
    EXPECT_EQ(r.visible, (std::vector<std::string>{"a", "b", "c", "d"}));
    EXPECT_TRUE(r.hidden.empty());
    EXPECT_TRUE(r.hidden_count_by_visible.empty());
}

TEST(GreedySelectorTest, OverlappingPairKeepsOneWithBadge) {
    std::vector<Glyph> glyphs = {
        {"a", 0.0, 0.0}, {"b", 0.0, 0.0001}, {"c", 10.0, 10.0},
    };
    GreedySelector selector;
    SelectionResult r = selector.select(glyphs, 15.0);

    ASSERT_EQ(r.visible.size(), 2u);
    ASSERT_EQ(r.hidden.size(), 1u);
    EXPECT_TRUE(contains(r.visible, "c"));
    EXPECT_NE(contains(r.visible, "a"), contains(r.visible, "b"));

    const std::string& kept = contains(r.visible, "a") ? std::string("a") : std::string("b");
    ASSERT_EQ(r.hidden_count_by_visible.size(), 1u);
    EXPECT_EQ(r.hidden_count_by_visible.at(kept), 2);
    EXPECT_EQ(r.hidden_count_by_visible.count("c"), 0u);

    EXPECT_EQ(selector.getLastStats().overlap_edges, 1u);
    EXPECT_EQ(selector.getLastStats().picks, 1u);
}

TEST(GreedySelectorTest, FirstGlyphWinsATie) {
    std::vector<Glyph> glyphs = {{"a", 0.0, 0.0}, {"b", 0.0, 0.0001}};
    SelectionResult r = GreedySelector().select(glyphs, 15.0);
    EXPECT_EQ(r.visible, std::vector<std::string>{"a"});
    EXPECT_EQ(r.hidden, std::vector<std::string>{"b"});
}

TEST(GreedySelectorTest, MostConflictedGlyphIsPickedFirst) {
    // b overlaps both neighbours, a and c only overlap b
    std::vector<Glyph> glyphs = {
        {"a", 0.0, 0.0}, {"b", 0.0, 0.0002}, {"c", 0.0, 0.0004},
    };
    SelectionResult r = GreedySelector().select(glyphs, 15.0);
    EXPECT_EQ(r.visible, std::vector<std::string>{"b"});
    EXPECT_EQ(r.hidden, (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(r.hidden_count_by_visible.at("b"), 3);
}

TEST(GreedySelectorTest, AlreadyVisibleGlyphsHideTheirNeighbours) {
    std::vector<Glyph> glyphs = {
        {"a", 0.0, 0.0}, {"b", 0.0, 0.0001}, {"c", 10.0, 10.0},
    };
    SelectionResult r = GreedySelector().select(glyphs, 15.0, {"b", "not-in-batch"});

    EXPECT_EQ(r.visible, (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(r.hidden, std::vector<std::string>{"a"});
    EXPECT_EQ(r.hidden_count_by_visible.at("b"), 2);
}

TEST(GreedySelectorTest, SelectionIsIdempotent) {
    auto glyphs = grid(6, 6, 0.001);
    GreedySelector selector;
    SelectionResult first = selector.select(glyphs, 60.0);
    ASSERT_FALSE(first.hidden.empty());

    std::vector<Glyph> visible;
    for (const auto& g : glyphs) {
        if (contains(first.visible, g.id)) visible.push_back(g);
    }
    SelectionResult second = selector.select(visible, 60.0);
    EXPECT_EQ(second.visible, first.visible);
    EXPECT_TRUE(second.hidden.empty());
    EXPECT_TRUE(second.hidden_count_by_visible.empty());
}

TEST(GreedySelectorTest, ResultPartitionsInputAndVisibleSetIsOverlapFree) {
    auto glyphs = grid(8, 7, 0.0007);
    const double radius = 50.0;
    SelectionResult r = GreedySelector().select(glyphs, radius);

    EXPECT_EQ(r.size(), glyphs.size());
    std::set<std::string> seen(r.visible.begin(), r.visible.end());
    for (const auto& id : r.hidden) {
        EXPECT_TRUE(seen.insert(id).second) << id << " is both visible and hidden";
    }
    EXPECT_EQ(seen.size(), glyphs.size());

    IntersectionIndex index(glyphs, radius);
    for (size_t i = 0; i < glyphs.size(); ++i) {
        for (size_t j = i + 1; j < glyphs.size(); ++j) {
            if (contains(r.visible, glyphs[i].id) && contains(r.visible, glyphs[j].id)) {
                EXPECT_FALSE(index.overlaps(i, j)) << glyphs[i].id << " overlaps " << glyphs[j].id;
            }
        }
    }

    // Every hidden glyph is attributed to exactly one visible glyph
    int attributed = 0;
    for (const auto& [id, count] : r.hidden_count_by_visible) {
        EXPECT_TRUE(contains(r.visible, id));
        EXPECT_GE(count, 2);
        attributed += count - 1;
    }
    EXPECT_EQ(attributed, static_cast<int>(r.hidden.size()));
}

TEST(GreedySelectorTest, OutputListsKeepInputOrder) {
    auto glyphs = grid(5, 5, 0.0008);
    SelectionResult r = GreedySelector().select(glyphs, 50.0);

    auto position = [&](const std::string& id) {
        return std::find_if(glyphs.begin(), glyphs.end(), [&](const Glyph& g) { return g.id == id; }) - glyphs.begin();
    };
    for (size_t i = 1; i < r.visible.size(); ++i) {
        EXPECT_LT(position(r.visible[i - 1]), position(r.visible[i]));
    }
    for (size_t i = 1; i < r.hidden.size(); ++i) {
        EXPECT_LT(position(r.hidden[i - 1]), position(r.hidden[i]));
    }
}
