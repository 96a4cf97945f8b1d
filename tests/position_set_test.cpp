#include <anchorpoint-cpp/anchorpoint.hpp>

#include "fixtures.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace anchorpoint_cpp;
using anchorpoint_cpp::testing::amendment;
using anchorpoint_cpp::testing::s102b;

// -- Construction and normalization -------------------------------------------

TEST(PositionSet, default_constructed_is_empty) {
    const auto set = PositionSet{};
    EXPECT_TRUE(set.empty());
    EXPECT_TRUE(set.positions().empty());
    EXPECT_TRUE(set.quotes().empty());
}

TEST(PositionSet, positions_are_sorted) {
    const auto set = PositionSet{{50, 60}, {20, 40}};
    ASSERT_EQ(set.positions().size(), 2u);
    EXPECT_EQ(set.positions()[0], (PositionSelector{20, 40}));
    EXPECT_EQ(set.positions()[1], (PositionSelector{50, 60}));
}

TEST(PositionSet, overlapping_positions_are_merged) {
    const auto set = PositionSet{{40, 60}, {50, 80}};
    ASSERT_EQ(set.positions().size(), 1u);
    EXPECT_EQ(set.positions()[0], (PositionSelector{40, 80}));
}

TEST(PositionSet, adjacent_positions_are_merged) {
    const auto set = PositionSet{{0, 4}, {4, 10}};
    ASSERT_EQ(set.positions().size(), 1u);
    EXPECT_EQ(set.positions()[0], (PositionSelector{0, 10}));
}

TEST(PositionSet, chain_of_overlaps_collapses) {
    const auto set = PositionSet{{30, 40}, {0, 10}, {5, 20}, {18, 31}};
    EXPECT_EQ(set.positions(), (std::vector<PositionSelector>{{0, 40}}));
}

TEST(PositionSet, unbounded_position_absorbs_later_ones) {
    const auto set = PositionSet{PositionSelector::from_start(10), PositionSelector{40, 50}};
    EXPECT_EQ(set.positions(), (std::vector<PositionSelector>{PositionSelector::from_start(10)}));
}

TEST(PositionSet, from_one_selector) {
    const auto set = PositionSet{PositionSelector{5, 10}};
    ASSERT_EQ(set.positions().size(), 1u);
    EXPECT_EQ(set.positions()[0].start(), 5u);
}

TEST(PositionSet, from_pairs) {
    const auto set = PositionSet::from_pairs({{19, 22}, {0, 12}});
    EXPECT_EQ(set, (PositionSet{{0, 12}, {19, 22}}));
}

TEST(PositionSet, from_pairs_rejects_empty_interval) {
    EXPECT_THROW(PositionSet::from_pairs({{0, 12}, {5, 5}}), InvalidSelectorError);
}

TEST(PositionSet, from_quotes_holds_no_positions) {
    const auto set = PositionSet::from_quotes({QuoteSelector{"idea"}});
    EXPECT_TRUE(set.positions().empty());
    ASSERT_EQ(set.quotes().size(), 1u);
    EXPECT_FALSE(set.empty());
}

// -- Union --------------------------------------------------------------------

TEST(PositionSet, union_of_non_overlapping_sets) {
    const auto left = PositionSet{PositionSelector{50, 60}};
    const auto right = PositionSet{PositionSelector{20, 40}};
    const auto joined = left.union_with(right);
    ASSERT_EQ(joined.positions().size(), 2u);
    EXPECT_EQ(joined.positions()[0].start(), 20u);
}

TEST(PositionSet, union_of_overlapping_sets) {
    const auto left = PositionSet{PositionSelector{40, 60}};
    const auto right = PositionSet{PositionSelector{50, 80}};
    const auto joined = left.union_with(right);
    EXPECT_EQ(joined.positions(), (std::vector<PositionSelector>{{40, 80}}));
}

TEST(PositionSet, union_with_selector) {
    const auto set = PositionSet{{5, 10}, {20, 30}};
    const auto joined = set.union_with(PositionSelector{2, 8});
    ASSERT_EQ(joined.positions().size(), 2u);
    EXPECT_EQ(joined.positions()[0].end(), 10u);
    EXPECT_EQ(joined.positions()[1].start(), 20u);
}

TEST(PositionSet, union_keeps_quotes_of_both) {
    const auto left = PositionSet::from_quotes({QuoteSelector{"idea"}});
    const auto right = PositionSet{std::vector{PositionSelector{0, 5}},
                                   std::vector{QuoteSelector{"concept"}}};
    const auto joined = left.union_with(right);
    EXPECT_EQ(joined.positions().size(), 1u);
    EXPECT_EQ(joined.quotes().size(), 2u);
}

// -- Intersection and difference ----------------------------------------------

TEST(PositionSet, intersection_with_selector) {
    const auto position = QuoteSelector{"", "", ", procedure"}.resolve(s102b);
    ASSERT_EQ(position, (PositionSelector{0, 90}));

    const auto set = PositionSet{position}.intersect(PositionSelector{70, 100});
    ASSERT_EQ(set.positions().size(), 1u);
    EXPECT_EQ(set.positions()[0], (PositionSelector{70, 90}));
}

TEST(PositionSet, intersection_is_commutative) {
    const auto a = PositionSet{{0, 10}, {20, 30}, {40, 50}};
    const auto b = PositionSet{{5, 25}, {45, 60}};
    EXPECT_EQ(a.intersect(b), b.intersect(a));
    EXPECT_EQ(a.intersect(b), (PositionSet{{5, 10}, {20, 25}, {45, 50}}));
}

TEST(PositionSet, intersection_drops_quotes) {
    const auto set = PositionSet{std::vector{PositionSelector{0, 10}},
                                 std::vector{QuoteSelector{"idea"}}};
    EXPECT_TRUE(set.intersect(PositionSelector{0, 5}).quotes().empty());
}

TEST(PositionSet, intersection_of_disjoint_sets_is_empty) {
    EXPECT_TRUE((PositionSet{{0, 10}}).intersect(PositionSet{{10, 20}}).empty());
}

TEST(PositionSet, difference_of_sets) {
    const auto whole = PositionSet{QuoteSelector{"", "", ", procedure"}.resolve(s102b)};
    const auto removed = PositionSet{QuoteSelector{"for an original work of authorship"}.resolve(s102b)};
    const auto rest = whole.difference(removed);
    ASSERT_EQ(rest.positions().size(), 2u);
    EXPECT_EQ(rest.positions()[0], (PositionSelector{0, 37}));
    EXPECT_EQ(rest.positions()[1], (PositionSelector{71, 90}));
}

TEST(PositionSet, difference_across_several_intervals) {
    const auto set = PositionSet{{0, 10}, {20, 30}};
    const auto rest = set.difference(PositionSet{{5, 22}, {25, 26}});
    EXPECT_EQ(rest, (PositionSet{{0, 5}, {22, 25}, {26, 30}}));
}

TEST(PositionSet, difference_keeps_quotes) {
    const auto set = PositionSet{std::vector{PositionSelector{0, 10}},
                                 std::vector{QuoteSelector{"idea"}}};
    EXPECT_EQ(set.difference(PositionSelector{0, 5}).quotes().size(), 1u);
}

TEST(PositionSet, difference_of_unbounded_interval) {
    const auto set = PositionSet{PositionSelector::from_start(10)};
    const auto rest = set.difference(PositionSelector{20, 30});
    ASSERT_EQ(rest.positions().size(), 2u);
    EXPECT_EQ(rest.positions()[0], (PositionSelector{10, 20}));
    EXPECT_EQ(rest.positions()[1], PositionSelector::from_start(30));
}

// -- Shift --------------------------------------------------------------------

TEST(PositionSet, shift_forward) {
    const auto set = PositionSet{{5, 10}, {20, 30}}.shift(5);
    EXPECT_EQ(set.positions()[0], (PositionSelector{10, 15}));
}

TEST(PositionSet, shift_back) {
    const auto set = PositionSet{{5, 10}, {20, 30}}.shift(-5);
    EXPECT_EQ(set.positions()[0], (PositionSelector{0, 5}));
}

TEST(PositionSet, shift_below_zero_throws) {
    const auto set = PositionSet{{5, 10}, {20, 30}};
    EXPECT_THROW(set.shift(-15), RangeUnderflowError);
    EXPECT_THROW(set.shift(-40), RangeUnderflowError);
}

TEST(PositionSet, shift_from_legal_citation) {
    const auto set = PositionSet{PositionSelector{4, 17}};
    EXPECT_THROW(set.shift(-7), RangeUnderflowError);
    EXPECT_EQ(set.shift(-3), (PositionSet{PositionSelector{1, 14}}));
}

TEST(PositionSet, shift_keeps_quotes) {
    const auto set = PositionSet{std::vector{PositionSelector{5, 10}},
                                 std::vector{QuoteSelector{"idea"}}};
    EXPECT_EQ(set.shift(3).quotes(), set.quotes());
}

// -- Margins ------------------------------------------------------------------

TEST(PositionSet, zero_margin_is_identity) {
    const auto set = PositionSet{{5, 10}, {20, 30}};
    EXPECT_EQ(set.add_margin(0, 0), set);
}

TEST(PositionSet, margin_merges_nearby_intervals) {
    const auto set = PositionSet{{5, 10}, {12, 30}};
    EXPECT_EQ(set.add_margin(1, 1), (PositionSet{{4, 31}}));
}

TEST(PositionSet, margin_stops_at_zero) {
    const auto set = PositionSet{{2, 10}};
    EXPECT_EQ(set.add_margin(5, 0), (PositionSet{{0, 10}}));
}

TEST(PositionSet, margin_keeps_unbounded_end) {
    const auto set = PositionSet{PositionSelector::from_start(10)};
    EXPECT_EQ(set.add_margin(2, 2), PositionSet{PositionSelector::from_start(8)});
}

// -- Quote resolution ---------------------------------------------------------

TEST(PositionSet, resolve_quotes_folds_into_positions) {
    const auto set = PositionSet{std::vector{PositionSelector{0, 7}},
                                 std::vector{QuoteSelector{"great"}}};
    const auto resolved = set.resolve_quotes("Here is some great text.");
    EXPECT_TRUE(resolved.quotes().empty());
    EXPECT_EQ(resolved, (PositionSet{{0, 7}, {13, 18}}));
}

TEST(PositionSet, resolve_quotes_is_all_or_nothing) {
    const auto set = PositionSet::from_quotes({QuoteSelector{"great"}, QuoteSelector{"missing"}});
    try {
        (void)set.resolve_quotes("Here is some great text.");
        FAIL() << "expected TextSelectionError";
    } catch (const TextSelectionError& e) {
        const auto message = std::string{e.what()};
        EXPECT_NE(message.find("quote 1"), std::string::npos);
        EXPECT_NE(message.find("missing"), std::string::npos);
    }
}

TEST(PositionSet, bridge_gaps_fills_punctuation) {
    const auto passage = std::string{"a quote.\") Therefore,"};
    const auto set = PositionSet{{0, 7}, {11, 21}};
    EXPECT_EQ(set.as_string(passage), "a quote\xE2\x80\xA6Therefore,");
    EXPECT_EQ(set.bridge_gaps(passage, 4), (PositionSet{{0, 21}}));
    EXPECT_EQ(set.select_text(passage, 4), "a quote.\") Therefore,");
}

TEST(PositionSet, bridge_gaps_fills_blank_margin) {
    const auto passage = std::string{"Some text."};
    const auto set = PositionSet{{0, 4}, {5, 10}};
    EXPECT_EQ(set.as_string(passage), "Some\xE2\x80\xA6text.");
    EXPECT_EQ(set.select_text(passage, 1), "Some text.");
}

TEST(PositionSet, bridge_gaps_leaves_wide_gaps) {
    const auto passage = std::string{"a quote.\") Therefore,"};
    const auto set = PositionSet{{0, 7}, {11, 21}};
    EXPECT_EQ(set.bridge_gaps(passage, 3), set);
}

TEST(PositionSet, bridge_gaps_leaves_gaps_with_words) {
    const auto passage = std::string{"one and two"};
    const auto set = PositionSet{{0, 3}, {8, 11}};
    EXPECT_EQ(set.bridge_gaps(passage, 5), set);
}

TEST(PositionSet, bridge_gaps_rejects_zero_width) {
    const auto set = PositionSet{{0, 4}, {5, 10}};
    EXPECT_THROW(set.bridge_gaps("Some text.", 0), InvalidSelectorError);
}

// -- Comparison ---------------------------------------------------------------

TEST(PositionSet, same_positions_in_any_order_are_equal) {
    const auto a = PositionSet{{0, 4}, {5, 10}};
    const auto b = PositionSet{{5, 10}, {0, 4}};
    EXPECT_EQ(a, b);
    EXPECT_TRUE(a.covers(b));
    EXPECT_FALSE(a.strictly_covers(b));
}

TEST(PositionSet, quotes_compare_as_sets) {
    const auto a = PositionSet::from_quotes({QuoteSelector{"idea"}, QuoteSelector{"concept"}});
    const auto b = PositionSet::from_quotes({QuoteSelector{"concept"}, QuoteSelector{"idea"},
                                             QuoteSelector{"idea"}});
    const auto c = PositionSet::from_quotes({QuoteSelector{"idea"}});
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(PositionSet, covers_selector) {
    const auto set = PositionSet{{0, 4}, {5, 10}};
    EXPECT_TRUE(set.covers(PositionSelector{6, 10}));
    EXPECT_TRUE(set.strictly_covers(PositionSelector{6, 10}));
    EXPECT_FALSE(set.covers(PositionSelector{3, 6}));
}

TEST(PositionSet, covers_empty_set) {
    const auto set = PositionSet{{0, 200}};
    EXPECT_TRUE(set.covers(PositionSet{}));
    EXPECT_TRUE(set.strictly_covers(PositionSet{}));
}

TEST(PositionSet, covers_is_transitive) {
    const auto a = PositionSet{{0, 100}};
    const auto b = PositionSet{{10, 30}, {50, 70}};
    const auto c = PositionSet{{20, 25}};
    ASSERT_TRUE(a.covers(b));
    ASSERT_TRUE(b.covers(c));
    EXPECT_TRUE(a.covers(c));
}

TEST(PositionSet, full_passage_covers_selections) {
    const auto factory = PositionSetFactory{std::string{s102b}};
    const auto selections = factory.from_quote_selectors({
        QuoteSelector{"In no case does copyright protection"},
        QuoteSelector{"extend to any idea"},
    });
    const auto full_passage = PositionSet{{0, 200}};
    EXPECT_TRUE(full_passage.strictly_covers(selections));
    EXPECT_TRUE(full_passage.covers(selections));
    EXPECT_FALSE(selections.covers(full_passage));
}

// -- Document access ----------------------------------------------------------

TEST(PositionSet, as_quotes_makes_unique_quotes) {
    const auto position = QuoteSelector{"United States", "", " and subject"}.resolve(amendment);
    const auto quotes = PositionSet{position}.as_quotes(amendment);
    ASSERT_EQ(quotes.size(), 1u);
    EXPECT_EQ(quotes[0].exact(), "United States");
    EXPECT_EQ(quotes[0].resolve(amendment), position);
}

TEST(PositionSet, as_quotes_appends_stored_quotes) {
    const auto set = PositionSet{std::vector{PositionSelector{53, 84}},
                                 std::vector{QuoteSelector{"due process"}}};
    const auto quotes = set.as_quotes(amendment);
    ASSERT_EQ(quotes.size(), 2u);
    EXPECT_EQ(quotes[0].exact(), "and subject to the jurisdiction");
    EXPECT_EQ(quotes[1], QuoteSelector{"due process"});
}

TEST(PositionSet, as_string_marks_omissions) {
    const auto factory = PositionSetFactory{std::string{s102b}};
    const auto set = factory.from_quote_selectors({
        QuoteSelector{"In no case does copyright protection"},
        QuoteSelector{"extend to any idea"},
    });
    EXPECT_EQ(set.as_string(s102b),
              "In no case does copyright protection\xE2\x80\xA6" "extend to any idea\xE2\x80\xA6");
}

TEST(PositionSet, as_string_of_empty_set_is_empty) {
    EXPECT_EQ(PositionSet{}.as_string("Here is some great text."), "");
}
