#include <anchorpoint-cpp/anchorpoint.hpp>

#include "fixtures.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace anchorpoint_cpp;
using anchorpoint_cpp::testing::legal_text;
using anchorpoint_cpp::testing::s102b;

namespace {

const auto gap = TextPassage{"", false};

auto passage(std::string text) -> TextPassage {
    return TextPassage{std::move(text), true};
}

auto two_selections() -> PositionSet {
    const auto factory = PositionSetFactory{std::string{s102b}};
    return factory.from_quote_selectors({
        QuoteSelector{"In no case does copyright protection"},
        QuoteSelector{"extend to any idea"},
    });
}

}  // namespace

// -- TextPassage --------------------------------------------------------------

TEST(TextPassage, means_ignores_surrounding_punctuation) {
    EXPECT_TRUE(passage("words,").means(passage(" words.")));
    EXPECT_FALSE(passage("words").means(passage("other words")));
}

TEST(TextPassage, gap_means_nothing) {
    EXPECT_FALSE(passage("words").means(gap));
    EXPECT_FALSE(gap.means(gap));
}

TEST(TextPassage, implies_contained_text) {
    EXPECT_TRUE(passage("some more words").implies(passage("more words;")));
    EXPECT_FALSE(passage("more words").implies(passage("some more words")));
}

TEST(TextPassage, everything_implies_a_gap) {
    EXPECT_TRUE(passage("words").implies(gap));
    EXPECT_TRUE(gap.implies(gap));
    EXPECT_FALSE(gap.implies(passage("words")));
}

// -- Rendering ----------------------------------------------------------------

TEST(TextSequence, render_emits_gaps_between_selections) {
    const auto sequence = TextSequence::render(s102b, two_selections());
    ASSERT_EQ(sequence.size(), 4u);
    EXPECT_EQ(sequence[0], passage("In no case does copyright protection"));
    EXPECT_FALSE(sequence[1].included);
    EXPECT_EQ(sequence[1].text, " for an original work of authorship ");
    EXPECT_EQ(sequence[2], passage("extend to any idea"));
    EXPECT_FALSE(sequence[3].included);
}

TEST(TextSequence, render_emits_leading_gap) {
    const auto sequence = TextSequence::render(legal_text, PositionSet{{65, 93}});
    ASSERT_EQ(sequence.size(), 3u);
    EXPECT_FALSE(sequence[0].included);
    EXPECT_EQ(sequence[1].text, "original works of authorship");
    EXPECT_FALSE(sequence[2].included);
}

TEST(TextSequence, render_resolves_quotes) {
    const auto set = PositionSet::from_quotes({QuoteSelector{"authorship", "", " include"}});
    const auto sequence = TextSequence::render(legal_text, set);
    EXPECT_EQ(sequence.preview(), "authorship");
}

TEST(TextSequence, render_fails_for_unresolvable_quote) {
    const auto set = PositionSet::from_quotes({QuoteSelector{"authorship"}});
    EXPECT_THROW(TextSequence::render(legal_text, set), TextSelectionError);
}

TEST(TextSequence, render_clips_at_document_end) {
    const auto sequence = TextSequence::render(s102b, PositionSet{{0, 200}, {251, 1000}});
    ASSERT_EQ(sequence.size(), 3u);
    EXPECT_EQ(sequence[0].text.size(), 200u);
    EXPECT_EQ(sequence[2].text, "embodied in such work.");
}

TEST(TextSequence, render_skips_intervals_past_the_end) {
    const auto sequence = TextSequence::render("short", PositionSet{{0, 2}, {10, 20}});
    ASSERT_EQ(sequence.size(), 2u);
    EXPECT_EQ(sequence[0], passage("sh"));
    EXPECT_EQ(sequence[1], (TextPassage{"ort", false}));
}

TEST(TextSequence, render_whole_document_has_no_gaps) {
    const auto sequence = TextSequence::render("Some text.", PositionSet{PositionSelector::from_start(0)});
    ASSERT_EQ(sequence.size(), 1u);
    EXPECT_EQ(sequence[0], passage("Some text."));
}

TEST(TextSequence, render_empty_set_is_one_gap) {
    const auto sequence = TextSequence::render("Some text.", PositionSet{});
    ASSERT_EQ(sequence.size(), 1u);
    EXPECT_FALSE(sequence[0].included);
    EXPECT_EQ(sequence.preview(), "");
}

// -- Preview and string form --------------------------------------------------

TEST(TextSequence, preview_marks_interior_gaps_only) {
    const auto sequence = TextSequence::render(s102b, two_selections());
    EXPECT_EQ(sequence.preview(),
              "In no case does copyright protection\xE2\x80\xA6" "extend to any idea");
}

TEST(TextSequence, preview_trims_leading_gap) {
    const auto sequence = TextSequence::render(legal_text, PositionSet{{65, 93}});
    EXPECT_EQ(sequence.preview(), "original works of authorship");
}

TEST(TextSequence, to_string_marks_every_gap) {
    const auto sequence = TextSequence::render(s102b, two_selections());
    EXPECT_EQ(sequence.to_string(),
              "In no case does copyright protection\xE2\x80\xA6" "extend to any idea\xE2\x80\xA6");
}

TEST(TextSequence, to_string_joins_adjacent_passages_with_space) {
    const auto sequence = TextSequence{{passage("In no case does copyright protection"),
                                        passage("extend to any idea")}};
    EXPECT_EQ(sequence.to_string(), "In no case does copyright protection extend to any idea");
}

TEST(TextSequence, only_gaps_render_as_empty_string) {
    const auto blanks = TextSequence{{gap, gap}};
    EXPECT_EQ(blanks.size(), 2u);
    EXPECT_FALSE(blanks[1].included);
    EXPECT_EQ(blanks.to_string(), "");
}

// -- Concatenation ------------------------------------------------------------

TEST(TextSequence, concat_merges_gaps_at_the_seam) {
    const auto first = TextSequence{{passage("In no case does copyright protection"), gap,
                                     passage("extend to any idea"), gap}};
    const auto second = TextSequence{{gap, passage("embodied in such work.")}};
    const auto joined = first.concat(second);

    ASSERT_EQ(joined.size(), 5u);
    EXPECT_FALSE(joined[1].included);
    EXPECT_TRUE(joined[2].included);
    EXPECT_EQ(joined.to_string(),
              "In no case does copyright protection\xE2\x80\xA6" "extend to any idea\xE2\x80\xA6"
              "embodied in such work.");
}

TEST(TextSequence, concat_without_gaps) {
    const auto first = TextSequence{{passage("This is a full section.")}};
    const auto second = TextSequence{{passage("This is the full immediately following section.")}};
    const auto joined = first.concat(second);
    EXPECT_EQ(joined.size(), 2u);
    EXPECT_EQ(joined.to_string(),
              "This is a full section. This is the full immediately following section.");
}

TEST(TextSequence, concat_with_empty_sequence) {
    const auto some = TextSequence{{passage("Some Text.")}};
    EXPECT_EQ(some.concat(TextSequence{}), some);
    EXPECT_EQ(TextSequence{}.concat(some), some);
}

TEST(TextSequence, strip_removes_edge_gaps) {
    const auto sequence = TextSequence{{gap, passage("a"), gap, passage("b"), gap}};
    const auto stripped = sequence.strip();
    ASSERT_EQ(stripped.size(), 3u);
    EXPECT_EQ(stripped[0], passage("a"));
    EXPECT_EQ(stripped[2], passage("b"));
}

// -- Comparison ---------------------------------------------------------------

TEST(TextSequence, same_meaning_regardless_of_edge_gaps) {
    const auto rendered = TextSequence::render(s102b, two_selections());
    const auto handcrafted = TextSequence{{gap, passage("In no case does copyright protection"), gap,
                                           passage("extend to any idea")}};
    EXPECT_TRUE(rendered.means(handcrafted));
    EXPECT_FALSE(rendered.strictly_implies(handcrafted));
}

TEST(TextSequence, one_sequence_means_another) {
    const auto rendered = TextSequence::render(s102b, two_selections());
    const auto handcrafted = TextSequence{{passage("In no case does copyright protection"), gap,
                                           passage("extend to any idea")}};
    EXPECT_TRUE(rendered.means(handcrafted));
    EXPECT_TRUE(rendered.implies(handcrafted));
    EXPECT_FALSE(rendered.strictly_implies(handcrafted));
}

TEST(TextSequence, omitting_gap_changes_meaning) {
    const auto rendered = TextSequence::render(s102b, two_selections());
    const auto handcrafted = TextSequence{{passage("In no case does copyright protection"),
                                           passage("extend to any idea")}};
    EXPECT_FALSE(rendered.means(handcrafted));
}

TEST(TextSequence, full_passage_implies_selections) {
    const auto selections = TextSequence::render(s102b, two_selections());
    const auto full_passage = TextSequence::render(s102b, PositionSet{{0, 200}});
    EXPECT_TRUE(full_passage.strictly_implies(selections));
    EXPECT_FALSE(selections.strictly_implies(full_passage));
    EXPECT_FALSE(selections.implies(full_passage));
}
