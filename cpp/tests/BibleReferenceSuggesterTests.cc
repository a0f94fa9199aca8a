/** \brief Test cases for the BibleReferenceSuggester class.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "BibleBookMatcher.h"
#include "BibleReferenceSuggester.h"
#include "FakeBibleCollaborators.h"
#include "UnitTest.h"


using namespace Scripture;


namespace {


const double EPSILON(1e-6);


} // unnamed namespace


TEST(confident_book_suggestions) {
    const BibleBookMatcher matcher;
    const BibleReferenceSuggester suggester(matcher);

    const auto suggestions(suggester.generateSuggestions("jn", GetTestBooks()));
    CHECK_EQ(suggestions.size(), 5u);
    if (suggestions.size() != 5)
        return;

    CHECK_EQ(suggestions[0].text_, "John");
    CHECK_EQ(suggestions[0].type_, BOOK_SUGGESTION);
    CHECK_NEAR(suggestions[0].score_, 900.0, EPSILON);

    CHECK_EQ(suggestions[1].text_, "John 1");
    CHECK_EQ(suggestions[1].type_, CHAPTER_SUGGESTION);
    CHECK_NEAR(suggestions[1].score_, 800.0, EPSILON);
    CHECK_EQ(suggestions[1].reference_.chapter_, 1u);

    CHECK_EQ(suggestions[2].text_, "John 1:1");
    CHECK_EQ(suggestions[2].type_, COMPLETE_SUGGESTION);
    CHECK_NEAR(suggestions[2].score_, 700.0, EPSILON);
    CHECK_TRUE(suggestions[2].reference_.is_complete_);

    CHECK_EQ(suggestions[3].text_, "1 John");
    CHECK_EQ(suggestions[3].type_, BOOK_SUGGESTION);
    CHECK_EQ(suggestions[4].text_, "2 John");
}


TEST(unconfident_book_suggestions) {
    const BibleBookMatcher matcher;
    const BibleReferenceSuggester suggester(matcher);

    const auto suggestions(suggester.generateSuggestions("Pslam", GetTestBooks()));
    CHECK_EQ(suggestions.size(), BibleReferenceSuggester::DEFAULT_BOOK_MATCH_COUNT);
    CHECK_FALSE(suggestions.empty());
    if (not suggestions.empty())
        CHECK_EQ(suggestions.front().text_, "Psalms");
    for (const auto &suggestion : suggestions)
        CHECK_EQ(suggestion.type_, BOOK_SUGGESTION);
}


TEST(sorted_and_limited_suggestions) {
    const BibleBookMatcher matcher;
    const BibleReferenceSuggester suggester(matcher, 5);
    const auto books(GetTestBooks());

    for (const std::string input : { "j", "ez", "gene", "1", "Mathew" }) {
        const auto suggestions(suggester.generateSuggestions(input, books, 4));
        CHECK_LE(suggestions.size(), 4u);
        for (size_t i(1); i < suggestions.size(); ++i)
            CHECK_GE(suggestions[i - 1].score_, suggestions[i].score_);
    }

    CHECK_EQ(suggester.generateSuggestions("jn", books, 1).size(), 1u);
    CHECK_TRUE(suggester.generateSuggestions("", books).empty());
    CHECK_TRUE(suggester.generateSuggestions("   ", books).empty());
    CHECK_TRUE(suggester.generateSuggestions("xyzzy", books).empty());
}


TEST(high_confidence_threshold) {
    const BibleBookMatcher matcher;
    const auto books(GetTestBooks());

    // The threshold must be exceeded, reaching it is not enough.
    const BibleReferenceSuggester strict_suggester(matcher, 1, 900.0);
    auto suggestions(strict_suggester.generateSuggestions("jn", books));
    CHECK_EQ(suggestions.size(), 1u);

    suggestions = strict_suggester.generateSuggestions("John", books);
    CHECK_EQ(suggestions.size(), 3u);
}


TEST(completions_after_verse) {
    const BibleBookMatcher matcher;
    const BibleReferenceSuggester suggester(matcher);
    const BookRecord john(GetTestBook("John"));

    const auto suggestions(suggester.getCompletionSuggestions(john, "jn 3:16 "));
    CHECK_EQ(suggestions.size(), 1u);
    if (suggestions.empty())
        return;
    CHECK_EQ(suggestions[0].text_, "John 3:16-17");
    CHECK_EQ(suggestions[0].type_, COMPLETE_SUGGESTION);
    CHECK_NEAR(suggestions[0].score_, 800.0, EPSILON);
    CHECK_EQ(suggestions[0].reference_.verse_end_, 17u);
}


TEST(completions_after_largest_verse) {
    const BibleBookMatcher matcher;
    const BibleReferenceSuggester suggester(matcher);
    const BookRecord john(GetTestBook("John"));

    CHECK_TRUE(suggester.getCompletionSuggestions(john, "John 3:4294967295").empty());

    const auto suggestions(suggester.getCompletionSuggestions(john, "John 3:4294967294"));
    CHECK_EQ(suggestions.size(), 1u);
    if (suggestions.empty())
        return;
    CHECK_EQ(suggestions[0].text_, "John 3:4294967294-4294967295");
}


TEST(completions_after_chapter) {
    const BibleBookMatcher matcher;
    const BibleReferenceSuggester suggester(matcher);

    const auto suggestions(suggester.getCompletionSuggestions(GetTestBook("John"), "John 3"));
    CHECK_EQ(suggestions.size(), 1u);
    if (suggestions.empty())
        return;
    CHECK_EQ(suggestions[0].text_, "John 3:1");
    CHECK_EQ(suggestions[0].type_, COMPLETE_SUGGESTION);
    CHECK_NEAR(suggestions[0].score_, 900.0, EPSILON);
}


TEST(completions_after_book) {
    const BibleBookMatcher matcher;
    const BibleReferenceSuggester suggester(matcher);

    const auto suggestions(suggester.getCompletionSuggestions(GetTestBook("Genesis"), "Gen"));
    CHECK_EQ(suggestions.size(), 2u);
    if (suggestions.size() != 2)
        return;
    CHECK_EQ(suggestions[0].text_, "Genesis 1");
    CHECK_EQ(suggestions[0].type_, CHAPTER_SUGGESTION);
    CHECK_NEAR(suggestions[0].score_, 900.0, EPSILON);
    CHECK_EQ(suggestions[1].text_, "Genesis 1:1");
    CHECK_EQ(suggestions[1].type_, COMPLETE_SUGGESTION);
    CHECK_NEAR(suggestions[1].score_, 850.0, EPSILON);
}


TEST_MAIN(BibleReferenceSuggester)
