/** \brief Test cases for the scripture reference formatting functions.
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
#include <limits>
#include "FakeBibleCollaborators.h"
#include "ScriptureReference.h"
#include "UnitTest.h"


using namespace Scripture;


TEST(format_reference) {
    const BookRecord john(GetTestBook("John"));
    CHECK_EQ(FormatReference(MakeReference(john)), "John");
    CHECK_EQ(FormatReference(MakeReference(john, 3u)), "John 3");
    CHECK_EQ(FormatReference(MakeReference(john, 3u, 16u)), "John 3:16");
    CHECK_EQ(FormatReference(MakeReference(john, 3u, 16u, 17u)), "John 3:16-17");

    // A range that ends where it starts is a single verse.
    CHECK_EQ(FormatReference(MakeReference(john, 3u, 16u, 16u)), "John 3:16");
}


TEST(format_reference_without_book) {
    ParsedReference reference;
    reference.raw_input_ = "xyz 1:2";
    CHECK_EQ(FormatReference(reference), "xyz 1:2");
    CHECK_EQ(FormatShortReference(reference), "xyz 1:2");
}


TEST(format_short_reference) {
    CHECK_EQ(FormatShortReference(MakeReference(GetTestBook("1 John"), 2u, 1u, 3u)), "1Jn 2:1-3");

    const BookRecord book_without_short_name(7, "Judges", "", 21, 7, OLD_TESTAMENT);
    CHECK_EQ(FormatShortReference(MakeReference(book_without_short_name, 4u)), "Judges 4");
}


TEST(format_suggestion_text) {
    const BookRecord psalms(GetTestBook("Psalms"));
    CHECK_EQ(FormatSuggestionText(psalms), "Psalms");
    CHECK_EQ(FormatSuggestionText(psalms, 23u), "Psalms 23");
    CHECK_EQ(FormatSuggestionText(psalms, 23u, 1u), "Psalms 23:1");

    // A verse w/o a chapter is meaningless.
    CHECK_EQ(FormatSuggestionText(psalms, std::nullopt, 1u), "Psalms");
}


TEST(create_reference_key) {
    const BookRecord john(GetTestBook("John"));
    CHECK_EQ(CreateReferenceKey(MakeReference(john)), "43");
    CHECK_EQ(CreateReferenceKey(MakeReference(john, 3u)), "43:3");
    CHECK_EQ(CreateReferenceKey(MakeReference(john, 3u, 16u)), "43:3:16");
    CHECK_EQ(CreateReferenceKey(MakeReference(john, 3u, 16u, 17u)), "43:3:16:17");
    CHECK_EQ(CreateReferenceKey(ParsedReference()), "");
}


TEST(are_references_equal) {
    const BookRecord john(GetTestBook("John"));
    CHECK_TRUE(AreReferencesEqual(MakeReference(john, 3u, 16u), MakeReference(john, 3u, 16u, 16u)));
    CHECK_FALSE(AreReferencesEqual(MakeReference(john, 3u, 16u), MakeReference(john, 3u, 16u, 17u)));
    CHECK_FALSE(AreReferencesEqual(MakeReference(john, 3u, 16u), MakeReference(GetTestBook("1 John"), 3u, 16u)));
}


TEST(make_reference) {
    const ParsedReference reference(MakeReference(GetTestBook("Genesis"), 1u, 1u));
    CHECK_TRUE(reference.is_valid_);
    CHECK_TRUE(reference.is_complete_);
    CHECK_FALSE(reference.hasError());
    CHECK_EQ(reference.book_token_, "Genesis");
    CHECK_EQ(reference.raw_input_, "Genesis 1:1");

    const ParsedReference incomplete_reference(MakeReference(GetTestBook("Genesis"), 1u));
    CHECK_TRUE(incomplete_reference.is_valid_);
    CHECK_FALSE(incomplete_reference.is_complete_);
}


TEST(completions_for_book) {
    const auto completions(GenerateCompletionSuggestions(MakeReference(GetTestBook("Genesis"))));
    CHECK_EQ(completions.size(), 2u);
    CHECK_EQ(completions[0], "Genesis 1");
    CHECK_EQ(completions[1], "Genesis 1:1");
}


TEST(completions_for_chapter) {
    const auto completions(GenerateCompletionSuggestions(MakeReference(GetTestBook("Genesis"), 5u)));
    CHECK_EQ(completions.size(), 1u);
    CHECK_EQ(completions[0], "Genesis 5:1");
}


TEST(completions_for_verse) {
    const BookRecord john(GetTestBook("John"));
    const auto completions(GenerateCompletionSuggestions(MakeReference(john, 3u, 16u)));
    CHECK_EQ(completions.size(), 3u);
    CHECK_EQ(completions[0], "John 3:17");
    CHECK_EQ(completions[1], "John 3:16-17");
    CHECK_EQ(completions[2], "John 4:1");

    const auto range_completions(GenerateCompletionSuggestions(MakeReference(john, 3u, 16u, 18u)));
    CHECK_EQ(range_completions.size(), 2u);
    CHECK_EQ(range_completions[0], "John 3:17");
    CHECK_EQ(range_completions[1], "John 4:1");

    CHECK_EQ(GenerateCompletionSuggestions(MakeReference(john, 3u, 16u), 1).size(), 1u);
    CHECK_TRUE(GenerateCompletionSuggestions(ParsedReference()).empty());
}


TEST(completions_at_largest_numbers) {
    const BookRecord john(GetTestBook("John"));
    const unsigned largest(std::numeric_limits<unsigned>::max());

    const auto last_verse_completions(GenerateCompletionSuggestions(MakeReference(john, 3u, largest)));
    CHECK_EQ(last_verse_completions.size(), 1u);
    CHECK_EQ(last_verse_completions[0], "John 4:1");

    const auto last_chapter_completions(GenerateCompletionSuggestions(MakeReference(john, largest, 7u)));
    CHECK_EQ(last_chapter_completions.size(), 2u);
    CHECK_EQ(last_chapter_completions[0], "John 4294967295:8");
    CHECK_EQ(last_chapter_completions[1], "John 4294967295:7-8");

    CHECK_TRUE(GenerateCompletionSuggestions(MakeReference(john, largest, largest)).empty());
}


TEST(parsed_reference_equality) {
    ParsedReference reference1(MakeReference(GetTestBook("John"), 3u, 16u));
    ParsedReference reference2(reference1);
    reference2.raw_input_ = "jn 3:16";
    CHECK_TRUE(reference1 == reference2);

    reference2.verse_end_ = 17u;
    CHECK_TRUE(reference1 != reference2);
}


TEST(get_max_verse) {
    ChapterVerseInfo info(43, 21);
    CHECK_EQ(info.getMaxVerse(3, 31), 31u);

    info.per_chapter_verse_count_[3] = 36;
    info.per_chapter_verse_count_[4] = 0;
    info.max_verse_seen_ = 54;
    CHECK_EQ(info.getMaxVerse(3, 31), 36u);
    CHECK_EQ(info.getMaxVerse(4, 31), 54u);
    CHECK_EQ(info.getMaxVerse(22, 31), 54u);
}


TEST(enum_strings) {
    CHECK_EQ(MatchTypeToString(EXACT_MATCH), "exact");
    CHECK_EQ(MatchTypeToString(ABBREVIATION_MATCH), "abbreviation");
    CHECK_EQ(MatchTypeToString(FUZZY_MATCH), "fuzzy");
    CHECK_EQ(SuggestionTypeToString(CHAPTER_SUGGESTION), "chapter");
    CHECK_EQ(TestamentToString(NEW_TESTAMENT), "NT");
    CHECK_EQ(StringToTestament(" ot "), OLD_TESTAMENT);
    CHECK_EQ(StringToTestament("apocrypha"), UNKNOWN_TESTAMENT);
}


TEST_MAIN(ScriptureReference)
