/** \file   BibleReferenceSuggester.cc
 *  \brief  Implementation of the BibleReferenceSuggester class.
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
#include "BibleReferenceSuggester.h"
#include <algorithm>
#include <limits>
#include "StringUtil.h"


namespace Scripture {


namespace {


const double RANGE_COMPLETION_SCORE(800.0);
const double FIRST_VERSE_COMPLETION_SCORE(900.0);
const double FIRST_CHAPTER_COMPLETION_SCORE(900.0);
const double BOOK_START_COMPLETION_SCORE(850.0);


inline Suggestion MakeSuggestion(const ParsedReference &reference, const double score, const SuggestionType type) {
    return Suggestion(FormatReference(reference), reference, score, type);
}


} // unnamed namespace


BibleReferenceSuggester::BibleReferenceSuggester(const BibleBookMatcher &book_matcher, const unsigned book_match_count,
                                                 const double high_confidence_score)
    : book_matcher_(book_matcher), book_match_count_(book_match_count), high_confidence_score_(high_confidence_score),
      chapter_and_verse_tail_matcher_("(\\d+):(\\d+)$"), chapter_tail_matcher_("(\\d+)$")
{
}


std::vector<Suggestion> BibleReferenceSuggester::generateSuggestions(const std::string &input, const std::vector<BookRecord> &books,
                                                                     const size_t limit) const
{
    std::vector<Suggestion> suggestions;
    if (StringUtil::TrimWhite(input).empty())
        return suggestions;

    for (const auto &match : book_matcher_.findMatches(input, books, book_match_count_)) {
        suggestions.emplace_back(MakeSuggestion(MakeReference(match.book_), match.score_, BOOK_SUGGESTION));
        if (match.score_ > high_confidence_score_) {
            suggestions.emplace_back(MakeSuggestion(MakeReference(match.book_, 1u), match.score_ - CHAPTER_SUGGESTION_PENALTY,
                                                    CHAPTER_SUGGESTION));
            suggestions.emplace_back(MakeSuggestion(MakeReference(match.book_, 1u, 1u), match.score_ - COMPLETE_SUGGESTION_PENALTY,
                                                    COMPLETE_SUGGESTION));
        }
    }

    std::stable_sort(suggestions.begin(), suggestions.end(),
                     [](const Suggestion &lhs, const Suggestion &rhs) { return lhs.score_ > rhs.score_; });
    if (suggestions.size() > limit)
        suggestions.erase(suggestions.begin() + limit, suggestions.end());

    return suggestions;
}


std::vector<Suggestion> BibleReferenceSuggester::getCompletionSuggestions(const BookRecord &book, const std::string &current_input) const {
    std::vector<Suggestion> suggestions;
    const std::string trimmed_input(StringUtil::TrimWhite(current_input));

    unsigned chapter, verse;
    const auto chapter_and_verse_match(chapter_and_verse_tail_matcher_.match(trimmed_input));
    if (chapter_and_verse_match and StringUtil::ToUnsigned(chapter_and_verse_match[1], &chapter)
        and StringUtil::ToUnsigned(chapter_and_verse_match[2], &verse))
    {
        // There is no next verse to extend the range to.
        if (verse == std::numeric_limits<unsigned>::max())
            return suggestions;
        suggestions.emplace_back(MakeSuggestion(MakeReference(book, chapter, verse, verse + 1), RANGE_COMPLETION_SCORE,
                                                COMPLETE_SUGGESTION));
        return suggestions;
    }

    const auto chapter_match(chapter_tail_matcher_.match(trimmed_input));
    if (chapter_match and StringUtil::ToUnsigned(chapter_match[1], &chapter)) {
        suggestions.emplace_back(MakeSuggestion(MakeReference(book, chapter, 1u), FIRST_VERSE_COMPLETION_SCORE, COMPLETE_SUGGESTION));
        return suggestions;
    }

    suggestions.emplace_back(MakeSuggestion(MakeReference(book, 1u), FIRST_CHAPTER_COMPLETION_SCORE, CHAPTER_SUGGESTION));
    suggestions.emplace_back(MakeSuggestion(MakeReference(book, 1u, 1u), BOOK_START_COMPLETION_SCORE, COMPLETE_SUGGESTION));
    return suggestions;
}


} // namespace Scripture
