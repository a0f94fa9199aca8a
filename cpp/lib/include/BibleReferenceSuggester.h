/** \file   BibleReferenceSuggester.h
 *  \brief  Autocompletion of partially typed scripture references.
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
#pragma once


#include <string>
#include <vector>
#include "BibleBookMatcher.h"
#include "RegexMatcher.h"
#include "ScriptureReference.h"


namespace Scripture {


class BibleReferenceSuggester {
public:
    static constexpr unsigned DEFAULT_BOOK_MATCH_COUNT = 3;
    static constexpr double DEFAULT_HIGH_CONFIDENCE_SCORE = 800.0;
    static constexpr double CHAPTER_SUGGESTION_PENALTY = 100.0;
    static constexpr double COMPLETE_SUGGESTION_PENALTY = 200.0;

private:
    const BibleBookMatcher &book_matcher_;
    const unsigned book_match_count_;
    const double high_confidence_score_;
    const ThreadSafeRegexMatcher chapter_and_verse_tail_matcher_;
    const ThreadSafeRegexMatcher chapter_tail_matcher_;

public:
    explicit BibleReferenceSuggester(const BibleBookMatcher &book_matcher, const unsigned book_match_count = DEFAULT_BOOK_MATCH_COUNT,
                                     const double high_confidence_score = DEFAULT_HIGH_CONFIDENCE_SCORE);

    /** \brief Suggests the best matching books for "input".  Books that match w/ a score above the high-confidence
     *         threshold additionally get suggestions for their first chapter and their first verse, scored 100 and 200
     *         below the book itself.
     *  \return At most "limit" suggestions sorted by descending score.  Equal scores keep the order in which they
     *          were generated.
     *  \note   No bounds checking is done, only in-memory data is used.
     */
    std::vector<Suggestion> generateSuggestions(const std::string &input, const std::vector<BookRecord> &books,
                                                const size_t limit = 5) const;

    /** \brief Suggests how to continue "current_input" once its book has been resolved to "book".
     *  \note  A trailing "chapter:verse" leads to a verse range, a trailing chapter to its first verse and anything
     *         else to the first chapter and the first verse of the book.
     */
    std::vector<Suggestion> getCompletionSuggestions(const BookRecord &book, const std::string &current_input) const;
};


} // namespace Scripture
