/** \file   BibleReferenceParser.h
 *  \brief  Turns free-form text like "jn 3:16-17" into a structured scripture reference.
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


/** \brief Parses references of the forms "Book Chapter:Verse[-Verse]", "Book Chapter" and "Book", tried in that order.
 *
 *  A book consists of an optional leading 1, 2 or 3 followed by one or more words made of letters, e.g. "1 John" or
 *  "Song of Songs".  The book token is resolved with a BibleBookMatcher.  Matches that score below the confidence
 *  threshold still set the book but result in an invalid reference asking "Did you mean ...?".  Chapter and verse
 *  numbers are only checked for being positive, bounds checking is done by the BibleReferenceValidator.
 *
 *  Instances are immutable and may be shared between threads.
 */
class BibleReferenceParser {
public:
    static constexpr double DEFAULT_CONFIDENT_SCORE = 800.0;

private:
    const BibleBookMatcher &book_matcher_;
    const double confident_score_;
    const ThreadSafeRegexMatcher full_reference_matcher_;
    const ThreadSafeRegexMatcher chapter_reference_matcher_;
    const ThreadSafeRegexMatcher book_reference_matcher_;

public:
    explicit BibleReferenceParser(const BibleBookMatcher &book_matcher, const double confident_score = DEFAULT_CONFIDENT_SCORE);

    /** \note Never throws for bad input.  Problems are reported in the "error_" member of the returned reference.  Empty
     *        input results in an invalid reference w/o an error message.
     */
    ParsedReference parse(const std::string &raw_input, const std::vector<BookRecord> &books) const;

private:
    // \return False if no book could be found at all.
    bool resolveBook(const std::string &book_token, const std::vector<BookRecord> &books, ParsedReference * const reference) const;
    void parseChapterAndVerses(const std::string &chapter, const std::string &verse_start, const std::string &verse_end,
                               ParsedReference * const reference) const;
};


} // namespace Scripture
