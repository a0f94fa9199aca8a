/** \file   BibleBookMatcher.h
 *  \brief  Ranks the books of a catalog against a, possibly misspelled or abbreviated, book name.
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


#include <optional>
#include <string>
#include <vector>
#include "BibleBookTable.h"
#include "ScriptureReference.h"


namespace Scripture {


/** \brief Tiered book name matching.
 *
 *  Every tier occupies its own score band and the bands do not overlap:
 *
 *      exact         1000       input equals the name or the short name
 *      abbreviation   900       input is a known abbreviation of the book
 *      prefix        800-899    the name or the short name starts with the input
 *      substring     600-650    the name or the short name contains the input
 *      fuzzy           0-400    Levenshtein similarity above the configured minimum
 *
 *  Comparisons are case insensitive and ignore surrounding whitespace.
 */
class BibleBookMatcher {
public:
    static constexpr double EXACT_SCORE = 1000.0;
    static constexpr double ABBREVIATION_SCORE = 900.0;
    static constexpr double PREFIX_BASE_SCORE = 800.0;
    static constexpr double PREFIX_MAX_BONUS = 99.0;
    static constexpr double SUBSTRING_BASE_SCORE = 600.0;
    static constexpr double SUBSTRING_BONUS_WEIGHT = 25.0;
    static constexpr double FUZZY_MAX_SCORE = 400.0;
    static constexpr double DEFAULT_MIN_FUZZY_SIMILARITY = 0.3;

private:
    const BibleBookTable &book_table_;
    const double min_fuzzy_similarity_;

public:
    explicit BibleBookMatcher(const BibleBookTable &book_table = BibleBookTable::GetDefault(),
                              const double min_fuzzy_similarity = DEFAULT_MIN_FUZZY_SIMILARITY)
        : book_table_(book_table), min_fuzzy_similarity_(min_fuzzy_similarity) { }

    inline const BibleBookTable &getBookTable() const { return book_table_; }

    /** \return Up to "limit" matches with non-zero scores, best first.  Equal scores are ordered by the canonical
     *          order of the books.  Empty or all-whitespace input has no matches.
     */
    std::vector<BookMatch> findMatches(const std::string &input, const std::vector<BookRecord> &books, const size_t limit = 5) const;

    std::optional<BookMatch> getBestMatch(const std::string &input, const std::vector<BookRecord> &books) const;

    /** \brief Scores a single book.
     *  \param normalised_input  Lower-cased input without surrounding whitespace.
     *  \return 0.0 if the book does not match at all.
     */
    double scoreBook(const BookRecord &book, const std::string &normalised_input, MatchType * const match_type) const;

private:
    unsigned getBookOrder(const BookRecord &book) const;
};


// \return 1 - distance / max(length1, length2) with the case insensitive Levenshtein distance, 1.0 for two empty strings.
double LevenshteinSimilarity(const std::string &s1, const std::string &s2);


} // namespace Scripture
