/** \file   BibleBookMatcher.cc
 *  \brief  Implementation of the BibleBookMatcher class.
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
#include <algorithm>
#include "StringUtil.h"


namespace Scripture {


double LevenshteinSimilarity(const std::string &s1, const std::string &s2) {
    const size_t max_length(std::max(s1.length(), s2.length()));
    if (max_length == 0)
        return 1.0;

    const double similarity(1.0 - static_cast<double>(StringUtil::LevenshteinDistance(s1, s2, /* ignore_case = */ true)) / max_length);
    return std::max(0.0, similarity);
}


namespace {


// Earlier and longer occurrences of "input" in "text" score higher.  The result is in (0, 50].
double SubstringBonus(const std::string &text, const std::string &input) {
    const size_t index(text.find(input));
    if (index == std::string::npos)
        return 0.0;

    const double position_score(static_cast<double>(text.length() - index) / text.length());
    const double length_score(static_cast<double>(input.length()) / text.length());
    return (position_score + length_score) * BibleBookMatcher::SUBSTRING_BONUS_WEIGHT;
}


} // unnamed namespace


double BibleBookMatcher::scoreBook(const BookRecord &book, const std::string &normalised_input, MatchType * const match_type) const {
    const std::string name(StringUtil::ToLower(StringUtil::TrimWhite(book.name_)));
    const std::string short_name(StringUtil::ToLower(StringUtil::TrimWhite(book.short_name_)));

    if (name == normalised_input or (not short_name.empty() and short_name == normalised_input)) {
        *match_type = EXACT_MATCH;
        return EXACT_SCORE;
    }

    const std::string canonical_name(book_table_.lookupAbbreviation(normalised_input));
    if (not canonical_name.empty() and StringUtil::ToLower(canonical_name) == name) {
        *match_type = ABBREVIATION_MATCH;
        return ABBREVIATION_SCORE;
    }

    const bool name_has_prefix(StringUtil::StartsWith(name, normalised_input));
    const bool short_name_has_prefix(not short_name.empty() and StringUtil::StartsWith(short_name, normalised_input));
    if (name_has_prefix or short_name_has_prefix) {
        const size_t reference_length(short_name.empty() ? name.length() : std::min(name.length(), short_name.length()));
        const double coverage(std::min(1.0, static_cast<double>(normalised_input.length()) / reference_length));
        *match_type = PREFIX_MATCH;
        return PREFIX_BASE_SCORE + coverage * PREFIX_MAX_BONUS;
    }

    if (name.find(normalised_input) != std::string::npos) {
        *match_type = SUBSTRING_MATCH;
        return SUBSTRING_BASE_SCORE + SubstringBonus(name, normalised_input);
    }
    if (not short_name.empty() and short_name.find(normalised_input) != std::string::npos) {
        *match_type = SUBSTRING_MATCH;
        return SUBSTRING_BASE_SCORE + SubstringBonus(short_name, normalised_input);
    }

    double similarity(LevenshteinSimilarity(name, normalised_input));
    if (not short_name.empty())
        similarity = std::max(similarity, LevenshteinSimilarity(short_name, normalised_input));
    *match_type = FUZZY_MATCH;
    return (similarity > min_fuzzy_similarity_) ? similarity * FUZZY_MAX_SCORE : 0.0;
}


unsigned BibleBookMatcher::getBookOrder(const BookRecord &book) const {
    return (book.order_ != 0) ? book.order_ : book_table_.getBookOrder(book.name_);
}


std::vector<BookMatch> BibleBookMatcher::findMatches(const std::string &input, const std::vector<BookRecord> &books,
                                                     const size_t limit) const
{
    std::vector<BookMatch> matches;
    const std::string normalised_input(StringUtil::ToLower(StringUtil::TrimWhite(input)));
    if (normalised_input.empty() or limit == 0)
        return matches;

    for (const auto &book : books) {
        MatchType match_type;
        const double score(scoreBook(book, normalised_input, &match_type));
        if (score > 0.0)
            matches.emplace_back(book, score, match_type, book.name_);
    }

    std::stable_sort(matches.begin(), matches.end(), [this](const BookMatch &lhs, const BookMatch &rhs) {
        if (lhs.score_ != rhs.score_)
            return lhs.score_ > rhs.score_;
        return getBookOrder(lhs.book_) < getBookOrder(rhs.book_);
    });

    if (matches.size() > limit)
        matches.erase(matches.begin() + limit, matches.end());
    return matches;
}


std::optional<BookMatch> BibleBookMatcher::getBestMatch(const std::string &input, const std::vector<BookRecord> &books) const {
    std::vector<BookMatch> matches(findMatches(input, books, /* limit = */ 1));
    if (matches.empty())
        return std::nullopt;
    return matches.front();
}


} // namespace Scripture
