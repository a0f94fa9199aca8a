/** \file   BibleReferenceParser.cc
 *  \brief  Implementation of the BibleReferenceParser class.
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
#include "BibleReferenceParser.h"
#include "StringUtil.h"
#include "util.h"


namespace Scripture {


namespace {


const std::string BOOK_PATTERN("([1-3]?\\s*[A-Za-z]+(?:\\s+[A-Za-z]+)*)");


// \return False if "number_candidate" is not a positive base-10 number.
bool ParsePositiveNumber(const std::string &number_candidate, unsigned * const number) {
    return StringUtil::ToUnsigned(number_candidate, number) and *number > 0;
}


} // unnamed namespace


BibleReferenceParser::BibleReferenceParser(const BibleBookMatcher &book_matcher, const double confident_score)
    : book_matcher_(book_matcher), confident_score_(confident_score),
      full_reference_matcher_("^" + BOOK_PATTERN + "\\s+(\\d+):(\\d+)(?:-(\\d+))?$"),
      chapter_reference_matcher_("^" + BOOK_PATTERN + "\\s+(\\d+)$"), book_reference_matcher_("^" + BOOK_PATTERN + "$")
{
}


bool BibleReferenceParser::resolveBook(const std::string &book_token, const std::vector<BookRecord> &books,
                                       ParsedReference * const reference) const
{
    reference->book_token_ = book_token;

    const auto best_match(book_matcher_.getBestMatch(book_token, books));
    if (not best_match)
        return false;

    reference->book_ = best_match->book_;
    if (best_match->score_ >= confident_score_)
        reference->is_valid_ = true;
    else {
        reference->is_valid_ = false;
        reference->error_ = "Did you mean \"" + best_match->book_.name_ + "\"?";
    }

    return true;
}


// Numbers are recorded even for a reference that is already invalid so that callers can offer a corrected version.
// The first problem found determines the error message.
void BibleReferenceParser::parseChapterAndVerses(const std::string &chapter, const std::string &verse_start,
                                                 const std::string &verse_end, ParsedReference * const reference) const
{
    const auto SetError([reference](const std::string &error) {
        if (reference->is_valid_) {
            reference->is_valid_ = false;
            reference->error_ = error;
        }
    });

    if (chapter.empty())
        return;
    unsigned number;
    if (not ParsePositiveNumber(chapter, &number)) {
        SetError("Invalid chapter number");
        return;
    }
    reference->chapter_ = number;

    if (verse_start.empty())
        return;
    if (not ParsePositiveNumber(verse_start, &number)) {
        SetError("Invalid verse number");
        return;
    }
    reference->verse_start_ = number;

    if (verse_end.empty())
        return;
    if (not StringUtil::ToUnsigned(verse_end, &number)) {
        SetError("Invalid verse number");
        return;
    }
    reference->verse_end_ = number;
    if (number < *reference->verse_start_)
        SetError("Invalid verse range");
}


ParsedReference BibleReferenceParser::parse(const std::string &raw_input, const std::vector<BookRecord> &books) const {
    ParsedReference reference;
    reference.raw_input_ = StringUtil::TrimWhite(raw_input);
    if (reference.raw_input_.empty())
        return reference;

    const ThreadSafeRegexMatcher * const matchers[] = { &full_reference_matcher_, &chapter_reference_matcher_,
                                                        &book_reference_matcher_ };
    for (const auto matcher : matchers) {
        const auto match_result(matcher->match(reference.raw_input_));
        if (not match_result)
            continue;

        const std::string book_token(StringUtil::TrimWhite(match_result[1]));
        if (not resolveBook(book_token, books, &reference)) {
            reference.error_ = "Book \"" + book_token + "\" not found";
            return reference;
        }

        parseChapterAndVerses(match_result.hasGroup(2) ? match_result[2] : "", match_result.hasGroup(3) ? match_result[3] : "",
                              match_result.hasGroup(4) ? match_result[4] : "", &reference);
        reference.updateCompleteness();
        return reference;
    }

    // None of the patterns matched, so we try to interpret the whole input as a book name:
    if (not resolveBook(reference.raw_input_, books, &reference)) {
        reference.error_ = "Invalid reference format";
        return reference;
    }
    reference.updateCompleteness();

    return reference;
}


} // namespace Scripture
