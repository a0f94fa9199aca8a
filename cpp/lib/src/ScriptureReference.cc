/** \file   ScriptureReference.cc
 *  \brief  Formatting and helper functions for scripture references.
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
#include "ScriptureReference.h"
#include <limits>
#include "StringUtil.h"
#include "util.h"


namespace Scripture {


std::string TestamentToString(const Testament testament) {
    switch (testament) {
    case OLD_TESTAMENT:
        return "OT";
    case NEW_TESTAMENT:
        return "NT";
    case UNKNOWN_TESTAMENT:
        return "";
    }

    LOG_ERROR("unknown testament " + std::to_string(testament) + "!");
}


Testament StringToTestament(const std::string &testament_candidate) {
    const std::string normalised_candidate(StringUtil::ToLower(StringUtil::TrimWhite(testament_candidate)));
    if (normalised_candidate == "ot")
        return OLD_TESTAMENT;
    if (normalised_candidate == "nt")
        return NEW_TESTAMENT;
    return UNKNOWN_TESTAMENT;
}


bool ParsedReference::operator==(const ParsedReference &rhs) const {
    if (book_.has_value() != rhs.book_.has_value())
        return false;
    if (book_ and *book_ != *rhs.book_)
        return false;

    return book_token_ == rhs.book_token_ and chapter_ == rhs.chapter_ and verse_start_ == rhs.verse_start_
           and verse_end_ == rhs.verse_end_ and is_valid_ == rhs.is_valid_ and is_complete_ == rhs.is_complete_
           and error_ == rhs.error_;
}


std::string MatchTypeToString(const MatchType match_type) {
    switch (match_type) {
    case EXACT_MATCH:
        return "exact";
    case ABBREVIATION_MATCH:
        return "abbreviation";
    case PREFIX_MATCH:
        return "prefix";
    case SUBSTRING_MATCH:
        return "substring";
    case FUZZY_MATCH:
        return "fuzzy";
    }

    LOG_ERROR("unknown match type " + std::to_string(match_type) + "!");
}


unsigned ChapterVerseInfo::getMaxVerse(const unsigned chapter, const unsigned default_verse_count) const {
    const auto chapter_and_verse_count(per_chapter_verse_count_.find(chapter));
    if (chapter_and_verse_count != per_chapter_verse_count_.cend() and chapter_and_verse_count->second > 0)
        return chapter_and_verse_count->second;
    return (max_verse_seen_ > 0) ? max_verse_seen_ : default_verse_count;
}


std::string SuggestionTypeToString(const SuggestionType suggestion_type) {
    switch (suggestion_type) {
    case BOOK_SUGGESTION:
        return "book";
    case CHAPTER_SUGGESTION:
        return "chapter";
    case VERSE_SUGGESTION:
        return "verse";
    case COMPLETE_SUGGESTION:
        return "complete";
    }

    LOG_ERROR("unknown suggestion type " + std::to_string(suggestion_type) + "!");
}


ParsedReference MakeReference(const BookRecord &book, const std::optional<unsigned> &chapter,
                              const std::optional<unsigned> &verse_start, const std::optional<unsigned> &verse_end)
{
    ParsedReference reference;
    reference.book_token_ = book.name_;
    reference.book_ = book;
    reference.chapter_ = chapter;
    reference.verse_start_ = verse_start;
    reference.verse_end_ = verse_end;
    reference.is_valid_ = true;
    reference.updateCompleteness();
    reference.raw_input_ = FormatReference(reference);

    return reference;
}


namespace {


std::string FormatChapterAndVerses(const ParsedReference &reference) {
    std::string chapter_and_verses;
    if (not reference.chapter_)
        return chapter_and_verses;

    chapter_and_verses += " " + std::to_string(*reference.chapter_);
    if (reference.verse_start_) {
        chapter_and_verses += ":" + std::to_string(*reference.verse_start_);
        if (reference.verse_end_ and *reference.verse_end_ != *reference.verse_start_)
            chapter_and_verses += "-" + std::to_string(*reference.verse_end_);
    }

    return chapter_and_verses;
}


} // unnamed namespace


std::string FormatReference(const ParsedReference &reference) {
    if (not reference.book_)
        return reference.raw_input_;
    return reference.book_->name_ + FormatChapterAndVerses(reference);
}


std::string FormatShortReference(const ParsedReference &reference) {
    if (not reference.book_)
        return reference.raw_input_;
    const std::string &book_name(reference.book_->short_name_.empty() ? reference.book_->name_ : reference.book_->short_name_);
    return book_name + FormatChapterAndVerses(reference);
}


std::string FormatSuggestionText(const BookRecord &book, const std::optional<unsigned> &chapter, const std::optional<unsigned> &verse) {
    std::string text(book.name_);
    if (chapter) {
        text += " " + std::to_string(*chapter);
        if (verse)
            text += ":" + std::to_string(*verse);
    }

    return text;
}


std::string CreateReferenceKey(const ParsedReference &reference) {
    if (not reference.book_)
        return "";

    std::vector<std::string> parts{ std::to_string(reference.book_->id_) };
    if (reference.chapter_) {
        parts.emplace_back(std::to_string(*reference.chapter_));
        if (reference.verse_start_) {
            parts.emplace_back(std::to_string(*reference.verse_start_));
            if (reference.verse_end_ and *reference.verse_end_ != *reference.verse_start_)
                parts.emplace_back(std::to_string(*reference.verse_end_));
        }
    }

    return StringUtil::Join(parts, ":");
}


std::vector<std::string> GenerateCompletionSuggestions(const ParsedReference &reference, const size_t max_suggestions) {
    std::vector<std::string> suggestions;
    if (not reference.book_)
        return suggestions;

    const std::string &book_name(reference.book_->name_);
    if (not reference.chapter_) {
        suggestions.emplace_back(book_name + " 1");
        suggestions.emplace_back(book_name + " 1:1");
    } else if (not reference.verse_start_)
        suggestions.emplace_back(book_name + " " + std::to_string(*reference.chapter_) + ":1");
    else {
        const unsigned chapter(*reference.chapter_), verse(*reference.verse_start_);
        if (verse < std::numeric_limits<unsigned>::max()) {
            suggestions.emplace_back(book_name + " " + std::to_string(chapter) + ":" + std::to_string(verse + 1));
            if (not reference.verse_end_)
                suggestions.emplace_back(book_name + " " + std::to_string(chapter) + ":" + std::to_string(verse) + "-"
                                         + std::to_string(verse + 1));
        }
        if (chapter < std::numeric_limits<unsigned>::max())
            suggestions.emplace_back(book_name + " " + std::to_string(chapter + 1) + ":1");
    }

    if (suggestions.size() > max_suggestions)
        suggestions.resize(max_suggestions);
    return suggestions;
}


} // namespace Scripture
