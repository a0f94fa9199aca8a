/** \file   ScriptureReference.h
 *  \brief  Data types shared by the scripture reference parser, matcher, validator and suggester.
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


#include <map>
#include <optional>
#include <string>
#include <vector>


namespace Scripture {


enum Testament { OLD_TESTAMENT, NEW_TESTAMENT, UNKNOWN_TESTAMENT };


std::string TestamentToString(const Testament testament);

// \return UNKNOWN_TESTAMENT if "testament_candidate" is neither "OT" nor "NT" (case insensitive).
Testament StringToTestament(const std::string &testament_candidate);


// A book as provided by a BookCatalog.
struct BookRecord {
    unsigned id_;
    std::string name_;
    std::string short_name_;
    unsigned chapter_count_;
    unsigned order_; // 0 if the catalog does not know the canonical order
    Testament testament_;

public:
    BookRecord(): id_(0), chapter_count_(0), order_(0), testament_(UNKNOWN_TESTAMENT) { }
    BookRecord(const unsigned id, const std::string &name, const std::string &short_name, const unsigned chapter_count,
               const unsigned order = 0, const Testament testament = UNKNOWN_TESTAMENT)
        : id_(id), name_(name), short_name_(short_name), chapter_count_(chapter_count), order_(order), testament_(testament) { }

    inline bool operator==(const BookRecord &rhs) const { return id_ == rhs.id_ and name_ == rhs.name_; }
    inline bool operator!=(const BookRecord &rhs) const { return not operator==(rhs); }
};


struct Verse {
    unsigned chapter_;
    unsigned verse_;
    std::string text_;

public:
    Verse(const unsigned chapter, const unsigned verse, const std::string &text = ""): chapter_(chapter), verse_(verse), text_(text) { }
};


/** \brief The, possibly partial, result of parsing a free-form scripture reference.
 *  \note  An empty "error_" means that there is no error.  "is_valid_" being false implies a non-empty "error_" except
 *         for empty input.
 */
struct ParsedReference {
    std::string raw_input_;
    std::string book_token_;
    std::optional<BookRecord> book_;
    std::optional<unsigned> chapter_;
    std::optional<unsigned> verse_start_;
    std::optional<unsigned> verse_end_;
    bool is_valid_;
    bool is_complete_;
    std::string error_;

public:
    ParsedReference(): is_valid_(false), is_complete_(false) { }

    inline bool hasError() const { return not error_.empty(); }

    // Sets "is_complete_" from the current field values.
    inline void updateCompleteness() { is_complete_ = is_valid_ and book_ and chapter_ and verse_start_; }

    // Compares everything except for the raw input.
    bool operator==(const ParsedReference &rhs) const;
    inline bool operator!=(const ParsedReference &rhs) const { return not operator==(rhs); }
};


enum MatchType { EXACT_MATCH, ABBREVIATION_MATCH, PREFIX_MATCH, SUBSTRING_MATCH, FUZZY_MATCH };


std::string MatchTypeToString(const MatchType match_type);


struct BookMatch {
    BookRecord book_;
    double score_;
    MatchType match_type_;
    std::string matched_text_;

public:
    BookMatch(const BookRecord &book, const double score, const MatchType match_type, const std::string &matched_text)
        : book_(book), score_(score), match_type_(match_type), matched_text_(matched_text) { }
};


/** \brief Chapter and verse bounds of a single book in a single Bible version. */
struct ChapterVerseInfo {
    unsigned book_id_;
    unsigned chapter_count_;
    std::map<unsigned, unsigned> per_chapter_verse_count_;
    unsigned max_verse_seen_;

public:
    ChapterVerseInfo(): book_id_(0), chapter_count_(0), max_verse_seen_(0) { }
    ChapterVerseInfo(const unsigned book_id, const unsigned chapter_count)
        : book_id_(book_id), chapter_count_(chapter_count), max_verse_seen_(0) { }

    /** \return The recorded verse count of "chapter" if there is a non-zero one, o/w the largest verse number seen in
     *          any chapter of the book and, if that is also unknown, "default_verse_count".
     */
    unsigned getMaxVerse(const unsigned chapter, const unsigned default_verse_count) const;
};


struct ValidationResult {
    bool is_valid_;
    std::string error_;
    std::optional<ParsedReference> auto_correction_;

public:
    ValidationResult(): is_valid_(true) { }
    ValidationResult(const bool is_valid, const std::string &error): is_valid_(is_valid), error_(error) { }
    ValidationResult(const std::string &error, const ParsedReference &auto_correction)
        : is_valid_(false), error_(error), auto_correction_(auto_correction) { }
};


enum SuggestionType { BOOK_SUGGESTION, CHAPTER_SUGGESTION, VERSE_SUGGESTION, COMPLETE_SUGGESTION };


std::string SuggestionTypeToString(const SuggestionType suggestion_type);


struct Suggestion {
    std::string text_;
    ParsedReference reference_;
    double score_;
    SuggestionType type_;

public:
    Suggestion(const std::string &text, const ParsedReference &reference, const double score, const SuggestionType type)
        : text_(text), reference_(reference), score_(score), type_(type) { }
};


/** \brief Creates a valid reference to "book" with the given chapter and verses.
 *  \note  "raw_input_" will be set to the formatted form of the reference.
 */
ParsedReference MakeReference(const BookRecord &book, const std::optional<unsigned> &chapter = std::nullopt,
                              const std::optional<unsigned> &verse_start = std::nullopt,
                              const std::optional<unsigned> &verse_end = std::nullopt);


// \return "Book ch:v-w" where the parts that are missing are left out.  "-w" is omitted if it equals "v".  If there is
//         no book, the raw input will be returned.
std::string FormatReference(const ParsedReference &reference);

// Like FormatReference() but uses the book's short name, if it has one.
std::string FormatShortReference(const ParsedReference &reference);

std::string FormatSuggestionText(const BookRecord &book, const std::optional<unsigned> &chapter = std::nullopt,
                                 const std::optional<unsigned> &verse = std::nullopt);

// \return A key of the form "book_id:chapter:verse_start[:verse_end]" or the empty string if "reference" has no book.
std::string CreateReferenceKey(const ParsedReference &reference);

inline bool AreReferencesEqual(const ParsedReference &reference1, const ParsedReference &reference2) {
    return CreateReferenceKey(reference1) == CreateReferenceKey(reference2);
}


/** \brief Proposes how a reference could be continued.
 *  \return For a bare book its first chapter and first verse, for a chapter its first verse and for anything with a
 *          verse the next verse, a two-verse range (unless there already is a range) and the next chapter.
 */
std::vector<std::string> GenerateCompletionSuggestions(const ParsedReference &reference, const size_t max_suggestions = 3);


} // namespace Scripture
