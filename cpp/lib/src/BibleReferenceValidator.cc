/** \file   BibleReferenceValidator.cc
 *  \brief  Implementation of the BibleReferenceValidator class.
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
#include "BibleReferenceValidator.h"
#include <algorithm>
#include "util.h"


namespace Scripture {


namespace {


inline unsigned Clamp(const unsigned value, const unsigned min, const unsigned max) {
    return std::min(std::max(value, min), max);
}


// Clamps the chapter first and the verses against the corrected chapter so that the result is always in bounds.
ParsedReference ClampToBounds(const ParsedReference &reference, const ChapterVerseInfo &info, const unsigned default_verse_count) {
    ParsedReference corrected_reference(reference);
    corrected_reference.is_valid_ = true;
    corrected_reference.error_.clear();

    if (corrected_reference.chapter_) {
        corrected_reference.chapter_ = Clamp(*corrected_reference.chapter_, 1, std::max(info.chapter_count_, 1u));
        const unsigned max_verse(info.getMaxVerse(*corrected_reference.chapter_, default_verse_count));
        if (corrected_reference.verse_start_) {
            corrected_reference.verse_start_ = Clamp(*corrected_reference.verse_start_, 1, max_verse);
            if (corrected_reference.verse_end_)
                corrected_reference.verse_end_ = Clamp(*corrected_reference.verse_end_, *corrected_reference.verse_start_, max_verse);
        }
    }

    corrected_reference.updateCompleteness();
    corrected_reference.raw_input_ = FormatReference(corrected_reference);
    return corrected_reference;
}


} // unnamed namespace


ValidationResult BibleReferenceValidator::validate(const ParsedReference &reference, const std::string &version_id) const {
    if (not reference.is_valid_ or not reference.book_)
        return ValidationResult(false, reference.hasError() ? reference.error_ : "Invalid reference");

    const BookRecord &book(*reference.book_);
    ChapterVerseInfo info;
    try {
        info = bounds_cache_.getBounds(book, version_id);
    } catch (const std::exception &x) {
        LOG_WARNING("can't validate \"" + FormatReference(reference) + "\": " + std::string(x.what()));
        return ValidationResult(false, "Unable to validate reference");
    }

    if (not reference.chapter_)
        return ValidationResult();

    const unsigned chapter(*reference.chapter_);
    if (chapter < 1 or chapter > info.chapter_count_)
        return ValidationResult(book.name_ + " has only " + std::to_string(info.chapter_count_) + " chapters",
                                ClampToBounds(reference, info, bounds_cache_.getDefaultVerseCount()));

    if (not reference.verse_start_)
        return ValidationResult();

    const unsigned max_verse(info.getMaxVerse(chapter, bounds_cache_.getDefaultVerseCount()));
    const unsigned verse_start(*reference.verse_start_);
    if (verse_start < 1 or verse_start > max_verse)
        return ValidationResult(book.name_ + " " + std::to_string(chapter) + " has only " + std::to_string(max_verse) + " verses",
                                ClampToBounds(reference, info, bounds_cache_.getDefaultVerseCount()));

    if (reference.verse_end_ and (*reference.verse_end_ < verse_start or *reference.verse_end_ > max_verse))
        return ValidationResult("Invalid verse range. " + book.name_ + " " + std::to_string(chapter) + " has "
                                    + std::to_string(max_verse) + " verses",
                                ClampToBounds(reference, info, bounds_cache_.getDefaultVerseCount()));

    return ValidationResult();
}


} // namespace Scripture
