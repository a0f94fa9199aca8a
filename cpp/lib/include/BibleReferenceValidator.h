/** \file   BibleReferenceValidator.h
 *  \brief  Checks parsed scripture references against the chapter and verse counts of a Bible version.
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
#include "BibleBoundsCache.h"
#include "ScriptureReference.h"


namespace Scripture {


class BibleReferenceValidator {
    BibleBoundsCache &bounds_cache_;

public:
    explicit BibleReferenceValidator(BibleBoundsCache * const bounds_cache): bounds_cache_(*bounds_cache) { }

    /** \brief Validates the chapter, the first verse and the last verse of "reference", in that order.
     *  \return The result for the first check that fails.  In that case the auto-correction is "reference" w/ all of
     *          its numbers clamped into range, which will itself validate successfully.  References that the parser
     *          already found to be invalid are returned as invalid w/o any checks or auto-correction.
     *  \note   May block while the bounds of the book are being fetched.
     */
    ValidationResult validate(const ParsedReference &reference, const std::string &version_id) const;
};


} // namespace Scripture
