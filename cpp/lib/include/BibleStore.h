/** \file   BibleStore.h
 *  \brief  Interfaces of the data sources that the scripture reference resolver relies on.
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
#include "ScriptureReference.h"


namespace Scripture {


class BookCatalog {
public:
    virtual ~BookCatalog() = default;

    // \return The canonical books, typically in canonical order.
    virtual std::vector<BookRecord> listBooks() const = 0;
};


class VerseStore {
public:
    virtual ~VerseStore() = default;

    /** \return The verses of the chapter ordered by verse number.  An empty result means that the version has no such
     *          chapter.
     *  \throws std::runtime_error if the verses could not be retrieved.
     *  \note   Implementations must support concurrent calls.
     */
    virtual std::vector<Verse> getVerses(const std::string &version_id, const unsigned book_id, const unsigned chapter) const = 0;
};


} // namespace Scripture
