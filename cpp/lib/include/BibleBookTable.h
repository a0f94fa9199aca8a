/** \file   BibleBookTable.h
 *  \brief  Canonical names, abbreviations, order and testament of the 66 books of the Protestant canon.
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


#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "ScriptureReference.h"


namespace Scripture {


class BibleBookTable {
public:
    static constexpr unsigned UNKNOWN_BOOK_ORDER = 999;

    struct Entry {
        std::string canonical_name_;
        std::set<std::string> abbreviations_; // all lower-case
        unsigned order_;
        Testament testament_;

    public:
        Entry(const std::string &canonical_name, const std::set<std::string> &abbreviations, const unsigned order,
              const Testament testament)
            : canonical_name_(canonical_name), abbreviations_(abbreviations), order_(order), testament_(testament) { }
    };

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> lowercase_name_to_entry_index_map_;
    std::unordered_map<std::string, std::string> abbreviation_to_canonical_name_map_;

public:
    // Constructs the built-in table.
    BibleBookTable();

    /** \brief Constructs the built-in table and adds the "abbreviation=Canonical Book Name" lines from
     *         "extra_abbreviations_filename".  Empty lines and everything after a hash mark are ignored.
     *  \throws std::runtime_error if the file can't be read, a line is malformed or names an unknown book.
     */
    explicit BibleBookTable(const std::string &extra_abbreviations_filename);

    // \return The shared built-in table which is constructed on first use.
    static const BibleBookTable &GetDefault();

    inline const std::vector<Entry> &getEntries() const { return entries_; }
    inline size_t size() const { return entries_.size(); }

    // \return The entry for "book_name" (case insensitive) or nullptr if there is none.
    const Entry *findEntry(const std::string &book_name) const;

    /** \brief Resolves an abbreviation or a full book name.
     *  \return The canonical book name or the empty string if "abbreviation_candidate" is unknown.
     *  \note   Leading and trailing whitespace and case are ignored.
     */
    std::string lookupAbbreviation(const std::string &abbreviation_candidate) const;

    // \return The canonical position (1-66) of the book or UNKNOWN_BOOK_ORDER.
    unsigned getBookOrder(const std::string &book_name) const;

    Testament getTestament(const std::string &book_name) const;

    // \note Overwrites an existing mapping of "abbreviation".
    void addAbbreviation(const std::string &abbreviation, const std::string &canonical_name);

private:
    void addEntry(const Entry &entry);
    void loadExtraAbbreviations(const std::string &extra_abbreviations_filename);
};


} // namespace Scripture
