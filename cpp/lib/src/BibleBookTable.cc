/** \file   BibleBookTable.cc
 *  \brief  Implementation of the BibleBookTable class.
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
#include "BibleBookTable.h"
#include <fstream>
#include <stdexcept>
#include "StringUtil.h"
#include "util.h"


namespace Scripture {


namespace {


const std::vector<BibleBookTable::Entry> &GetBuiltInEntries() {
    static const std::vector<BibleBookTable::Entry> built_in_entries{
        { "Genesis", { "gen", "ge", "gn" }, 1, OLD_TESTAMENT },
        { "Exodus", { "exo", "ex", "exod" }, 2, OLD_TESTAMENT },
        { "Leviticus", { "lev", "le", "lv" }, 3, OLD_TESTAMENT },
        { "Numbers", { "num", "nu", "nm", "nb" }, 4, OLD_TESTAMENT },
        { "Deuteronomy", { "deut", "de", "dt" }, 5, OLD_TESTAMENT },
        { "Joshua", { "josh", "jos", "jsh" }, 6, OLD_TESTAMENT },
        { "Judges", { "judg", "jdg", "jg", "jud" }, 7, OLD_TESTAMENT },
        { "Ruth", { "ruth", "rut", "ru" }, 8, OLD_TESTAMENT },
        { "1 Samuel", { "1sam", "1 sam", "1s", "1sa", "i sam" }, 9, OLD_TESTAMENT },
        { "2 Samuel", { "2sam", "2 sam", "2s", "2sa", "ii sam" }, 10, OLD_TESTAMENT },
        { "1 Kings", { "1kgs", "1 kgs", "1k", "1ki", "i kgs" }, 11, OLD_TESTAMENT },
        { "2 Kings", { "2kgs", "2 kgs", "2k", "2ki", "ii kgs" }, 12, OLD_TESTAMENT },
        { "1 Chronicles", { "1chr", "1 chr", "1ch", "1chron", "i chr" }, 13, OLD_TESTAMENT },
        { "2 Chronicles", { "2chr", "2 chr", "2ch", "2chron", "ii chr" }, 14, OLD_TESTAMENT },
        { "Ezra", { "ezra", "ezr", "ez" }, 15, OLD_TESTAMENT },
        { "Nehemiah", { "neh", "ne" }, 16, OLD_TESTAMENT },
        { "Esther", { "esth", "est", "es" }, 17, OLD_TESTAMENT },
        { "Job", { "job", "jb" }, 18, OLD_TESTAMENT },
        { "Psalms", { "ps", "psa", "psalm", "psalms" }, 19, OLD_TESTAMENT },
        { "Proverbs", { "prov", "pro", "prv", "pr" }, 20, OLD_TESTAMENT },
        { "Ecclesiastes", { "eccl", "ecc", "ec", "qoh" }, 21, OLD_TESTAMENT },
        { "Song of Songs", { "song", "sos", "so", "ss", "cant" }, 22, OLD_TESTAMENT },
        { "Isaiah", { "isa", "is" }, 23, OLD_TESTAMENT },
        { "Jeremiah", { "jer", "je", "jr" }, 24, OLD_TESTAMENT },
        { "Lamentations", { "lam", "la" }, 25, OLD_TESTAMENT },
        { "Ezekiel", { "ezek", "eze", "ez" }, 26, OLD_TESTAMENT },
        { "Daniel", { "dan", "da", "dn" }, 27, OLD_TESTAMENT },
        { "Hosea", { "hos", "ho" }, 28, OLD_TESTAMENT },
        { "Joel", { "joel", "joe", "jl" }, 29, OLD_TESTAMENT },
        { "Amos", { "amos", "amo", "am" }, 30, OLD_TESTAMENT },
        { "Obadiah", { "obad", "oba", "ob" }, 31, OLD_TESTAMENT },
        { "Jonah", { "jonah", "jon", "jnh" }, 32, OLD_TESTAMENT },
        { "Micah", { "mic", "mi" }, 33, OLD_TESTAMENT },
        { "Nahum", { "nah", "na" }, 34, OLD_TESTAMENT },
        { "Habakkuk", { "hab", "hb" }, 35, OLD_TESTAMENT },
        { "Zephaniah", { "zeph", "zep", "zp" }, 36, OLD_TESTAMENT },
        { "Haggai", { "hag", "hg" }, 37, OLD_TESTAMENT },
        { "Zechariah", { "zech", "zec", "zc" }, 38, OLD_TESTAMENT },
        { "Malachi", { "mal", "ml" }, 39, OLD_TESTAMENT },
        { "Matthew", { "matt", "mat", "mt" }, 40, NEW_TESTAMENT },
        { "Mark", { "mark", "mar", "mk", "mr" }, 41, NEW_TESTAMENT },
        { "Luke", { "luke", "luk", "lk" }, 42, NEW_TESTAMENT },
        { "John", { "john", "joh", "jn" }, 43, NEW_TESTAMENT },
        { "Acts", { "acts", "act", "ac" }, 44, NEW_TESTAMENT },
        { "Romans", { "rom", "ro", "rm" }, 45, NEW_TESTAMENT },
        { "1 Corinthians", { "1cor", "1 cor", "1co", "1c", "i cor" }, 46, NEW_TESTAMENT },
        { "2 Corinthians", { "2cor", "2 cor", "2co", "2c", "ii cor" }, 47, NEW_TESTAMENT },
        { "Galatians", { "gal", "ga" }, 48, NEW_TESTAMENT },
        { "Ephesians", { "eph", "ep" }, 49, NEW_TESTAMENT },
        { "Philippians", { "phil", "php", "pp" }, 50, NEW_TESTAMENT },
        { "Colossians", { "col", "co" }, 51, NEW_TESTAMENT },
        { "1 Thessalonians", { "1thess", "1 thess", "1th", "1 th", "i thess" }, 52, NEW_TESTAMENT },
        { "2 Thessalonians", { "2thess", "2 thess", "2th", "2 th", "ii thess" }, 53, NEW_TESTAMENT },
        { "1 Timothy", { "1tim", "1 tim", "1ti", "1t", "i tim" }, 54, NEW_TESTAMENT },
        { "2 Timothy", { "2tim", "2 tim", "2ti", "2t", "ii tim" }, 55, NEW_TESTAMENT },
        { "Titus", { "titus", "tit", "ti" }, 56, NEW_TESTAMENT },
        { "Philemon", { "phlm", "phm", "pm" }, 57, NEW_TESTAMENT },
        { "Hebrews", { "heb", "he" }, 58, NEW_TESTAMENT },
        { "James", { "jas", "jam", "jm" }, 59, NEW_TESTAMENT },
        { "1 Peter", { "1pet", "1 pet", "1pe", "1p", "i pet" }, 60, NEW_TESTAMENT },
        { "2 Peter", { "2pet", "2 pet", "2pe", "2p", "ii pet" }, 61, NEW_TESTAMENT },
        { "1 John", { "1john", "1 john", "1jn", "1j", "i john" }, 62, NEW_TESTAMENT },
        { "2 John", { "2john", "2 john", "2jn", "2j", "ii john" }, 63, NEW_TESTAMENT },
        { "3 John", { "3john", "3 john", "3jn", "3j", "iii john" }, 64, NEW_TESTAMENT },
        { "Jude", { "jude", "jud", "jd" }, 65, NEW_TESTAMENT },
        { "Revelation", { "rev", "re", "rv" }, 66, NEW_TESTAMENT },
    };

    return built_in_entries;
}


inline std::string Normalise(const std::string &s) {
    return StringUtil::ToLower(StringUtil::TrimWhite(s));
}


} // unnamed namespace


BibleBookTable::BibleBookTable() {
    for (const auto &entry : GetBuiltInEntries())
        addEntry(entry);
}


BibleBookTable::BibleBookTable(const std::string &extra_abbreviations_filename): BibleBookTable() {
    loadExtraAbbreviations(extra_abbreviations_filename);
}


const BibleBookTable &BibleBookTable::GetDefault() {
    static const BibleBookTable default_table;
    return default_table;
}


// Abbreviations that are shared between books, e.g. "ez", end up referring to the book that was added last.
void BibleBookTable::addEntry(const Entry &entry) {
    const std::string lowercase_name(StringUtil::ToLower(entry.canonical_name_));
    if (unlikely(lowercase_name_to_entry_index_map_.find(lowercase_name) != lowercase_name_to_entry_index_map_.cend()))
        LOG_ERROR("duplicate canonical book name \"" + entry.canonical_name_ + "\"!");

    lowercase_name_to_entry_index_map_[lowercase_name] = entries_.size();
    entries_.emplace_back(entry);

    abbreviation_to_canonical_name_map_[lowercase_name] = entry.canonical_name_;
    for (const auto &abbreviation : entry.abbreviations_)
        abbreviation_to_canonical_name_map_[StringUtil::ToLower(abbreviation)] = entry.canonical_name_;
}


const BibleBookTable::Entry *BibleBookTable::findEntry(const std::string &book_name) const {
    const auto name_and_index(lowercase_name_to_entry_index_map_.find(Normalise(book_name)));
    return (name_and_index == lowercase_name_to_entry_index_map_.cend()) ? nullptr : &entries_[name_and_index->second];
}


std::string BibleBookTable::lookupAbbreviation(const std::string &abbreviation_candidate) const {
    const auto abbreviation_and_canonical_name(abbreviation_to_canonical_name_map_.find(Normalise(abbreviation_candidate)));
    return (abbreviation_and_canonical_name == abbreviation_to_canonical_name_map_.cend()) ? ""
                                                                                             : abbreviation_and_canonical_name->second;
}


unsigned BibleBookTable::getBookOrder(const std::string &book_name) const {
    const Entry * const entry(findEntry(book_name));
    return (entry == nullptr) ? UNKNOWN_BOOK_ORDER : entry->order_;
}


Testament BibleBookTable::getTestament(const std::string &book_name) const {
    const Entry * const entry(findEntry(book_name));
    return (entry == nullptr) ? UNKNOWN_TESTAMENT : entry->testament_;
}


void BibleBookTable::addAbbreviation(const std::string &abbreviation, const std::string &canonical_name) {
    const std::string normalised_abbreviation(Normalise(abbreviation));
    if (unlikely(normalised_abbreviation.empty()))
        throw std::runtime_error("in BibleBookTable::addAbbreviation: empty abbreviation for \"" + canonical_name + "\"!");

    const auto name_and_index(lowercase_name_to_entry_index_map_.find(Normalise(canonical_name)));
    if (unlikely(name_and_index == lowercase_name_to_entry_index_map_.cend()))
        throw std::runtime_error("in BibleBookTable::addAbbreviation: unknown book \"" + canonical_name + "\"!");

    Entry &entry(entries_[name_and_index->second]);
    const auto old_mapping(abbreviation_to_canonical_name_map_.find(normalised_abbreviation));
    if (old_mapping != abbreviation_to_canonical_name_map_.end() and old_mapping->second != entry.canonical_name_)
        LOG_WARNING("\"" + normalised_abbreviation + "\" now refers to \"" + entry.canonical_name_ + "\" instead of \""
                    + old_mapping->second + "\"!");

    entry.abbreviations_.emplace(normalised_abbreviation);
    abbreviation_to_canonical_name_map_[normalised_abbreviation] = entry.canonical_name_;
}


void BibleBookTable::loadExtraAbbreviations(const std::string &extra_abbreviations_filename) {
    std::ifstream input(extra_abbreviations_filename);
    if (input.fail())
        throw std::runtime_error("in BibleBookTable::loadExtraAbbreviations: failed to open \"" + extra_abbreviations_filename
                                 + "\" for reading!");

    unsigned line_no(0), mapping_count(0);
    for (std::string line; std::getline(input, line); /* Intentionally empty! */) {
        ++line_no;

        // Deal w/ comments, leading and trailing spaces and empty lines:
        const size_t first_hash_pos(line.find('#'));
        if (first_hash_pos != std::string::npos)
            line.resize(first_hash_pos);
        StringUtil::TrimWhite(&line);
        if (line.empty())
            continue;

        const size_t equal_pos(line.find('='));
        if (equal_pos == std::string::npos or equal_pos == 0 or equal_pos == line.length() - 1)
            throw std::runtime_error("in BibleBookTable::loadExtraAbbreviations: bad input in \"" + extra_abbreviations_filename
                                     + "\" on line " + std::to_string(line_no) + "!");

        try {
            addAbbreviation(line.substr(0, equal_pos), StringUtil::TrimWhite(line.substr(equal_pos + 1)));
        } catch (const std::runtime_error &x) {
            throw std::runtime_error(std::string(x.what()) + " (\"" + extra_abbreviations_filename + "\", line "
                                     + std::to_string(line_no) + ")");
        }
        ++mapping_count;
    }

    LOG_DEBUG("loaded " + std::to_string(mapping_count) + " extra abbreviation(s) from \"" + extra_abbreviations_filename + "\".");
}


} // namespace Scripture
