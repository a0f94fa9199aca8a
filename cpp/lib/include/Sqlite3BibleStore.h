/** \file   Sqlite3BibleStore.h
 *  \brief  A BookCatalog and VerseStore backed by an Sqlite3 database.
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


#include <mutex>
#include <string>
#include <vector>
#include "BibleStore.h"
#include "Sqlite3DbConnection.h"


namespace Scripture {


/** \brief Reads books, versions and verses from the following tables:
 *
 *      books(id, name, short_name, testament, book_order, chapters)
 *      versions(id, name, full_name)
 *      verses(version_id, book_id, chapter, verse, text)
 *
 *  \note  All database accesses are serialised, so a single instance can be shared between threads.
 */
class Sqlite3BibleStore final : public BookCatalog, public VerseStore {
public:
    struct VersionRecord {
        std::string id_;
        std::string name_;
        std::string full_name_;

    public:
        VersionRecord(const std::string &id, const std::string &name, const std::string &full_name)
            : id_(id), name_(name), full_name_(full_name) { }
    };

private:
    mutable std::mutex mutex_;
    mutable Sqlite3DbConnection db_connection_;

public:
    // \throws std::runtime_error if the database can't be opened.
    explicit Sqlite3BibleStore(const std::string &database_path,
                               const Sqlite3DbConnection::OpenMode open_mode = Sqlite3DbConnection::READONLY)
        : db_connection_(database_path, open_mode) { }

    // \return The books ordered by their canonical order.
    std::vector<BookRecord> listBooks() const override;

    std::vector<Verse> getVerses(const std::string &version_id, const unsigned book_id, const unsigned chapter) const override;

    std::vector<VersionRecord> listVersions() const;

    /** \return "preferred_version_id" if the database contains such a version, o/w the ID of the first version.
     *  \throws std::runtime_error if the database contains no versions at all.
     */
    std::string getDefaultVersion(const std::string &preferred_version_id) const;

    // \return True if all three tables exist.
    bool hasSchema() const;

    // Creates the tables if they don't exist yet.
    void createSchema();

    void insertBook(const BookRecord &book);
    void insertVersion(const VersionRecord &version);
    void insertVerse(const std::string &version_id, const unsigned book_id, const Verse &verse);
};


} // namespace Scripture
