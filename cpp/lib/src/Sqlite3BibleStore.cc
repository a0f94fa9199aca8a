/** \file   Sqlite3BibleStore.cc
 *  \brief  Implementation of the Sqlite3BibleStore class.
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
#include "Sqlite3BibleStore.h"
#include <stdexcept>
#include "util.h"


namespace Scripture {


std::vector<BookRecord> Sqlite3BibleStore::listBooks() const {
    std::lock_guard<std::mutex> lock(mutex_);

    db_connection_.queryOrThrow("SELECT id, name, short_name, testament, book_order, chapters FROM books ORDER BY book_order, id");
    DbResultSet result_set(db_connection_.getLastResultSet());
    std::vector<BookRecord> books;
    while (const DbRow row = result_set.getNextRow()) {
        books.emplace_back(static_cast<unsigned>(row.getInteger("id")), row["name"], row.getValue("short_name"),
                           static_cast<unsigned>(row.getInteger("chapters")),
                           row.isNull("book_order") ? 0u : static_cast<unsigned>(row.getInteger("book_order")),
                           StringToTestament(row.getValue("testament")));
    }

    return books;
}


std::vector<Verse> Sqlite3BibleStore::getVerses(const std::string &version_id, const unsigned book_id, const unsigned chapter) const {
    std::lock_guard<std::mutex> lock(mutex_);

    db_connection_.queryOrThrow("SELECT chapter, verse, text FROM verses WHERE version_id="
                                + db_connection_.escapeString(version_id, /* add_quotes = */ true) + " AND book_id="
                                + std::to_string(book_id) + " AND chapter=" + std::to_string(chapter) + " ORDER BY verse");
    DbResultSet result_set(db_connection_.getLastResultSet());
    std::vector<Verse> verses;
    while (const DbRow row = result_set.getNextRow())
        verses.emplace_back(static_cast<unsigned>(row.getInteger("chapter")), static_cast<unsigned>(row.getInteger("verse")),
                            row.getValue("text"));

    return verses;
}


std::vector<Sqlite3BibleStore::VersionRecord> Sqlite3BibleStore::listVersions() const {
    std::lock_guard<std::mutex> lock(mutex_);

    db_connection_.queryOrThrow("SELECT id, name, full_name FROM versions ORDER BY rowid");
    DbResultSet result_set(db_connection_.getLastResultSet());
    std::vector<VersionRecord> versions;
    while (const DbRow row = result_set.getNextRow())
        versions.emplace_back(row["id"], row.getValue("name"), row.getValue("full_name"));

    return versions;
}


std::string Sqlite3BibleStore::getDefaultVersion(const std::string &preferred_version_id) const {
    const auto versions(listVersions());
    if (unlikely(versions.empty()))
        throw std::runtime_error("in Sqlite3BibleStore::getDefaultVersion: \"" + db_connection_.getDatabasePath()
                                 + "\" contains no Bible versions!");

    for (const auto &version : versions) {
        if (version.id_ == preferred_version_id)
            return version.id_;
    }

    if (not preferred_version_id.empty())
        LOG_WARNING("version \"" + preferred_version_id + "\" not found, using \"" + versions.front().id_ + "\" instead.");
    return versions.front().id_;
}


bool Sqlite3BibleStore::hasSchema() const {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const std::string table_name : { "books", "versions", "verses" }) {
        if (not db_connection_.tableExists(table_name))
            return false;
    }

    return true;
}


void Sqlite3BibleStore::createSchema() {
    std::lock_guard<std::mutex> lock(mutex_);

    db_connection_.queryOrThrow("CREATE TABLE IF NOT EXISTS books (id INTEGER PRIMARY KEY, name TEXT NOT NULL UNIQUE, "
                                "short_name TEXT, testament TEXT, book_order INTEGER, chapters INTEGER NOT NULL)");
    db_connection_.queryOrThrow("CREATE TABLE IF NOT EXISTS versions (id TEXT PRIMARY KEY, name TEXT NOT NULL, full_name TEXT)");
    db_connection_.queryOrThrow("CREATE TABLE IF NOT EXISTS verses (version_id TEXT NOT NULL REFERENCES versions(id), "
                                "book_id INTEGER NOT NULL REFERENCES books(id), chapter INTEGER NOT NULL, "
                                "verse INTEGER NOT NULL, text TEXT, PRIMARY KEY (version_id, book_id, chapter, verse))");
}


void Sqlite3BibleStore::insertBook(const BookRecord &book) {
    std::lock_guard<std::mutex> lock(mutex_);

    db_connection_.queryOrThrow("INSERT INTO books (id, name, short_name, testament, book_order, chapters) VALUES ("
                                + std::to_string(book.id_) + "," + db_connection_.escapeString(book.name_, true) + ","
                                + db_connection_.escapeString(book.short_name_, true) + ","
                                + db_connection_.escapeString(TestamentToString(book.testament_), true) + ","
                                + std::to_string(book.order_) + "," + std::to_string(book.chapter_count_) + ")");
}


void Sqlite3BibleStore::insertVersion(const VersionRecord &version) {
    std::lock_guard<std::mutex> lock(mutex_);

    db_connection_.queryOrThrow("INSERT INTO versions (id, name, full_name) VALUES (" + db_connection_.escapeString(version.id_, true)
                                + "," + db_connection_.escapeString(version.name_, true) + ","
                                + db_connection_.escapeString(version.full_name_, true) + ")");
}


void Sqlite3BibleStore::insertVerse(const std::string &version_id, const unsigned book_id, const Verse &verse) {
    std::lock_guard<std::mutex> lock(mutex_);

    db_connection_.queryOrThrow("INSERT INTO verses (version_id, book_id, chapter, verse, text) VALUES ("
                                + db_connection_.escapeString(version_id, true) + "," + std::to_string(book_id) + ","
                                + std::to_string(verse.chapter_) + "," + std::to_string(verse.verse_) + ","
                                + db_connection_.escapeString(verse.text_, true) + ")");
}


} // namespace Scripture
