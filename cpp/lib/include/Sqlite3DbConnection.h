/** \file   Sqlite3DbConnection.h
 *  \brief  Interface for the Sqlite3DbConnection class.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2021-2026 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include <sqlite3.h>
#include "DbResultSet.h"


/** \note Instances are not safe for concurrent use.  The underlying handle is opened in serialised mode but the
 *        "last statement" state is per connection, so callers sharing a connection between threads need a mutex.
 */
class Sqlite3DbConnection final {
    sqlite3 *sqlite3_;
    sqlite3_stmt *stmt_handle_;
    std::string database_path_;

public:
    enum OpenMode { READONLY, READWRITE, CREATE };

public:
    // \throws std::runtime_error if the database can't be opened.
    Sqlite3DbConnection(const std::string &database_path, const OpenMode open_mode);
    ~Sqlite3DbConnection();

    Sqlite3DbConnection(const Sqlite3DbConnection &) = delete;
    Sqlite3DbConnection &operator=(const Sqlite3DbConnection &) = delete;

    inline std::string getLastErrorMessage() const { return ::sqlite3_errmsg(sqlite3_); }
    inline const std::string &getDatabasePath() const { return database_path_; }

    // \return True on success, o/w false.  Use getLastErrorMessage() to find out what went wrong.
    bool query(const std::string &query_statement);

    // \throws std::runtime_error if the query failed.
    void queryOrThrow(const std::string &query_statement);

    /** \brief Hands over the rows of the last query.
     *  \note  Must be called before the next query, which would otherwise discard the rows.
     */
    DbResultSet getLastResultSet();

    std::string escapeString(const std::string &unescaped_string, const bool add_quotes = false) const;

    bool tableExists(const std::string &table_name);
};
