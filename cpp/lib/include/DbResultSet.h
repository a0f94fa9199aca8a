/** \file   DbResultSet.h
 *  \brief  Interface for the DbResultSet class.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2015-2026 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include <string>
#include <sqlite3.h>
#include "DbRow.h"


/** \brief The rows produced by the last query of an Sqlite3DbConnection.
 *  \note  Owns the underlying prepared statement and finalises it once all rows have been consumed or upon destruction.
 */
class DbResultSet {
    friend class Sqlite3DbConnection;
    sqlite3_stmt *stmt_handle_;
    std::map<std::string, unsigned> field_name_to_index_map_;
    bool has_rows_;

private:
    explicit DbResultSet(sqlite3_stmt * const stmt_handle);

public:
    DbResultSet(DbResultSet &&other);
    DbResultSet(const DbResultSet &) = delete;
    DbResultSet &operator=(const DbResultSet &) = delete;
    ~DbResultSet();

    inline bool empty() const { return not has_rows_; }

    /** Typically you would call this in a loop like:
     *
     *  while (const DbRow row = result_set.getNextRow())
     *      ProcessRow(row);
     *
     *  \throws std::runtime_error if stepping through the statement failed.
     */
    DbRow getNextRow();
};
