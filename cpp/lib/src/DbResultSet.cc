/** \file   DbResultSet.cc
 *  \brief  Implementation of the DbResultSet class.
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
#include "DbResultSet.h"
#include <stdexcept>
#include "util.h"


DbResultSet::DbResultSet(sqlite3_stmt * const stmt_handle): stmt_handle_(stmt_handle), has_rows_(false) {
    if (stmt_handle_ == nullptr)
        return;

    // The connection already stepped onto the first row.
    has_rows_ = ::sqlite3_data_count(stmt_handle_) > 0;

    const int column_count(::sqlite3_column_count(stmt_handle_));
    for (int col_no(0); col_no < column_count; ++col_no) {
        const char * const column_name(::sqlite3_column_name(stmt_handle_, col_no));
        if (column_name == nullptr)
            LOG_ERROR("sqlite3_column_name() failed for index " + std::to_string(col_no) + "!");
        field_name_to_index_map_.emplace(column_name, col_no);
    }

    // Rewind so that getNextRow() starts with the first row again.
    if (::sqlite3_reset(stmt_handle_) != SQLITE_OK)
        throw std::runtime_error("in DbResultSet::DbResultSet: sqlite3_reset failed!");
}


DbResultSet::DbResultSet(DbResultSet &&other)
    : stmt_handle_(other.stmt_handle_), field_name_to_index_map_(std::move(other.field_name_to_index_map_)), has_rows_(other.has_rows_)
{
    other.stmt_handle_ = nullptr;
    other.has_rows_ = false;
}


DbResultSet::~DbResultSet() {
    if (stmt_handle_ != nullptr) {
        if (::sqlite3_finalize(stmt_handle_) != SQLITE_OK)
            LOG_WARNING("failed to finalise an Sqlite3 statement!");
        stmt_handle_ = nullptr;
    }
}


DbRow DbResultSet::getNextRow() {
    if (stmt_handle_ == nullptr or not has_rows_)
        return DbRow();

    switch (::sqlite3_step(stmt_handle_)) {
    case SQLITE_ROW:
        return DbRow(stmt_handle_, field_name_to_index_map_);
    case SQLITE_DONE:
    case SQLITE_OK:
        if (::sqlite3_finalize(stmt_handle_) != SQLITE_OK)
            LOG_WARNING("failed to finalise an Sqlite3 statement!");
        stmt_handle_ = nullptr;
        return DbRow();
    default: {
        const std::string error_message(::sqlite3_errmsg(::sqlite3_db_handle(stmt_handle_)));
        ::sqlite3_finalize(stmt_handle_);
        stmt_handle_ = nullptr;
        throw std::runtime_error("in DbResultSet::getNextRow: sqlite3_step() failed! (" + error_message + ")");
    }
    }
}
