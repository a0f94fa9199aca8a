/** \file   Sqlite3DbConnection.cc
 *  \brief  Implementation of the Sqlite3DbConnection class.
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
#include "Sqlite3DbConnection.h"
#include <stdexcept>
#include <cerrno>
#include "util.h"


Sqlite3DbConnection::Sqlite3DbConnection(const std::string &database_path, const OpenMode open_mode)
    : sqlite3_(nullptr), stmt_handle_(nullptr), database_path_(database_path)
{
    int flags(0);
    switch (open_mode) {
    case READONLY:
        flags = SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX;
        break;
    case READWRITE:
        flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
        break;
    case CREATE:
        flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        break;
    }

    if (::sqlite3_open_v2(database_path.c_str(), &sqlite3_, flags, nullptr) != SQLITE_OK) {
        const std::string error_message(sqlite3_ == nullptr ? "out of memory" : ::sqlite3_errmsg(sqlite3_));
        ::sqlite3_close(sqlite3_);
        throw std::runtime_error("failed to create or open an Sqlite3 database with path \"" + database_path + "\"! ("
                                 + error_message + ")");
    }
    errno = 0; // It seems that sqlite3_open_v2 internally tries something that fails but doesn't clear errno afterwards.
}


Sqlite3DbConnection::~Sqlite3DbConnection() {
    if (stmt_handle_ != nullptr) {
        const int result_code(::sqlite3_finalize(stmt_handle_));
        if (result_code != SQLITE_OK)
            LOG_WARNING("failed to finalise an Sqlite3 statement! (" + getLastErrorMessage() + ", code was "
                        + std::to_string(result_code) + ")");
    }
    if (::sqlite3_close(sqlite3_) != SQLITE_OK)
        LOG_WARNING("failed to cleanly close an Sqlite3 database!");
}


bool Sqlite3DbConnection::query(const std::string &query_statement) {
    LOG_DEBUG(query_statement);

    if (stmt_handle_ != nullptr) {
        const int result_code(::sqlite3_finalize(stmt_handle_));
        stmt_handle_ = nullptr;
        if (result_code != SQLITE_OK) {
            LOG_WARNING("failed to finalise an Sqlite3 statement! (" + getLastErrorMessage() + ", code was "
                        + std::to_string(result_code) + ")");
            return false;
        }
    }

    const char *rest;
    if (::sqlite3_prepare_v2(sqlite3_, query_statement.c_str(), query_statement.length(), &stmt_handle_, &rest) != SQLITE_OK) {
        stmt_handle_ = nullptr;
        return false;
    }
    if (rest != nullptr and *rest != '\0')
        LOG_ERROR("junk after SQL statement (" + query_statement + "): \"" + std::string(rest) + "\"!");

    switch (::sqlite3_step(stmt_handle_)) {
    case SQLITE_DONE:
    case SQLITE_OK:
    case SQLITE_ROW:
        break;
    default:
        ::sqlite3_finalize(stmt_handle_);
        stmt_handle_ = nullptr;
        return false;
    }

    return true;
}


void Sqlite3DbConnection::queryOrThrow(const std::string &query_statement) {
    if (unlikely(not query(query_statement)))
        throw std::runtime_error("in Sqlite3DbConnection::queryOrThrow: SQL error: " + getLastErrorMessage() + " (statement: "
                                 + query_statement + ")");
}


DbResultSet Sqlite3DbConnection::getLastResultSet() {
    const auto temp_handle(stmt_handle_);
    stmt_handle_ = nullptr;
    return DbResultSet(temp_handle);
}


std::string Sqlite3DbConnection::escapeString(const std::string &unescaped_string, const bool add_quotes) const {
    std::string escaped_string;
    escaped_string.reserve(unescaped_string.size() + (add_quotes ? 2 : 0));
    if (add_quotes)
        escaped_string += '\'';

    for (const char ch : unescaped_string) {
        if (ch == '\'')
            escaped_string += '\'';
        escaped_string += ch;
    }

    if (add_quotes)
        escaped_string += '\'';
    return escaped_string;
}


bool Sqlite3DbConnection::tableExists(const std::string &table_name) {
    queryOrThrow("SELECT name FROM sqlite_master WHERE type='table' AND name=" + escapeString(table_name, /* add_quotes = */ true));
    return not getLastResultSet().empty();
}
