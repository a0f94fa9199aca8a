/** \file   DbRow.cc
 *  \brief  Implementation of the DbRow class.
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
#include "DbRow.h"
#include <stdexcept>
#include "util.h"


std::string DbRow::operator[](const size_t i) const {
    if (unlikely(i >= size()))
        throw std::out_of_range("index out of range in DbRow::operator[]: max. index is " + std::to_string(static_cast<int>(size()) - 1)
                                + ", actual index was " + std::to_string(i) + "!");

    const char * const text(reinterpret_cast<const char *>(::sqlite3_column_text(stmt_handle_, i)));
    if (text == nullptr)
        throw std::out_of_range("in DbRow::operator[]: trying to access a NULL value in column " + std::to_string(i) + " as a string!");
    const auto field_size(::sqlite3_column_bytes(stmt_handle_, i));
    return std::string(text, field_size);
}


std::string DbRow::operator[](const std::string &column_name) const {
    return operator[](getColumnIndex(column_name));
}


std::string DbRow::getValue(const std::string &column_name, const std::string &default_value) const {
    const size_t index(getColumnIndex(column_name));
    if (isNull(index))
        return default_value;

    return operator[](index);
}


long long DbRow::getInteger(const std::string &column_name) const {
    const size_t index(getColumnIndex(column_name));
    if (unlikely(isNull(index)))
        throw std::out_of_range("in DbRow::getInteger: column \"" + column_name + "\" is NULL!");

    return ::sqlite3_column_int64(stmt_handle_, index);
}


bool DbRow::isNull(const size_t i) const {
    if (unlikely(i >= size()))
        throw std::out_of_range("in DbRow::isNull: max. index is " + std::to_string(static_cast<int>(size()) - 1)
                                + ", actual index was " + std::to_string(i) + "!");

    return ::sqlite3_column_type(stmt_handle_, i) == SQLITE_NULL;
}


bool DbRow::isNull(const std::string &column_name) const {
    return isNull(getColumnIndex(column_name));
}


size_t DbRow::getColumnIndex(const std::string &column_name) const {
    if (unlikely(field_name_to_index_map_ == nullptr))
        throw std::out_of_range("in DbRow::getColumnIndex: empty row has no column \"" + column_name + "\"!");

    const auto name_and_index_iter(field_name_to_index_map_->find(column_name));
    if (unlikely(name_and_index_iter == field_name_to_index_map_->cend()))
        throw std::out_of_range("in DbRow::getColumnIndex: invalid column name \"" + column_name + "\"!");

    return name_and_index_iter->second;
}
