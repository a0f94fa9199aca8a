/** \file    IniFile.cc
 *  \brief   Implementation of class IniFile.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 *  \author  Dr. Gordon W. Paynter
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2026 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "IniFile.h"
#include <fstream>
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include <cstring>
#include "StringUtil.h"
#include "util.h"


void IniFile::Section::insert(const std::string &variable_name, const std::string &value) {
    if (unlikely(find(variable_name) != end()))
        throw std::runtime_error("in IniFile::Section::insert: duplicate variable name \"" + variable_name + "\" in section \""
                                 + section_name_ + "\"!");

    entries_.emplace_back(variable_name, value);
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const auto existing_entry(find(variable_name));
    return (existing_entry == end()) ? default_value : existing_entry->value_;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name, const unsigned default_value) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end())
        return default_value;

    unsigned number;
    if (not StringUtil::ToUnsigned(existing_entry->value_, &number))
        throw std::runtime_error("invalid unsigned entry \"" + variable_name + "\" in section \"" + section_name_ + "\"! (bad value is \""
                                 + existing_entry->value_ + "\")");

    return number;
}


double IniFile::Section::getDouble(const std::string &variable_name, const double default_value) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end())
        return default_value;

    double number;
    if (not StringUtil::ToDouble(existing_entry->value_, &number))
        throw std::runtime_error("invalid double entry \"" + variable_name + "\" in section \"" + section_name_ + "\"! (bad value is \""
                                 + existing_entry->value_ + "\")");

    return number;
}


IniFile::IniFile(const std::string &ini_file_name): ini_file_name_(ini_file_name), current_lineno_(0) {
    processFile();
}


const IniFile::Section *IniFile::getSection(const std::string &section_name) const {
    const auto section(std::find(sections_.cbegin(), sections_.cend(), section_name));
    return (section == sections_.cend()) ? nullptr : &*section;
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const {
    const Section * const section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getString(variable_name, default_value);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const {
    const Section * const section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getUnsigned(variable_name, default_value);
}


double IniFile::getDouble(const std::string &section_name, const std::string &variable_name, const double default_value) const {
    const Section * const section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getDouble(variable_name, default_value);
}


void IniFile::processSectionHeader(const std::string &line) {
    if (line[line.length() - 1] != ']')
        throw std::runtime_error("in IniFile::processSectionHeader: garbled section header on " + getLocation() + "!");

    const std::string section_name(StringUtil::Trim(line.substr(1, line.length() - 2), " \t"));
    if (section_name.empty())
        throw std::runtime_error("in IniFile::processSectionHeader: empty section name on " + getLocation() + "!");
    if (getSection(section_name) != nullptr)
        throw std::runtime_error("in IniFile::processSectionHeader: duplicate section \"" + section_name + "\" on " + getLocation() + "!");

    sections_.emplace_back(section_name);
}


namespace {


// Names start with a letter followed by letters, digits, hyphens, underscores and periods.
bool IsValidVariableName(const std::string &possible_variable_name) {
    if (unlikely(possible_variable_name.empty()))
        return false;

    std::string::const_iterator ch(possible_variable_name.begin());
    if (not std::isalpha(static_cast<unsigned char>(*ch)))
        return false;

    for (++ch; ch != possible_variable_name.end(); ++ch) {
        if (not std::isalnum(static_cast<unsigned char>(*ch)) and *ch != '-' and *ch != '_' and *ch != '.')
            return false;
    }

    return true;
}


void StripComment(std::string * const line) {
    bool inside_string_literal(false);
    for (size_t pos(0); pos < line->length(); ++pos) {
        if ((*line)[pos] == '"')
            inside_string_literal = not inside_string_literal;
        else if ((*line)[pos] == '#' and not inside_string_literal) {
            line->resize(pos);
            return;
        }
    }
}


} // unnamed namespace


void IniFile::processSectionEntry(const std::string &line) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos) { // A bare flag.
        if (unlikely(not IsValidVariableName(line)))
            throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + line + "\" on " + getLocation() + "!");

        sections_.back().insert(line, "true");
        return;
    }

    const std::string variable_name(StringUtil::Trim(line.substr(0, equal_sign), " \t"));
    if (not IsValidVariableName(variable_name))
        throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\" on " + getLocation()
                                 + "!");

    std::string value(StringUtil::Trim(line.substr(equal_sign + 1), " \t"));
    if (value.empty())
        throw std::runtime_error("in IniFile::processSectionEntry: missing variable value on " + getLocation() + "!");

    if (value[0] == '"') {
        if (value.length() == 1 or value[value.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processSectionEntry: improperly quoted value on " + getLocation() + "!");
        value = value.substr(1, value.length() - 2);
    }

    sections_.back().insert(variable_name, value);
}


void IniFile::processFile() {
    std::ifstream ini_file(ini_file_name_);
    if (ini_file.fail())
        throw std::runtime_error("in IniFile::processFile: can't open \"" + ini_file_name_ + "\"! (" + std::string(std::strerror(errno))
                                 + ")");

    std::string line;
    while (std::getline(ini_file, line)) {
        ++current_lineno_;

        StripComment(&line);
        StringUtil::TrimWhite(&line);
        if (line.empty())
            continue;

        if (line[0] == '[')
            processSectionHeader(line);
        else {
            // Entries before the first section header end up in an unnamed section.
            if (sections_.empty())
                sections_.emplace_back("");
            processSectionEntry(line);
        }
    }

    errno = 0;
}
