/** \file    IniFile.h
 *  \brief   Declarations for an initialisation file parsing class.
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
#pragma once


#include <algorithm>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Parses "name = value" style configuration files that are grouped into "[section]"s.
 *  \note   Everything following a '#' that is not part of a double-quoted value is treated as a comment.  A bare name
 *          w/o an equal sign is a flag and gets the value "true".
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_;

    public:
        Entry(const std::string &name, const std::string &value): name_(name), value_(value) { }
    };

    class Section {
        std::string section_name_;
        std::vector<Entry> entries_;

    public:
        typedef std::vector<Entry>::const_iterator const_iterator;

    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }

        inline bool operator==(const std::string &section_name) const { return section_name == section_name_; }
        inline const std::string &getSectionName() const { return section_name_; }
        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }
        inline size_t size() const { return entries_.size(); }

        // \throws std::runtime_error if "variable_name" already exists.
        void insert(const std::string &variable_name, const std::string &value);

        // \return An iterator referencing the found entry or end() if no matching entry was found.
        inline const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }

        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        /** \brief   Retrieves an unsigned value from a configuration file.
         *  \param   variable_name  The name of the section entry to read.
         *  \param   default_value  A default to return if the variable is not defined.
         *  \throws  A std::runtime_error if the value was found but is not a valid unsigned number.
         */
        unsigned getUnsigned(const std::string &variable_name, const unsigned default_value) const;

        // \throws  A std::runtime_error if the value was found but cannot be converted to a double.
        double getDouble(const std::string &variable_name, const double default_value) const;
    };

private:
    std::vector<Section> sections_;
    std::string ini_file_name_;
    unsigned current_lineno_;

public:
    /** \brief  Construct an IniFile based on the named file.
     *  \throws std::runtime_error if the file can't be read or is syntactically invalid.
     */
    explicit IniFile(const std::string &ini_file_name);

    // \return A pointer to the named section or nullptr if there is no such section.
    const Section *getSection(const std::string &section_name) const;

    // The following return "default_value" if either the section or the variable is missing.
    std::string getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const;
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const;
    double getDouble(const std::string &section_name, const std::string &variable_name, const double default_value) const;

private:
    void processFile();
    void processSectionHeader(const std::string &line);
    void processSectionEntry(const std::string &line);
    std::string getLocation() const { return "line " + std::to_string(current_lineno_) + " in \"" + ini_file_name_ + "\""; }
};
