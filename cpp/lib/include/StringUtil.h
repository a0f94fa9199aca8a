/** \file    StringUtil.h
 *  \brief   Declarations for string utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 *  \author  Artur Kedzierski
 */

/*
 *  Copyright 2002-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *  Copyright 2002-2004 Dr. Johannes Ruscheinski.
 *  Copyright 2015-2026 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#ifndef STRING_UTIL_H
#define STRING_UTIL_H


#include <string>
#include <stdexcept>
#include <cstring>
#include <strings.h>
#include "util.h"


namespace StringUtil {


// Plain ASCII whitespace.  We deliberately leave out 0xA0 as it is part of multibyte UTF-8 sequences.
const std::string WHITE_SPACE(" \t\n\v\r\f");


/** \brief  Converts "s" to lowercase (ASCII only).
 *  \return The converted string.
 */
std::string ToLower(std::string * const s);


/** \brief  Returns a lowercase version of "s" (ASCII only). */
std::string ToLower(const std::string &s);


/** \brief   Removes all leading and trailing characters contained in "trim_set" from "s".
 *  \return  The trimmed string.
 */
std::string Trim(const std::string &trim_set, std::string * const s);
std::string Trim(const std::string &s, const std::string &trim_set);


inline std::string TrimWhite(std::string * const s) {
    return Trim(WHITE_SPACE, s);
}


inline std::string TrimWhite(const std::string &s) {
    std::string temp_s(s);
    return TrimWhite(&temp_s);
}


/** \brief   Converts "s" to an unsigned number.
 *  \return  False if "s" is not a valid non-negative number in base "base" or if it overflows an unsigned.
 *  \note    Leading whitespace is ignored but trailing characters are not.
 */
bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base = 10);


/** \brief   Converts "s" to a double.
 *  \return  False if "s" is empty or not a valid floating point number.
 */
bool ToDouble(const std::string &s, double * const n);



/** \brief   Does the given string start with the suggested prefix?
 *  \param   s            The string to test.
 *  \param   prefix       The prefix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or starts with the prefix "prefix."
 */
inline bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false) {
    return prefix.empty()
           or (s.length() >= prefix.length()
               and (ignore_case ? (::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)
                                : (std::strncmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)));
}


/** \brief  Joins the strings in "source" with "separator" between adjacent elements. */
template <typename StringContainer> std::string Join(const StringContainer &source, const std::string &separator) {
    std::string dest;
    for (typename StringContainer::const_iterator i(source.begin()); i != source.end(); ++i) {
        if (i != source.begin())
            dest += separator;
        dest += *i;
    }

    return dest;
}


/** \brief  Computes the edit distance between "s1" and "s2".
 *  \note   Insertions, deletions and substitutions all have unit cost.
 */
unsigned LevenshteinDistance(const std::string &s1, const std::string &s2, const bool ignore_case = false);


} // namespace StringUtil


#endif // ifndef STRING_UTIL_H
