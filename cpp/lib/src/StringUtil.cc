/** \file    StringUtil.cc
 *  \brief   Implementation of string utility functions.
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

#include "StringUtil.h"
#include <algorithm>
#include <vector>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>


namespace StringUtil {


std::string ToLower(std::string * const s) {
    for (std::string::iterator ch(s->begin()); ch != s->end(); ++ch)
        *ch = std::tolower(static_cast<unsigned char>(*ch));

    return *s;
}


std::string ToLower(const std::string &s) {
    std::string result(s);
    return ToLower(&result);
}


std::string Trim(const std::string &trim_set, std::string * const s) {
    const std::string::size_type first(s->find_first_not_of(trim_set));
    if (first == std::string::npos) {
        s->clear();
        return *s;
    }

    const std::string::size_type last(s->find_last_not_of(trim_set));
    *s = s->substr(first, last - first + 1);

    return *s;
}


std::string Trim(const std::string &s, const std::string &trim_set) {
    std::string temp_s(s);
    return Trim(trim_set, &temp_s);
}


bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base) {
    std::string::const_iterator ch(s.begin());
    while (ch != s.end() and std::isspace(static_cast<unsigned char>(*ch)))
        ++ch;
    if (unlikely(ch == s.end() or *ch == '-' or *ch == '+'))
        return false;

    char *end_ptr;
    errno = 0;
    const unsigned long ul(std::strtoul(s.c_str(), &end_ptr, base));
    *n = static_cast<unsigned>(ul);

    const bool ok((*end_ptr == '\0') and (errno == 0) and (ul <= UINT_MAX));
    errno = 0;
    return ok;
}


bool ToDouble(const std::string &s, double * const n) {
    if (unlikely(s.empty()))
        return false;

    char *end_ptr;
    errno = 0;
    *n = std::strtod(s.c_str(), &end_ptr);

    const bool ok((*end_ptr == '\0') and (errno == 0));
    errno = 0;
    return ok;
}


unsigned LevenshteinDistance(const std::string &s1, const std::string &s2, const bool ignore_case) {
    const std::string a(ignore_case ? ToLower(s1) : s1), b(ignore_case ? ToLower(s2) : s2);
    const std::size_t len1(a.size()), len2(b.size());

    std::vector<std::vector<unsigned>> matrix(len1 + 1, std::vector<unsigned>(len2 + 1));
    for (std::size_t i(0); i <= len1; ++i)
        matrix[i][0] = i;
    for (std::size_t j(0); j <= len2; ++j)
        matrix[0][j] = j;

    for (std::size_t i(1); i <= len1; ++i) {
        for (std::size_t j(1); j <= len2; ++j) {
            const unsigned substitution_cost(a[i - 1] == b[j - 1] ? 0 : 1);
            matrix[i][j] = std::min({ matrix[i - 1][j] + 1, matrix[i][j - 1] + 1, matrix[i - 1][j - 1] + substitution_cost });
        }
    }

    return matrix[len1][len2];
}


} // namespace StringUtil
