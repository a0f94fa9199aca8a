/** \brief Test cases for the IniFile class.
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
#include <stdexcept>
#include "FileUtil.h"
#include "IniFile.h"
#include "UnitTest.h"


namespace {


// Writes "contents" to "temp_file" and parses it.
IniFile ParseIniFile(const FileUtil::AutoTempFile &temp_file, const std::string &contents) {
    FileUtil::WriteStringOrDie(temp_file.getFilePath(), contents);
    return IniFile(temp_file.getFilePath());
}


} // unnamed namespace


TEST(sections_and_entries) {
    const FileUtil::AutoTempFile temp_file("/tmp/IniFileTests", ".conf");
    const IniFile ini_file(ParseIniFile(temp_file, "top_level = 1\n"
                                                   "# A comment line.\n"
                                                   "[Matcher]\n"
                                                   "  confident_score = 900   # trailing comment\n"
                                                   "fuzzy_min_similarity=0.25\n"
                                                   "strict\n"
                                                   "\n"
                                                   "[ Database ]\n"
                                                   "path = \"/var/lib/bibles #1.sqlite\"\n"));

    CHECK_EQ(ini_file.getUnsigned("", "top_level", 0), 1u);
    CHECK_EQ(ini_file.getUnsigned("Matcher", "confident_score", 0), 900u);
    CHECK_NEAR(ini_file.getDouble("Matcher", "fuzzy_min_similarity", 0.0), 0.25, 1e-9);
    CHECK_EQ(ini_file.getString("Matcher", "strict", "false"), "true");
    CHECK_EQ(ini_file.getString("Database", "path", ""), "/var/lib/bibles #1.sqlite");

    const IniFile::Section * const matcher_section(ini_file.getSection("Matcher"));
    CHECK_TRUE(matcher_section != nullptr);
    if (matcher_section != nullptr) {
        CHECK_EQ(matcher_section->size(), 3u);
        CHECK_EQ(matcher_section->getSectionName(), "Matcher");
    }
    CHECK_TRUE(ini_file.getSection("Abbreviations") == nullptr);
}


TEST(defaults) {
    const FileUtil::AutoTempFile temp_file("/tmp/IniFileTests", ".conf");
    const IniFile ini_file(ParseIniFile(temp_file, "[Matcher]\nmax_matches = 3\n"));

    CHECK_EQ(ini_file.getUnsigned("Matcher", "limit", 7), 7u);
    CHECK_EQ(ini_file.getUnsigned("Suggestions", "max_matches", 5), 5u);
    CHECK_NEAR(ini_file.getDouble("Matcher", "confident_score", 700.0), 700.0, 1e-9);
    CHECK_EQ(ini_file.getString("Database", "default_version", "KJV"), "KJV");
}


TEST(invalid_values) {
    const FileUtil::AutoTempFile temp_file("/tmp/IniFileTests", ".conf");
    const IniFile ini_file(ParseIniFile(temp_file, "[Matcher]\nmax_matches = many\nconfident_score = -\n"));

    CHECK_THROWS(ini_file.getUnsigned("Matcher", "max_matches", 10), std::runtime_error);
    CHECK_THROWS(ini_file.getDouble("Matcher", "confident_score", 700.0), std::runtime_error);
}


TEST(syntax_errors) {
    const FileUtil::AutoTempFile temp_file("/tmp/IniFileTests", ".conf");

    CHECK_THROWS(ParseIniFile(temp_file, "[Matcher\nmax_matches = 3\n"), std::runtime_error);
    CHECK_THROWS(ParseIniFile(temp_file, "[ ]\n"), std::runtime_error);
    CHECK_THROWS(ParseIniFile(temp_file, "[Matcher]\n[Matcher]\n"), std::runtime_error);
    CHECK_THROWS(ParseIniFile(temp_file, "[Matcher]\nmax_matches = 3\nmax_matches = 4\n"), std::runtime_error);
    CHECK_THROWS(ParseIniFile(temp_file, "[Matcher]\n1st = 3\n"), std::runtime_error);
    CHECK_THROWS(ParseIniFile(temp_file, "[Matcher]\nmax_matches =\n"), std::runtime_error);
    CHECK_THROWS(ParseIniFile(temp_file, "[Database]\npath = \"/var/lib\n"), std::runtime_error);
    CHECK_THROWS(IniFile("/nonexistent/scripture_resolver.conf"), std::runtime_error);
}


TEST_MAIN(IniFile)
