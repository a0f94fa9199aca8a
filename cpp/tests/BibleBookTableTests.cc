/** \brief Test cases for the BibleBookTable class.
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
#include "BibleBookTable.h"
#include "FileUtil.h"
#include "UnitTest.h"


using namespace Scripture;


TEST(size_and_order) {
    const BibleBookTable &table(BibleBookTable::GetDefault());
    CHECK_EQ(table.size(), 66u);

    unsigned expected_order(0);
    for (const auto &entry : table.getEntries())
        CHECK_EQ(entry.order_, ++expected_order);

    CHECK_EQ(table.getEntries().front().canonical_name_, "Genesis");
    CHECK_EQ(table.getEntries().back().canonical_name_, "Revelation");
}


TEST(book_order) {
    const BibleBookTable &table(BibleBookTable::GetDefault());
    CHECK_EQ(table.getBookOrder("Genesis"), 1u);
    CHECK_EQ(table.getBookOrder("psalms"), 19u);
    CHECK_EQ(table.getBookOrder("Matthew"), 40u);
    CHECK_EQ(table.getBookOrder("Revelation"), 66u);
    CHECK_EQ(table.getBookOrder("Tobit"), BibleBookTable::UNKNOWN_BOOK_ORDER);
}


TEST(testaments) {
    const BibleBookTable &table(BibleBookTable::GetDefault());
    CHECK_EQ(table.getTestament("Malachi"), OLD_TESTAMENT);
    CHECK_EQ(table.getTestament("Matthew"), NEW_TESTAMENT);
    CHECK_EQ(table.getTestament("Sirach"), UNKNOWN_TESTAMENT);
}


TEST(lookup_abbreviation) {
    const BibleBookTable &table(BibleBookTable::GetDefault());
    CHECK_EQ(table.lookupAbbreviation("jn"), "John");
    CHECK_EQ(table.lookupAbbreviation("  JN "), "John");
    CHECK_EQ(table.lookupAbbreviation("ex"), "Exodus");
    CHECK_EQ(table.lookupAbbreviation("ps"), "Psalms");
    CHECK_EQ(table.lookupAbbreviation("1 cor"), "1 Corinthians");
    CHECK_EQ(table.lookupAbbreviation("song"), "Song of Songs");
    CHECK_EQ(table.lookupAbbreviation("rev"), "Revelation");

    // Full names resolve too.
    CHECK_EQ(table.lookupAbbreviation("genesis"), "Genesis");
    CHECK_EQ(table.lookupAbbreviation("1 John"), "1 John");

    CHECK_EQ(table.lookupAbbreviation("xyz"), "");
    CHECK_EQ(table.lookupAbbreviation(""), "");
}


TEST(shared_abbreviations) {
    const BibleBookTable &table(BibleBookTable::GetDefault());
    CHECK_EQ(table.lookupAbbreviation("ez"), "Ezekiel");
    CHECK_EQ(table.lookupAbbreviation("jud"), "Jude");
}


TEST(find_entry) {
    const BibleBookTable &table(BibleBookTable::GetDefault());
    const BibleBookTable::Entry * const entry(table.findEntry("EXODUS"));
    CHECK_TRUE(entry != nullptr);
    if (entry != nullptr) {
        CHECK_EQ(entry->canonical_name_, "Exodus");
        CHECK_TRUE(entry->abbreviations_.find("exod") != entry->abbreviations_.cend());
    }
    CHECK_TRUE(table.findEntry("ex") == nullptr);
}


TEST(add_abbreviation) {
    BibleBookTable table;
    table.addAbbreviation("Offb", "Revelation");
    CHECK_EQ(table.lookupAbbreviation("offb"), "Revelation");

    // Remapping an existing abbreviation is allowed.
    table.addAbbreviation("ez", "Ezra");
    CHECK_EQ(table.lookupAbbreviation("ez"), "Ezra");

    CHECK_THROWS(table.addAbbreviation("tob", "Tobit"), std::runtime_error);
    CHECK_THROWS(table.addAbbreviation("  ", "Genesis"), std::runtime_error);

    // The shared table must not be affected.
    CHECK_EQ(BibleBookTable::GetDefault().lookupAbbreviation("offb"), "");
}


TEST(extra_abbreviations_file) {
    const FileUtil::AutoTempFile temp_file("/tmp/BibleBookTableTests");
    FileUtil::WriteStringOrDie(temp_file.getFilePath(), "# German abbreviations\n"
                                                        "Offb = Revelation\n"
                                                        "\n"
                                                        "apg=Acts   # Apostelgeschichte\n"
                                                        "hld=song of songs\n");

    const BibleBookTable table(temp_file.getFilePath());
    CHECK_EQ(table.size(), 66u);
    CHECK_EQ(table.lookupAbbreviation("offb"), "Revelation");
    CHECK_EQ(table.lookupAbbreviation("APG"), "Acts");
    CHECK_EQ(table.lookupAbbreviation("hld"), "Song of Songs");
    CHECK_EQ(table.lookupAbbreviation("jn"), "John");
}


TEST(bad_extra_abbreviations_files) {
    CHECK_THROWS(BibleBookTable("/nonexistent/extra_abbreviations.map"), std::runtime_error);

    const FileUtil::AutoTempFile missing_equal_sign_file("/tmp/BibleBookTableTests");
    FileUtil::WriteStringOrDie(missing_equal_sign_file.getFilePath(), "offb Revelation\n");
    CHECK_THROWS(BibleBookTable(missing_equal_sign_file.getFilePath()), std::runtime_error);

    const FileUtil::AutoTempFile unknown_book_file("/tmp/BibleBookTableTests");
    FileUtil::WriteStringOrDie(unknown_book_file.getFilePath(), "tob=Tobit\n");
    CHECK_THROWS(BibleBookTable(unknown_book_file.getFilePath()), std::runtime_error);
}


TEST_MAIN(BibleBookTable)
