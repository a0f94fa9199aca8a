/** \brief In-memory book catalog and verse store for the scripture tests.
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
#pragma once


#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <vector>
#include "BibleStore.h"
#include "ScriptureReference.h"


// The Protestant canon w/ the IDs being the canonical positions.
inline std::vector<Scripture::BookRecord> GetTestBooks() {
    struct { const char *name_, *short_name_; unsigned chapter_count_; } const BOOKS[] = {
        { "Genesis", "Gen", 50 },        { "Exodus", "Exo", 40 },          { "Leviticus", "Lev", 27 },
        { "Numbers", "Num", 36 },        { "Deuteronomy", "Deu", 34 },     { "Joshua", "Jos", 24 },
        { "Judges", "Jdg", 21 },         { "Ruth", "Rut", 4 },             { "1 Samuel", "1Sa", 31 },
        { "2 Samuel", "2Sa", 24 },       { "1 Kings", "1Ki", 22 },         { "2 Kings", "2Ki", 25 },
        { "1 Chronicles", "1Ch", 29 },   { "2 Chronicles", "2Ch", 36 },    { "Ezra", "Ezr", 10 },
        { "Nehemiah", "Neh", 13 },       { "Esther", "Est", 10 },          { "Job", "Job", 42 },
        { "Psalms", "Psa", 150 },        { "Proverbs", "Pro", 31 },        { "Ecclesiastes", "Ecc", 12 },
        { "Song of Songs", "Sng", 8 },   { "Isaiah", "Isa", 66 },          { "Jeremiah", "Jer", 52 },
        { "Lamentations", "Lam", 5 },    { "Ezekiel", "Ezk", 48 },         { "Daniel", "Dan", 12 },
        { "Hosea", "Hos", 14 },          { "Joel", "Jol", 3 },             { "Amos", "Amo", 9 },
        { "Obadiah", "Oba", 1 },         { "Jonah", "Jon", 4 },            { "Micah", "Mic", 7 },
        { "Nahum", "Nah", 3 },           { "Habakkuk", "Hab", 3 },         { "Zephaniah", "Zep", 3 },
        { "Haggai", "Hag", 2 },          { "Zechariah", "Zec", 14 },       { "Malachi", "Mal", 4 },
        { "Matthew", "Mat", 28 },        { "Mark", "Mrk", 16 },            { "Luke", "Luk", 24 },
        { "John", "Jhn", 21 },           { "Acts", "Act", 28 },            { "Romans", "Rom", 16 },
        { "1 Corinthians", "1Co", 16 },  { "2 Corinthians", "2Co", 13 },   { "Galatians", "Gal", 6 },
        { "Ephesians", "Eph", 6 },       { "Philippians", "Php", 4 },      { "Colossians", "Col", 4 },
        { "1 Thessalonians", "1Th", 5 }, { "2 Thessalonians", "2Th", 3 },  { "1 Timothy", "1Ti", 6 },
        { "2 Timothy", "2Ti", 4 },       { "Titus", "Tit", 3 },            { "Philemon", "Phm", 1 },
        { "Hebrews", "Heb", 13 },        { "James", "Jas", 5 },            { "1 Peter", "1Pe", 5 },
        { "2 Peter", "2Pe", 3 },         { "1 John", "1Jn", 5 },           { "2 John", "2Jn", 1 },
        { "3 John", "3Jn", 1 },          { "Jude", "Jud", 1 },             { "Revelation", "Rev", 22 },
    };

    std::vector<Scripture::BookRecord> books;
    unsigned order(0);
    for (const auto &book : BOOKS) {
        ++order;
        books.emplace_back(order, book.name_, book.short_name_, book.chapter_count_, order,
                           (order <= 39) ? Scripture::OLD_TESTAMENT : Scripture::NEW_TESTAMENT);
    }

    return books;
}


// \return The book named "book_name" from GetTestBooks().
inline Scripture::BookRecord GetTestBook(const std::string &book_name) {
    for (const auto &book : GetTestBooks()) {
        if (book.name_ == book_name)
            return book;
    }

    throw std::runtime_error("in GetTestBook: unknown book \"" + book_name + "\"!");
}


class InMemoryBookCatalog : public Scripture::BookCatalog {
    mutable std::mutex mutex_;
    std::vector<Scripture::BookRecord> books_;

public:
    explicit InMemoryBookCatalog(const std::vector<Scripture::BookRecord> &books = GetTestBooks()): books_(books) { }

    std::vector<Scripture::BookRecord> listBooks() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return books_;
    }

    void setBooks(const std::vector<Scripture::BookRecord> &books) {
        std::lock_guard<std::mutex> lock(mutex_);
        books_ = books;
    }
};


// Every chapter has "default_verse_count" verses unless overridden w/ setVerseCount().  Counts all calls to getVerses().
class CountingVerseStore : public Scripture::VerseStore {
    typedef std::tuple<std::string, unsigned, unsigned> Key; // (version ID, book ID, chapter)

    mutable std::mutex mutex_;
    const unsigned default_verse_count_;
    std::map<Key, unsigned> verse_counts_;
    std::set<std::pair<unsigned, unsigned>> failing_chapters_; // (book ID, chapter)
    std::chrono::milliseconds delay_;
    mutable std::atomic<unsigned> fetch_count_;

public:
    explicit CountingVerseStore(const unsigned default_verse_count = 25)
        : default_verse_count_(default_verse_count), delay_(0), fetch_count_(0) { }

    std::vector<Scripture::Verse> getVerses(const std::string &version_id, const unsigned book_id,
                                            const unsigned chapter) const override
    {
        ++fetch_count_;

        std::chrono::milliseconds delay;
        unsigned verse_count(default_verse_count_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failing_chapters_.find(std::make_pair(book_id, chapter)) != failing_chapters_.cend())
                throw std::runtime_error("simulated failure for book " + std::to_string(book_id) + ", chapter "
                                         + std::to_string(chapter));
            const auto key_and_count(verse_counts_.find(Key(version_id, book_id, chapter)));
            if (key_and_count != verse_counts_.cend())
                verse_count = key_and_count->second;
            delay = delay_;
        }
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);

        std::vector<Scripture::Verse> verses;
        for (unsigned verse(1); verse <= verse_count; ++verse)
            verses.emplace_back(chapter, verse, "verse " + std::to_string(verse));
        return verses;
    }

    void setVerseCount(const std::string &version_id, const unsigned book_id, const unsigned chapter, const unsigned verse_count) {
        std::lock_guard<std::mutex> lock(mutex_);
        verse_counts_[Key(version_id, book_id, chapter)] = verse_count;
    }

    void setFailingChapter(const unsigned book_id, const unsigned chapter) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_chapters_.emplace(book_id, chapter);
    }

    // Every call to getVerses() sleeps for "delay" which makes concurrent requests overlap.
    void setDelay(const std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_ = delay;
    }

    inline unsigned getFetchCount() const { return fetch_count_; }
    inline void resetFetchCount() { fetch_count_ = 0; }
};
