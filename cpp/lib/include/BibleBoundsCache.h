/** \file   BibleBoundsCache.h
 *  \brief  Lazily loaded chapter and verse counts per book and Bible version.
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


#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include "BibleStore.h"
#include "ScriptureReference.h"


namespace Scripture {


/** \brief Caches ChapterVerseInfo instances keyed by (book ID, version ID).
 *
 *  On a miss the verses of every chapter of the book are fetched from the VerseStore, one chapter at a time.  Only a
 *  single thread populates a given key.  Other threads asking for the same key while it is being populated wait on the
 *  entry's own condition variable and then share its result, even if the entry gets dropped in the meantime.  A chapter
 *  whose verses can't be fetched is recorded with the default verse count.
 */
class BibleBoundsCache {
public:
    static constexpr unsigned DEFAULT_VERSE_COUNT = 31;

private:
    typedef std::pair<unsigned, std::string> Key; // (book ID, version ID)

    // Guarded by the cache's mutex.
    struct CacheEntry {
        bool populated_;
        bool failed_;
        ChapterVerseInfo info_;
        std::condition_variable population_finished_;

    public:
        CacheEntry(): populated_(false), failed_(false) { }
    };

    const VerseStore &verse_store_;
    const unsigned default_verse_count_;
    mutable std::mutex mutex_;
    std::map<Key, std::shared_ptr<CacheEntry>> key_to_entry_map_;
    std::string current_version_id_;
    std::set<std::string> dropped_version_ids_;

public:
    explicit BibleBoundsCache(const VerseStore &verse_store, const unsigned default_verse_count = DEFAULT_VERSE_COUNT);
    BibleBoundsCache(const BibleBoundsCache &) = delete;
    BibleBoundsCache &operator=(const BibleBoundsCache &) = delete;

    inline unsigned getDefaultVerseCount() const { return default_verse_count_; }

    /** \note Blocks while the bounds are being fetched, either by this call or by a concurrent one for the same key.
     *        Bounds of a version that has been dropped by setVersion() are fetched but not cached.
     *  \throws std::runtime_error if the concurrent population this call waited for failed.
     */
    ChapterVerseInfo getBounds(const BookRecord &book, const std::string &version_id);

    // \return True if the bounds are already cached.  Never triggers any fetching.
    bool lookup(const unsigned book_id, const std::string &version_id, ChapterVerseInfo * const info) const;

    // \return True if bounds of "book_id" are currently being fetched for any version.
    bool isLoading(const unsigned book_id) const;

    /** \brief Makes "version_id" the current version and drops the bounds of all other versions.
     *  \note  Populations of other versions that are still in progress complete and are handed to their waiters but
     *         their results won't be cached.  Nothing is cached for the dropped versions until they become current again.
     */
    void setVersion(const std::string &version_id);

    std::string getVersion() const;

    // Drops all cached bounds.
    void clear();

    // \return The number of cached, fully populated, entries.
    size_t size() const;

private:
    ChapterVerseInfo populate(const BookRecord &book, const std::string &version_id) const;
};


} // namespace Scripture
