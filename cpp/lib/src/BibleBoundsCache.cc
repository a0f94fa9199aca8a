/** \file   BibleBoundsCache.cc
 *  \brief  Implementation of the BibleBoundsCache class.
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
#include "BibleBoundsCache.h"
#include <algorithm>
#include <stdexcept>
#include "util.h"


namespace Scripture {


BibleBoundsCache::BibleBoundsCache(const VerseStore &verse_store, const unsigned default_verse_count)
    : verse_store_(verse_store), default_verse_count_(default_verse_count)
{
    if (unlikely(default_verse_count_ == 0))
        throw std::runtime_error("in BibleBoundsCache::BibleBoundsCache: the default verse count must be positive!");
}


ChapterVerseInfo BibleBoundsCache::populate(const BookRecord &book, const std::string &version_id) const {
    LOG_DEBUG("loading the bounds of \"" + book.name_ + "\" (version " + version_id + ").");

    ChapterVerseInfo info(book.id_, book.chapter_count_);
    unsigned failed_chapter_count(0);
    for (unsigned chapter(1); chapter <= book.chapter_count_; ++chapter) {
        try {
            unsigned max_verse(0);
            for (const auto &verse : verse_store_.getVerses(version_id, book.id_, chapter))
                max_verse = std::max(max_verse, verse.verse_);
            info.per_chapter_verse_count_[chapter] = max_verse;
            info.max_verse_seen_ = std::max(info.max_verse_seen_, max_verse);
        } catch (const std::exception &x) {
            LOG_WARNING("failed to load the verses of \"" + book.name_ + " " + std::to_string(chapter) + "\" (version "
                        + version_id + "): " + std::string(x.what()));
            info.per_chapter_verse_count_[chapter] = default_verse_count_;
            ++failed_chapter_count;
        }
    }

    LOG_DEBUG("loaded the bounds of \"" + book.name_ + "\" (version " + version_id + "), "
              + std::to_string(failed_chapter_count) + " chapter(s) failed.");
    return info;
}


ChapterVerseInfo BibleBoundsCache::getBounds(const BookRecord &book, const std::string &version_id) {
    const Key key(book.id_, version_id);

    std::unique_lock<std::mutex> lock(mutex_);
    const auto key_and_entry(key_to_entry_map_.find(key));
    if (key_and_entry != key_to_entry_map_.end()) {
        // Holding on to the entry keeps it alive should setVersion() drop it while we wait.
        const std::shared_ptr<CacheEntry> entry(key_and_entry->second);
        entry->population_finished_.wait(lock, [&entry] { return entry->populated_ or entry->failed_; });
        if (unlikely(entry->failed_))
            throw std::runtime_error("in BibleBoundsCache::getBounds: loading the bounds of \"" + book.name_ + "\" (version "
                                     + version_id + ") failed!");
        return entry->info_;
    }

    std::shared_ptr<CacheEntry> entry;
    if (dropped_version_ids_.find(version_id) == dropped_version_ids_.end()) {
        entry = std::make_shared<CacheEntry>();
        key_to_entry_map_.emplace(key, entry);
    } else
        LOG_DEBUG("not caching the bounds of \"" + book.name_ + "\" as version " + version_id + " has been dropped.");
    lock.unlock();

    ChapterVerseInfo info;
    try {
        info = populate(book, version_id);
    } catch (const std::exception &x) {
        LOG_WARNING("loading the bounds of \"" + book.name_ + "\" failed: " + std::string(x.what()));
        if (entry != nullptr) {
            lock.lock();
            entry->failed_ = true;
            const auto current_key_and_entry(key_to_entry_map_.find(key));
            if (current_key_and_entry != key_to_entry_map_.end() and current_key_and_entry->second == entry)
                key_to_entry_map_.erase(current_key_and_entry);
            entry->population_finished_.notify_all();
        }
        throw;
    }

    if (entry != nullptr) {
        lock.lock();
        entry->info_ = info;
        entry->populated_ = true;
        const auto current_key_and_entry(key_to_entry_map_.find(key));
        if (current_key_and_entry == key_to_entry_map_.end() or current_key_and_entry->second != entry)
            LOG_DEBUG("not caching the bounds of \"" + book.name_ + "\" (version " + version_id + ") as they have been dropped.");
        entry->population_finished_.notify_all();
    }

    return info;
}


bool BibleBoundsCache::lookup(const unsigned book_id, const std::string &version_id, ChapterVerseInfo * const info) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key_and_entry(key_to_entry_map_.find(Key(book_id, version_id)));
    if (key_and_entry == key_to_entry_map_.cend() or not key_and_entry->second->populated_)
        return false;

    *info = key_and_entry->second->info_;
    return true;
}


bool BibleBoundsCache::isLoading(const unsigned book_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &key_and_entry : key_to_entry_map_) {
        if (key_and_entry.first.first == book_id and not key_and_entry.second->populated_)
            return true;
    }

    return false;
}


void BibleBoundsCache::setVersion(const std::string &version_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (version_id == current_version_id_)
        return;

    // Waiters on dropped entries keep their own references, so they still get the results of populations in progress.
    unsigned dropped_count(0);
    for (auto key_and_entry(key_to_entry_map_.begin()); key_and_entry != key_to_entry_map_.end();) {
        if (key_and_entry->first.second != version_id) {
            dropped_version_ids_.insert(key_and_entry->first.second);
            key_and_entry = key_to_entry_map_.erase(key_and_entry);
            ++dropped_count;
        } else
            ++key_and_entry;
    }
    if (not current_version_id_.empty())
        dropped_version_ids_.insert(current_version_id_);
    dropped_version_ids_.erase(version_id);
    current_version_id_ = version_id;

    LOG_INFO("switched to version \"" + version_id + "\", dropped " + std::to_string(dropped_count) + " cached book(s).");
}


std::string BibleBoundsCache::getVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_version_id_;
}


void BibleBoundsCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    key_to_entry_map_.clear();
}


size_t BibleBoundsCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(key_to_entry_map_.cbegin(), key_to_entry_map_.cend(),
                         [](const std::pair<const Key, std::shared_ptr<CacheEntry>> &key_and_entry) {
                             return key_and_entry.second->populated_;
                         });
}


} // namespace Scripture
