/** \file   ScriptureResolver.h
 *  \brief  Entry point for parsing, matching, validating and autocompleting scripture references.
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
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "AsyncUtil.h"
#include "BibleBookMatcher.h"
#include "BibleBookTable.h"
#include "BibleBoundsCache.h"
#include "BibleReferenceParser.h"
#include "BibleReferenceSuggester.h"
#include "BibleReferenceValidator.h"
#include "BibleStore.h"
#include "IniFile.h"
#include "ScriptureReference.h"
#include "ThreadUtil.h"


namespace Scripture {


class ScriptureResolver {
public:
    struct Config {
        double confident_score_;
        double min_fuzzy_similarity_;
        unsigned max_matches_;
        unsigned suggestion_book_matches_;
        double high_confidence_score_;
        unsigned suggestion_limit_;
        unsigned default_verse_count_;
        std::string database_path_;
        std::string default_version_;
        std::string extra_abbreviations_file_;

    public:
        // The built-in defaults.
        Config();

        /** \brief Reads the [Matcher], [Suggestions], [Validation], [Database] and [Abbreviations] sections.  Missing
         *         entries keep their built-in defaults.
         *  \throws std::runtime_error on malformed or out-of-range values.
         */
        explicit Config(const IniFile &ini_file);
    };

    // Receives the generation of the request that produced "result".
    typedef std::function<void(const unsigned generation, const ValidationResult &result)> ValidationCallback;

private:
    struct ValidationRequest {
        ParsedReference reference_;
        std::string version_id_;
        unsigned generation_;
        ValidationCallback callback_;

    public:
        ValidationRequest(const ParsedReference &reference, const std::string &version_id, const unsigned generation,
                          const ValidationCallback &callback)
            : reference_(reference), version_id_(version_id), generation_(generation), callback_(callback) { }
    };

    typedef AsyncUtil::Tasklet<ValidationRequest, ValidationResult> ValidationTasklet;

    const BookCatalog &book_catalog_;
    const Config config_;
    const BibleBookTable book_table_;
    const BibleBookMatcher book_matcher_;
    const BibleReferenceParser reference_parser_;
    const BibleReferenceSuggester reference_suggester_;
    BibleBoundsCache bounds_cache_;
    const BibleReferenceValidator reference_validator_;

    mutable std::mutex books_mutex_;
    std::shared_ptr<const std::vector<BookRecord>> books_;

    std::atomic<unsigned> latest_generation_;
    std::mutex delivery_mutex_; // Serialises the staleness check and the callback w/ issuing new generations.
    ThreadUtil::ThreadSafeCounter<unsigned> pending_validation_count_;
    std::mutex tasklets_mutex_;
    std::list<std::shared_ptr<ValidationTasklet>> tasklets_;

public:
    /** \note "version_id" is the Bible version that validations are initially done against.  The catalog is read once
     *        during construction and again on each call to reloadCatalog().
     *  \throws std::runtime_error if the extra abbreviations file named in "config" can't be loaded.
     */
    ScriptureResolver(const BookCatalog &book_catalog, const VerseStore &verse_store, const std::string &version_id,
                      const Config &config = Config());
    ScriptureResolver(const ScriptureResolver &) = delete;
    ScriptureResolver &operator=(const ScriptureResolver &) = delete;

    // Waits for all outstanding asynchronous validations.
    ~ScriptureResolver();

    inline const Config &getConfig() const { return config_; }
    inline const BibleBookTable &getBookTable() const { return book_table_; }

    // \return A snapshot of the current book list.
    std::shared_ptr<const std::vector<BookRecord>> getBooks() const;

    ParsedReference parseReference(const std::string &raw_input) const;

    // \note A "limit" of 0 selects the configured maximum.
    std::vector<BookMatch> findBookMatches(const std::string &input, const size_t limit = 0) const;
    std::optional<BookMatch> getBestMatch(const std::string &input) const;

    // \note A "limit" of 0 selects the configured suggestion limit.
    std::vector<Suggestion> generateSuggestions(const std::string &input, const size_t limit = 0) const;
    std::vector<Suggestion> getCompletionSuggestions(const BookRecord &book, const std::string &current_input) const;

    // Validates against the current version and blocks until the result is available.
    ValidationResult validateReference(const ParsedReference &reference);

    /** \brief Starts validating "reference" against the current version on a background thread.
     *  \return The generation of this request.
     *  \note   "callback" is invoked on the background thread, and only if no later call to this function or to
     *          setVersion() has superseded the request by the time the result is available.  Once this function or
     *          setVersion() has returned no callback of an older request is running or will be run.  Callbacks must
     *          therefore not call back into validateReferenceAsync() or setVersion().  Bounds fetched for a superseded
     *          request remain cached unless its version has been dropped.
     */
    unsigned validateReferenceAsync(const ParsedReference &reference, const ValidationCallback &callback);

    inline unsigned getLatestGeneration() const { return latest_generation_; }
    inline unsigned getPendingValidationCount() const { return pending_validation_count_; }
    void waitForPendingValidations();

    // Switches the Bible version.  Drops all cached bounds of other versions and supersedes pending validations.
    void setVersion(const std::string &version_id);
    inline std::string getVersion() const { return bounds_cache_.getVersion(); }

    // Replaces the book list w/ a fresh copy from the catalog and drops all cached bounds.
    void reloadCatalog();

    // \return The cached chapter count of "book" for the current version, or the catalog's if nothing has been cached.
    unsigned getMaxChapter(const BookRecord &book) const;

    // \return The number of verses in "chapter" for the current version, fetching the bounds of "book" if necessary.
    unsigned getMaxVerse(const BookRecord &book, const unsigned chapter);

    inline bool isLoadingBook(const unsigned book_id) const { return bounds_cache_.isLoading(book_id); }

private:
    std::shared_ptr<ValidationTasklet> startValidation(const ParsedReference &reference, const unsigned generation,
                                                       const ValidationCallback &callback);
    void runValidation(const ValidationRequest &request, ValidationResult * const result);
    void pruneCompletedTasklets();
    unsigned startNewGeneration();
};


} // namespace Scripture
