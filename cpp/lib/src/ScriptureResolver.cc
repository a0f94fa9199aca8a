/** \file   ScriptureResolver.cc
 *  \brief  Implementation of the ScriptureResolver class.
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
#include "ScriptureResolver.h"
#include <stdexcept>
#include "util.h"


namespace Scripture {


ScriptureResolver::Config::Config()
    : confident_score_(BibleReferenceParser::DEFAULT_CONFIDENT_SCORE),
      min_fuzzy_similarity_(BibleBookMatcher::DEFAULT_MIN_FUZZY_SIMILARITY), max_matches_(5),
      suggestion_book_matches_(BibleReferenceSuggester::DEFAULT_BOOK_MATCH_COUNT),
      high_confidence_score_(BibleReferenceSuggester::DEFAULT_HIGH_CONFIDENCE_SCORE), suggestion_limit_(5),
      default_verse_count_(BibleBoundsCache::DEFAULT_VERSE_COUNT)
{
}


namespace {


void CheckRange(const std::string &section_and_name, const double value, const double min, const double max) {
    if (value < min or value > max)
        throw std::runtime_error("in ScriptureResolver::Config::Config: " + section_and_name + " must be in the range ["
                                 + std::to_string(min) + "," + std::to_string(max) + "]!");
}


} // unnamed namespace


ScriptureResolver::Config::Config(const IniFile &ini_file): Config() {
    confident_score_ = ini_file.getDouble("Matcher", "confident_score", confident_score_);
    CheckRange("Matcher.confident_score", confident_score_, 0.0, BibleBookMatcher::EXACT_SCORE);
    min_fuzzy_similarity_ = ini_file.getDouble("Matcher", "fuzzy_min_similarity", min_fuzzy_similarity_);
    CheckRange("Matcher.fuzzy_min_similarity", min_fuzzy_similarity_, 0.0, 1.0);
    max_matches_ = ini_file.getUnsigned("Matcher", "max_matches", max_matches_);
    CheckRange("Matcher.max_matches", max_matches_, 1, 1000);

    suggestion_book_matches_ = ini_file.getUnsigned("Suggestions", "book_matches", suggestion_book_matches_);
    CheckRange("Suggestions.book_matches", suggestion_book_matches_, 1, 1000);
    high_confidence_score_ = ini_file.getDouble("Suggestions", "high_confidence_score", high_confidence_score_);
    CheckRange("Suggestions.high_confidence_score", high_confidence_score_, 0.0, BibleBookMatcher::EXACT_SCORE);
    suggestion_limit_ = ini_file.getUnsigned("Suggestions", "limit", suggestion_limit_);
    CheckRange("Suggestions.limit", suggestion_limit_, 1, 1000);

    default_verse_count_ = ini_file.getUnsigned("Validation", "default_verse_count", default_verse_count_);
    CheckRange("Validation.default_verse_count", default_verse_count_, 1, 1000);

    database_path_ = ini_file.getString("Database", "path", database_path_);
    default_version_ = ini_file.getString("Database", "default_version", default_version_);
    extra_abbreviations_file_ = ini_file.getString("Abbreviations", "extra_map_file", extra_abbreviations_file_);
}


ScriptureResolver::ScriptureResolver(const BookCatalog &book_catalog, const VerseStore &verse_store, const std::string &version_id,
                                     const Config &config)
    : book_catalog_(book_catalog), config_(config),
      book_table_(config_.extra_abbreviations_file_.empty() ? BibleBookTable() : BibleBookTable(config_.extra_abbreviations_file_)),
      book_matcher_(book_table_, config_.min_fuzzy_similarity_), reference_parser_(book_matcher_, config_.confident_score_),
      reference_suggester_(book_matcher_, config_.suggestion_book_matches_, config_.high_confidence_score_),
      bounds_cache_(verse_store, config_.default_verse_count_), reference_validator_(&bounds_cache_),
      books_(std::make_shared<const std::vector<BookRecord>>(book_catalog_.listBooks())), latest_generation_(0)
{
    bounds_cache_.setVersion(version_id);
}


ScriptureResolver::~ScriptureResolver() {
    waitForPendingValidations();
}


std::shared_ptr<const std::vector<BookRecord>> ScriptureResolver::getBooks() const {
    std::lock_guard<std::mutex> lock(books_mutex_);
    return books_;
}


ParsedReference ScriptureResolver::parseReference(const std::string &raw_input) const {
    return reference_parser_.parse(raw_input, *getBooks());
}


std::vector<BookMatch> ScriptureResolver::findBookMatches(const std::string &input, const size_t limit) const {
    return book_matcher_.findMatches(input, *getBooks(), (limit == 0) ? config_.max_matches_ : limit);
}


std::optional<BookMatch> ScriptureResolver::getBestMatch(const std::string &input) const {
    return book_matcher_.getBestMatch(input, *getBooks());
}


std::vector<Suggestion> ScriptureResolver::generateSuggestions(const std::string &input, const size_t limit) const {
    return reference_suggester_.generateSuggestions(input, *getBooks(), (limit == 0) ? config_.suggestion_limit_ : limit);
}


std::vector<Suggestion> ScriptureResolver::getCompletionSuggestions(const BookRecord &book, const std::string &current_input) const {
    return reference_suggester_.getCompletionSuggestions(book, current_input);
}


void ScriptureResolver::runValidation(const ValidationRequest &request, ValidationResult * const result) {
    *result = reference_validator_.validate(request.reference_, request.version_id_);
    if (not request.callback_)
        return;

    std::lock_guard<std::mutex> delivery_lock(delivery_mutex_);
    if (request.generation_ != latest_generation_) {
        LOG_DEBUG("discarding the result of validation #" + std::to_string(request.generation_) + " (\""
                  + FormatReference(request.reference_) + "\") as it has been superseded.");
        return;
    }
    request.callback_(request.generation_, *result);
}


std::shared_ptr<ScriptureResolver::ValidationTasklet> ScriptureResolver::startValidation(const ParsedReference &reference,
                                                                                         const unsigned generation,
                                                                                         const ValidationCallback &callback)
{
    auto tasklet(std::make_shared<ValidationTasklet>(
        &pending_validation_count_, "validate \"" + FormatReference(reference) + "\"",
        [this](const ValidationRequest &request, ValidationResult * const result) { runValidation(request, result); },
        std::make_unique<ValidationResult>(false, "Unable to validate reference"),
        std::make_unique<ValidationRequest>(reference, bounds_cache_.getVersion(), generation, callback)));
    tasklet->start();

    return tasklet;
}


void ScriptureResolver::pruneCompletedTasklets() {
    tasklets_.remove_if([](const std::shared_ptr<ValidationTasklet> &tasklet) { return tasklet->isComplete(); });
}


ValidationResult ScriptureResolver::validateReference(const ParsedReference &reference) {
    AsyncUtil::Future<ValidationRequest, ValidationResult> future(startValidation(reference, /* generation = */ 0, ValidationCallback()));
    if (not future.hasResult())
        return ValidationResult(false, "Unable to validate reference");
    return future.getResult();
}


unsigned ScriptureResolver::startNewGeneration() {
    std::lock_guard<std::mutex> delivery_lock(delivery_mutex_);
    return ++latest_generation_;
}


unsigned ScriptureResolver::validateReferenceAsync(const ParsedReference &reference, const ValidationCallback &callback) {
    const unsigned generation(startNewGeneration());

    std::lock_guard<std::mutex> lock(tasklets_mutex_);
    pruneCompletedTasklets();
    tasklets_.emplace_back(startValidation(reference, generation, callback));

    return generation;
}


void ScriptureResolver::waitForPendingValidations() {
    pending_validation_count_.waitForZero();

    std::lock_guard<std::mutex> lock(tasklets_mutex_);
    for (const auto &tasklet : tasklets_)
        tasklet->await();
    tasklets_.clear();
}


void ScriptureResolver::setVersion(const std::string &version_id) {
    // Supersede first so that no result computed against the old version gets delivered after the switch.
    startNewGeneration();
    bounds_cache_.setVersion(version_id);
}


void ScriptureResolver::reloadCatalog() {
    auto books(std::make_shared<const std::vector<BookRecord>>(book_catalog_.listBooks()));
    const size_t book_count(books->size());
    {
        std::lock_guard<std::mutex> lock(books_mutex_);
        books_.swap(books);
    }
    bounds_cache_.clear();

    LOG_INFO("reloaded the book catalog, " + std::to_string(book_count) + " book(s).");
}


unsigned ScriptureResolver::getMaxChapter(const BookRecord &book) const {
    ChapterVerseInfo info;
    if (bounds_cache_.lookup(book.id_, bounds_cache_.getVersion(), &info))
        return info.chapter_count_;
    return book.chapter_count_;
}


unsigned ScriptureResolver::getMaxVerse(const BookRecord &book, const unsigned chapter) {
    try {
        return bounds_cache_.getBounds(book, bounds_cache_.getVersion()).getMaxVerse(chapter, config_.default_verse_count_);
    } catch (const std::exception &x) {
        LOG_WARNING("can't determine the verse count of \"" + book.name_ + " " + std::to_string(chapter) + "\": " + x.what());
        return config_.default_verse_count_;
    }
}


} // namespace Scripture
