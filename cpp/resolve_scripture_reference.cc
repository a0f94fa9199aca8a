/** \brief Utility for resolving free-form scripture references against an Sqlite3 Bible database.
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
#include <iostream>
#include <memory>
#include <cstdlib>
#include "FileUtil.h"
#include "IniFile.h"
#include "ScriptureResolver.h"
#include "Sqlite3BibleStore.h"
#include "StringUtil.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--config-file=path] [--database=path] [--version=version_id] [--suggest] [--no-validation] reference1 [reference2 .. referenceN]\n"
            "Parses, matches and validates each reference against the Bible database.  The database path defaults to\n"
            "the [Database] path entry of the config file.  With --suggest, autocompletion suggestions will be listed too.");
}


std::string OptionalToString(const std::optional<unsigned> &value) {
    return value ? std::to_string(*value) : "-";
}


void DisplayParsedReference(const Scripture::ParsedReference &reference) {
    std::cout << "\tbook token: \"" << reference.book_token_ << "\"\n";
    if (reference.book_)
        std::cout << "\tbook: " << reference.book_->name_ << " (ID " << reference.book_->id_ << ", "
                  << reference.book_->chapter_count_ << " chapters)\n";
    else
        std::cout << "\tbook: -\n";
    std::cout << "\tchapter: " << OptionalToString(reference.chapter_) << ", verses: " << OptionalToString(reference.verse_start_)
              << " to " << OptionalToString(reference.verse_end_) << '\n';
    std::cout << "\tvalid: " << (reference.is_valid_ ? "yes" : "no") << ", complete: " << (reference.is_complete_ ? "yes" : "no")
              << '\n';
    if (reference.hasError())
        std::cout << "\terror: " << reference.error_ << '\n';
    if (reference.book_)
        std::cout << "\tformatted: " << Scripture::FormatReference(reference) << " (" << Scripture::FormatShortReference(reference)
                  << "), key: " << Scripture::CreateReferenceKey(reference) << '\n';
}


void DisplayMatches(const std::vector<Scripture::BookMatch> &matches) {
    for (const auto &match : matches)
        std::cout << "\tmatch: " << match.book_.name_ << " (" << Scripture::MatchTypeToString(match.match_type_) << ", score "
                  << match.score_ << ")\n";
}


void DisplaySuggestions(const std::vector<Scripture::Suggestion> &suggestions) {
    for (const auto &suggestion : suggestions)
        std::cout << "\tsuggestion: " << suggestion.text_ << " (" << Scripture::SuggestionTypeToString(suggestion.type_)
                  << ", score " << suggestion.score_ << ")\n";
}


void DisplayValidationResult(const Scripture::ValidationResult &result) {
    if (result.is_valid_) {
        std::cout << "\tvalidation: OK\n";
        return;
    }

    std::cout << "\tvalidation: " << result.error_ << '\n';
    if (result.auto_correction_)
        std::cout << "\tcorrection: " << Scripture::FormatReference(*result.auto_correction_) << '\n';
}


void ProcessReference(const std::string &raw_reference, const bool suggest, const bool validate,
                      Scripture::ScriptureResolver * const resolver)
{
    std::cout << '"' << raw_reference << "\"\n";

    const Scripture::ParsedReference reference(resolver->parseReference(raw_reference));
    DisplayParsedReference(reference);
    if (not reference.book_token_.empty())
        DisplayMatches(resolver->findBookMatches(reference.book_token_));

    if (suggest) {
        DisplaySuggestions(resolver->generateSuggestions(reference.book_token_.empty() ? raw_reference : reference.book_token_));
        if (reference.book_) {
            DisplaySuggestions(resolver->getCompletionSuggestions(*reference.book_, raw_reference));
            for (const auto &completion : Scripture::GenerateCompletionSuggestions(reference))
                std::cout << "\tcompletion: " << completion << '\n';
        }
    }

    if (validate)
        DisplayValidationResult(resolver->validateReference(reference));
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    std::unique_ptr<IniFile> ini_file;
    std::string database_path, version_id;
    bool suggest(false), validate(true);

    for (--argc, ++argv; argc > 0 and StringUtil::StartsWith(argv[0], "--"); --argc, ++argv) {
        const std::string option(argv[0]);
        if (StringUtil::StartsWith(option, "--config-file="))
            ini_file.reset(new IniFile(option.substr(__builtin_strlen("--config-file="))));
        else if (StringUtil::StartsWith(option, "--database="))
            database_path = option.substr(__builtin_strlen("--database="));
        else if (StringUtil::StartsWith(option, "--version="))
            version_id = option.substr(__builtin_strlen("--version="));
        else if (option == "--suggest")
            suggest = true;
        else if (option == "--no-validation")
            validate = false;
        else
            Usage();
    }
    if (argc < 1)
        Usage();

    const Scripture::ScriptureResolver::Config config(ini_file == nullptr ? Scripture::ScriptureResolver::Config()
                                                                          : Scripture::ScriptureResolver::Config(*ini_file));
    if (database_path.empty())
        database_path = config.database_path_;
    if (database_path.empty())
        LOG_ERROR("no database was specified, neither on the command-line nor in the config file!");
    std::string error_message;
    if (not FileUtil::Exists(database_path, &error_message))
        LOG_ERROR(error_message);

    const Scripture::Sqlite3BibleStore bible_store(database_path);
    if (not bible_store.hasSchema())
        LOG_ERROR("\"" + database_path + "\" lacks the books, versions or verses table!");
    if (version_id.empty())
        version_id = bible_store.getDefaultVersion(config.default_version_);
    LOG_INFO("using version \"" + version_id + "\" of \"" + database_path + "\".");

    Scripture::ScriptureResolver resolver(bible_store, bible_store, version_id, config);
    for (int arg_no(0); arg_no < argc; ++arg_no)
        ProcessReference(argv[arg_no], suggest, validate, &resolver);

    return EXIT_SUCCESS;
}
