//
// Created by gregorian-rayne on 2/15/26.
//

#include "bfa/git/collector.hpp"
#include "bfa/decay/knowledge_decay.hpp"
#include "bfa/utils/parallel.hpp"

#include <algorithm>

namespace bfa::git
{
    namespace {

        std::string failure_message(const std::string& file, const Error& error) {
            return "Could not analyze \"" + file + "\": " + error.to_string();
        }

    }  // namespace

    AuthorshipData collect_authorship(
        const IBlameSource& source,
        const std::vector<std::string>& files,
        IAnalysisObserver& observer
    ) {
        FileAuthorship authorship;
        authorship.reserve(files.size());
        std::vector<std::string> errors;

        std::size_t processed = 0;
        for (const auto& file : files) {
            FileAuthors entry;
            entry.file = file;

            auto result = source.blame(file);
            const bool failed = result.is_err();
            if (failed) {
                errors.push_back(failure_message(file, result.error()));
                observer.on_warning(errors.back());
            } else {
                entry.authors = std::move(result.value());
            }
            authorship.push_back(std::move(entry));

            observer.on_file_processed({"blame", file, ++processed, files.size(), failed});
        }

        return make_authorship_data(std::move(authorship), std::move(errors));
    }

    HistoryCollection collect_history(
        const IHistorySource& source,
        const std::vector<std::string>& files,
        const int window_days,
        const Timestamp now,
        const unsigned int threads,
        IAnalysisObserver& observer
    ) {
        HistoryCollection collection;
        if (files.empty()) {
            return collection;
        }

        const Timestamp since = decay::window_start(window_days, now);
        const auto workers = static_cast<unsigned int>(std::min<std::size_t>(
            threads == 0 ? parallel::hardware_concurrency() : threads,
            files.size()
        ));

        parallel::ThreadPool pool(workers);
        auto futures = parallel::submit_all(files,
            [&source, since](const std::string& file) {
                return source.history(file, since);
            },
            pool);

        collection.history.reserve(files.size());

        for (std::size_t i = 0; i < files.size(); ++i) {
            const auto& file = files[i];
            auto result = futures[i].get();

            auto& records = collection.history[file];
            const bool failed = result.is_err();
            if (failed) {
                collection.errors.push_back(failure_message(file, result.error()));
                observer.on_warning(collection.errors.back());
            } else {
                records = std::move(result.value());
            }

            observer.on_file_processed({"history", file, i + 1, files.size(), failed});
        }

        return collection;
    }
} // namespace bfa::git
