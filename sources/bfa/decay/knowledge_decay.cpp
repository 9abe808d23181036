//
// Created by gregorian-rayne on 2/12/26.
//

#include "bfa/decay/knowledge_decay.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace bfa::decay
{
    namespace {
        using Days = std::chrono::duration<double, std::ratio<86400>>;

        const std::vector<CommitRecord> no_records;
    }

    double decay_weight(const double decay_rate, const double elapsed_days) noexcept {
        const double days = std::max(elapsed_days, 0.0);
        return std::exp(-decay_rate * days / DAYS_PER_YEAR);
    }

    double elapsed_days(const Timestamp from, const Timestamp to) noexcept {
        return std::chrono::duration_cast<Days>(to - from).count();
    }

    std::optional<Timestamp> most_recent_commit(
        const std::vector<CommitRecord>& records,
        const std::string_view author
    ) {
        std::optional<Timestamp> latest;
        for (const auto& record : records) {
            if (record.author != author) {
                continue;
            }
            if (!latest || record.timestamp > *latest) {
                latest = record.timestamp;
            }
        }
        return latest;
    }

    FileAuthorship apply_decay(
        const FileAuthorship& authorship,
        const FileCommitHistory& history,
        const double decay_rate,
        const Timestamp current_time,
        const double no_history_multiplier
    ) {
        FileAuthorship weighted;
        weighted.reserve(authorship.size());

        for (const auto& file : authorship) {
            const auto it = history.find(file.file);
            const auto& records = it != history.end() ? it->second : no_records;

            FileAuthors weighted_file;
            weighted_file.file = file.file;
            weighted_file.authors.reserve(file.authors.size());

            for (const auto& [author, lines] : file.authors) {
                double factor = no_history_multiplier;
                if (const auto latest = most_recent_commit(records, author)) {
                    factor = decay_weight(decay_rate, elapsed_days(*latest, current_time));
                }
                weighted_file.authors.push_back({author, lines * factor});
            }

            weighted.push_back(std::move(weighted_file));
        }

        return weighted;
    }

    Timestamp window_start(const int window_days, const Timestamp current_time) noexcept {
        return current_time - std::chrono::duration_cast<Timestamp::duration>(
            std::chrono::hours(24) * window_days
        );
    }

    FileCommitHistory trim_to_window(
        const FileCommitHistory& history,
        const int window_days,
        const Timestamp current_time
    ) {
        const Timestamp cutoff = window_start(window_days, current_time);

        FileCommitHistory trimmed;
        trimmed.reserve(history.size());

        for (const auto& [file, records] : history) {
            auto& kept = trimmed[file];
            std::ranges::copy_if(records, std::back_inserter(kept),
                [cutoff](const CommitRecord& record) {
                    return record.timestamp >= cutoff;
                });
        }

        return trimmed;
    }
}  // namespace bfa::decay
