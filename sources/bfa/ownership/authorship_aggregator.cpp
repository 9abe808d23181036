//
// Created by gregorian-rayne on 2/12/26.
//

#include "bfa/ownership/authorship_aggregator.hpp"

#include <string_view>
#include <unordered_map>

namespace bfa::ownership
{
    namespace {

        void finish_doa(ContributorRanking& ranking, const std::size_t total_files) {
            for (auto& entry : ranking) {
                entry.doa = static_cast<double>(entry.files_owned) / static_cast<double>(total_files);
            }
        }

    }  // namespace

    ContributorRanking compute_doa(const FileOwnership& ownership) {
        ContributorRanking ranking;
        if (ownership.empty()) {
            return ranking;
        }

        std::unordered_map<std::string_view, std::size_t> index;

        for (const auto& [file, owner] : ownership) {
            if (!owner) {
                continue;
            }
            auto [it, inserted] = index.try_emplace(*owner, ranking.size());
            if (inserted) {
                ranking.push_back({*owner, 0.0, 0, std::nullopt});
            }
            ++ranking[it->second].files_owned;
        }

        finish_doa(ranking, ownership.size());
        return ranking;
    }

    ContributorRanking compute_weighted_doa(
        const FileOwnership& ownership,
        const FileAuthorship& weighted_authorship
    ) {
        ContributorRanking ranking;
        if (ownership.empty()) {
            return ranking;
        }

        std::unordered_map<std::string_view, const std::optional<std::string>*> owners;
        owners.reserve(ownership.size());
        for (const auto& entry : ownership) {
            owners.emplace(entry.file, &entry.owner);
        }

        std::unordered_map<std::string_view, std::size_t> index;

        for (const auto& file : weighted_authorship) {
            const auto owner_it = owners.find(file.file);
            const std::optional<std::string>* owner =
                owner_it != owners.end() ? owner_it->second : nullptr;

            for (const auto& [author, weighted_lines] : file.authors) {
                auto [it, inserted] = index.try_emplace(author, ranking.size());
                if (inserted) {
                    ranking.push_back({author, 0.0, 0, DecayActivity{}});
                }

                auto& entry = ranking[it->second];
                if (owner != nullptr && *owner == author) {
                    ++entry.files_owned;
                }
                entry.activity->recent_contributions += weighted_lines;
                entry.activity->total_contributions = entry.activity->recent_contributions;
            }
        }

        finish_doa(ranking, ownership.size());
        return ranking;
    }
}  // namespace bfa::ownership
