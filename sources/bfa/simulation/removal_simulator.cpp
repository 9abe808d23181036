//
// Created by gregorian-rayne on 2/13/26.
//

#include "bfa/simulation/removal_simulator.hpp"

#include <algorithm>

namespace bfa::simulation
{
    ContributorRanking rank_by_doa(ContributorRanking ranking) {
        std::ranges::stable_sort(ranking,
            [](const ContributorDOA& a, const ContributorDOA& b) {
                return a.doa > b.doa;
            });
        return ranking;
    }

    std::size_t count_ownerless(
        const FileOwnership& ownership,
        const std::unordered_set<std::string>& removed
    ) {
        return static_cast<std::size_t>(std::ranges::count_if(ownership,
            [&removed](const FileOwner& entry) {
                return !entry.owner || removed.contains(*entry.owner);
            }));
    }

    std::optional<double> ownerless_ratio(
        const FileOwnership& ownership,
        const std::unordered_set<std::string>& removed
    ) {
        if (ownership.empty()) {
            return std::nullopt;
        }
        return static_cast<double>(count_ownerless(ownership, removed)) /
               static_cast<double>(ownership.size());
    }

    RemovalResult simulate_removal(
        const ContributorRanking& ranking,
        const FileOwnership& ownership,
        const double threshold
    ) {
        RemovalResult result;
        result.ranking = rank_by_doa(ranking);

        // Nobody to remove or nothing to own: the ratio stays undefined.
        if (ownership.empty() || result.ranking.empty()) {
            return result;
        }

        const auto total_files = static_cast<double>(ownership.size());
        std::unordered_set<std::string> removed;

        for (const auto& contributor : result.ranking) {
            removed.insert(contributor.author);
            result.removed_contributors.push_back(contributor.author);
            ++result.bus_factor;

            const std::size_t ownerless = count_ownerless(ownership, removed);
            const double ratio = static_cast<double>(ownerless) / total_files;
            result.steps.push_back({contributor.author, contributor.doa, ownerless, ratio});

            if (ratio > threshold) {
                break;
            }
        }

        result.ownerless_ratio = ownerless_ratio(ownership, removed);
        return result;
    }
}  // namespace bfa::simulation
