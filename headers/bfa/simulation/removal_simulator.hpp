//
// Created by gregorian-rayne on 2/13/26.
//

#ifndef BFA_REMOVAL_SIMULATOR_HPP
#define BFA_REMOVAL_SIMULATOR_HPP

/**
 * @file removal_simulator.hpp
 * @brief Iterative contributor removal (the bus factor itself).
 *
 * Contributors are removed in descending DOA order. After each removal the
 * ownerless ratio is recomputed:
 *
 *     ownerless = files owned by a removed contributor + files without owner
 *     ratio     = ownerless / total files
 *
 * The simulation stops as soon as ratio > threshold. Reaching the threshold
 * exactly does not stop it: with 10 single-owner files, removing 5 gives
 * 0.5 and the bus factor is 6.
 *
 * Reference: Avelino et al., "A novel approach for estimating truck
 * factors" (ICPC 2016)
 */

#include "bfa/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>

namespace bfa::simulation
{
    /**
     * Sorts contributors by descending DOA. The sort is stable, so equal
     * DOA keeps encounter order.
     */
    [[nodiscard]] ContributorRanking rank_by_doa(ContributorRanking ranking);

    /**
     * Counts files that are ownerless given a set of removed contributors.
     */
    [[nodiscard]] std::size_t count_ownerless(
        const FileOwnership& ownership,
        const std::unordered_set<std::string>& removed
    );

    /**
     * Ownerless ratio for a set of removed contributors.
     *
     * @return The ratio, or empty when there are no files.
     */
    [[nodiscard]] std::optional<double> ownerless_ratio(
        const FileOwnership& ownership,
        const std::unordered_set<std::string>& removed
    );

    /**
     * Runs the removal simulation.
     *
     * If every contributor is removed without exceeding the threshold, the
     * bus factor is the number of contributors. With no files or no
     * contributors the bus factor is 0 and the ratio is empty.
     *
     * @param ranking DOA entries in encounter order (sorted internally).
     * @param ownership Ownership map the DOA was computed from.
     * @param threshold Ratio that must be strictly exceeded.
     */
    [[nodiscard]] RemovalResult simulate_removal(
        const ContributorRanking& ranking,
        const FileOwnership& ownership,
        double threshold
    );

}  // namespace bfa::simulation

#endif //BFA_REMOVAL_SIMULATOR_HPP
