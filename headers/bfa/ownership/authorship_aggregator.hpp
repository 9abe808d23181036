//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef BFA_AUTHORSHIP_AGGREGATOR_HPP
#define BFA_AUTHORSHIP_AGGREGATOR_HPP

/**
 * @file authorship_aggregator.hpp
 * @brief Degree of Authorship (DOA) per contributor.
 *
 * DOA = files owned / total files. Files without an owner count toward the
 * denominator only, so the DOA values of all contributors sum to at most 1.
 */

#include "bfa/types.hpp"

namespace bfa::ownership
{
    /**
     * Computes DOA from an ownership map.
     *
     * Contributors appear in the order of the first file they own; a
     * contributor who owns nothing does not appear.
     *
     * @return Unsorted DOA entries, empty when there are no files.
     */
    [[nodiscard]] ContributorRanking compute_doa(const FileOwnership& ownership);

    /**
     * Computes DOA for the time-weighted method.
     *
     * Every contributor of the weighted authorship appears, in first-observed
     * order, including contributors who own no file. Each entry carries the
     * contributor's summed weighted lines across all files, owned or not.
     *
     * @param ownership Ownership resolved from weighted_authorship.
     * @param weighted_authorship Authorship after knowledge decay.
     */
    [[nodiscard]] ContributorRanking compute_weighted_doa(
        const FileOwnership& ownership,
        const FileAuthorship& weighted_authorship
    );

}  // namespace bfa::ownership

#endif //BFA_AUTHORSHIP_AGGREGATOR_HPP
