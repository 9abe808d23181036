//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef BFA_OWNERSHIP_RESOLVER_HPP
#define BFA_OWNERSHIP_RESOLVER_HPP

/**
 * @file ownership_resolver.hpp
 * @brief Resolves the dominant owner of each file.
 *
 * The owner of a file is the contributor with the highest line count.
 * Ties go to the contributor observed first for that file; a file whose
 * total line count is zero has no owner.
 */

#include "bfa/types.hpp"

#include <optional>
#include <string>

namespace bfa::ownership
{
    /**
     * Resolves the owner of a single file.
     *
     * Only contributors with a positive line count are candidates.
     */
    [[nodiscard]] std::optional<std::string> resolve_owner(const FileAuthors& file);

    /**
     * Resolves the owner of every file, keeping file order.
     *
     * @param authorship Raw or time-weighted authorship.
     * @return A freshly built ownership map.
     */
    [[nodiscard]] FileOwnership resolve_ownership(const FileAuthorship& authorship);

}  // namespace bfa::ownership

#endif //BFA_OWNERSHIP_RESOLVER_HPP
