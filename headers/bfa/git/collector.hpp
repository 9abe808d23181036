//
// Created by gregorian-rayne on 2/15/26.
//

#ifndef BFA_COLLECTOR_HPP
#define BFA_COLLECTOR_HPP

/**
 * @file collector.hpp
 * @brief Builds analysis input from blame and history sources.
 *
 * Per-file failures never abort a collection: the file is kept with empty
 * data and a message is added to the error list.
 */

#include "bfa/git/git_integration.hpp"
#include "bfa/observer.hpp"
#include "bfa/types.hpp"

#include <string>
#include <vector>

namespace bfa::git
{
    /**
     * Blames every file sequentially.
     *
     * @param source Blame provider.
     * @param files Files in the order they should appear in the result.
     * @param observer Receives one "blame" progress event per file and a
     *        warning per failure.
     */
    [[nodiscard]] AuthorshipData collect_authorship(
        const IBlameSource& source,
        const std::vector<std::string>& files,
        IAnalysisObserver& observer = null_observer()
    );

    struct HistoryCollection {
        FileCommitHistory history;
        std::vector<std::string> errors;
    };

    /**
     * Retrieves commit records for every file on a thread pool.
     *
     * The map is complete when this returns. Files whose query failed map
     * to an empty record list.
     *
     * @param window_days Records older than now - window_days are not requested.
     * @param threads Worker count (0 = hardware concurrency).
     * @param observer Called on the calling thread, in file order.
     */
    [[nodiscard]] HistoryCollection collect_history(
        const IHistorySource& source,
        const std::vector<std::string>& files,
        int window_days,
        Timestamp now,
        unsigned int threads = 0,
        IAnalysisObserver& observer = null_observer()
    );

} // namespace bfa::git

#endif //BFA_COLLECTOR_HPP
