//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef BFA_OBSERVER_HPP
#define BFA_OBSERVER_HPP

/**
 * @file observer.hpp
 * @brief Progress and diagnostic callbacks for analyses.
 *
 * The analysis pipeline reports to an observer at fixed checkpoints:
 * - on_start: before a method runs
 * - on_file_processed: after each file is blamed or its history fetched
 * - on_removal: after each simulated contributor removal
 * - on_complete: after the removal simulation finishes
 *
 * Every callback has an empty default. Results never depend on whether
 * anything is listening.
 */

#include "bfa/types.hpp"

#include <cstddef>
#include <string_view>

namespace bfa
{
    /**
     * Progress of a per-file collection phase.
     */
    struct FileProgress {
        std::string_view phase;     // "blame" or "history"
        std::string_view file;
        std::size_t processed = 0;
        std::size_t total = 0;
        bool failed = false;
    };

    class IAnalysisObserver {
    public:
        virtual ~IAnalysisObserver() = default;

        virtual void on_start(std::string_view /*method*/, std::size_t /*total_files*/) {}
        virtual void on_info(std::string_view /*message*/) {}
        virtual void on_warning(std::string_view /*message*/) {}
        virtual void on_file_processed(const FileProgress& /*progress*/) {}
        virtual void on_removal(const RemovalStep& /*step*/, std::size_t /*total_files*/) {}
        virtual void on_complete(const RemovalResult& /*result*/) {}
    };

    /**
     * Returns an observer that ignores every event.
     */
    [[nodiscard]] IAnalysisObserver& null_observer() noexcept;

}  // namespace bfa

#endif //BFA_OBSERVER_HPP
