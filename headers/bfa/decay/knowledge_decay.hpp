//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef BFA_KNOWLEDGE_DECAY_HPP
#define BFA_KNOWLEDGE_DECAY_HPP

/**
 * @file knowledge_decay.hpp
 * @brief Time-weighting of authorship by recency of contribution.
 *
 * Knowledge of a file fades after the contributor last touched it:
 *
 *     weight = exp(-decay_rate * elapsed_days / 365)
 *
 * where elapsed_days is measured from the contributor's most recent commit
 * on that file. A contributor without any commit in the history window
 * keeps a fixed fraction of their lines (NO_HISTORY_MULTIPLIER) so that
 * the signal is weakened, never erased.
 *
 * Reference: Jabrayilzade et al., "Bus Factor in Practice" (ICSE-SEIP 2022)
 */

#include "bfa/types.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace bfa::decay
{
    /// Multiplier for contributors with no commit evidence in the window
    inline constexpr double NO_HISTORY_MULTIPLIER = 0.01;

    /// Days in the decay period
    inline constexpr double DAYS_PER_YEAR = 365.0;

    /**
     * Exponential decay weight for a number of elapsed days.
     *
     * Negative elapsed time (a commit "in the future") is clamped to zero,
     * so the weight never exceeds 1.
     */
    [[nodiscard]] double decay_weight(double decay_rate, double elapsed_days) noexcept;

    /**
     * Days between two time points, fractional.
     */
    [[nodiscard]] double elapsed_days(Timestamp from, Timestamp to) noexcept;

    /**
     * Most recent commit time of an author among a file's records.
     */
    [[nodiscard]] std::optional<Timestamp> most_recent_commit(
        const std::vector<CommitRecord>& records,
        std::string_view author
    );

    /**
     * Rescales every contributor's line count by knowledge decay.
     *
     * Files missing from history are treated as having no records. The
     * input is not modified; file and contributor order are preserved.
     *
     * @param authorship Raw per-file authorship.
     * @param history Commit records per file.
     * @param decay_rate Decay rate per year (non-negative).
     * @param current_time Reference time for elapsed days.
     * @param no_history_multiplier Weight for contributors without records.
     * @return Weighted authorship.
     */
    [[nodiscard]] FileAuthorship apply_decay(
        const FileAuthorship& authorship,
        const FileCommitHistory& history,
        double decay_rate,
        Timestamp current_time,
        double no_history_multiplier = NO_HISTORY_MULTIPLIER
    );

    /**
     * Drops records older than window_days before current_time.
     */
    [[nodiscard]] FileCommitHistory trim_to_window(
        const FileCommitHistory& history,
        int window_days,
        Timestamp current_time
    );

    /**
     * Start of the history window.
     */
    [[nodiscard]] Timestamp window_start(int window_days, Timestamp current_time) noexcept;

}  // namespace bfa::decay

#endif //BFA_KNOWLEDGE_DECAY_HPP
