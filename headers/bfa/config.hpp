//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef BFA_CONFIG_HPP
#define BFA_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Analysis configuration.
 *
 * Defaults follow Jabrayilzade et al. for the time-weighted method:
 * - decay rate 0.5 per year
 * - 548 day (1.5 year) history window
 * - majority threshold 0.5 (strictly exceeded)
 *
 * Configuration is a plain value passed to every analysis call; nothing
 * is cached between calls. A TOML file may override any key:
 *
 * @code
 *     [analysis]
 *     decay_rate = 0.3
 *     window_days = 365
 *     threshold = 0.5
 *     top_contributors = 15
 * @endcode
 */

#include "bfa/result.hpp"
#include "bfa/error.hpp"

#include <cstddef>
#include <filesystem>
#include <string_view>

namespace bfa
{
    struct AnalysisConfig {
        /// Exponential knowledge-decay rate (per 365 days)
        double decay_rate = 0.5;

        /// Commit-history lookback window in days
        int window_days = 548;

        /// Ownerless ratio that must be strictly exceeded to stop removal
        double threshold = 0.5;

        /// Weight applied when a contributor has no commit in the window
        double max_decay_multiplier = 0.01;

        /// Length of the ranked contributor list in reports
        std::size_t top_contributors = 10;

        /// Worker threads for history retrieval (0 = hardware concurrency)
        unsigned int history_threads = 0;

        /**
         * Checks that all values are in range.
         *
         * @return Success, or a ConfigError naming the offending key.
         */
        [[nodiscard]] Result<void, Error> validate() const;
    };

    /**
     * Parses configuration from TOML text. Missing keys keep their
     * defaults; the result is validated.
     */
    [[nodiscard]] Result<AnalysisConfig, Error> load_config_string(std::string_view content);

    /**
     * Reads and parses a TOML configuration file.
     */
    [[nodiscard]] Result<AnalysisConfig, Error> load_config_file(const std::filesystem::path& path);

}  // namespace bfa

#endif //BFA_CONFIG_HPP
