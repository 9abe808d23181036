//
// Created by gregorian-rayne on 2/13/26.
//

#ifndef BFA_REPORT_HPP
#define BFA_REPORT_HPP

/**
 * @file report.hpp
 * @brief Bus factor report structure and builder.
 *
 * The report is the output contract of every calculation method. Its shape
 * is identical for all methods; fields specific to the time-weighted
 * method are optional.
 */

#include "bfa/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bfa::report
{
    /**
     * Qualitative risk derived from the bus factor.
     */
    enum class RiskLevel {
        Critical,   // bus factor 1
        High,       // bus factor 2
        Moderate,   // bus factor 3-4
        Low         // bus factor 5+
    };

    [[nodiscard]] const char* to_string(RiskLevel level) noexcept;

    /**
     * Maps a bus factor to a risk level.
     *
     * A bus factor of 0 (no files or no owners) is reported as High.
     */
    [[nodiscard]] RiskLevel classify_risk(std::size_t bus_factor) noexcept;

    /**
     * Message and recommendation for one risk level.
     */
    struct RiskText {
        std::string_view message;
        std::string_view recommendation;
    };

    /**
     * Wording used by a calculation method for each risk level.
     */
    struct RiskWording {
        RiskText critical;
        RiskText high;
        RiskText moderate;
        RiskText low;

        [[nodiscard]] const RiskText& for_level(RiskLevel level) const noexcept;
    };

    /**
     * Wording of the standard method, used when a method supplies none.
     */
    [[nodiscard]] const RiskWording& default_risk_wording() noexcept;

    struct Interpretation {
        RiskLevel risk = RiskLevel::High;
        std::string message;
        std::string recommendation;
    };

    /**
     * Builds the interpretation. The message is prefixed with
     * "Project has a bus factor of N."
     */
    [[nodiscard]] Interpretation interpret(std::size_t bus_factor, const RiskWording& wording);

    struct ReportSummary {
        std::size_t bus_factor = 0;
        std::size_t total_files = 0;
        std::size_t total_contributors = 0;
        std::vector<std::string> critical_contributors;
    };

    /**
     * Parameters of the time-weighted method, echoed in the report.
     */
    struct DecayMetadata {
        double decay_rate = 0.0;
        int window_days = 0;
        Timestamp analysis_date;
    };

    struct ReportAnalysis {
        std::string method;
        std::string description;
        std::optional<double> final_ownerless_ratio;
        double threshold = 0.5;
        std::optional<DecayMetadata> metadata;
    };

    struct TopContributor {
        std::string author;
        std::string degree_of_authorship;       // "NN.NN%"
        std::size_t files_owned = 0;            // round(doa * total files)
        std::optional<std::string> recent_activity_score;
    };

    struct AuthorShare {
        std::string author;
        double lines = 0.0;
        std::string percentage;                 // "NN.NN"
        std::optional<std::string> weighted_lines;
        std::optional<std::string> weighted_percentage;
    };

    struct FileShares {
        std::string file;
        std::vector<AuthorShare> authors;
    };

    struct Report {
        ReportSummary summary;
        ReportAnalysis analysis;
        std::vector<TopContributor> top_contributors;
        FileOwnership file_ownership;
        std::vector<FileShares> file_authorship_map;
        Interpretation interpretation;
        std::vector<std::string> errors;
    };

    /**
     * Method-specific inputs to the report builder.
     */
    struct ReportOptions {
        std::string method;
        std::string description;
        double threshold = 0.5;
        std::size_t top_contributors = 10;
        std::optional<DecayMetadata> metadata;
        const RiskWording* wording = nullptr;
        const FileAuthorship* weighted_authorship = nullptr;
    };

    /**
     * Formats a ratio as a percentage with two decimals, e.g. 0.5 -> "50.00".
     */
    [[nodiscard]] std::string format_percentage(double ratio);

    /**
     * Assembles the report. Performs no I/O.
     *
     * @param source Authorship the analysis started from.
     * @param ownership Ownership used by the simulation.
     * @param removal Simulation result (carries the ranked contributors).
     * @param options Method-specific settings.
     */
    [[nodiscard]] Report build_report(
        const AuthorshipData& source,
        const FileOwnership& ownership,
        const RemovalResult& removal,
        const ReportOptions& options
    );

}  // namespace bfa::report

#endif //BFA_REPORT_HPP
