//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef BUSFACTORANALYZER_TYPES_HPP
#define BUSFACTORANALYZER_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures for authorship and bus factor analysis.
 *
 * - Authorship: FileAuthors, FileAuthorship, CommitRecord, FileCommitHistory
 * - Ownership: FileOwner, FileOwnership
 * - Ranking: ContributorDOA, ContributorRanking
 * - Simulation: RemovalStep, RemovalResult
 * - Source data: AuthorshipData
 *
 * Per-file and per-contributor collections are vectors, not hash maps:
 * the order in which files and contributors were first observed is part of
 * the result (it decides ownership and ranking ties), so it must survive
 * every transformation unchanged.
 */

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <unordered_map>

namespace bfa {

    namespace fs = std::filesystem;

    /**
     * Duration in nanoseconds for timing measurements.
     */
    using Duration = std::chrono::nanoseconds;

    /**
     * Timestamp for absolute time points (commit times, analysis time).
     */
    using Timestamp = std::chrono::system_clock::time_point;

    // ============================================================================
    // Authorship
    // ============================================================================

    /**
     * Line count attributed to one contributor. Raw blame counts are whole
     * numbers; after knowledge decay they become real-valued.
     */
    struct AuthorLines {
        std::string author;
        double lines = 0.0;
    };

    /**
     * Authorship of a single file, contributors in first-observed order.
     */
    struct FileAuthors {
        std::string file;
        std::vector<AuthorLines> authors;

        [[nodiscard]] double total_lines() const noexcept;

        /**
         * Returns the entry for an author, or nullptr if the author has
         * no lines in this file.
         */
        [[nodiscard]] const AuthorLines* find(std::string_view author) const noexcept;
    };

    /**
     * Per-file authorship of a repository, files in first-observed order.
     * File paths are unique.
     */
    using FileAuthorship = std::vector<FileAuthors>;

    /**
     * One historical touch of a file.
     */
    struct CommitRecord {
        std::string author;
        Timestamp timestamp;
        std::string revision;
    };

    /**
     * Commit records per file. Record order within a file is irrelevant;
     * a file without an entry has no known history.
     */
    using FileCommitHistory = std::unordered_map<std::string, std::vector<CommitRecord>>;

    /**
     * Adds lines to an author's entry, appending the author if unseen.
     */
    void add_lines(std::vector<AuthorLines>& authors, std::string_view author, double lines);

    // ============================================================================
    // Ownership and Ranking
    // ============================================================================

    /**
     * Dominant owner of a file. An empty owner means the file has no
     * identifiable owner.
     */
    struct FileOwner {
        std::string file;
        std::optional<std::string> owner;
    };

    using FileOwnership = std::vector<FileOwner>;

    /**
     * Contribution totals tracked by the time-weighted method.
     *
     * total_contributions currently equals recent_contributions; it is
     * reserved for lifetime totals.
     */
    struct DecayActivity {
        double recent_contributions = 0.0;
        double total_contributions = 0.0;
    };

    /**
     * Degree of Authorship of one contributor.
     */
    struct ContributorDOA {
        std::string author;
        double doa = 0.0;              // files_owned / total files, in [0, 1]
        std::size_t files_owned = 0;
        std::optional<DecayActivity> activity;
    };

    /**
     * Contributors in encounter order, or in removal order once ranked.
     */
    using ContributorRanking = std::vector<ContributorDOA>;

    // ============================================================================
    // Removal Simulation
    // ============================================================================

    /**
     * State after one contributor has been removed.
     */
    struct RemovalStep {
        std::string author;
        double doa = 0.0;
        std::size_t ownerless_files = 0;
        double ownerless_ratio = 0.0;
    };

    /**
     * Outcome of the removal simulation.
     *
     * ownerless_ratio is empty when there are no files (0/0).
     */
    struct RemovalResult {
        std::size_t bus_factor = 0;
        std::vector<std::string> removed_contributors;
        std::optional<double> ownerless_ratio;
        ContributorRanking ranking;      // descending DOA, stable
        std::vector<RemovalStep> steps;
    };

    // ============================================================================
    // Source Data
    // ============================================================================

    /**
     * Authorship extracted from a working copy, plus the failures the
     * extractor wants surfaced in the report.
     */
    struct AuthorshipData {
        FileAuthorship file_authorship;
        std::vector<AuthorLines> total_authorship;   // lines per contributor
        std::size_t total_files = 0;
        fs::path repo_path;
        std::vector<std::string> errors;
    };

    /**
     * Builds AuthorshipData from per-file authorship, computing the
     * per-contributor totals and the file count.
     */
    [[nodiscard]] AuthorshipData make_authorship_data(
        FileAuthorship file_authorship,
        std::vector<std::string> errors = {}
    );

    /**
     * Everything a calculation method consumes. The history is empty for
     * the standard method.
     */
    struct AnalysisInput {
        AuthorshipData authorship;
        FileCommitHistory history;
    };

}  // namespace bfa

#endif //BUSFACTORANALYZER_TYPES_HPP
