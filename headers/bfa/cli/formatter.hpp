//
// Created by gregorian-rayne on 2/16/26.
//

#ifndef BFA_FORMATTER_HPP
#define BFA_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Output formatting utilities for CLI.
 *
 * Provides consistent formatting for:
 * - Tables
 * - Ratios and paths
 * - Colors and styles
 * - The human-readable bus factor report
 */

#include "bfa/types.hpp"
#include "bfa/report/report.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace bfa::cli
{
    /**
     * Terminal color codes.
     */
    namespace colors {

        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;

        extern const char* RED;
        extern const char* GREEN;
        extern const char* YELLOW;
        extern const char* BLUE;
        extern const char* CYAN;

        /**
         * Returns true if colors should be used.
         */
        bool enabled();

        void set_enabled(bool enable);

    }  // namespace colors

    /**
     * Table column definition.
     */
    struct Column {
        std::string header;
        std::size_t width = 0;    // 0 = auto
        bool right_align = false;
    };

    using Row = std::vector<std::string>;

    /**
     * Table formatter for aligned output.
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        void add_row(Row row);

        [[nodiscard]] std::string render() const;
        void render(std::ostream& out) const;

        void set_show_headers(bool show) { show_headers_ = show; }

    private:
        void calculate_widths();

        std::vector<Column> columns_;
        std::vector<Row> rows_;
        bool show_headers_ = true;
    };

    /**
     * Formats a ratio as a percentage, or "undefined" when empty.
     */
    [[nodiscard]] std::string format_ratio(const std::optional<double>& ratio);

    /**
     * Formats a file path for display (truncates from the left if too long).
     */
    [[nodiscard]] std::string format_path(std::string_view path, std::size_t max_width = 60);

    /**
     * Colorizes a risk level name.
     */
    [[nodiscard]] std::string colorize_risk(report::RiskLevel risk);

    /**
     * Prints a report as text.
     */
    class ReportPrinter {
    public:
        explicit ReportPrinter(std::ostream& out);

        void print_summary(const report::Report& report) const;
        void print_risk(const report::Report& report) const;
        void print_top_contributors(const report::Report& report) const;
        void print_method(const report::Report& report) const;

        /**
         * Prints everything, or only the summary when summary_only is set.
         */
        void print(const report::Report& report, bool summary_only) const;

    private:
        void heading(std::string_view title) const;

        std::ostream& out_;
    };

}  // namespace bfa::cli

#endif //BFA_FORMATTER_HPP
