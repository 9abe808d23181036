//
// Created by gregorian-rayne on 2/16/26.
//

#include "bfa/cli/formatter.hpp"
#include "bfa/cli/progress.hpp"

#include <iomanip>
#include <sstream>

namespace bfa::cli
{
    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";

        const char* RED = "\033[31m";
        const char* GREEN = "\033[32m";
        const char* YELLOW = "\033[33m";
        const char* BLUE = "\033[34m";
        const char* CYAN = "\033[36m";

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    // ============================================================================
    // Formatting Functions
    // ============================================================================

    std::string format_ratio(const std::optional<double>& ratio) {
        if (!ratio) {
            return "undefined";
        }
        return report::format_percentage(*ratio) + "%";
    }

    std::string format_path(const std::string_view path, const std::size_t max_width) {
        if (path.length() <= max_width) {
            return std::string(path);
        }

        const std::string ellipsis = "...";
        return ellipsis + std::string(path.substr(path.length() - max_width + ellipsis.length()));
    }

    std::string colorize_risk(const report::RiskLevel risk) {
        const std::string name = report::to_string(risk);
        if (!colors::enabled()) {
            return name;
        }

        switch (risk) {
        case report::RiskLevel::Critical:
            return std::string(colors::RED) + colors::BOLD + name + colors::RESET;
        case report::RiskLevel::High:
            return std::string(colors::YELLOW) + colors::BOLD + name + colors::RESET;
        case report::RiskLevel::Moderate:
            return std::string(colors::CYAN) + colors::BOLD + name + colors::RESET;
        case report::RiskLevel::Low:
            return std::string(colors::GREEN) + colors::BOLD + name + colors::RESET;
        }
        return name;
    }

    // ============================================================================
    // Table Implementation
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        while (row.size() < columns_.size()) {
            row.emplace_back();
        }
        rows_.push_back(std::move(row));
    }

    void Table::calculate_widths() {
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].width == 0) {
                std::size_t max_width = columns_[i].header.length();
                for (const auto& row : rows_) {
                    if (i < row.size() && row[i].length() > max_width) {
                        max_width = row[i].length();
                    }
                }
                columns_[i].width = max_width;
            }
        }
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        // Widths are computed on a copy so render() stays const
        Table temp = *this;
        temp.calculate_widths();

        auto render_row = [&](const Row& row, const bool is_header = false) {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                const auto& col = temp.columns_[i];
                std::string cell = i < row.size() ? row[i] : "";

                if (cell.length() > col.width && col.width > 3) {
                    cell = cell.substr(0, col.width - 3) + "...";
                }

                if (is_header && colors::enabled()) {
                    out << colors::BOLD;
                }

                if (col.right_align) {
                    out << std::right << std::setw(static_cast<int>(col.width)) << cell;
                } else {
                    out << std::left << std::setw(static_cast<int>(col.width)) << cell;
                }

                if (is_header && colors::enabled()) {
                    out << colors::RESET;
                }

                if (i < temp.columns_.size() - 1) {
                    out << "  ";
                }
            }
            out << "\n";
        };

        if (show_headers_) {
            Row header;
            for (const auto& col : temp.columns_) {
                header.push_back(col.header);
            }
            render_row(header, true);

            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                out << std::string(temp.columns_[i].width, '-');
                if (i < temp.columns_.size() - 1) {
                    out << "--";
                }
            }
            out << "\n";
        }

        for (const auto& row : temp.rows_) {
            render_row(row);
        }
    }

    // ============================================================================
    // ReportPrinter Implementation
    // ============================================================================

    ReportPrinter::ReportPrinter(std::ostream& out)
        : out_(out)
    {}

    void ReportPrinter::heading(const std::string_view title) const {
        if (colors::enabled()) {
            out_ << colors::BOLD << title << colors::RESET << "\n";
        } else {
            out_ << title << "\n";
        }
    }

    void ReportPrinter::print_summary(const report::Report& report) const {
        const auto& summary = report.summary;

        out_ << "\n";
        heading("Summary");
        out_ << "  Bus Factor:            ";
        if (colors::enabled()) {
            out_ << colors::YELLOW << colors::BOLD << summary.bus_factor << colors::RESET;
        } else {
            out_ << summary.bus_factor;
        }
        out_ << "\n";
        out_ << "  Total Files:           " << summary.total_files << "\n";
        out_ << "  Total Contributors:    " << summary.total_contributors << "\n";

        out_ << "  Critical Contributors: ";
        for (std::size_t i = 0; i < summary.critical_contributors.size(); ++i) {
            if (i > 0) out_ << ", ";
            out_ << summary.critical_contributors[i];
        }
        out_ << "\n\n";
    }

    void ReportPrinter::print_risk(const report::Report& report) const {
        heading("Risk Assessment");
        out_ << "  Risk Level: " << colorize_risk(report.interpretation.risk) << "\n";
        out_ << "  " << report.interpretation.message << "\n";
        out_ << "  " << report.interpretation.recommendation << "\n\n";
    }

    void ReportPrinter::print_top_contributors(const report::Report& report) const {
        if (report.top_contributors.empty()) {
            return;
        }

        heading("Top Contributors (by Degree of Authorship)");

        const bool weighted = report.analysis.metadata.has_value();
        std::vector<Column> columns = {
            {"#", 0, true},
            {"Author", 0, false},
            {"DOA", 0, true},
            {"Files Owned", 0, true}
        };
        if (weighted) {
            columns.push_back({"Recent Activity", 0, true});
        }

        Table table(std::move(columns));
        std::size_t rank = 0;
        for (const auto& contributor : report.top_contributors) {
            Row row = {
                std::to_string(++rank),
                contributor.author,
                contributor.degree_of_authorship,
                "~" + std::to_string(contributor.files_owned)
            };
            if (weighted) {
                row.push_back(contributor.recent_activity_score.value_or("0"));
            }
            table.add_row(std::move(row));
        }

        table.render(out_);
        out_ << "\n";
    }

    void ReportPrinter::print_method(const report::Report& report) const {
        const auto& analysis = report.analysis;

        if (colors::enabled()) out_ << colors::DIM;
        out_ << "Analysis Method: " << analysis.method << "\n";
        out_ << "Ownerless Files Ratio: " << format_ratio(analysis.final_ownerless_ratio) << "\n";
        if (analysis.metadata) {
            out_ << "Decay Rate: " << analysis.metadata->decay_rate
                 << ", Time Window: " << analysis.metadata->window_days << " days\n";
        }
        if (colors::enabled()) out_ << colors::RESET;
        out_ << "\n";
    }

    void ReportPrinter::print(const report::Report& report, const bool summary_only) const {
        print_summary(report);
        if (summary_only) {
            return;
        }
        print_risk(report);
        print_top_contributors(report);
        print_method(report);
    }

}  // namespace bfa::cli
