//
// Created by gregorian-rayne on 2/13/26.
//

#include "bfa/report/report.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace bfa::report
{
    namespace {

        constexpr RiskWording STANDARD_WORDING{
            {"The loss of a single developer would severely impact the project.",
             "Urgent action needed to distribute knowledge and ownership across more team members."},
            {"Very few developers hold critical knowledge.",
             "Consider implementing pair programming, code reviews, and documentation to spread knowledge."},
            {"Knowledge is somewhat concentrated.",
             "Continue efforts to involve more developers in different parts of the codebase."},
            {"Knowledge is well distributed.",
             "Maintain current practices for knowledge sharing and collaboration."}
        };

        std::string format_fixed(const double value, const int precision) {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(precision) << value;
            return ss.str();
        }

        std::vector<FileShares> build_file_shares(
            const FileAuthorship& authorship,
            const FileAuthorship* weighted
        ) {
            std::vector<FileShares> shares;
            shares.reserve(authorship.size());

            for (std::size_t i = 0; i < authorship.size(); ++i) {
                const auto& file = authorship[i];
                const double total = file.total_lines();

                // Same index when built by apply_decay, otherwise look up by path.
                const FileAuthors* weighted_file = nullptr;
                if (weighted != nullptr) {
                    if (i < weighted->size() && (*weighted)[i].file == file.file) {
                        weighted_file = &(*weighted)[i];
                    } else {
                        const auto it = std::ranges::find(*weighted, file.file, &FileAuthors::file);
                        weighted_file = it != weighted->end() ? &*it : nullptr;
                    }
                }
                const double weighted_total = weighted_file ? weighted_file->total_lines() : 0.0;

                FileShares entry;
                entry.file = file.file;
                for (const auto& [author, lines] : file.authors) {
                    AuthorShare share;
                    share.author = author;
                    share.lines = lines;
                    share.percentage = total > 0.0 ? format_percentage(lines / total) : "0.00";

                    if (weighted != nullptr) {
                        const AuthorLines* w = weighted_file ? weighted_file->find(author) : nullptr;
                        const double weighted_lines = w ? w->lines : 0.0;
                        share.weighted_lines = format_fixed(weighted_lines, 2);
                        share.weighted_percentage = weighted_total > 0.0
                            ? format_percentage(weighted_lines / weighted_total)
                            : "0.00";
                    }
                    entry.authors.push_back(std::move(share));
                }
                shares.push_back(std::move(entry));
            }

            return shares;
        }

    }  // namespace

    const char* to_string(const RiskLevel level) noexcept {
        switch (level) {
            case RiskLevel::Critical: return "CRITICAL";
            case RiskLevel::High:     return "HIGH";
            case RiskLevel::Moderate: return "MODERATE";
            case RiskLevel::Low:      return "LOW";
        }
        return "UNKNOWN";
    }

    RiskLevel classify_risk(const std::size_t bus_factor) noexcept {
        if (bus_factor == 1) return RiskLevel::Critical;
        if (bus_factor <= 2) return RiskLevel::High;
        if (bus_factor <= 4) return RiskLevel::Moderate;
        return RiskLevel::Low;
    }

    const RiskText& RiskWording::for_level(const RiskLevel level) const noexcept {
        switch (level) {
            case RiskLevel::Critical: return critical;
            case RiskLevel::High:     return high;
            case RiskLevel::Moderate: return moderate;
            case RiskLevel::Low:      return low;
        }
        return high;
    }

    const RiskWording& default_risk_wording() noexcept {
        return STANDARD_WORDING;
    }

    Interpretation interpret(const std::size_t bus_factor, const RiskWording& wording) {
        Interpretation result;
        result.risk = classify_risk(bus_factor);

        const auto& text = wording.for_level(result.risk);
        result.message = "Project has a bus factor of " + std::to_string(bus_factor) + ". ";
        result.message += text.message;
        result.recommendation = std::string(text.recommendation);
        return result;
    }

    std::string format_percentage(const double ratio) {
        return format_fixed(ratio * 100.0, 2);
    }

    Report build_report(
        const AuthorshipData& source,
        const FileOwnership& ownership,
        const RemovalResult& removal,
        const ReportOptions& options
    ) {
        Report report;

        report.summary.bus_factor = removal.bus_factor;
        report.summary.total_files = source.total_files;
        report.summary.total_contributors = source.total_authorship.size();
        report.summary.critical_contributors = removal.removed_contributors;

        report.analysis.method = options.method;
        report.analysis.description = options.description;
        report.analysis.final_ownerless_ratio = removal.ownerless_ratio;
        report.analysis.threshold = options.threshold;
        report.analysis.metadata = options.metadata;

        const std::size_t top = std::min(options.top_contributors, removal.ranking.size());
        report.top_contributors.reserve(top);
        for (std::size_t i = 0; i < top; ++i) {
            const auto& contributor = removal.ranking[i];

            TopContributor entry;
            entry.author = contributor.author;
            entry.degree_of_authorship = format_percentage(contributor.doa) + "%";
            entry.files_owned = static_cast<std::size_t>(
                std::llround(contributor.doa * static_cast<double>(source.total_files))
            );
            if (contributor.activity) {
                entry.recent_activity_score = format_fixed(contributor.activity->recent_contributions, 0);
            }
            report.top_contributors.push_back(std::move(entry));
        }

        report.file_ownership = ownership;
        report.file_authorship_map = build_file_shares(source.file_authorship, options.weighted_authorship);

        const RiskWording& wording = options.wording ? *options.wording : default_risk_wording();
        report.interpretation = interpret(removal.bus_factor, wording);

        report.errors = source.errors;
        return report;
    }
}  // namespace bfa::report
