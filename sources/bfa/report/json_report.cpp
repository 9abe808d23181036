//
// Created by gregorian-rayne on 2/13/26.
//

#include "bfa/report/json_report.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace bfa::report
{
    using json = nlohmann::json;

    namespace {

        json optional_number(const std::optional<double>& value) {
            return value ? json(*value) : json(nullptr);
        }

        json summary_to_json(const ReportSummary& summary) {
            return {
                {"busFactor", summary.bus_factor},
                {"totalFiles", summary.total_files},
                {"totalContributors", summary.total_contributors},
                {"criticalContributors", summary.critical_contributors}
            };
        }

        json analysis_to_json(const ReportAnalysis& analysis) {
            json j = {
                {"method", analysis.method},
                {"description", analysis.description},
                {"finalOwnerlessRatio", optional_number(analysis.final_ownerless_ratio)},
                {"threshold", analysis.threshold}
            };
            if (analysis.metadata) {
                j["metadata"] = {
                    {"decayRate", analysis.metadata->decay_rate},
                    {"timeWindowDays", analysis.metadata->window_days},
                    {"analysisDate", format_iso8601(analysis.metadata->analysis_date)}
                };
            }
            return j;
        }

        json contributors_to_json(const std::vector<TopContributor>& contributors) {
            json arr = json::array();
            for (const auto& c : contributors) {
                json entry = {
                    {"author", c.author},
                    {"degreeOfAuthorship", c.degree_of_authorship},
                    {"filesOwned", c.files_owned}
                };
                if (c.recent_activity_score) {
                    entry["recentActivityScore"] = *c.recent_activity_score;
                }
                arr.push_back(std::move(entry));
            }
            return arr;
        }

        json ownership_to_json(const FileOwnership& ownership) {
            json obj = json::object();
            for (const auto& [file, owner] : ownership) {
                obj[file] = owner ? json(*owner) : json(nullptr);
            }
            return obj;
        }

        json shares_to_json(const std::vector<FileShares>& files) {
            json obj = json::object();
            for (const auto& file : files) {
                json authors = json::object();
                for (const auto& share : file.authors) {
                    json entry = {
                        {"lines", share.lines},
                        {"percentage", share.percentage}
                    };
                    if (share.weighted_lines) {
                        entry["weightedLines"] = *share.weighted_lines;
                    }
                    if (share.weighted_percentage) {
                        entry["weightedPercentage"] = *share.weighted_percentage;
                    }
                    authors[share.author] = std::move(entry);
                }
                obj[file.file] = std::move(authors);
            }
            return obj;
        }

    }  // namespace

    std::string format_iso8601(const Timestamp time) {
        const auto time_t_val = std::chrono::system_clock::to_time_t(time);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            time.time_since_epoch()
        ).count() % 1000;

        std::tm time_info{};
        gmtime_r(&time_t_val, &time_info);

        std::ostringstream ss;
        ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << (millis < 0 ? millis + 1000 : millis)
           << 'Z';
        return ss.str();
    }

    json to_json(const Report& report) {
        json j;
        j["summary"] = summary_to_json(report.summary);
        j["analysis"] = analysis_to_json(report.analysis);
        j["topContributors"] = contributors_to_json(report.top_contributors);
        j["fileOwnership"] = ownership_to_json(report.file_ownership);
        j["fileAuthorshipMap"] = shares_to_json(report.file_authorship_map);
        j["interpretation"] = {
            {"risk", to_string(report.interpretation.risk)},
            {"message", report.interpretation.message},
            {"recommendation", report.interpretation.recommendation}
        };
        j["errors"] = report.errors;
        return j;
    }
}  // namespace bfa::report
