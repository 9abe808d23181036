//
// Created by gregorian-rayne on 2/13/26.
//

#include "bfa/report/json_report.hpp"

#include <gtest/gtest.h>

namespace bfa::report
{
    namespace {
        Report sample_report() {
            Report report;
            report.summary = {2, 3, 2, {"Alice", "Bob"}};
            report.analysis.method = "Standard";
            report.analysis.description = "desc";
            report.analysis.final_ownerless_ratio = 2.0 / 3.0;
            report.analysis.threshold = 0.5;
            report.top_contributors = {{"Alice", "66.67%", 2, std::nullopt}};
            report.file_ownership = {{"a.cpp", "Alice"}, {"b.cpp", std::nullopt}};
            report.file_authorship_map = {
                {"a.cpp", {{"Alice", 10.0, "100.00", std::nullopt, std::nullopt}}}
            };
            report.interpretation = interpret(2, default_risk_wording());
            return report;
        }
    }

    TEST(JsonReportTest, TopLevelKeys) {
        const auto j = to_json(sample_report());

        EXPECT_TRUE(j.contains("summary"));
        EXPECT_TRUE(j.contains("analysis"));
        EXPECT_TRUE(j.contains("topContributors"));
        EXPECT_TRUE(j.contains("fileOwnership"));
        EXPECT_TRUE(j.contains("fileAuthorshipMap"));
        EXPECT_TRUE(j.contains("interpretation"));
        ASSERT_TRUE(j.contains("errors"));
        EXPECT_TRUE(j["errors"].is_array());
        EXPECT_TRUE(j["errors"].empty());
    }

    TEST(JsonReportTest, Summary) {
        const auto j = to_json(sample_report());

        EXPECT_EQ(j["summary"]["busFactor"], 2);
        EXPECT_EQ(j["summary"]["totalFiles"], 3);
        EXPECT_EQ(j["summary"]["totalContributors"], 2);
        EXPECT_EQ(j["summary"]["criticalContributors"][1], "Bob");
    }

    TEST(JsonReportTest, AnalysisWithoutMetadata) {
        const auto j = to_json(sample_report());

        EXPECT_EQ(j["analysis"]["method"], "Standard");
        EXPECT_NEAR(j["analysis"]["finalOwnerlessRatio"].get<double>(), 0.6667, 1e-4);
        EXPECT_DOUBLE_EQ(j["analysis"]["threshold"].get<double>(), 0.5);
        EXPECT_FALSE(j["analysis"].contains("metadata"));
    }

    TEST(JsonReportTest, UndefinedRatioIsNull) {
        auto report = sample_report();
        report.analysis.final_ownerless_ratio = std::nullopt;

        const auto j = to_json(report);
        EXPECT_TRUE(j["analysis"]["finalOwnerlessRatio"].is_null());
    }

    TEST(JsonReportTest, UnownedFileIsNull) {
        const auto j = to_json(sample_report());

        EXPECT_EQ(j["fileOwnership"]["a.cpp"], "Alice");
        EXPECT_TRUE(j["fileOwnership"]["b.cpp"].is_null());
    }

    TEST(JsonReportTest, Contributors) {
        const auto j = to_json(sample_report());

        const auto& first = j["topContributors"][0];
        EXPECT_EQ(first["author"], "Alice");
        EXPECT_EQ(first["degreeOfAuthorship"], "66.67%");
        EXPECT_EQ(first["filesOwned"], 2);
        EXPECT_FALSE(first.contains("recentActivityScore"));
    }

    TEST(JsonReportTest, AuthorshipMap) {
        const auto j = to_json(sample_report());

        const auto& alice = j["fileAuthorshipMap"]["a.cpp"]["Alice"];
        EXPECT_DOUBLE_EQ(alice["lines"].get<double>(), 10.0);
        EXPECT_EQ(alice["percentage"], "100.00");
        EXPECT_FALSE(alice.contains("weightedLines"));
    }

    TEST(JsonReportTest, TimeWeightedFields) {
        auto report = sample_report();
        report.analysis.metadata = DecayMetadata{0.5, 548, Timestamp{} + std::chrono::milliseconds(1700000000123)};
        report.top_contributors[0].recent_activity_score = "61";
        report.file_authorship_map[0].authors[0].weighted_lines = "6.07";
        report.file_authorship_map[0].authors[0].weighted_percentage = "100.00";

        const auto j = to_json(report);
        const auto& metadata = j["analysis"]["metadata"];
        EXPECT_DOUBLE_EQ(metadata["decayRate"].get<double>(), 0.5);
        EXPECT_EQ(metadata["timeWindowDays"], 548);
        EXPECT_EQ(metadata["analysisDate"], "2023-11-14T22:13:20.123Z");

        EXPECT_EQ(j["topContributors"][0]["recentActivityScore"], "61");
        EXPECT_EQ(j["fileAuthorshipMap"]["a.cpp"]["Alice"]["weightedLines"], "6.07");
    }

    TEST(JsonReportTest, InterpretationAndErrors) {
        auto report = sample_report();
        report.errors = {"Could not analyze \"x\""};

        const auto j = to_json(report);
        EXPECT_EQ(j["interpretation"]["risk"], "HIGH");
        ASSERT_TRUE(j.contains("errors"));
        EXPECT_EQ(j["errors"].size(), 1u);
    }

    TEST(JsonReportTest, Iso8601Epoch) {
        EXPECT_EQ(format_iso8601(Timestamp{}), "1970-01-01T00:00:00.000Z");
    }
}
