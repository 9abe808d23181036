//
// Created by gregorian-rayne on 2/12/26.
//

#include "bfa/decay/knowledge_decay.hpp"

#include <gtest/gtest.h>
#include <cmath>

namespace bfa::decay
{
    namespace {
        Timestamp days_before(const Timestamp now, const int days) {
            return now - std::chrono::hours(24) * days;
        }

        const Timestamp NOW = Timestamp{} + std::chrono::hours(24) * 20000;
    }

    TEST(KnowledgeDecayTest, WeightIsOneForFreshCommits) {
        EXPECT_DOUBLE_EQ(decay_weight(0.5, 0.0), 1.0);
    }

    TEST(KnowledgeDecayTest, WeightFollowsExponential) {
        EXPECT_NEAR(decay_weight(0.5, 365.0), std::exp(-0.5), 1e-12);
        EXPECT_NEAR(decay_weight(1.0, 730.0), std::exp(-2.0), 1e-12);
    }

    TEST(KnowledgeDecayTest, ZeroRateMeansNoDecay) {
        EXPECT_DOUBLE_EQ(decay_weight(0.0, 1000.0), 1.0);
    }

    TEST(KnowledgeDecayTest, FutureCommitsAreNotAmplified) {
        EXPECT_DOUBLE_EQ(decay_weight(0.5, -10.0), 1.0);
    }

    TEST(KnowledgeDecayTest, ElapsedDays) {
        EXPECT_DOUBLE_EQ(elapsed_days(days_before(NOW, 365), NOW), 365.0);
        EXPECT_DOUBLE_EQ(elapsed_days(NOW, NOW), 0.0);
    }

    TEST(KnowledgeDecayTest, MostRecentCommitPerAuthor) {
        const std::vector<CommitRecord> records = {
            {"Alice", days_before(NOW, 300), "a1"},
            {"Bob", days_before(NOW, 10), "b1"},
            {"Alice", days_before(NOW, 100), "a2"},
        };

        EXPECT_EQ(most_recent_commit(records, "Alice").value(), days_before(NOW, 100));
        EXPECT_EQ(most_recent_commit(records, "Bob").value(), days_before(NOW, 10));
        EXPECT_FALSE(most_recent_commit(records, "Carol").has_value());
    }

    TEST(KnowledgeDecayTest, DecaysByLastCommit) {
        const FileAuthorship authorship = {{"file1", {{"Alice", 100}}}};
        FileCommitHistory history;
        history["file1"] = {{"Alice", days_before(NOW, 365), "a1"}};

        const auto weighted = apply_decay(authorship, history, 0.5, NOW);
        ASSERT_EQ(weighted.size(), 1u);
        ASSERT_EQ(weighted[0].authors.size(), 1u);
        EXPECT_NEAR(weighted[0].authors[0].lines, 60.65, 0.01);
    }

    TEST(KnowledgeDecayTest, NoHistoryUsesMultiplier) {
        const FileAuthorship authorship = {{"file1", {{"Bob", 80}}}};

        const auto weighted = apply_decay(authorship, {}, 0.5, NOW);
        EXPECT_DOUBLE_EQ(weighted[0].authors[0].lines, 80 * NO_HISTORY_MULTIPLIER);
        EXPECT_DOUBLE_EQ(weighted[0].authors[0].lines, 0.8);
    }

    TEST(KnowledgeDecayTest, CustomMultiplier) {
        const FileAuthorship authorship = {{"file1", {{"Bob", 50}}}};

        const auto weighted = apply_decay(authorship, {}, 0.5, NOW, 0.1);
        EXPECT_DOUBLE_EQ(weighted[0].authors[0].lines, 5.0);
    }

    TEST(KnowledgeDecayTest, DecayPreservesFileAndAuthorOrder) {
        const FileAuthorship authorship = {
            {"b.cpp", {{"Zed", 10}, {"Amy", 20}}},
            {"a.cpp", {{"Amy", 5}}},
        };

        const auto weighted = apply_decay(authorship, {}, 0.5, NOW);
        ASSERT_EQ(weighted.size(), 2u);
        EXPECT_EQ(weighted[0].file, "b.cpp");
        EXPECT_EQ(weighted[0].authors[0].author, "Zed");
        EXPECT_EQ(weighted[0].authors[1].author, "Amy");
        EXPECT_EQ(weighted[1].file, "a.cpp");
    }

    TEST(KnowledgeDecayTest, TrimDropsCommitsOutsideWindow) {
        FileCommitHistory history;
        history["file1"] = {
            {"Alice", days_before(NOW, 10), "a1"},
            {"Alice", days_before(NOW, 600), "a0"},
        };
        history["file2"] = {{"Bob", days_before(NOW, 900), "b0"}};

        const auto trimmed = trim_to_window(history, 548, NOW);
        ASSERT_EQ(trimmed.at("file1").size(), 1u);
        EXPECT_EQ(trimmed.at("file1")[0].revision, "a1");
        EXPECT_TRUE(trimmed.at("file2").empty());
    }

    TEST(KnowledgeDecayTest, WindowStart) {
        EXPECT_EQ(window_start(30, NOW), days_before(NOW, 30));
    }
}
