//
// Created by gregorian-rayne on 2/12/26.
//

#include "bfa/ownership/authorship_aggregator.hpp"

#include <gtest/gtest.h>

namespace bfa::ownership
{
    namespace {
        const ContributorDOA* find(const ContributorRanking& ranking, const std::string& author) {
            for (const auto& entry : ranking) {
                if (entry.author == author) {
                    return &entry;
                }
            }
            return nullptr;
        }
    }

    TEST(AuthorshipAggregatorTest, DoaIsShareOfAllFiles) {
        const FileOwnership ownership = {
            {"a", "Alice"},
            {"b", "Alice"},
            {"c", "Bob"},
            {"d", std::nullopt},
        };

        const auto ranking = compute_doa(ownership);
        ASSERT_EQ(ranking.size(), 2u);

        EXPECT_EQ(ranking[0].author, "Alice");
        EXPECT_EQ(ranking[0].files_owned, 2u);
        EXPECT_DOUBLE_EQ(ranking[0].doa, 0.5);
        EXPECT_FALSE(ranking[0].activity.has_value());

        EXPECT_EQ(ranking[1].author, "Bob");
        EXPECT_DOUBLE_EQ(ranking[1].doa, 0.25);
    }

    TEST(AuthorshipAggregatorTest, EmptyOwnershipGivesEmptyRanking) {
        EXPECT_TRUE(compute_doa({}).empty());
        EXPECT_TRUE(compute_weighted_doa({}, {}).empty());
    }

    TEST(AuthorshipAggregatorTest, UnownedFilesOnly) {
        const FileOwnership ownership = {{"a", std::nullopt}, {"b", std::nullopt}};
        EXPECT_TRUE(compute_doa(ownership).empty());
    }

    TEST(AuthorshipAggregatorTest, WeightedIncludesNonOwners) {
        const FileAuthorship weighted = {
            {"file1", {{"Alice", 60.65}, {"Bob", 0.8}}},
            {"file2", {{"Bob", 10.0}}},
        };
        const FileOwnership ownership = {{"file1", "Alice"}, {"file2", "Bob"}};

        const auto ranking = compute_weighted_doa(ownership, weighted);
        ASSERT_EQ(ranking.size(), 2u);

        const auto* alice = find(ranking, "Alice");
        ASSERT_NE(alice, nullptr);
        EXPECT_EQ(alice->files_owned, 1u);
        EXPECT_DOUBLE_EQ(alice->doa, 0.5);
        ASSERT_TRUE(alice->activity.has_value());
        EXPECT_DOUBLE_EQ(alice->activity->recent_contributions, 60.65);

        const auto* bob = find(ranking, "Bob");
        ASSERT_NE(bob, nullptr);
        EXPECT_EQ(bob->files_owned, 1u);
        EXPECT_DOUBLE_EQ(bob->activity->recent_contributions, 10.8);
    }

    TEST(AuthorshipAggregatorTest, WeightedContributorWithoutFiles) {
        const FileAuthorship weighted = {{"file1", {{"Alice", 5.0}, {"Carol", 1.0}}}};
        const FileOwnership ownership = {{"file1", "Alice"}};

        const auto ranking = compute_weighted_doa(ownership, weighted);
        const auto* carol = find(ranking, "Carol");
        ASSERT_NE(carol, nullptr);
        EXPECT_EQ(carol->files_owned, 0u);
        EXPECT_DOUBLE_EQ(carol->doa, 0.0);
    }
}
