//
// Created by gregorian-rayne on 2/13/26.
//

#include "bfa/simulation/removal_simulator.hpp"
#include "bfa/ownership/authorship_aggregator.hpp"
#include "bfa/ownership/ownership_resolver.hpp"

#include <gtest/gtest.h>

namespace bfa::simulation
{
    namespace {
        RemovalResult run(const FileAuthorship& authorship, const double threshold = 0.5) {
            const auto ownership = ownership::resolve_ownership(authorship);
            const auto ranking = ownership::compute_doa(ownership);
            return simulate_removal(ranking, ownership, threshold);
        }
    }

    TEST(RemovalSimulatorTest, RankIsStableDescending) {
        const ContributorRanking ranking = {
            {"Bob", 0.25, 1, std::nullopt},
            {"Alice", 0.5, 2, std::nullopt},
            {"Carol", 0.25, 1, std::nullopt},
        };

        const auto ranked = rank_by_doa(ranking);
        EXPECT_EQ(ranked[0].author, "Alice");
        EXPECT_EQ(ranked[1].author, "Bob");
        EXPECT_EQ(ranked[2].author, "Carol");
    }

    TEST(RemovalSimulatorTest, CountsUnownedAndRemoved) {
        const FileOwnership ownership = {{"a", "Alice"}, {"b", "Bob"}, {"c", std::nullopt}};

        EXPECT_EQ(count_ownerless(ownership, {}), 1u);
        EXPECT_EQ(count_ownerless(ownership, {"Alice"}), 2u);
        EXPECT_DOUBLE_EQ(ownerless_ratio(ownership, {"Alice", "Bob"}).value(), 1.0);
        EXPECT_FALSE(ownerless_ratio({}, {}).has_value());
    }

    TEST(RemovalSimulatorTest, FourFilesThreeContributors) {
        const FileAuthorship authorship = {
            {"file1.js", {{"Alice", 100}}},
            {"file2.js", {{"Alice", 80}, {"Bob", 20}}},
            {"file3.js", {{"Bob", 100}}},
            {"file4.js", {{"Charlie", 100}}},
        };

        const auto result = run(authorship);
        EXPECT_EQ(result.bus_factor, 2u);
        ASSERT_EQ(result.removed_contributors.size(), 2u);
        EXPECT_EQ(result.removed_contributors[0], "Alice");
        EXPECT_EQ(result.removed_contributors[1], "Bob");
        EXPECT_DOUBLE_EQ(result.ownerless_ratio.value(), 0.75);
    }

    TEST(RemovalSimulatorTest, RatioAtThresholdDoesNotStop) {
        std::vector<FileAuthors> authorship;
        const std::vector<std::string> owners = {"A", "A", "A", "A", "A", "B", "C", "D", "E", "F"};
        for (std::size_t i = 0; i < owners.size(); ++i) {
            authorship.push_back({"f" + std::to_string(i), {{owners[i], 10}}});
        }

        const auto result = run(authorship);
        ASSERT_EQ(result.steps.size(), 2u);
        EXPECT_DOUBLE_EQ(result.steps[0].ownerless_ratio, 0.5);
        EXPECT_DOUBLE_EQ(result.steps[1].ownerless_ratio, 0.6);
        EXPECT_EQ(result.bus_factor, 2u);
    }

    TEST(RemovalSimulatorTest, TenSingleOwnerFiles) {
        FileAuthorship authorship;
        for (int i = 0; i < 10; ++i) {
            authorship.push_back({"f" + std::to_string(i), {{"dev" + std::to_string(i), 10}}});
        }

        const auto result = run(authorship);
        EXPECT_EQ(result.bus_factor, 6u);
        EXPECT_DOUBLE_EQ(result.ownerless_ratio.value(), 0.6);
        EXPECT_EQ(result.removed_contributors.front(), "dev0");
    }

    TEST(RemovalSimulatorTest, ZeroFiles) {
        const auto result = run({});
        EXPECT_EQ(result.bus_factor, 0u);
        EXPECT_TRUE(result.removed_contributors.empty());
        EXPECT_FALSE(result.ownerless_ratio.has_value());
    }

    TEST(RemovalSimulatorTest, AllFilesUnowned) {
        const FileAuthorship authorship = {{"a", {}}, {"b", {}}};

        const auto result = run(authorship);
        EXPECT_EQ(result.bus_factor, 0u);
        EXPECT_TRUE(result.ranking.empty());
        EXPECT_TRUE(result.steps.empty());
        EXPECT_FALSE(result.ownerless_ratio.has_value());
    }

    TEST(RemovalSimulatorTest, ThresholdNeverExceeded) {
        const FileAuthorship authorship = {
            {"a", {{"Alice", 10}}},
            {"b", {{"Bob", 10}}},
        };

        const auto result = run(authorship, 0.99);
        EXPECT_EQ(result.bus_factor, 2u);
        EXPECT_DOUBLE_EQ(result.ownerless_ratio.value(), 1.0);
    }

    TEST(RemovalSimulatorTest, RatioIsMonotonic) {
        FileAuthorship authorship;
        for (int i = 0; i < 12; ++i) {
            authorship.push_back({"f" + std::to_string(i), {{"dev" + std::to_string(i % 5), 10}}});
        }

        const auto result = run(authorship, 0.9);
        for (std::size_t i = 1; i < result.steps.size(); ++i) {
            EXPECT_GE(result.steps[i].ownerless_ratio, result.steps[i - 1].ownerless_ratio);
        }
        EXPECT_EQ(result.steps.size(), result.bus_factor);
    }
}
