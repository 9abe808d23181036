//
// Created by gregorian-rayne on 2/15/26.
//

#include "bfa/git/collector.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <map>
#include <mutex>
#include <set>

namespace bfa::git
{
    namespace {
        const Timestamp NOW = Timestamp{} + std::chrono::hours(24) * 20000;

        class FakeBlameSource final : public IBlameSource {
        public:
            std::map<std::string, std::vector<AuthorLines>> data;
            std::set<std::string> failing;

            [[nodiscard]] Result<std::vector<AuthorLines>, Error> blame(const std::string& file) const override {
                if (failing.contains(file)) {
                    return Result<std::vector<AuthorLines>, Error>::failure(
                        Error::git_error("git blame failed", "binary file")
                    );
                }
                const auto it = data.find(file);
                return Result<std::vector<AuthorLines>, Error>::success(
                    it != data.end() ? it->second : std::vector<AuthorLines>{}
                );
            }
        };

        class FakeHistorySource final : public IHistorySource {
        public:
            std::set<std::string> failing;
            mutable std::atomic<int> calls{0};
            mutable std::mutex mutex;
            mutable std::vector<Timestamp> since_values;

            [[nodiscard]] Result<std::vector<CommitRecord>, Error> history(
                const std::string& file,
                const Timestamp since
            ) const override {
                ++calls;
                {
                    std::lock_guard lock(mutex);
                    since_values.push_back(since);
                }
                if (failing.contains(file)) {
                    return Result<std::vector<CommitRecord>, Error>::failure(
                        Error::git_error("git log failed")
                    );
                }
                return Result<std::vector<CommitRecord>, Error>::success(
                    std::vector<CommitRecord>{{"dev-" + file, NOW, "rev-" + file}}
                );
            }
        };

        class CountingObserver final : public IAnalysisObserver {
        public:
            void on_warning(std::string_view /*message*/) override { ++warnings; }

            void on_file_processed(const FileProgress& progress) override {
                ++processed;
                last_total = progress.total;
                if (progress.failed) {
                    ++failed;
                }
            }

            int warnings = 0;
            int processed = 0;
            int failed = 0;
            std::size_t last_total = 0;
        };
    }

    TEST(CollectAuthorshipTest, BuildsAuthorshipInFileOrder) {
        FakeBlameSource source;
        source.data["b.cpp"] = {{"Alice", 10}, {"Bob", 5}};
        source.data["a.cpp"] = {{"Bob", 7}};

        const auto data = collect_authorship(source, {"b.cpp", "a.cpp"});

        ASSERT_EQ(data.file_authorship.size(), 2u);
        EXPECT_EQ(data.file_authorship[0].file, "b.cpp");
        EXPECT_EQ(data.file_authorship[1].file, "a.cpp");
        EXPECT_EQ(data.total_files, 2u);
        ASSERT_EQ(data.total_authorship.size(), 2u);
        EXPECT_DOUBLE_EQ(data.total_authorship[1].lines, 12.0);
        EXPECT_TRUE(data.errors.empty());
    }

    TEST(CollectAuthorshipTest, FailedFilesAreRecordedAndKept) {
        FakeBlameSource source;
        source.data["ok.cpp"] = {{"Alice", 3}};
        source.failing.insert("image.png");
        CountingObserver observer;

        const auto data = collect_authorship(source, {"ok.cpp", "image.png"}, observer);

        ASSERT_EQ(data.file_authorship.size(), 2u);
        EXPECT_TRUE(data.file_authorship[1].authors.empty());
        EXPECT_EQ(data.total_files, 2u);

        ASSERT_EQ(data.errors.size(), 1u);
        EXPECT_EQ(data.errors[0].rfind("Could not analyze \"image.png\": ", 0), 0u);

        EXPECT_EQ(observer.warnings, 1);
        EXPECT_EQ(observer.processed, 2);
        EXPECT_EQ(observer.failed, 1);
        EXPECT_EQ(observer.last_total, 2u);
    }

    TEST(CollectHistoryTest, CollectsEveryFile) {
        FakeHistorySource source;
        std::vector<std::string> files;
        for (int i = 0; i < 25; ++i) {
            files.push_back("f" + std::to_string(i));
        }

        const auto collection = collect_history(source, files, 548, NOW, 4);

        EXPECT_EQ(source.calls.load(), 25);
        ASSERT_EQ(collection.history.size(), 25u);
        EXPECT_EQ(collection.history.at("f7")[0].author, "dev-f7");
        EXPECT_TRUE(collection.errors.empty());
    }

    TEST(CollectHistoryTest, UsesWindowStart) {
        FakeHistorySource source;

        const auto collection = collect_history(source, {"a"}, 30, NOW);

        ASSERT_EQ(source.since_values.size(), 1u);
        EXPECT_EQ(source.since_values[0], NOW - std::chrono::hours(24) * 30);
        EXPECT_EQ(collection.history.size(), 1u);
    }

    TEST(CollectHistoryTest, FailuresLeaveEmptyHistory) {
        FakeHistorySource source;
        source.failing.insert("bad");
        CountingObserver observer;

        const auto collection = collect_history(source, {"good", "bad"}, 548, NOW, 2, observer);

        ASSERT_EQ(collection.history.size(), 2u);
        EXPECT_TRUE(collection.history.at("bad").empty());
        EXPECT_EQ(collection.history.at("good").size(), 1u);
        ASSERT_EQ(collection.errors.size(), 1u);
        EXPECT_NE(collection.errors[0].find("\"bad\""), std::string::npos);
        EXPECT_EQ(observer.failed, 1);
        EXPECT_EQ(observer.processed, 2);
    }

    TEST(CollectHistoryTest, NoFiles) {
        FakeHistorySource source;

        const auto collection = collect_history(source, {}, 548, NOW);
        EXPECT_TRUE(collection.history.empty());
        EXPECT_EQ(source.calls.load(), 0);
    }
}
