//
// Created by gregorian-rayne on 2/14/26.
//

#include "bfa/io/authorship_io.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace bfa::io
{
    namespace fs = std::filesystem;

    TEST(AuthorshipIoTest, ParsesFileAuthorship) {
        const auto result = parse_authorship_json(R"({
            "fileAuthorship": {
                "src/b.cpp": {"Alice": 80, "Bob": 20},
                "src/a.cpp": {"Charlie": 12.5}
            }
        })");
        ASSERT_TRUE(result.is_ok()) << result.error();

        const auto& data = result.value().authorship;
        ASSERT_EQ(data.file_authorship.size(), 2u);
        EXPECT_EQ(data.file_authorship[0].file, "src/b.cpp");
        EXPECT_EQ(data.file_authorship[0].authors[0].author, "Alice");
        EXPECT_DOUBLE_EQ(data.file_authorship[0].authors[0].lines, 80.0);
        EXPECT_EQ(data.file_authorship[1].file, "src/a.cpp");
        EXPECT_DOUBLE_EQ(data.file_authorship[1].authors[0].lines, 12.5);

        EXPECT_EQ(data.total_files, 2u);
        EXPECT_EQ(data.total_authorship.size(), 3u);
        EXPECT_TRUE(result.value().history.empty());
    }

    TEST(AuthorshipIoTest, EmptyFileHasNoAuthors) {
        const auto result = parse_authorship_json(R"({"fileAuthorship": {"empty.txt": {}}})");
        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().authorship.file_authorship[0].authors.empty());
    }

    TEST(AuthorshipIoTest, ParsesHistoryAndErrors) {
        const auto result = parse_authorship_json(R"({
            "fileAuthorship": {"a.cpp": {"Alice": 10}},
            "commitHistory": {
                "a.cpp": [{"author": "Alice", "timestamp": 1700000000, "hash": "abc123"}]
            },
            "errors": ["Could not analyze \"b.cpp\""]
        })");
        ASSERT_TRUE(result.is_ok()) << result.error();

        const auto& records = result.value().history.at("a.cpp");
        ASSERT_EQ(records.size(), 1u);
        EXPECT_EQ(records[0].author, "Alice");
        EXPECT_EQ(records[0].revision, "abc123");
        EXPECT_EQ(records[0].timestamp, Timestamp{std::chrono::seconds{1700000000}});

        ASSERT_EQ(result.value().authorship.errors.size(), 1u);
    }

    TEST(AuthorshipIoTest, MissingAuthorshipIsParseError) {
        const auto result = parse_authorship_json(R"({"commitHistory": {}})");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    }

    TEST(AuthorshipIoTest, NegativeLinesReadAsZeroAndNoted) {
        const auto result = parse_authorship_json(R"({
            "fileAuthorship": {"a": {"Alice": -5, "Bob": 3}},
            "errors": ["Could not analyze \"b\""]
        })");
        ASSERT_TRUE(result.is_ok()) << result.error();

        const auto& data = result.value().authorship;
        ASSERT_EQ(data.file_authorship[0].authors.size(), 2u);
        EXPECT_EQ(data.file_authorship[0].authors[0].author, "Alice");
        EXPECT_DOUBLE_EQ(data.file_authorship[0].authors[0].lines, 0.0);
        EXPECT_DOUBLE_EQ(data.file_authorship[0].authors[1].lines, 3.0);

        ASSERT_EQ(data.errors.size(), 2u);
        EXPECT_EQ(data.errors[0], "Could not analyze \"b\"");
        EXPECT_EQ(data.errors[1], "Negative line count for \"Alice\" in \"a\" treated as 0");
    }

    TEST(AuthorshipIoTest, NonNumericLinesRejected) {
        const auto result = parse_authorship_json(R"({"fileAuthorship": {"a": {"Alice": "ten"}}})");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().message(), "Line count must be a number");
        EXPECT_EQ(result.error().context().value(), "a: Alice");
    }

    TEST(AuthorshipIoTest, BadCommitRecordRejected) {
        const auto result = parse_authorship_json(R"({
            "fileAuthorship": {"a": {"Alice": 1}},
            "commitHistory": {"a": [{"author": "Alice"}]}
        })");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    }

    TEST(AuthorshipIoTest, MillisecondTimestampRejected) {
        const auto result = parse_authorship_json(R"({
            "fileAuthorship": {"a": {"Alice": 1}},
            "commitHistory": {"a": [{"author": "Alice", "timestamp": 1700000000000000}]}
        })");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
        EXPECT_EQ(result.error().message(), "Commit timestamp out of range (expected epoch seconds)");
    }

    TEST(AuthorshipIoTest, NegativeTimestampWithinRangeAccepted) {
        const auto result = parse_authorship_json(R"({
            "fileAuthorship": {"a": {"Alice": 1}},
            "commitHistory": {"a": [{"author": "Alice", "timestamp": -86400}]}
        })");
        ASSERT_TRUE(result.is_ok()) << result.error();
        EXPECT_EQ(result.value().history.at("a")[0].timestamp, Timestamp{std::chrono::seconds{-86400}});
    }

    TEST(AuthorshipIoTest, SyntaxError) {
        const auto result = parse_authorship_json("{\"fileAuthorship\": ");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().message(), "JSON parse error");
    }

    class AuthorshipFileTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir_ = fs::temp_directory_path() / "bfa_io_test";
            fs::create_directories(temp_dir_);
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(temp_dir_, ec);
        }

        fs::path temp_dir_;
    };

    TEST_F(AuthorshipFileTest, LoadsFromDisk) {
        const fs::path path = temp_dir_ / "authorship.json";
        {
            std::ofstream file(path);
            file << R"({"fileAuthorship": {"main.cpp": {"Alice": 3}}})";
        }

        const auto result = load_authorship_json(path);
        ASSERT_TRUE(result.is_ok()) << result.error();
        EXPECT_EQ(result.value().authorship.repo_path, temp_dir_);
        EXPECT_EQ(result.value().authorship.total_files, 1u);
    }

    TEST_F(AuthorshipFileTest, MissingFile) {
        const auto result = load_authorship_json(temp_dir_ / "nope.json");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }
}
