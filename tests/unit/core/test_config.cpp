//
// Created by gregorian-rayne on 2/11/26.
//

#include "bfa/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace bfa
{
    namespace fs = std::filesystem;

    TEST(AnalysisConfigTest, Defaults) {
        const AnalysisConfig config;

        EXPECT_DOUBLE_EQ(config.decay_rate, 0.5);
        EXPECT_EQ(config.window_days, 548);
        EXPECT_DOUBLE_EQ(config.threshold, 0.5);
        EXPECT_DOUBLE_EQ(config.max_decay_multiplier, 0.01);
        EXPECT_EQ(config.top_contributors, 10u);
        EXPECT_EQ(config.history_threads, 0u);
        EXPECT_TRUE(config.validate().is_ok());
    }

    TEST(AnalysisConfigTest, RejectsNegativeDecayRate) {
        AnalysisConfig config;
        config.decay_rate = -0.1;

        const auto result = config.validate();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST(AnalysisConfigTest, ZeroDecayRateIsAllowed) {
        AnalysisConfig config;
        config.decay_rate = 0.0;
        EXPECT_TRUE(config.validate().is_ok());
    }

    TEST(AnalysisConfigTest, RejectsNonPositiveWindow) {
        AnalysisConfig config;
        config.window_days = 0;
        EXPECT_TRUE(config.validate().is_err());

        config.window_days = -30;
        EXPECT_TRUE(config.validate().is_err());
    }

    TEST(AnalysisConfigTest, ThresholdRange) {
        AnalysisConfig config;

        config.threshold = 0.0;
        EXPECT_TRUE(config.validate().is_ok());

        config.threshold = 0.99;
        EXPECT_TRUE(config.validate().is_ok());

        config.threshold = 1.0;
        EXPECT_TRUE(config.validate().is_err());

        config.threshold = -0.01;
        EXPECT_TRUE(config.validate().is_err());
    }

    TEST(AnalysisConfigTest, MultiplierAndTopCount) {
        AnalysisConfig config;
        config.max_decay_multiplier = 0.0;
        EXPECT_TRUE(config.validate().is_err());

        config.max_decay_multiplier = 1.0;
        EXPECT_TRUE(config.validate().is_ok());

        config.top_contributors = 0;
        EXPECT_TRUE(config.validate().is_err());
    }

    TEST(ConfigLoadTest, EmptyDocumentKeepsDefaults) {
        const auto result = load_config_string("");
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().window_days, 548);
    }

    TEST(ConfigLoadTest, ReadsAnalysisSection) {
        const auto result = load_config_string(R"(
[analysis]
decay_rate = 1.25
window_days = 365
threshold = 0.6
top_contributors = 5
history_threads = 4
)");
        ASSERT_TRUE(result.is_ok()) << result.error();

        const auto& config = result.value();
        EXPECT_DOUBLE_EQ(config.decay_rate, 1.25);
        EXPECT_EQ(config.window_days, 365);
        EXPECT_DOUBLE_EQ(config.threshold, 0.6);
        EXPECT_DOUBLE_EQ(config.max_decay_multiplier, 0.01);
        EXPECT_EQ(config.top_contributors, 5u);
        EXPECT_EQ(config.history_threads, 4u);
    }

    TEST(ConfigLoadTest, WrongTypeIsConfigError) {
        const auto result = load_config_string("[analysis]\nwindow_days = \"long\"\n");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
        EXPECT_EQ(result.error().context().value(), "analysis.window_days");
    }

    TEST(ConfigLoadTest, SyntaxErrorIsParseError) {
        const auto result = load_config_string("[analysis\ndecay_rate = ");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    }

    TEST(ConfigLoadTest, InvalidValuesFailValidation) {
        const auto result = load_config_string("[analysis]\nthreshold = 1.5\n");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST(ConfigLoadTest, NegativeCountRejected) {
        const auto result = load_config_string("[analysis]\ntop_contributors = -3\n");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST(ConfigLoadTest, WindowBeyondIntRangeRejected) {
        const auto result = load_config_string("[analysis]\nwindow_days = 5000000000\n");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
        EXPECT_EQ(result.error().message(), "Value out of range");
        EXPECT_EQ(result.error().context().value(), "analysis.window_days");
    }

    TEST(ConfigLoadTest, ThreadCountBeyondRangeRejected) {
        const auto result = load_config_string("[analysis]\nhistory_threads = 8589934592\n");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
        EXPECT_EQ(result.error().context().value(), "analysis.history_threads");
    }

    class ConfigFileTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir_ = fs::temp_directory_path() / "bfa_config_test";
            fs::create_directories(temp_dir_);
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(temp_dir_, ec);
        }

        fs::path write(const std::string& name, const std::string& content) const {
            const fs::path path = temp_dir_ / name;
            std::ofstream file(path);
            file << content;
            return path;
        }

        fs::path temp_dir_;
    };

    TEST_F(ConfigFileTest, LoadsFile) {
        const auto path = write("bfa.toml", "[analysis]\ndecay_rate = 2.0\n");

        const auto result = load_config_file(path);
        ASSERT_TRUE(result.is_ok());
        EXPECT_DOUBLE_EQ(result.value().decay_rate, 2.0);
    }

    TEST_F(ConfigFileTest, MissingFileIsNotFound) {
        const auto result = load_config_file(temp_dir_ / "missing.toml");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }
}
