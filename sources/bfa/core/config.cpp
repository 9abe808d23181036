//
// Created by gregorian-rayne on 2/11/26.
//

#include "bfa/config.hpp"

#include <toml++/toml.h>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace bfa
{
    namespace {

        template<typename T>
        Result<void, Error> read_key(const toml::table& section, const std::string_view key, T& out) {
            const toml::node* node = section.get(key);
            if (node == nullptr) {
                return Result<void, Error>::success();
            }
            if (const auto value = node->value<T>()) {
                out = *value;
                return Result<void, Error>::success();
            }
            return Result<void, Error>::failure(
                Error::config_error("Invalid value type", "analysis." + std::string(key))
            );
        }

        Result<void, Error> read_count(const toml::table& section, const std::string_view key, std::int64_t& out) {
            if (auto result = read_key(section, key, out); result.is_err()) {
                return result;
            }
            if (out < 0) {
                return Result<void, Error>::failure(
                    Error::config_error("Value must not be negative", "analysis." + std::string(key))
                );
            }
            return Result<void, Error>::success();
        }

        Result<void, Error> check_range(
            const std::string_view key,
            const std::int64_t value,
            const std::int64_t min,
            const std::int64_t max
        ) {
            if (value < min || value > max) {
                return Result<void, Error>::failure(
                    Error::config_error("Value out of range", "analysis." + std::string(key))
                );
            }
            return Result<void, Error>::success();
        }

    }  // namespace

    Result<void, Error> AnalysisConfig::validate() const {
        if (!(decay_rate >= 0.0)) {
            return Result<void, Error>::failure(
                Error::config_error("Decay rate must be non-negative", "decay_rate=" + std::to_string(decay_rate))
            );
        }
        if (window_days <= 0) {
            return Result<void, Error>::failure(
                Error::config_error("History window must be positive", "window_days=" + std::to_string(window_days))
            );
        }
        if (!(threshold >= 0.0 && threshold < 1.0)) {
            return Result<void, Error>::failure(
                Error::config_error("Threshold must be in [0, 1)", "threshold=" + std::to_string(threshold))
            );
        }
        if (!(max_decay_multiplier > 0.0 && max_decay_multiplier <= 1.0)) {
            return Result<void, Error>::failure(
                Error::config_error("Maximum decay multiplier must be in (0, 1]",
                                    "max_decay_multiplier=" + std::to_string(max_decay_multiplier))
            );
        }
        if (top_contributors == 0) {
            return Result<void, Error>::failure(
                Error::config_error("Top contributor count must be positive", "top_contributors=0")
            );
        }
        return Result<void, Error>::success();
    }

    Result<AnalysisConfig, Error> load_config_string(const std::string_view content) {
        toml::table tbl;
        try {
            tbl = toml::parse(content);
        } catch (const toml::parse_error& err) {
            std::ostringstream where;
            where << "line " << err.source().begin.line << ": " << err.description();
            return Result<AnalysisConfig, Error>::failure(
                Error::parse_error("Invalid TOML configuration", where.str())
            );
        }

        AnalysisConfig config;
        const toml::table* section = tbl["analysis"].as_table();
        if (section == nullptr) {
            if (tbl.contains("analysis")) {
                return Result<AnalysisConfig, Error>::failure(
                    Error::config_error("[analysis] must be a table")
                );
            }
            return Result<AnalysisConfig, Error>::success(config);
        }

        std::int64_t window_days = config.window_days;
        auto top = static_cast<std::int64_t>(config.top_contributors);
        auto threads = static_cast<std::int64_t>(config.history_threads);

        for (auto result : {
                 read_key(*section, "decay_rate", config.decay_rate),
                 read_key(*section, "threshold", config.threshold),
                 read_key(*section, "max_decay_multiplier", config.max_decay_multiplier),
                 read_key(*section, "window_days", window_days),
                 read_count(*section, "top_contributors", top),
                 read_count(*section, "history_threads", threads)}) {
            if (result.is_err()) {
                return Result<AnalysisConfig, Error>::failure(result.error());
            }
        }

        for (auto result : {
                 check_range("window_days", window_days,
                             std::numeric_limits<int>::min(), std::numeric_limits<int>::max()),
                 check_range("history_threads", threads,
                             0, std::numeric_limits<unsigned int>::max())}) {
            if (result.is_err()) {
                return Result<AnalysisConfig, Error>::failure(result.error());
            }
        }

        config.window_days = static_cast<int>(window_days);
        config.top_contributors = static_cast<std::size_t>(top);
        config.history_threads = static_cast<unsigned int>(threads);

        if (auto valid = config.validate(); valid.is_err()) {
            return Result<AnalysisConfig, Error>::failure(valid.error());
        }
        return Result<AnalysisConfig, Error>::success(config);
    }

    Result<AnalysisConfig, Error> load_config_file(const std::filesystem::path& path) {
        if (std::error_code ec; !std::filesystem::exists(path, ec)) {
            return Result<AnalysisConfig, Error>::failure(
                Error::not_found("Configuration file not found", path.string())
            );
        }

        std::ifstream file(path);
        if (!file) {
            return Result<AnalysisConfig, Error>::failure(
                Error::io_error("Failed to open configuration file", path.string())
            );
        }

        std::ostringstream content;
        content << file.rdbuf();

        auto config = load_config_string(content.str());
        if (config.is_err()) {
            return Result<AnalysisConfig, Error>::failure(config.error().with_context(path.string()));
        }
        return config;
    }
}  // namespace bfa
