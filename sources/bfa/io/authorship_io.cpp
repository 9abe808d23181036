//
// Created by gregorian-rayne on 2/14/26.
//

#include "bfa/io/authorship_io.hpp"
#include "bfa/utils/json_utils.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>

namespace bfa::io
{
    using ojson = nlohmann::ordered_json;

    namespace {

        Result<FileAuthorship, Error> parse_file_authorship(const ojson& node, std::vector<std::string>& warnings) {
            if (!node.is_object()) {
                return Result<FileAuthorship, Error>::failure(
                    Error::parse_error("fileAuthorship must be an object")
                );
            }

            FileAuthorship authorship;
            authorship.reserve(node.size());

            for (const auto& [file, authors] : node.items()) {
                if (!authors.is_object()) {
                    return Result<FileAuthorship, Error>::failure(
                        Error::parse_error("Authors must be an object", file)
                    );
                }

                FileAuthors entry;
                entry.file = file;
                for (const auto& [author, lines] : authors.items()) {
                    if (!lines.is_number()) {
                        return Result<FileAuthorship, Error>::failure(
                            Error::parse_error("Line count must be a number", file + ": " + author)
                        );
                    }
                    double value = lines.get<double>();
                    // A negative count contributes nothing and is reported.
                    if (value < 0.0) {
                        warnings.push_back("Negative line count for \"" + author + "\" in \"" + file +
                                           "\" treated as 0");
                        value = 0.0;
                    }
                    add_lines(entry.authors, author, value);
                }
                authorship.push_back(std::move(entry));
            }

            return Result<FileAuthorship, Error>::success(std::move(authorship));
        }

        Result<CommitRecord, Error> parse_commit(const ojson& node, const std::string& file) {
            if (!node.is_object()
                || !node.contains("author") || !node["author"].is_string()
                || !node.contains("timestamp") || !node["timestamp"].is_number()) {
                return Result<CommitRecord, Error>::failure(
                    Error::parse_error("Commit record needs author and timestamp", file)
                );
            }

            // Epoch seconds must fit the clock's nanosecond representation.
            constexpr auto max_seconds = std::chrono::duration_cast<std::chrono::seconds>(
                Timestamp::duration::max()
            ).count();
            const double seconds = node["timestamp"].get<double>();
            if (!(std::abs(seconds) < static_cast<double>(max_seconds))) {
                return Result<CommitRecord, Error>::failure(
                    Error::parse_error("Commit timestamp out of range (expected epoch seconds)",
                                       file + ": " + node["timestamp"].dump())
                );
            }

            CommitRecord record;
            record.author = node["author"].get<std::string>();
            record.timestamp = Timestamp{std::chrono::seconds{static_cast<std::int64_t>(seconds)}};
            if (node.contains("hash") && node["hash"].is_string()) {
                record.revision = node["hash"].get<std::string>();
            }
            return Result<CommitRecord, Error>::success(std::move(record));
        }

        Result<FileCommitHistory, Error> parse_history(const ojson& node) {
            if (!node.is_object()) {
                return Result<FileCommitHistory, Error>::failure(
                    Error::parse_error("commitHistory must be an object")
                );
            }

            FileCommitHistory history;
            for (const auto& [file, records] : node.items()) {
                if (!records.is_array()) {
                    return Result<FileCommitHistory, Error>::failure(
                        Error::parse_error("Commit history must be an array", file)
                    );
                }

                auto& list = history[file];
                for (const auto& record : records) {
                    auto parsed = parse_commit(record, file);
                    if (parsed.is_err()) {
                        return Result<FileCommitHistory, Error>::failure(parsed.error());
                    }
                    list.push_back(std::move(parsed.value()));
                }
            }

            return Result<FileCommitHistory, Error>::success(std::move(history));
        }

    }  // namespace

    Result<AnalysisInput, Error> authorship_from_json(const ojson& document) {
        if (!document.is_object() || !document.contains("fileAuthorship")) {
            return Result<AnalysisInput, Error>::failure(
                Error::parse_error("Missing fileAuthorship")
            );
        }

        std::vector<std::string> errors;
        auto authorship = parse_file_authorship(document["fileAuthorship"], errors);
        if (authorship.is_err()) {
            return Result<AnalysisInput, Error>::failure(authorship.error());
        }

        FileCommitHistory history;
        if (document.contains("commitHistory")) {
            auto parsed = parse_history(document["commitHistory"]);
            if (parsed.is_err()) {
                return Result<AnalysisInput, Error>::failure(parsed.error());
            }
            history = std::move(parsed.value());
        }

        // Errors carried by the document come before the ones found here.
        std::size_t recorded = 0;
        if (document.contains("errors")) {
            const auto& node = document["errors"];
            if (!node.is_array()) {
                return Result<AnalysisInput, Error>::failure(
                    Error::parse_error("errors must be an array")
                );
            }
            for (const auto& message : node) {
                if (!message.is_string()) {
                    return Result<AnalysisInput, Error>::failure(
                        Error::parse_error("errors must contain strings")
                    );
                }
                errors.insert(errors.begin() + recorded++, message.get<std::string>());
            }
        }

        AnalysisInput input;
        input.authorship = make_authorship_data(std::move(authorship.value()), std::move(errors));
        input.history = std::move(history);
        return Result<AnalysisInput, Error>::success(std::move(input));
    }

    Result<AnalysisInput, Error> parse_authorship_json(const std::string_view content) {
        return json_utils::parse<ojson>(content).and_then(
            [](const ojson& document) { return authorship_from_json(document); }
        );
    }

    Result<AnalysisInput, Error> load_authorship_json(const std::filesystem::path& path) {
        auto result = json_utils::read_file<ojson>(path).and_then(
            [](const ojson& document) { return authorship_from_json(document); }
        );
        if (result.is_err()) {
            return Result<AnalysisInput, Error>::failure(result.error().with_context(path.string()));
        }
        result.value().authorship.repo_path = path.parent_path();
        return result;
    }
}  // namespace bfa::io
