//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef BUSFACTORANALYZER_ERROR_HPP
#define BUSFACTORANALYZER_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error types used with Result<T, Error>.
 *
 * Only genuinely invalid requests become errors: an unknown calculation
 * method, an invalid configuration, unreadable input files or a failing git
 * command. Data-shape anomalies in authorship data (empty files, zero line
 * counts) are normal conditions and never produce an Error.
 *
 * Usage:
 * @code
 *     auto report = run_analysis("xyz", input, config);
 *     if (report.is_err()) {
 *         std::cerr << report.error() << std::endl;
 *         // Output: [NotFound] Unknown bus factor calculation method (context: xyz)
 *     }
 * @endcode
 */

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace bfa {

    /**
     * Error category enumeration.
     */
    enum class ErrorCode {
        None,             ///< No error
        InvalidArgument,  ///< Invalid argument or parameter
        NotFound,         ///< Resource or method not found
        ParseError,       ///< Parsing failed
        IoError,          ///< I/O operation failed
        ConfigError,      ///< Configuration validation failed
        AnalysisError,    ///< Analysis could not be performed
        GitError,         ///< Git operation failed
        InternalError     ///< Internal/unexpected error
    };

    /**
     * Converts an ErrorCode to its string representation.
     */
    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "None";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::AnalysisError:   return "AnalysisError";
            case ErrorCode::GitError:        return "GitError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Structured error type with code, message, and optional context.
     *
     * Error objects are immutable after construction.
     */
    class Error {
    public:
        Error(ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message))
            , context_(std::nullopt) {}

        Error(ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message) {
            return {ErrorCode::InvalidArgument, std::move(message)};
        }

        static Error invalid_argument(std::string message, std::string context) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message) {
            return {ErrorCode::NotFound, std::move(message)};
        }

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message) {
            return {ErrorCode::ParseError, std::move(message)};
        }

        static Error parse_error(std::string message, std::string context) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message) {
            return {ErrorCode::IoError, std::move(message)};
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message) {
            return {ErrorCode::ConfigError, std::move(message)};
        }

        static Error config_error(std::string message, std::string context) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error analysis_error(std::string message) {
            return {ErrorCode::AnalysisError, std::move(message)};
        }

        static Error git_error(std::string message) {
            return {ErrorCode::GitError, std::move(message)};
        }

        static Error git_error(std::string message, std::string context) {
            return {ErrorCode::GitError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        /**
         * Creates a new error with additional context appended.
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Formats the error as "[ErrorCode] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const {
            return code_ == other.code_ &&
                   message_ == other.message_ &&
                   context_ == other.context_;
        }

        bool operator!=(const Error& other) const {
            return !(*this == other);
        }

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace bfa

#endif //BUSFACTORANALYZER_ERROR_HPP
