//
// Created by gregorian-rayne on 2/13/26.
//

#ifndef BFA_JSON_UTILS_HPP
#define BFA_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief JSON helpers on top of nlohmann/json.
 *
 * All operations use Result<T, Error> for error handling.
 */

#include "bfa/result.hpp"
#include "bfa/error.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace bfa::json_utils {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    /**
     * Parses JSON text. Pass nlohmann::ordered_json to keep key order.
     */
    template<typename Json = json>
    Result<Json, Error> parse(std::string_view content) {
        try {
            return Result<Json, Error>::success(Json::parse(content));
        } catch (const typename Json::parse_error& e) {
            return Result<Json, Error>::failure(
                Error::parse_error("JSON parse error", e.what())
            );
        }
    }

    /**
     * Reads and parses a JSON file.
     *
     * @param path Path to the JSON file.
     * @return The parsed JSON value, NotFound, IoError or ParseError.
     */
    template<typename Json = json>
    Result<Json, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<Json, Error>::failure(
                Error::not_found("JSON file not found", path.string())
            );
        }

        std::ifstream file(path);
        if (!file) {
            return Result<Json, Error>::failure(
                Error::io_error("Failed to open JSON file", path.string())
            );
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();

        auto result = parse<Json>(buffer.str());
        if (result.is_err()) {
            return Result<Json, Error>::failure(result.error().with_context(path.string()));
        }
        return result;
    }

    /**
     * Serializes a JSON value.
     *
     * Invalid UTF-8 in author names is replaced instead of throwing.
     *
     * @param indent Indentation level (-1 for compact output).
     */
    inline std::string to_string(const json& data, const int indent = -1) {
        return data.dump(indent, ' ', false, json::error_handler_t::replace);
    }

    /**
     * Writes a JSON value to a file, creating parent directories.
     *
     * @param indent Indentation level (-1 for compact output).
     */
    inline Result<void, Error> write_file(
        const fs::path& path,
        const json& data,
        int indent = 2
    ) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        file << to_string(data, indent) << '\n';

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write JSON file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

}  // namespace bfa::json_utils

#endif //BFA_JSON_UTILS_HPP
