//
// Created by gregorian-rayne on 2/14/26.
//

#ifndef BFA_AUTHORSHIP_IO_HPP
#define BFA_AUTHORSHIP_IO_HPP

/**
 * @file authorship_io.hpp
 * @brief Loading pre-extracted authorship and history from JSON.
 *
 * Format:
 * @code
 * {
 *   "fileAuthorship": { "src/a.cpp": { "Alice": 120, "Bob": 4 } },
 *   "commitHistory":  { "src/a.cpp": [ {"author": "Alice", "timestamp": 1700000000, "hash": "abc"} ] },
 *   "errors": [ "..." ]
 * }
 * @endcode
 *
 * commitHistory and errors are optional. Timestamps are epoch seconds.
 * Files keep document order. A negative line count is read as 0 and noted
 * in errors.
 */

#include "bfa/error.hpp"
#include "bfa/result.hpp"
#include "bfa/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string_view>

namespace bfa::io {

    [[nodiscard]] Result<AnalysisInput, Error> authorship_from_json(const nlohmann::ordered_json& document);

    [[nodiscard]] Result<AnalysisInput, Error> parse_authorship_json(std::string_view content);

    /**
     * Reads an authorship file.
     *
     * @return The input, NotFound, IoError, or ParseError for malformed
     *         content (non-numeric line counts, out-of-range timestamps).
     */
    [[nodiscard]] Result<AnalysisInput, Error> load_authorship_json(const std::filesystem::path& path);

}  // namespace bfa::io

#endif //BFA_AUTHORSHIP_IO_HPP
