//
// Created by gregorian-rayne on 2/13/26.
//

#ifndef BFA_JSON_REPORT_HPP
#define BFA_JSON_REPORT_HPP

/**
 * @file json_report.hpp
 * @brief JSON serialization of bus factor reports.
 *
 * Keys are camelCase. An undefined ownerless ratio and files without an
 * owner serialize as null. The analysis date is an ISO-8601 UTC string.
 */

#include "bfa/report/report.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace bfa::report
{
    [[nodiscard]] nlohmann::json to_json(const Report& report);

    /**
     * Formats a timestamp as "YYYY-MM-DDTHH:MM:SS.mmmZ".
     */
    [[nodiscard]] std::string format_iso8601(Timestamp time);

}  // namespace bfa::report

#endif //BFA_JSON_REPORT_HPP
