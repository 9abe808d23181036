//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef BUSFACTORANALYZER_VERSION_HPP
#define BUSFACTORANALYZER_VERSION_HPP

/**
 * @file version.hpp
 * @brief Bus Factor Analyzer version information.
 */

namespace bfa {

    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 2;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "1.2.0";

    /**
     * Project name.
     */
    constexpr auto PROJECT_NAME = "Bus Factor Analyzer";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "bfa";

}  // namespace bfa

#endif //BUSFACTORANALYZER_VERSION_HPP
