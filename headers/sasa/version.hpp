//
// Created by gregorian-rayne on 1/6/26.
//

#ifndef SASA_VERSION_HPP
#define SASA_VERSION_HPP

/**
 * @file version.hpp
 * @brief SAS Static Analyzer version information.
 */

namespace sasa {

    /**
     * Incremented for breaking changes to the report shape.
     */
    constexpr int VERSION_MAJOR = 1;

    constexpr int VERSION_MINOR = 0;

    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "1.0.0";

    constexpr auto PROJECT_NAME = "SAS Static Analyzer";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "sasa";

}  // namespace sasa

#endif //SASA_VERSION_HPP
