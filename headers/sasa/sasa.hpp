//
// Created by gregorian-rayne on 1/6/26.
//

#ifndef SASA_SASA_HPP
#define SASA_SASA_HPP

/**
 * @file sasa.hpp
 * @brief Main header for the SAS Static Analyzer library.
 *
 * Pulls in the analysis entry point, the report exporters and the
 * configuration loader. Include specific headers for more targeted
 * dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"

#include "analyzers/analyzer.hpp"
#include "config/config.hpp"
#include "exporters/exporter.hpp"
#include "utils/file_utils.hpp"
#include "utils/string_utils.hpp"

#endif //SASA_SASA_HPP
