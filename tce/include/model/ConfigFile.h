#pragma once

#include "model/TransformConfig.h"
#include <string>

namespace TCE {

/**
 * @brief JSON configuration file of the command-line tool
 *
 * @code
 * {
 *   "testPrefixes": ["test", "check_"],
 *   "tier": "advanced",
 *   "enableLoopParametrize": true,
 *   "keepLegacyClassStructure": false,
 *   "defaultDecimalPlaces": 7,
 *   "parametrizeIds": true,
 *   "parametrizeAnnotations": false,
 *   "stageDeadlineMs": 5000
 * }
 * @endcode
 *
 * Every key is optional; absent keys keep the builder's current value.
 */
class ConfigFile {
public:
    /**
     * @brief Apply the settings of a JSON document to builder
     * @throws ConfigurationError on malformed JSON, unknown keys or values of the wrong type
     */
    static void apply(const std::string &jsonText, TransformConfig::Builder &builder);
};

}  // namespace TCE
