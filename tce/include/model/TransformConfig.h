#pragma once

#include "model/DegradationTier.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace TCE {

/**
 * @brief Immutable per-run configuration
 *
 * Built once through TransformConfig::Builder, which validates every field,
 * and passed by const reference into the driver. Shared read-only between
 * units transformed in parallel.
 *
 * @code
 * auto config = TransformConfig::Builder()
 *                   .addTestPrefix("check_")
 *                   .setTier(DegradationTier::Advanced)
 *                   .build();
 * @endcode
 */
class TransformConfig {
public:
    class Builder;

    /**
     * @brief Default configuration: prefix "test", tier chosen by analysis
     */
    TransformConfig();

    const std::vector<std::string> &getTestPrefixes() const {
        return testPrefixes_;
    }

    bool isLoopParametrizeEnabled() const {
        return enableLoopParametrize_;
    }

    bool keepsLegacyClassStructure() const {
        return keepLegacyClassStructure_;
    }

    const std::optional<DegradationTier> &getTier() const {
        return tier_;
    }

    int getDefaultDecimalPlaces() const {
        return defaultDecimalPlaces_;
    }

    bool generatesParametrizeIds() const {
        return parametrizeIds_;
    }

    bool generatesParametrizeAnnotations() const {
        return parametrizeAnnotations_;
    }

    const std::optional<std::chrono::milliseconds> &getStageDeadline() const {
        return stageDeadline_;
    }

    /**
     * @brief True if name starts with one of the accepted test prefixes
     */
    bool isTestName(const std::string &name) const;

    /**
     * @brief True if some prefix other than the default "test" is configured
     */
    bool hasCustomPrefixes() const;

private:
    std::vector<std::string> testPrefixes_;
    bool enableLoopParametrize_ = true;
    bool keepLegacyClassStructure_ = false;
    std::optional<DegradationTier> tier_;
    int defaultDecimalPlaces_;
    bool parametrizeIds_ = true;
    bool parametrizeAnnotations_ = false;
    std::optional<std::chrono::milliseconds> stageDeadline_;
};

/**
 * @brief Validating builder for TransformConfig
 */
class TransformConfig::Builder {
public:
    Builder();

    /**
     * @brief Replace the accepted prefixes
     */
    Builder &setTestPrefixes(std::vector<std::string> prefixes);

    /**
     * @brief Accept one more prefix in addition to the current ones
     */
    Builder &addTestPrefix(const std::string &prefix);

    Builder &setLoopParametrize(bool enabled);
    Builder &setKeepLegacyClassStructure(bool keep);
    Builder &setTier(DegradationTier tier);
    Builder &setDefaultDecimalPlaces(int places);
    Builder &setParametrizeIds(bool enabled);
    Builder &setParametrizeAnnotations(bool enabled);
    Builder &setStageDeadline(std::chrono::milliseconds deadline);

    /**
     * @brief Validate and produce the configuration
     * @throws ConfigurationError on an empty prefix list, malformed prefix,
     *         negative decimal places or non-positive deadline
     */
    TransformConfig build() const;

private:
    TransformConfig config_;
};

}  // namespace TCE
