#ifndef SELSUM_SUM_SUMMER_CONFIG_HPP
#define SELSUM_SUM_SUMMER_CONFIG_HPP

#include <cstdint>
#include <string>

#include "outcome/outcome.hpp"
#include "sum/summer_error.hpp"

namespace selsum::sum
{
    /**
     * Settings of one summation. Signed fields so that a caller passing a non-positive limit
     * gets a configuration error instead of a silent wrap-around.
     */
    struct SummerConfig
    {
        static constexpr int64_t kDefaultPrecisionLimit = 200;
        static constexpr int64_t kDefaultExpansionLimit = 4096;

        /// significant digits a single number may carry before it is counted as overflow
        int64_t precision_limit = kDefaultPrecisionLimit;
        /// digit positions a single number may expand to once its exponent is applied
        int64_t     expansion_limit = kDefaultExpansionLimit;
        std::string log_level       = "info";

        /// @return expansion guard actually applied, never below the precision limit
        uint64_t EffectiveExpansionLimit() const;
    };

    /**
     * @brief check limits and log level
     * @param config settings to check
     * @return success, or the SummerError describing the first invalid setting
     */
    outcome::result<void> ValidateSummerConfig( const SummerConfig &config );

    /**
     * @brief read settings from a JSON file such as {"precision_limit": 60, "log_level": "debug"}
     * @param config_path path to the JSON file
     * @param defaults values kept for keys missing from the file
     * @return validated settings or error
     */
    outcome::result<SummerConfig> LoadSummerConfig( const std::string &config_path,
                                                    const SummerConfig &defaults = SummerConfig() );
} // namespace selsum::sum

#endif // SELSUM_SUM_SUMMER_CONFIG_HPP
