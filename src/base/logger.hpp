#ifndef SELSUM_LOGGER_HPP
#define SELSUM_LOGGER_HPP

#include <string>

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace selsum::base
{
    using Logger = std::shared_ptr<spdlog::logger>;

    /**
     * Provide logger object
     * @param tag - tagging name for identifying logger
     * @return logger object, shared with every caller asking for the same tag
     */
    Logger createLogger( const std::string &tag );

    /**
     * Apply a spdlog level name ("trace", "debug", "info", "warning", "error",
     * "critical", "off") to every registered logger and to the ones created later.
     * @param level - spdlog level name
     * @return false if the name is not a known level, nothing is changed then
     */
    bool setLogLevel( const std::string &level );

    /**
     * @param level - candidate level name
     * @return true if setLogLevel() would accept it
     */
    bool isKnownLogLevel( const std::string &level );
} // namespace selsum::base

#endif // SELSUM_LOGGER_HPP
