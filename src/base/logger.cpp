#include "base/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{
    void setGlobalPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S][%l][%n] %v" );
    }

    // stdout carries the summation result, diagnostics go to stderr.
    // The registry hands new loggers the level last set by setLogLevel().
    std::shared_ptr<spdlog::logger> createLogger( const std::string &tag )
    {
        auto logger = spdlog::stderr_color_mt( tag );
        setGlobalPattern( *logger );
        return logger;
    }

    std::mutex &loggerMutex()
    {
        static std::mutex mutex;
        return mutex;
    }
} // namespace

namespace selsum::base
{
    Logger createLogger( const std::string &tag )
    {
        std::lock_guard<std::mutex> lock( loggerMutex() );
        auto                        logger = spdlog::get( tag );
        if ( logger == nullptr )
        {
            logger = ::createLogger( tag );
        }
        return logger;
    }

    bool isKnownLogLevel( const std::string &level )
    {
        // from_str maps unknown names to "off", so only "off" itself may yield it
        return level == "off" || spdlog::level::from_str( level ) != spdlog::level::off;
    }

    bool setLogLevel( const std::string &level )
    {
        if ( !isKnownLogLevel( level ) )
        {
            return false;
        }
        std::lock_guard<std::mutex> lock( loggerMutex() );
        spdlog::set_level( spdlog::level::from_str( level ) );
        return true;
    }
} // namespace selsum::base
