#include "sum/summer_config.hpp"

#include <algorithm>
#include <fstream>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "base/logger.hpp"

namespace selsum::sum
{
    uint64_t SummerConfig::EffectiveExpansionLimit() const
    {
        return static_cast<uint64_t>( std::max( expansion_limit, precision_limit ) );
    }

    outcome::result<void> ValidateSummerConfig( const SummerConfig &config )
    {
        if ( config.precision_limit <= 0 )
        {
            return SummerError::NON_POSITIVE_PRECISION_LIMIT;
        }
        if ( config.expansion_limit <= 0 )
        {
            return SummerError::NON_POSITIVE_EXPANSION_LIMIT;
        }
        if ( !base::isKnownLogLevel( config.log_level ) )
        {
            return SummerError::UNKNOWN_LOG_LEVEL;
        }
        return outcome::success();
    }

    outcome::result<SummerConfig> LoadSummerConfig( const std::string &config_path, const SummerConfig &defaults )
    {
        auto logger = base::createLogger( "SummerConfig" );

        std::ifstream stream( config_path );
        if ( !stream )
        {
            logger->error( "Cannot open config file {}", config_path );
            return SummerError::CONFIG_FILE_UNREADABLE;
        }

        SummerConfig config = defaults;
        try
        {
            boost::property_tree::ptree tree;
            boost::property_tree::read_json( stream, tree );

            // a value of the wrong type throws ptree_bad_data
            if ( tree.count( "precision_limit" ) != 0 )
            {
                config.precision_limit = tree.get<int64_t>( "precision_limit" );
            }
            if ( tree.count( "expansion_limit" ) != 0 )
            {
                config.expansion_limit = tree.get<int64_t>( "expansion_limit" );
            }
            if ( tree.count( "log_level" ) != 0 )
            {
                config.log_level = tree.get<std::string>( "log_level" );
            }
        }
        catch ( const boost::property_tree::ptree_error &e )
        {
            logger->error( "Cannot parse config file {}: {}", config_path, e.what() );
            return SummerError::CONFIG_PARSE_FAILED;
        }

        OUTCOME_TRY( ValidateSummerConfig( config ) );
        logger->debug( "Loaded {}: precision_limit={} expansion_limit={} log_level={}",
                       config_path,
                       config.precision_limit,
                       config.expansion_limit,
                       config.log_level );
        return config;
    }
} // namespace selsum::sum
