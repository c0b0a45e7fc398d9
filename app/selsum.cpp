/**
 * @file        selsum.cpp
 * @brief       Command line host: sums the numbers in a text and prints the report an editor would show.
 */

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "base/logger.hpp"
#include "sum/selection_report.hpp"
#include "sum/selection_summer.hpp"
#include "sum/summer_config.hpp"

namespace
{
    constexpr int kExitOk         = 0;
    constexpr int kExitInputError = 1;
    constexpr int kExitUsageError = 2;

    // cmd line options
    struct Options
    {
        bool help  = false;
        bool quiet = false;
        // where the text comes from, standard input when neither is set
        boost::optional<std::string> text;
        boost::optional<std::string> input_path;
        boost::optional<std::string> config_path;
        // overrides of the config file values
        boost::optional<int64_t>     precision_limit;
        boost::optional<int64_t>     expansion_limit;
        boost::optional<std::string> log_level;
        std::string                  usage;
    };

    boost::optional<Options> parseCommandLine( int argc, char **argv )
    {
        namespace po = boost::program_options;
        try
        {
            Options     o;
            std::string text;
            std::string input_path;
            std::string config_path;
            std::string log_level;
            int64_t     precision_limit = 0;
            int64_t     expansion_limit = 0;

            po::options_description desc( "selsum options" );
            desc.add_options()( "help,h", "print usage message" )
                ( "text,t", po::value( &text ), "text to sum, instead of standard input" )
                ( "input,i", po::value( &input_path ), "file holding the text to sum" )
                ( "precision,p", po::value( &precision_limit ), "significant digits kept per number" )
                ( "expansion-limit", po::value( &expansion_limit ), "digit positions a number may span" )
                ( "config,c", po::value( &config_path ), "JSON config file" )
                ( "log-level,l", po::value( &log_level ), "trace, debug, info, warn, error, critical or off" )
                ( "quiet,q", po::bool_switch( &o.quiet ), "print the sum only" )
                ;

            po::variables_map vm;
            po::store( po::parse_command_line( argc, argv, desc ), vm );
            po::notify( vm );

            std::ostringstream usage;
            usage << desc;
            o.usage = usage.str();
            o.help  = vm.count( "help" ) != 0;

            if ( vm.count( "text" ) != 0 && vm.count( "input" ) != 0 )
            {
                std::cerr << "--text and --input are mutually exclusive\n" << desc << "\n";
                return boost::none;
            }
            if ( vm.count( "text" ) != 0 )
            {
                o.text = text;
            }
            if ( vm.count( "input" ) != 0 )
            {
                o.input_path = input_path;
            }
            if ( vm.count( "config" ) != 0 )
            {
                o.config_path = config_path;
            }
            if ( vm.count( "precision" ) != 0 )
            {
                o.precision_limit = precision_limit;
            }
            if ( vm.count( "expansion-limit" ) != 0 )
            {
                o.expansion_limit = expansion_limit;
            }
            if ( vm.count( "log-level" ) != 0 )
            {
                o.log_level = log_level;
            }

            return o;
        }
        catch ( const std::exception &e )
        {
            std::cerr << e.what() << std::endl;
        }
        return boost::none;
    }

    boost::optional<std::string> readInput( const Options &options )
    {
        if ( options.text )
        {
            return options.text;
        }
        if ( options.input_path )
        {
            std::ifstream file( *options.input_path, std::ios::binary );
            if ( !file )
            {
                return boost::none;
            }
            return std::string( std::istreambuf_iterator<char>( file ), std::istreambuf_iterator<char>() );
        }
        return std::string( std::istreambuf_iterator<char>( std::cin ), std::istreambuf_iterator<char>() );
    }
} // namespace

int main( int argc, char *argv[] )
{
    using namespace selsum;

    auto options = parseCommandLine( argc, argv );
    if ( !options )
    {
        return kExitUsageError;
    }
    if ( options->help )
    {
        std::cout << options->usage << "\n";
        return kExitOk;
    }

    sum::SummerConfig config;
    if ( options->config_path )
    {
        auto loaded = sum::LoadSummerConfig( *options->config_path, config );
        if ( !loaded )
        {
            std::cerr << *options->config_path << ": " << loaded.error().message() << std::endl;
            return kExitInputError;
        }
        config = loaded.value();
    }
    if ( options->precision_limit )
    {
        config.precision_limit = *options->precision_limit;
    }
    if ( options->expansion_limit )
    {
        config.expansion_limit = *options->expansion_limit;
    }
    if ( options->log_level )
    {
        config.log_level = *options->log_level;
    }

    if ( auto valid = sum::ValidateSummerConfig( config ); !valid )
    {
        std::cerr << valid.error().message() << std::endl;
        return kExitInputError;
    }
    base::setLogLevel( config.log_level );
    auto logger = base::createLogger( "selsum" );

    auto text = readInput( *options );
    if ( !text )
    {
        logger->error( "Cannot read input file {}", *options->input_path );
        return kExitInputError;
    }

    auto result = sum::SumSelection( *text, config );
    if ( !result )
    {
        logger->error( "Summation failed: {}", result.error().message() );
        return kExitInputError;
    }

    if ( options->quiet )
    {
        std::cout << result.value().rendered_sum << std::endl;
        return kExitOk;
    }

    auto report = sum::ComposeReport( result.value(), config.precision_limit );
    std::cout << report.display_line << "\n";
    for ( const auto &notice : report.notices )
    {
        std::cout << notice << "\n";
    }
    std::cout.flush();
    return kExitOk;
}
