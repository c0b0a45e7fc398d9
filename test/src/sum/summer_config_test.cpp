#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "sum/summer_config.hpp"
#include "testutil/outcome.hpp"

using selsum::sum::LoadSummerConfig;
using selsum::sum::SummerConfig;
using selsum::sum::SummerError;
using selsum::sum::ValidateSummerConfig;

class SummerConfigFileTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        path_ = std::filesystem::temp_directory_path() /
                ( std::string( "selsum_config_" ) +
                  ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json" );
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove( path_, ec );
    }

    void WriteConfig( const std::string &content )
    {
        std::ofstream file( path_ );
        file << content;
    }

    std::filesystem::path path_;
};

TEST( SummerConfigTest, Defaults )
{
    SummerConfig config;

    EXPECT_EQ( config.precision_limit, 200 );
    EXPECT_EQ( config.expansion_limit, 4096 );
    EXPECT_EQ( config.log_level, "info" );
    EXPECT_OUTCOME_TRUE_1( ValidateSummerConfig( config ) );
}

TEST( SummerConfigTest, EffectiveExpansionLimitNeverBelowPrecision )
{
    SummerConfig config;
    EXPECT_EQ( config.EffectiveExpansionLimit(), 4096 );

    config.precision_limit = 5000;
    EXPECT_EQ( config.EffectiveExpansionLimit(), 5000 );
}

/**
 * @given settings with one invalid value each
 * @when they are validated
 * @then the matching SummerError is returned
 */
TEST( SummerConfigTest, ValidationErrors )
{
    SummerConfig precision;
    precision.precision_limit = 0;
    EXPECT_OUTCOME_ERROR( precision_error, ValidateSummerConfig( precision ), SummerError::NON_POSITIVE_PRECISION_LIMIT );

    SummerConfig expansion;
    expansion.expansion_limit = -1;
    EXPECT_OUTCOME_ERROR( expansion_error, ValidateSummerConfig( expansion ), SummerError::NON_POSITIVE_EXPANSION_LIMIT );

    SummerConfig level;
    level.log_level = "loud";
    EXPECT_OUTCOME_ERROR( level_error, ValidateSummerConfig( level ), SummerError::UNKNOWN_LOG_LEVEL );
}

/**
 * @given a JSON file setting some of the keys
 * @when it is loaded
 * @then those keys override the defaults and the others keep them
 */
TEST_F( SummerConfigFileTest, LoadsPartialFile )
{
    WriteConfig( R"({ "precision_limit": 60, "log_level": "debug" })" );

    EXPECT_OUTCOME_TRUE( config, LoadSummerConfig( path_.string() ) );
    EXPECT_EQ( config.precision_limit, 60 );
    EXPECT_EQ( config.expansion_limit, 4096 );
    EXPECT_EQ( config.log_level, "debug" );
}

TEST_F( SummerConfigFileTest, KeepsGivenDefaults )
{
    WriteConfig( R"({ "expansion_limit": 100 })" );

    SummerConfig defaults;
    defaults.precision_limit = 12;
    EXPECT_OUTCOME_TRUE( config, LoadSummerConfig( path_.string(), defaults ) );
    EXPECT_EQ( config.precision_limit, 12 );
    EXPECT_EQ( config.expansion_limit, 100 );
}

TEST_F( SummerConfigFileTest, MissingFile )
{
    EXPECT_OUTCOME_ERROR( error, LoadSummerConfig( path_.string() ), SummerError::CONFIG_FILE_UNREADABLE );
}

TEST_F( SummerConfigFileTest, MalformedJson )
{
    WriteConfig( "{ \"precision_limit\": " );

    EXPECT_OUTCOME_ERROR( error, LoadSummerConfig( path_.string() ), SummerError::CONFIG_PARSE_FAILED );
}

TEST_F( SummerConfigFileTest, WrongValueType )
{
    WriteConfig( R"({ "precision_limit": "many" })" );

    EXPECT_OUTCOME_ERROR( error, LoadSummerConfig( path_.string() ), SummerError::CONFIG_PARSE_FAILED );
}

TEST_F( SummerConfigFileTest, InvalidValueInFile )
{
    WriteConfig( R"({ "precision_limit": 0 })" );

    EXPECT_OUTCOME_ERROR( error, LoadSummerConfig( path_.string() ), SummerError::NON_POSITIVE_PRECISION_LIMIT );
}
