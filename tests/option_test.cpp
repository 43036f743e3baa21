// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include <gtest/gtest.h>

#include <exception>
#include <stdexcept>
#include <string>

#include "sim/option.hpp"
#include "sim/sim.hpp"

namespace {

class OptionTest : public ::testing::Test
{
protected:
    sim_t sim;

    void set( const std::string& name, const std::string& value )
    {
        opts::parse( &sim, sim.options, name, value );
    }

    // Message of the innermost nested exception
    static std::string innermost( const std::exception& e )
    {
        try
        {
            std::rethrow_if_nested( e );
        }
        catch ( const std::exception& nested )
        {
            return innermost( nested );
        }
        return e.what();
    }
};

// ============================================================================
// Simulation options
// ============================================================================

TEST_F(OptionTest, Parse_SetsTypedFields)
{
    set( "iterations", "250" );
    set( "fight_length", "300" );
    set( "latency", "0.05" );
    set( "druid.attack_power", "9000" );
    set( "druid.omen", "0" );
    set( "target.sunder", "true" );

    EXPECT_EQ( sim.iterations, 250 );
    EXPECT_EQ( sim.fight_length, timespan_t::from_seconds( 300 ) );
    EXPECT_EQ( sim.latency, timespan_t::from_millis( 50 ) );
    EXPECT_DOUBLE_EQ( sim.druid_config.attack_power, 9000.0 );
    EXPECT_FALSE( sim.druid_config.omen );
    EXPECT_TRUE( sim.target.sunder );
}

TEST_F(OptionTest, Parse_UnknownKeyThrows)
{
    EXPECT_THROW( set( "druid.attack_pwoer", "9000" ), std::invalid_argument );
}

TEST_F(OptionTest, Parse_OutOfRangeThrows)
{
    EXPECT_THROW( set( "druid.furor", "9" ), std::invalid_argument );
    EXPECT_THROW( set( "threads", "0" ), std::invalid_argument );
    EXPECT_THROW( set( "min_combos_for_rip", "6" ), std::invalid_argument );
    EXPECT_EQ( sim.strategy.min_combos_for_rip, 5 ) << "A rejected value leaves the field alone";
}

TEST_F(OptionTest, Parse_MalformedValueThrows)
{
    EXPECT_THROW( set( "iterations", "12abc" ), std::invalid_argument );
    EXPECT_THROW( set( "druid.omen", "maybe" ), std::invalid_argument );
}

// ============================================================================
// Option database
// ============================================================================

TEST_F(OptionTest, Database_CollectsNameValueTokens)
{
    option_db_t db;
    db.parse_text( "# comment line\niterations=10 threads=2\n\nuse_rake=1\n" );

    ASSERT_EQ( db.size(), 3u );
    EXPECT_EQ( db[ 0 ].name, "iterations" );
    EXPECT_EQ( db[ 1 ].value, "2" );
    EXPECT_EQ( db[ 2 ].name, "use_rake" );
}

TEST_F(OptionTest, Database_MissingInputFileThrows)
{
    option_db_t db;
    EXPECT_THROW( db.parse_token( "no_such_file.feral" ), std::invalid_argument );
}

TEST_F(OptionTest, Setup_AppliesDatabaseAndValidates)
{
    option_db_t db;
    db.parse_args( { "iterations=20", "threads=4", "trace=1" } );

    sim.setup( db );

    EXPECT_TRUE( sim.trace );
    EXPECT_EQ( sim.iterations, 1 ) << "A traced run is a single trial";
    EXPECT_EQ( sim.threads, 1 );
}

TEST_F(OptionTest, Validate_ClampsThreadsToIterations)
{
    set( "iterations", "3" );
    set( "threads", "8" );
    sim.validate();
    EXPECT_EQ( sim.threads, 3 );
}

TEST_F(OptionTest, Validate_RejectsNonPositiveFightLength)
{
    set( "fight_length", "0" );
    EXPECT_THROW( sim.validate(), std::invalid_argument );
}

// ============================================================================
// Effects
// ============================================================================

TEST_F(OptionTest, Effect_ParsesDefinition)
{
    set( "effect", "name=Grim_Toll,behavior=chance_proc,stat=arp,amount=612,duration=10,cooldown=45,"
                   "chance_on_hit=0.15" );

    ASSERT_EQ( sim.effect_specs.size(), 1u );
    const effect_spec_t& e = sim.effect_specs[ 0 ];
    EXPECT_EQ( e.name, "Grim_Toll" );
    EXPECT_EQ( e.stack_name, "Grim_Toll" );
    EXPECT_EQ( e.behavior, EFFECT_CHANCE_PROC );
    ASSERT_EQ( e.stats.size(), 1u );
    EXPECT_EQ( e.stats[ 0 ].stat, STAT_ARMOR_PEN_RATING );
    EXPECT_DOUBLE_EQ( e.stats[ 0 ].amount, 612.0 );
    EXPECT_EQ( e.duration, timespan_t::from_seconds( 10 ) );
    EXPECT_EQ( e.cooldown, timespan_t::from_seconds( 45 ) );
    EXPECT_DOUBLE_EQ( e.chance_on_hit, 0.15 );
    EXPECT_LT( e.chance_on_crit, 0.0 ) << "Crits use the hit chance unless given";
}

TEST_F(OptionTest, Effect_SeparateChancesAndTriggers)
{
    set( "effect", "name=Mirror,behavior=refreshing_proc,stat=crit_chance,amount=0.02,duration=10,"
                   "white_chance=0.1,yellow_chance=0.3,trigger=shred" );

    const effect_spec_t& e = sim.effect_specs.at( 0 );
    EXPECT_TRUE( e.separate_yellow );
    EXPECT_DOUBLE_EQ( e.white_chance, 0.1 );
    EXPECT_DOUBLE_EQ( e.yellow_chance, 0.3 );
    EXPECT_EQ( e.trigger, PROC_TRIGGER_SHRED );
}

TEST_F(OptionTest, Effect_ErrorsAreNested)
{
    try
    {
        set( "effect", "name=Broken,behavior=chance_proc,stat=ap,amount=100,duration=10,bogus=1" );
        FAIL() << "An unknown effect key must be rejected";
    }
    catch ( const std::invalid_argument& e )
    {
        EXPECT_NE( std::string( e.what() ).find( "bogus=1" ), std::string::npos ) << e.what();
        EXPECT_NE( innermost( e ).find( "Unknown option 'bogus'" ), std::string::npos ) << innermost( e );
    }

    EXPECT_TRUE( sim.effect_specs.empty() );
}

TEST_F(OptionTest, Effect_InvalidDefinitionThrows)
{
    EXPECT_THROW( set( "effect", "name=NoStat,behavior=fixed_use,duration=20" ), std::invalid_argument );
    EXPECT_THROW( set( "effect", "name=X,behavior=sometimes,stat=ap,amount=1,duration=1" ),
                  std::invalid_argument );
    EXPECT_THROW( set( "effect", "name=X,stat=ap,amount" ), std::invalid_argument );
}

// ============================================================================
// Rotation strategy
// ============================================================================

TEST_F(OptionTest, Strategy_SetByName)
{
    rotation_strategy_t s;
    s.set( "use_rake", "1" );
    s.set( "bite_time", "-1" );
    s.set( "min_combos_for_bite", "4" );

    EXPECT_TRUE( s.use_rake );
    EXPECT_LT( s.bite_time, 0.0 );
    EXPECT_EQ( s.min_combos_for_bite, 4 );
    EXPECT_THROW( s.set( "use_shred", "1" ), std::invalid_argument );
}

TEST_F(OptionTest, Strategy_ContradictionsRejected)
{
    rotation_strategy_t s;
    EXPECT_NO_THROW( s.validate() );

    s.prepop_berserk = true;
    EXPECT_THROW( s.validate(), std::invalid_argument );

    s = rotation_strategy_t();
    s.powerbear = true;
    EXPECT_THROW( s.validate(), std::invalid_argument );

    s = rotation_strategy_t();
    s.bearweave = true;
    s.flowershift = true;
    EXPECT_THROW( s.validate(), std::invalid_argument );
}

TEST_F(OptionTest, Main_ReportsBadOption)
{
    EXPECT_EQ( sim.main( { "iterations=abc" } ), 1 );
}

} // namespace
