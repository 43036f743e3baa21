// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "sim/scaling.hpp"
#include "sim/sim.hpp"

namespace {

class ScalingTest : public ::testing::Test
{
protected:
    sim_t sim;

    void configure( const std::vector<std::string>& args )
    {
        option_db_t db;
        db.parse_args( args );
        sim.setup( db );
    }

    static void expect_finite( const std::vector<scale_factor_t>& factors )
    {
        for ( const auto& f : factors )
        {
            EXPECT_TRUE( std::isfinite( f.value ) ) << f.name;
            EXPECT_TRUE( std::isfinite( f.error ) ) << f.name;
            EXPECT_GE( f.error, 0.0 ) << f.name;
        }
    }
};

// ============================================================================
// Paired deltas
// ============================================================================

TEST_F(ScalingTest, Delta_ZeroChangeGivesExactlyZero)
{
    configure( { "iterations=10", "fight_length=60", "seed=4" } );
    sim.execute();

    scale_factor_t sf = sim.scaling -> analyze_delta( "Nothing", STAT_ATTACK_POWER, 0, 1 );

    EXPECT_EQ( sf.name, "Nothing" );
    EXPECT_DOUBLE_EQ( sf.value, 0.0 ) << "Both sims replay the same trial seeds";
    EXPECT_DOUBLE_EQ( sf.error, 0.0 );
}

TEST_F(ScalingTest, Delta_AttackPowerRaisesDps)
{
    configure( { "iterations=20", "fight_length=120", "seed=9", "threads=2" } );
    sim.execute();

    scale_factor_t sf = sim.scaling -> analyze_delta( "AP", STAT_ATTACK_POWER, 2000, 1.0 / 2000 );
    EXPECT_GT( sf.value, 0.0 );
}

// ============================================================================
// Stat weights
// ============================================================================

TEST_F(ScalingTest, Analyze_NothingRequested)
{
    configure( { "iterations=5", "fight_length=60" } );
    sim.execute();
    sim.scaling -> analyze();

    EXPECT_TRUE( sim.scaling -> scale_factors.empty() );
    EXPECT_TRUE( sim.scaling -> mana_weights.empty() );
}

TEST_F(ScalingTest, Analyze_StatWeightsRelativeToAttackPower)
{
    configure( { "iterations=20", "fight_length=60", "seed=21", "calculate_scale_factors=1" } );
    sim.execute();
    sim.scaling -> analyze();

    const auto& factors = sim.scaling -> scale_factors;
    EXPECT_EQ( factors.size(), 7u );
    expect_finite( factors );

    for ( const char* name : { "1 AP", "1% hit", "1% crit", "1 Agility", "1% haste", "1 Armor Pen Rating",
                               "1 Weapon Damage" } )
        EXPECT_NE( sim.scaling -> find( name ), nullptr ) << name;

    const scale_factor_t* ap = sim.scaling -> find( "1 AP" );
    ASSERT_NE( ap, nullptr );
    ASSERT_NE( ap -> value, 0.0 );
    EXPECT_DOUBLE_EQ( ap -> weight, 1.0 );

    const scale_factor_t* crit = sim.scaling -> find( "1% crit" );
    ASSERT_NE( crit, nullptr );
    EXPECT_DOUBLE_EQ( crit -> weight, crit -> value / ap -> value );
}

// ============================================================================
// Mana weights
// ============================================================================

TEST_F(ScalingTest, Analyze_ManaWeightsComputeAttackPowerReference)
{
    configure( { "iterations=20", "fight_length=120", "seed=33", "bearweave=1", "calculate_mana_weights=1" } );
    sim.execute();
    sim.scaling -> analyze();

    const auto& weights = sim.scaling -> mana_weights;
    ASSERT_EQ( weights.size(), 4u );
    EXPECT_EQ( weights[ 0 ].name, "1 mana" );
    EXPECT_EQ( weights[ 1 ].name, "1 Spirit" );
    EXPECT_EQ( weights[ 2 ].name, "1 Int" );
    EXPECT_EQ( weights[ 3 ].name, "1 mp5" );
    expect_finite( weights );

    EXPECT_NE( sim.scaling -> find( "1 AP" ), nullptr ) << "Mana weights need an attack power reference";
}

} // namespace
