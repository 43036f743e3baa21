// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include <gtest/gtest.h>

#include "action/attack_roll.hpp"
#include "util/rng.hpp"

namespace {

constexpr int DRAWS = 100000;

class AttackRollTest : public ::testing::Test
{
protected:
    rng_t rng;

    void SetUp() override
    {
        rng.seed( 12345 );
    }
};

// ============================================================================
// Yellow table
// ============================================================================

TEST_F(AttackRollTest, Yellow_CritFrequencyMatchesChance)
{
    int crits = 0;
    for ( int i = 0; i < DRAWS; i++ )
    {
        roll_result_t r = attack_roll::yellow( rng, 100, 100, 0.0, 0.30, 2.0 );
        ASSERT_FALSE( r.miss() ) << "Nothing can miss with a zero miss chance";

        if ( r.crit() )
        {
            crits++;
            EXPECT_DOUBLE_EQ( r.damage, 200.0 );
        }
        else
        {
            EXPECT_EQ( r.result, RESULT_HIT );
            EXPECT_DOUBLE_EQ( r.damage, 100.0 ) << "Non-crit hits deal the flat damage";
        }
    }

    EXPECT_NEAR( static_cast<double>( crits ) / DRAWS, 0.30, 0.01 );
}

TEST_F(AttackRollTest, Yellow_MissDealsNoDamage)
{
    int misses = 0;
    for ( int i = 0; i < DRAWS; i++ )
    {
        roll_result_t r = attack_roll::yellow( rng, 100, 200, 0.10, 0.0, 2.0 );
        if ( r.miss() )
        {
            misses++;
            EXPECT_EQ( r.damage, 0.0 );
        }
        else
        {
            EXPECT_GE( r.damage, 100.0 );
            EXPECT_LE( r.damage, 200.0 );
        }
    }

    EXPECT_NEAR( static_cast<double>( misses ) / DRAWS, 0.10, 0.01 );
}

// ============================================================================
// White table
// ============================================================================

TEST_F(AttackRollTest, White_GlancesReduceDamage)
{
    int glances = 0;
    for ( int i = 0; i < DRAWS; i++ )
    {
        roll_result_t r = attack_roll::white( rng, 100, 100, 0.0, 0.0, 2.0 );
        if ( r.result == RESULT_GLANCE )
        {
            glances++;
            EXPECT_GE( r.damage, 65.0 );
            EXPECT_LE( r.damage, 85.0 );
        }
    }

    EXPECT_NEAR( static_cast<double>( glances ) / DRAWS, attack_roll::GLANCE_CHANCE, 0.01 );
}

// Bands are taken in miss, glance, crit order without clamping. With
// miss + glance + crit above 1 the hit band disappears and crits only get
// what is left.
TEST_F(AttackRollTest, White_OverfullTableKeepsThresholdOrder)
{
    int counts[ RESULT_MAX ] = {};
    for ( int i = 0; i < DRAWS; i++ )
    {
        roll_result_t r = attack_roll::white( rng, 100, 100, 0.10, 0.90, 2.0 );
        counts[ r.result ]++;
    }

    EXPECT_EQ( counts[ RESULT_HIT ], 0 ) << "No room left for ordinary hits";
    EXPECT_NEAR( static_cast<double>( counts[ RESULT_MISS ] ) / DRAWS, 0.10, 0.01 );
    EXPECT_NEAR( static_cast<double>( counts[ RESULT_GLANCE ] ) / DRAWS, 0.24, 0.01 );
    EXPECT_NEAR( static_cast<double>( counts[ RESULT_CRIT ] ) / DRAWS, 0.66, 0.01 );
}

// ============================================================================
// Spell and proc tables
// ============================================================================

TEST_F(AttackRollTest, ProcDamage_NeverCritsAndUsesResistBands)
{
    for ( int i = 0; i < 10000; i++ )
    {
        roll_result_t r = attack_roll::proc_damage( rng, 100, 100, 0.0 );
        ASSERT_EQ( r.result, RESULT_HIT );
        EXPECT_TRUE( r.damage == 100.0 || r.damage == 75.0 || r.damage == 50.0 || r.damage == 25.0 )
            << "Unexpected partial resist result " << r.damage;
    }
}

TEST_F(AttackRollTest, Spell_ResistsOnlyLandedHits)
{
    double total = 0;
    for ( int i = 0; i < DRAWS; i++ )
    {
        roll_result_t r = attack_roll::spell( rng, 100, 100, 0.0, 0.0, 1.5 );
        ASSERT_TRUE( r.hit() );
        total += r.damage;
    }

    // 0.55 + 0.30 * 0.75 + 0.14 * 0.5 + 0.01 * 0.25
    EXPECT_NEAR( total / DRAWS, 100 * 0.8475, 0.5 );
}

TEST_F(AttackRollTest, Rng_SameSeedSameSequence)
{
    rng_t a( 42 ), b( 42 );
    for ( int i = 0; i < 1000; i++ )
        ASSERT_EQ( a.real(), b.real() );
}

} // namespace
