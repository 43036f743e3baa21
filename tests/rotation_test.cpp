// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include <gtest/gtest.h>

#include "sim/rotation.hpp"
#include "sim/sim.hpp"

namespace {

class RotationTest : public ::testing::Test
{
protected:
    sim_t sim;
    druid_t* p = nullptr;
    simulation_state_t* s = nullptr;

    void SetUp() override
    {
        sim.init();
        p = sim.druid.get();
        s = &sim.state;

        s -> reset( timespan_t::from_seconds( 180 ) );
        s -> revitalize_frequency = timespan_t::from_seconds( 1000 );

        p -> miss_chance = 0;
        p -> crit_chance = 0;
    }

    void at( double seconds )
    {
        s -> time = timespan_t::from_seconds( seconds );
    }

    void mangle_up()
    {
        s -> mangle_debuff = true;
        s -> mangle_end = timespan_t::from_seconds( 60 );
    }

    double execute()
    {
        return sim.rotation.execute( *s, *p );
    }

    int casts( ability_e a ) const
    {
        return p -> breakdown[ a ].casts;
    }
};

// ============================================================================
// Opening
// ============================================================================

TEST_F(RotationTest, CombatBegin_BearMangleIsPermanent)
{
    sim.strategy.bear_mangle = true;
    sim.rotation.combat_begin( *s, *p );

    EXPECT_TRUE( s -> mangle_debuff );
    EXPECT_EQ( s -> mangle_end, timespan_t::max() );
}

TEST_F(RotationTest, CombatBegin_PrepoppedBerserkStartsBeforePull)
{
    sim.strategy.use_berserk = true;
    sim.strategy.prepop_berserk = true;
    sim.strategy.preproc_omen = true;
    sim.rotation.combat_begin( *s, *p );

    EXPECT_TRUE( p -> berserk );
    EXPECT_EQ( s -> berserk_end, timespan_t::from_seconds( 14 ) );
    EXPECT_EQ( p -> cooldown_remains( COOLDOWN_BERSERK ), timespan_t::from_seconds( 179 ) );
    EXPECT_EQ( p -> gcd, timespan_t::zero() );
    EXPECT_TRUE( p -> omen_proc );
    EXPECT_DOUBLE_EQ( p -> costs.shred, 21.0 );
}

TEST_F(RotationTest, Execute_OpensWithMangle)
{
    execute();

    EXPECT_EQ( casts( ABILITY_MANGLE_CAT ), 1 );
    EXPECT_TRUE( s -> mangle_debuff );
    EXPECT_EQ( s -> mangle_end, timespan_t::from_seconds( 60 ) );
}

// ============================================================================
// Builders and pooling
// ============================================================================

TEST_F(RotationTest, Execute_ShredsWhenMangleIsUp)
{
    mangle_up();
    execute();

    EXPECT_EQ( casts( ABILITY_SHRED ), 1 );
    EXPECT_EQ( p -> combo_points(), 1 );
}

TEST_F(RotationTest, Execute_WaitsForEnergyInsteadOfPolling)
{
    mangle_up();
    p -> set_resource( RESOURCE_ENERGY, 20 );

    double damage = execute();

    EXPECT_DOUBLE_EQ( damage, 0.0 );
    EXPECT_EQ( casts( ABILITY_SHRED ), 0 );
    // 22 missing energy is 2.2 s of regeneration, plus reaction latency
    EXPECT_EQ( s -> next_action, timespan_t::from_millis( 2210 ) );
}

TEST_F(RotationTest, Execute_ClearcastingShredsForFree)
{
    p -> omen_proc = true;
    p -> set_resource( RESOURCE_ENERGY, 10 );

    execute();

    EXPECT_EQ( casts( ABILITY_SHRED ), 1 ) << "Clearcasting goes into Shred even without Mangle up";
    EXPECT_EQ( casts( ABILITY_MANGLE_CAT ), 0 );
    EXPECT_DOUBLE_EQ( p -> energy(), 10.0 );
}

TEST_F(RotationTest, Execute_RakeWhenEnabled)
{
    sim.strategy.use_rake = true;
    mangle_up();

    execute();

    EXPECT_EQ( casts( ABILITY_RAKE ), 1 );
    EXPECT_TRUE( s -> rake.is_ticking() );
    EXPECT_EQ( s -> rake.end(), timespan_t::from_seconds( 9 ) );
}

// ============================================================================
// Finishers
// ============================================================================

TEST_F(RotationTest, Execute_RipsAtMinimumComboPoints)
{
    mangle_up();
    p -> set_resource( RESOURCE_COMBO_POINT, 5 );

    execute();

    EXPECT_EQ( casts( ABILITY_RIP ), 1 );
    EXPECT_TRUE( s -> rip.is_ticking() );
    EXPECT_EQ( s -> rip.end(), p -> rip_duration );
    EXPECT_EQ( p -> combo_points(), 0 );
}

TEST_F(RotationTest, Execute_BitesWhileRipHasTimeLeft)
{
    mangle_up();
    p -> set_resource( RESOURCE_COMBO_POINT, 5 );
    sim.rotation.rip( *s, *p );
    ASSERT_TRUE( s -> rip.is_ticking() );

    at( 1 );
    p -> set_resource( RESOURCE_ENERGY, 100 );
    p -> set_resource( RESOURCE_COMBO_POINT, 5 );
    execute();

    EXPECT_EQ( casts( ABILITY_FEROCIOUS_BITE ), 1 );
    EXPECT_EQ( p -> combo_points(), 0 );
}

TEST_F(RotationTest, Execute_NoBiteWhenRipEndsSoon)
{
    mangle_up();
    p -> set_resource( RESOURCE_COMBO_POINT, 5 );
    sim.rotation.rip( *s, *p );

    at( 10 );
    p -> set_resource( RESOURCE_ENERGY, 100 );
    p -> set_resource( RESOURCE_COMBO_POINT, 5 );
    execute();

    EXPECT_EQ( casts( ABILITY_FEROCIOUS_BITE ), 0 ) << "Only 6 s of Rip left, below the bite time";
    EXPECT_EQ( casts( ABILITY_SHRED ), 1 );
}

TEST_F(RotationTest, Execute_BitesInsteadOfRipNearFightEnd)
{
    at( 175 );
    s -> mangle_debuff = true;
    s -> mangle_end = timespan_t::from_seconds( 178 );
    p -> set_resource( RESOURCE_COMBO_POINT, 5 );

    execute();

    EXPECT_EQ( casts( ABILITY_RIP ), 0 );
    EXPECT_EQ( casts( ABILITY_FEROCIOUS_BITE ), 1 );
}

TEST_F(RotationTest, Shred_GlyphExtendsRipUpToSixSeconds)
{
    p -> set_resource( RESOURCE_COMBO_POINT, 5 );
    sim.rotation.rip( *s, *p );
    timespan_t rip_end = s -> rip.end();

    for ( int i = 0; i < 5; i++ )
    {
        p -> set_resource( RESOURCE_ENERGY, 100 );
        sim.rotation.shred( *s, *p );
    }

    EXPECT_EQ( casts( ABILITY_SHRED ), 5 );
    EXPECT_EQ( s -> rip.end(), rip_end + timespan_t::from_seconds( 6 ) );
}

TEST_F(RotationTest, FinisherCosts_IncludeBiteExtraEnergy)
{
    double rip_cost = 0, bite_cost = 0;

    sim.rotation.get_finisher_costs( *s, *p, rip_cost, bite_cost );
    EXPECT_DOUBLE_EQ( rip_cost, 30.0 );
    EXPECT_DOUBLE_EQ( bite_cost, 65.0 );

    p -> set_resource( RESOURCE_ENERGY, 20 );
    sim.rotation.get_finisher_costs( *s, *p, rip_cost, bite_cost );
    EXPECT_NEAR( bite_cost, 35.0 + 10 * sim.latency.total_seconds(), 1e-9 );

    EXPECT_GT( sim.rotation.calc_allowed_rip_downtime( *p, 65.0, 30.0 ), 0.0 );
}

// ============================================================================
// Cooldowns
// ============================================================================

TEST_F(RotationTest, TigersFury_UsedWhenLowOnEnergy)
{
    p -> set_resource( RESOURCE_ENERGY, 15 );
    sim.rotation.tigers_fury_rule( *s, *p );

    EXPECT_TRUE( p -> tigers_fury );
    EXPECT_DOUBLE_EQ( p -> energy(), 75.0 );
    EXPECT_EQ( s -> tf_end, timespan_t::from_seconds( 6 ) );
    EXPECT_EQ( p -> cooldown_remains( COOLDOWN_TIGERS_FURY ), timespan_t::from_seconds( 30 ) );

    sim.rotation.drop_tigers_fury( *s, *p );
    EXPECT_FALSE( p -> tigers_fury );
}

TEST_F(RotationTest, TigersFury_HeldWithEnergy)
{
    sim.rotation.tigers_fury_rule( *s, *p );
    EXPECT_FALSE( p -> tigers_fury );
}

TEST_F(RotationTest, Berserk_UsedWhenTigersFuryIsFarAway)
{
    sim.strategy.use_berserk = true;
    p -> start_cooldown( COOLDOWN_TIGERS_FURY, timespan_t::from_seconds( 25 ) );
    p -> set_resource( RESOURCE_ENERGY, 50 );

    execute();

    EXPECT_TRUE( p -> berserk );
    EXPECT_EQ( s -> berserk_end, timespan_t::from_seconds( 15 ) );
    EXPECT_DOUBLE_EQ( p -> costs.mangle, p -> costs.base_mangle / 2 );
}

// ============================================================================
// Weaving
// ============================================================================

TEST_F(RotationTest, Bearweave_ShiftsOnLowEnergy)
{
    sim.strategy.bearweave = true;
    mangle_up();
    p -> start_cooldown( COOLDOWN_TIGERS_FURY, timespan_t::from_seconds( 25 ) );
    p -> set_resource( RESOURCE_ENERGY, 10 );

    execute();
    EXPECT_TRUE( p -> ready_to_shift );

    execute();
    EXPECT_EQ( p -> form, FORM_BEAR );
    EXPECT_FALSE( s -> oom );
}

TEST_F(RotationTest, Bearweave_OutOfManaIsRecorded)
{
    sim.strategy.bearweave = true;
    mangle_up();
    p -> start_cooldown( COOLDOWN_TIGERS_FURY, timespan_t::from_seconds( 25 ) );
    p -> set_resource( RESOURCE_ENERGY, 10 );
    p -> set_resource( RESOURCE_MANA, p -> shift_cost );

    at( 42 );
    execute();

    EXPECT_FALSE( p -> ready_to_shift );
    EXPECT_EQ( p -> form, FORM_CAT );
    EXPECT_TRUE( s -> oom );
    EXPECT_EQ( s -> time_to_oom, timespan_t::from_seconds( 42 ) );
}

TEST_F(RotationTest, Powerbear_ShiftsWhenOutOfRage)
{
    sim.strategy.powerbear = true;
    p -> shift();
    p -> gcd = timespan_t::zero();
    p -> set_resource( RESOURCE_RAGE, 0 );
    p -> set_resource( RESOURCE_ENERGY, 40 );

    execute();

    EXPECT_EQ( casts( ABILITY_SHIFT_BEAR ), 2 ) << "Dire Bear Form is cast again for fresh rage";
    EXPECT_EQ( p -> form, FORM_BEAR );
    EXPECT_FALSE( s -> oom );
}

TEST_F(RotationTest, Powerbear_NeedsManaForCatForm)
{
    sim.strategy.powerbear = true;
    p -> shift();
    p -> gcd = timespan_t::zero();
    p -> set_resource( RESOURCE_RAGE, 0 );
    p -> set_resource( RESOURCE_ENERGY, 40 );
    p -> set_resource( RESOURCE_MANA, 1.5 * p -> shift_cost );

    at( 30 );
    execute();

    EXPECT_EQ( casts( ABILITY_SHIFT_BEAR ), 1 ) << "No powershift without mana to get back out";
    EXPECT_EQ( p -> form, FORM_BEAR );
    EXPECT_NEAR( p -> mana(), 1.5 * p -> shift_cost, 1e-9 );
    EXPECT_TRUE( s -> oom );
    EXPECT_EQ( s -> time_to_oom, timespan_t::from_seconds( 30 ) );
}

TEST_F(RotationTest, BearAutoAttack_MaulsWithSpareRage)
{
    p -> shift();
    p -> set_resource( RESOURCE_RAGE, 60 );

    sim.rotation.bear_auto_attack( *s, *p );
    EXPECT_EQ( casts( ABILITY_MAUL ), 1 );

    p -> set_resource( RESOURCE_RAGE, 0 );
    sim.rotation.bear_auto_attack( *s, *p );
    EXPECT_EQ( casts( ABILITY_MAUL ), 1 );
    EXPECT_EQ( casts( ABILITY_MELEE ), 1 );
}

} // namespace
