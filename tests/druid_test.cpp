// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include <gtest/gtest.h>

#include <algorithm>

#include "player/druid.hpp"
#include "player/stat_target.hpp"
#include "sim/sim.hpp"

namespace {

class DruidTest : public ::testing::Test
{
protected:
    sim_t sim;
    druid_t* druid = nullptr;

    void SetUp() override
    {
        sim.init();
        druid = sim.druid.get();

        // Deterministic outcomes: every special lands and none crit
        druid -> miss_chance = 0;
        druid -> crit_chance = 0;
    }
};

// ============================================================================
// Resources
// ============================================================================

TEST_F(DruidTest, Reset_StartsFullOfEnergy)
{
    EXPECT_EQ( druid -> form, FORM_CAT );
    EXPECT_DOUBLE_EQ( druid -> energy(), 100.0 );
    EXPECT_EQ( druid -> combo_points(), 0 );
    EXPECT_DOUBLE_EQ( druid -> rage(), 0.0 );
    EXPECT_DOUBLE_EQ( druid -> mana(), sim.druid_config.mana );
}

TEST_F(DruidTest, Resources_ClampToBounds)
{
    EXPECT_DOUBLE_EQ( druid -> resource_gain( RESOURCE_ENERGY, 500 ), 0.0 ) << "Energy is already capped";
    EXPECT_DOUBLE_EQ( druid -> energy(), 100.0 );

    EXPECT_DOUBLE_EQ( druid -> resource_loss( RESOURCE_ENERGY, 250 ), 100.0 );
    EXPECT_DOUBLE_EQ( druid -> energy(), 0.0 );

    druid -> resource_gain( RESOURCE_COMBO_POINT, 9 );
    EXPECT_EQ( druid -> combo_points(), MAX_COMBO_POINTS );

    druid -> resource_gain( RESOURCE_RAGE, 180 );
    EXPECT_DOUBLE_EQ( druid -> rage(), 100.0 );

    druid -> set_resource( RESOURCE_MANA, -10 );
    EXPECT_DOUBLE_EQ( druid -> mana(), 0.0 );
}

TEST_F(DruidTest, Regen_TenEnergyPerSecond)
{
    druid -> set_resource( RESOURCE_ENERGY, 20 );
    druid -> regen( timespan_t::from_seconds( 2.5 ) );
    EXPECT_DOUBLE_EQ( druid -> energy(), 45.0 );

    druid -> regen( timespan_t::from_seconds( 60 ) );
    EXPECT_DOUBLE_EQ( druid -> energy(), 100.0 );
}

// ============================================================================
// Builders
// ============================================================================

// Three Shreds in a row from full energy: the third cannot be paid for and
// must leave the druid untouched.
TEST_F(DruidTest, Shred_RejectedWhenEnergyRunsOut)
{
    action_result_t r = druid -> shred( false );
    EXPECT_TRUE( r.executed );
    EXPECT_DOUBLE_EQ( druid -> energy(), 58.0 );
    EXPECT_EQ( druid -> combo_points(), 1 );

    r = druid -> shred( false );
    EXPECT_TRUE( r.executed );
    EXPECT_DOUBLE_EQ( druid -> energy(), 16.0 );
    EXPECT_EQ( druid -> combo_points(), 2 );

    r = druid -> shred( false );
    EXPECT_FALSE( r.executed ) << "A 42 energy Shred with 16 energy must not go through";
    EXPECT_DOUBLE_EQ( r.damage, 0.0 );
    EXPECT_DOUBLE_EQ( druid -> energy(), 16.0 );
    EXPECT_EQ( druid -> combo_points(), 2 );
    EXPECT_EQ( druid -> breakdown[ ABILITY_SHRED ].casts, 2 );
}

TEST_F(DruidTest, Builder_MissRefundsEightyPercent)
{
    druid -> miss_chance = 1.0;

    action_result_t r = druid -> shred( false );
    EXPECT_TRUE( r.executed );
    EXPECT_FALSE( r.success );
    EXPECT_NEAR( druid -> energy(), 100 - 0.2 * 42, 1e-9 );
    EXPECT_EQ( druid -> combo_points(), 0 );
}

TEST_F(DruidTest, Builder_CritAwardsExtraComboPoint)
{
    druid -> crit_chance = 1.0;

    action_result_t r = druid -> mangle();
    EXPECT_EQ( r.result, RESULT_CRIT );
    EXPECT_EQ( druid -> combo_points(), 2 );
}

TEST_F(DruidTest, Clearcasting_MakesNextAbilityFree)
{
    druid -> omen_proc = true;

    action_result_t r = druid -> shred( false );
    EXPECT_TRUE( r.executed );
    EXPECT_DOUBLE_EQ( druid -> energy(), 100.0 );
    EXPECT_FALSE( druid -> omen_proc ) << "Clearcasting is consumed";
}

TEST_F(DruidTest, Berserk_HalvesCosts)
{
    druid -> berserk = true;
    druid -> set_ability_costs();

    EXPECT_DOUBLE_EQ( druid -> costs.shred, 21.0 );
    EXPECT_DOUBLE_EQ( druid -> costs.rake, 17.5 );
    EXPECT_DOUBLE_EQ( druid -> costs.roar, 12.5 );
}

// ============================================================================
// Finishers
// ============================================================================

TEST_F(DruidTest, Bite_ConsumesComboPointsAndExtraEnergy)
{
    druid -> set_resource( RESOURCE_COMBO_POINT, 5 );

    action_result_t r = druid -> bite();
    EXPECT_TRUE( r.success );
    EXPECT_GT( r.damage, 0.0 );
    EXPECT_EQ( druid -> combo_points(), 0 );
    EXPECT_DOUBLE_EQ( druid -> energy(), 100.0 - 35.0 - 30.0 );
}

TEST_F(DruidTest, Finishers_NeedComboPoints)
{
    EXPECT_FALSE( druid -> bite().executed );
    EXPECT_FALSE( druid -> rip().executed );
    EXPECT_FALSE( druid -> roar().executed );
    EXPECT_DOUBLE_EQ( druid -> energy(), 100.0 );
}

TEST_F(DruidTest, Rip_ReturnsTickDamageForComboPoints)
{
    druid -> set_resource( RESOURCE_COMBO_POINT, 4 );

    action_result_t r = druid -> rip();
    EXPECT_TRUE( r.success );
    EXPECT_DOUBLE_EQ( r.damage, druid -> damage.rip_tick[ 4 ] );
    EXPECT_DOUBLE_EQ( druid -> energy(), 70.0 );
    EXPECT_EQ( druid -> combo_points(), 0 );
}

TEST_F(DruidTest, Roar_DurationGrowsWithComboPoints)
{
    EXPECT_EQ( druid -> roar_duration( 1 ), timespan_t::from_seconds( 14 ) );
    EXPECT_EQ( druid -> roar_duration( 5 ), timespan_t::from_seconds( 34 ) );
    EXPECT_EQ( druid -> roar_duration( 0 ), timespan_t::zero() );
}

// ============================================================================
// Forms
// ============================================================================

TEST_F(DruidTest, Shift_BearAndBackCostsMana)
{
    double mana = druid -> mana();

    druid -> shift();
    EXPECT_EQ( druid -> form, FORM_BEAR );
    EXPECT_TRUE( druid -> enrage ) << "Enrage is used with the first shift";
    EXPECT_GE( druid -> rage(), 20.0 );
    EXPECT_NEAR( druid -> mana(), mana - druid -> shift_cost, 1e-9 );

    druid -> shift();
    EXPECT_EQ( druid -> form, FORM_CAT );
    EXPECT_FALSE( druid -> enrage );
    // Furor keeps 60 energy, Wolfshead Helm adds 20
    EXPECT_DOUBLE_EQ( druid -> energy(), 80.0 );
    EXPECT_NEAR( druid -> mana(), mana - 2 * druid -> shift_cost, 1e-9 );
}

TEST_F(DruidTest, BearForm_SlowsSwingTimer)
{
    timespan_t cat_swing = druid -> swing_time();
    druid -> shift();
    EXPECT_NEAR( druid -> swing_time().total_seconds(), 2.5 * cat_swing.total_seconds(), 0.003 );
}

TEST_F(DruidTest, FaerieFire_AlwaysGrantsClearcasting)
{
    double damage = druid -> faerie_fire();
    EXPECT_DOUBLE_EQ( damage, 0.0 ) << "Cat Form Faerie Fire deals no damage";
    EXPECT_TRUE( druid -> omen_proc );
    EXPECT_FALSE( druid -> cooldown_ready( COOLDOWN_FAERIE_FIRE ) );
}

TEST_F(DruidTest, Shift_WithoutManaMarksOom)
{
    sim.state.time = timespan_t::from_seconds( 75 );
    druid -> set_resource( RESOURCE_MANA, 0.5 * druid -> shift_cost );

    druid -> shift();
    EXPECT_EQ( druid -> form, FORM_BEAR );
    EXPECT_DOUBLE_EQ( druid -> mana(), 0.0 );
    EXPECT_TRUE( sim.state.oom );
    EXPECT_EQ( sim.state.time_to_oom, timespan_t::from_seconds( 75 ) );
}

TEST_F(DruidTest, Shift_WithManaKeepsOomClear)
{
    druid -> shift();
    druid -> shift();
    EXPECT_FALSE( sim.state.oom );
}

// ============================================================================
// Bear form
// ============================================================================

class BearTest : public DruidTest
{
protected:
    void SetUp() override
    {
        DruidTest::SetUp();
        druid -> form = FORM_BEAR;
        druid -> set_resource( RESOURCE_RAGE, 50 );
    }

    // Rage from a white hit of the given damage, or from a dodge using the
    // average swing as proxy damage
    static double swing_rage( double damage, bool crit )
    {
        double rage = 15.0 / 4.0 / 453.3 * damage + 2.5 / 2 * 3.5 * ( 1 + crit ) + 5 * crit;
        return std::min( rage, damage * 15.0 / 453.3 );
    }
};

TEST_F(BearTest, Specials_PayTheirRageCosts)
{
    druid -> maul( false );
    EXPECT_DOUBLE_EQ( druid -> rage(), 40.0 );

    action_result_t r = druid -> lacerate( false );
    EXPECT_TRUE( r.success );
    EXPECT_DOUBLE_EQ( druid -> rage(), 27.0 );

    r = druid -> mangle();
    EXPECT_TRUE( r.success );
    EXPECT_DOUBLE_EQ( druid -> rage(), 12.0 );
    EXPECT_EQ( druid -> cooldown_remains( COOLDOWN_MANGLE_BEAR ), timespan_t::from_seconds( 6 ) );

    EXPECT_EQ( druid -> breakdown[ ABILITY_MAUL ].casts, 1 );
    EXPECT_EQ( druid -> breakdown[ ABILITY_LACERATE ].casts, 1 );
    EXPECT_EQ( druid -> breakdown[ ABILITY_MANGLE_BEAR ].casts, 1 );
}

TEST_F(BearTest, Specials_RejectedWithoutRage)
{
    druid -> set_resource( RESOURCE_RAGE, 12 );

    EXPECT_FALSE( druid -> lacerate( false ).executed );
    EXPECT_FALSE( druid -> mangle().executed );
    EXPECT_TRUE( druid -> cooldown_ready( COOLDOWN_MANGLE_BEAR ) );
    EXPECT_DOUBLE_EQ( druid -> rage(), 12.0 );
}

TEST_F(BearTest, Specials_MissRefundsEightyPercent)
{
    druid -> miss_chance = 1.0;

    action_result_t r = druid -> lacerate( false );
    EXPECT_TRUE( r.executed );
    EXPECT_FALSE( r.success );
    EXPECT_DOUBLE_EQ( r.damage, 0.0 );
    EXPECT_NEAR( druid -> rage(), 50 - 0.2 * 13, 1e-9 );

    druid -> maul( false );
    EXPECT_NEAR( druid -> rage(), 50 - 0.2 * 13 - 0.2 * 10, 1e-9 );
}

TEST_F(BearTest, Specials_CritRefundsFiveRage)
{
    // Bear specials roll with four points of crit suppression
    druid -> crit_chance = 1.05;

    action_result_t r = druid -> mangle();
    EXPECT_EQ( r.result, RESULT_CRIT );
    EXPECT_DOUBLE_EQ( druid -> rage(), 50 - 15 + 5.0 );
}

TEST_F(BearTest, Clearcasting_MakesBearSpecialFree)
{
    druid -> omen_proc = true;

    action_result_t r = druid -> lacerate( false );
    EXPECT_TRUE( r.success );
    EXPECT_FALSE( druid -> omen_proc );
    EXPECT_DOUBLE_EQ( druid -> rage(), 50.0 );

    druid -> set_resource( RESOURCE_RAGE, 0 );
    druid -> omen_proc = true;
    EXPECT_DOUBLE_EQ( druid -> maul( false ), 0.0 ) << "The rage check comes before Clearcasting";
    EXPECT_TRUE( druid -> omen_proc );
}

TEST_F(BearTest, Swing_GeneratesRageFromDamage)
{
    druid -> set_resource( RESOURCE_RAGE, 0 );

    double damage = druid -> swing();
    ASSERT_GT( damage, 0.0 );
    EXPECT_NEAR( druid -> rage(), swing_rage( damage, false ), 1e-9 );
}

TEST_F(BearTest, Swing_DodgeStillGeneratesRage)
{
    druid -> set_resource( RESOURCE_RAGE, 0 );
    druid -> miss_chance = 0.5;
    druid -> dodge_chance = 0.5;

    // Every miss is re-rolled into a dodge
    for ( int i = 0; i < 20; i++ )
    {
        druid -> set_resource( RESOURCE_RAGE, 0 );
        double damage = druid -> swing();
        if ( damage > 0 )
            continue;

        const damage_range_t& range = druid -> damage.white_bear;
        double proxy = 0.5 * ( range.low + range.high );
        EXPECT_NEAR( druid -> rage(), swing_rage( proxy, false ), 1e-9 );
        return;
    }
    FAIL() << "No dodge in 20 swings at 50% miss chance";
}

TEST_F(BearTest, Swing_MissWithoutDodgeGivesNoRage)
{
    druid -> set_resource( RESOURCE_RAGE, 0 );
    druid -> miss_chance = 1.0;
    druid -> dodge_chance = 0;

    EXPECT_DOUBLE_EQ( druid -> swing(), 0.0 );
    EXPECT_DOUBLE_EQ( druid -> rage(), 0.0 );
}

// ============================================================================
// Stat deltas
// ============================================================================

TEST_F(DruidTest, ApplyDelta_AgilityMovesAttackPowerAndCrit)
{
    double ap   = druid -> attack_power;
    double crit = druid -> crit_chance;

    apply_delta( *druid, STAT_AGILITY, 100 );

    EXPECT_NEAR( druid -> attack_power, ap + 100 * sim.druid_config.ap_mod, 1e-9 );
    EXPECT_NEAR( druid -> crit_chance, crit + 100 / AGILITY_PER_CRIT_PERCENT / 100.0, 1e-12 );
}

TEST_F(DruidTest, ApplyDelta_HasteMultiplierUndoesItself)
{
    double multiplier = druid -> haste_multiplier;

    apply_delta( *druid, STAT_HASTE_MULTIPLIER, 0.3 );
    EXPECT_NEAR( druid -> haste_multiplier, multiplier * 1.3, 1e-12 );

    apply_delta( *druid, STAT_HASTE_MULTIPLIER, -0.3 );
    EXPECT_NEAR( druid -> haste_multiplier, multiplier, 1e-12 );
}

TEST_F(DruidTest, ApplyDelta_AttackPowerRaisesDamage)
{
    double shred = druid -> damage.shred.low;
    apply_delta( *druid, STAT_ATTACK_POWER, 1000 );
    EXPECT_GT( druid -> damage.shred.low, shred );
}

TEST_F(DruidTest, ApplyDelta_UnknownStatThrows)
{
    EXPECT_THROW( apply_delta( *druid, STAT_NONE, 1 ), std::invalid_argument );
}

} // namespace
