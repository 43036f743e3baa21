// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include <gtest/gtest.h>

#include "action/dot.hpp"
#include "sim/sim.hpp"

namespace {

class DotTest : public ::testing::Test
{
protected:
    sim_t sim;

    void SetUp() override
    {
        sim.init();
        sim.state.reset( timespan_t::from_seconds( 600 ) );
        sim.rng.seed( 7 );
    }

    void advance_to( double seconds )
    {
        sim.state.time = timespan_t::from_seconds( seconds );
    }
};

// ============================================================================
// Scheduling
// ============================================================================

TEST_F(DotTest, Trigger_SchedulesTicksUpToDuration)
{
    dot_t dot( sim, DOT_RIP, timespan_t::from_seconds( 2 ) );
    dot.snapshot( 100, 0.0, 2.0, false );
    dot.trigger( timespan_t::from_seconds( 12 ) );

    EXPECT_TRUE( dot.is_ticking() );
    EXPECT_EQ( dot.ticks_left(), 6 );
    EXPECT_EQ( dot.next_tick(), timespan_t::from_seconds( 2 ) );
    EXPECT_EQ( dot.end(), timespan_t::from_seconds( 12 ) );
    EXPECT_EQ( dot.current_stack(), 1 );
}

TEST_F(DotTest, Tick_ConsumesScheduleAndExpires)
{
    dot_t dot( sim, DOT_RAKE, timespan_t::from_seconds( 3 ) );
    dot.snapshot( 50, 0.0, 2.0, false );
    dot.trigger( timespan_t::from_seconds( 9 ) );

    double total = 0;
    for ( double t = 3; t <= 9; t += 3 )
    {
        advance_to( t );
        ASSERT_TRUE( dot.tick_due( sim.current_time() ) );
        total += dot.tick( 1.0 ).damage;
    }

    EXPECT_DOUBLE_EQ( total, 150.0 );
    EXPECT_EQ( dot.ticks_left(), 0 );
    EXPECT_TRUE( dot.expired( sim.current_time() ) );

    dot.cancel();
    EXPECT_FALSE( dot.is_ticking() );
    EXPECT_EQ( dot.next_tick(), timespan_t::max() );
}

TEST_F(DotTest, Tick_AppliesTargetMultiplier)
{
    dot_t dot( sim, DOT_RIP, timespan_t::from_seconds( 2 ) );
    dot.snapshot( 100, 0.0, 2.0, false );
    dot.trigger( timespan_t::from_seconds( 12 ) );

    advance_to( 2 );
    EXPECT_DOUBLE_EQ( dot.tick( 1.3 ).damage, 130.0 );
}

TEST_F(DotTest, Extend_AddsOneTickAtNewEnd)
{
    dot_t dot( sim, DOT_RIP, timespan_t::from_seconds( 2 ) );
    dot.snapshot( 100, 0.0, 2.0, false );
    dot.trigger( timespan_t::from_seconds( 16 ) );

    dot.extend( timespan_t::from_seconds( 2 ) );
    EXPECT_EQ( dot.end(), timespan_t::from_seconds( 18 ) );
    EXPECT_EQ( dot.ticks_left(), 9 );
}

TEST_F(DotTest, Refresh_StacksUpToMaximum)
{
    dot_t dot( sim, DOT_LACERATE, timespan_t::from_seconds( 3 ), MAX_LACERATE_STACKS );

    dot.refresh( timespan_t::from_seconds( 15 ) );
    EXPECT_EQ( dot.current_stack(), 1 ) << "Refreshing an inactive bleed applies it";

    for ( int i = 0; i < 10; i++ )
    {
        advance_to( 1.0 + i );
        dot.refresh( timespan_t::from_seconds( 15 ) );
    }

    EXPECT_EQ( dot.current_stack(), MAX_LACERATE_STACKS );
    EXPECT_TRUE( dot.at_max_stacks() );
    EXPECT_EQ( dot.end(), timespan_t::from_seconds( 25 ) );
    // Refreshes keep the 3 s tick rhythm
    EXPECT_EQ( dot.next_tick(), timespan_t::from_seconds( 3 ) );
}

// ============================================================================
// Snapshot
// ============================================================================

TEST_F(DotTest, Snapshot_LiveCritChangesDoNotAffectTicks)
{
    druid_t& p = *sim.druid;
    simulation_state_t& s = sim.state;

    p.miss_chance = 0;
    p.crit_chance = 0;
    p.set_resource( RESOURCE_COMBO_POINT, 5 );

    sim.rotation.rip( s, p );
    ASSERT_TRUE( s.rip.is_ticking() );

    double snapshot_crit = s.rip.crit_chance;
    double snapshot_tick = s.rip.tick_damage;

    // Every later tick should still use the crit chance of the application
    p.crit_chance = 1.0;
    p.attack_power += 5000;
    p.recalculate_damage();

    EXPECT_DOUBLE_EQ( s.rip.crit_chance, snapshot_crit );
    EXPECT_DOUBLE_EQ( s.rip.tick_damage, snapshot_tick );

    int crits = 0;
    while ( s.rip.ticks_left() > 0 )
    {
        advance_to( s.rip.next_tick().total_seconds() );
        roll_result_t r = s.rip.tick( 1.0 );
        crits += r.crit();
        EXPECT_TRUE( r.crit() || r.damage == snapshot_tick );
    }

    EXPECT_EQ( crits, 0 ) << "A zero crit snapshot never crits";
}

TEST_F(DotTest, Snapshot_UsesAppliedCritChance)
{
    dot_t dot( sim, DOT_RIP, timespan_t::from_seconds( 2 ) );
    dot.snapshot( 100, 1.0, 2.0, true );
    dot.trigger( timespan_t::from_seconds( 12 ) );

    advance_to( 2 );
    roll_result_t r = dot.tick( 1.0 );
    EXPECT_TRUE( r.crit() );
    EXPECT_DOUBLE_EQ( r.damage, 200.0 );
}

} // namespace
