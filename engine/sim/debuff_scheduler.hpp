// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include "util/timespan.hpp"

struct druid_t;
struct sim_t;
struct target_t;

// Ramps up Sunder Armor on the target, one stack per global cooldown, and
// refreshes the druid's damage ranges after each stack.
struct debuff_scheduler_t
{
  static constexpr int MAX_SUNDER_STACKS = 5;

  sim_t* sim;
  target_t& target;
  timespan_t interval;

  debuff_scheduler_t( sim_t* s, target_t& t ) :
    sim( s ), target( t ), interval( timespan_t::from_seconds( 1.5 ) )
  { }

  void reset();
  void update( timespan_t now, druid_t& );
  timespan_t next_event() const;
};
