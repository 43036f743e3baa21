// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include <vector>

#include "action/dot.hpp"
#include "fc_enums.hpp"
#include "sim/trial_record.hpp"
#include "util/generic.hpp"
#include "util/timespan.hpp"

struct sim_t;

// Fight state of one trial, shared by the event loop and the rotation.
struct simulation_state_t : private noncopyable
{
  timespan_t time;
  timespan_t fight_length;
  timespan_t next_action;

  // Buff and debuff end times; only meaningful while the flag is up
  timespan_t tf_end;
  timespan_t berserk_end;
  timespan_t roar_end;
  bool mangle_debuff;
  timespan_t mangle_end;

  dot_t rip;
  dot_t rake;
  dot_t lacerate;

  timespan_t revitalize_frequency;
  int num_hot_ticks;

  // Set the first time a weave is wanted but mana is short
  bool oom;
  timespan_t time_to_oom;

  double total_damage;
  std::vector<damage_sample_t> damage_samples;

  explicit simulation_state_t( sim_t& sim ) :
    rip( sim, DOT_RIP, timespan_t::from_seconds( 2 ) ),
    rake( sim, DOT_RAKE, timespan_t::from_seconds( 3 ) ),
    lacerate( sim, DOT_LACERATE, timespan_t::from_seconds( 3 ), MAX_LACERATE_STACKS )
  { reset( timespan_t::zero() ); }

  void reset( timespan_t length )
  {
    time = timespan_t::zero();
    fight_length = length;
    next_action = timespan_t::zero();
    tf_end = berserk_end = roar_end = mangle_end = timespan_t::zero();
    mangle_debuff = false;
    rip.reset();
    rake.reset();
    lacerate.reset();
    num_hot_ticks = 0;
    oom = false;
    time_to_oom = timespan_t::zero();
    total_damage = 0;
    damage_samples.clear();
  }

  timespan_t remaining() const
  { return fight_length - time; }

  void add_damage( double amount )
  {
    if ( amount == 0 )
      return;
    total_damage += amount;
    damage_samples.push_back( { time.total_seconds(), amount } );
  }

  void mark_oom()
  {
    if ( ! oom )
    {
      oom = true;
      time_to_oom = time;
    }
  }
};
