// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include <deque>

#include "action/attack_roll.hpp"
#include "fc_enums.hpp"
#include "util/format.hpp"
#include "util/generic.hpp"
#include "util/timespan.hpp"

struct sim_t;

/**
 * A periodic bleed on the target.
 *
 * Tick damage, crit chance and crit multiplier are captured when the bleed
 * is applied; later changes to the druid do not alter ticks that are
 * already scheduled. Only the target-side Mangle bonus is evaluated per tick.
 */
struct dot_t : private noncopyable
{
private:
  sim_t& sim;
  bool ticking;
  timespan_t start_time;
  timespan_t end_time;
  timespan_t last_tick_time;
  std::deque<timespan_t> ticks;
  int stack;

public:
  const dot_e type;
  const int max_stack;
  timespan_t tick_time;

  // Snapshot
  double tick_damage;
  double crit_chance;
  double crit_multiplier;
  bool   may_crit;

  dot_t( sim_t& s, dot_e t, timespan_t tick_time, int max_stack = 1 );

  void reset();
  void snapshot( double damage, double crit, double crit_mult, bool can_crit );
  void trigger( timespan_t duration );
  void refresh( timespan_t duration );
  void extend( timespan_t amount );
  void cancel();
  roll_result_t tick( double multiplier );

  bool is_ticking() const { return ticking; }
  bool tick_due( timespan_t now ) const
  { return ticking && ! ticks.empty() && now >= ticks.front(); }
  bool expired( timespan_t now ) const
  { return ticking && now >= end_time; }

  timespan_t remains() const;
  timespan_t next_tick() const
  { return ( ticking && ! ticks.empty() ) ? ticks.front() : timespan_t::max(); }
  timespan_t start() const { return start_time; }
  timespan_t end() const   { return end_time; }
  int ticks_left() const   { return ticking ? static_cast<int>( ticks.size() ) : 0; }
  int current_stack() const { return ticking ? stack : 0; }
  bool at_max_stacks() const { return current_stack() >= max_stack; }
  const char* name() const;

  friend void sc_format_to( const dot_t&, fmt::format_context::iterator );
};
