// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "dot.hpp"

#include <algorithm>

#include "sim/sim.hpp"
#include "util/util.hpp"

// ==========================================================================
// Dot
// ==========================================================================

dot_t::dot_t( sim_t& s, dot_e t, timespan_t tt, int ms ) :
  sim( s ),
  ticking( false ),
  stack( 0 ),
  type( t ),
  max_stack( ms ),
  tick_time( tt ),
  tick_damage( 0 ),
  crit_chance( 0 ),
  crit_multiplier( 1.0 ),
  may_crit( false )
{}

// dot_t::reset =============================================================

void dot_t::reset()
{
  ticking = false;
  start_time = end_time = last_tick_time = timespan_t::zero();
  ticks.clear();
  stack = 0;
  tick_damage = 0;
  crit_chance = 0;
  crit_multiplier = 1.0;
  may_crit = false;
}

// dot_t::snapshot ==========================================================

void dot_t::snapshot( double damage, double crit, double crit_mult, bool can_crit )
{
  tick_damage     = damage;
  crit_chance     = crit;
  crit_multiplier = crit_mult;
  may_crit        = can_crit;
}

// dot_t::trigger ===========================================================

void dot_t::trigger( timespan_t duration )
{
  timespan_t now = sim.current_time();

  ticking    = true;
  start_time = now;
  end_time   = now + duration;
  stack      = 1;

  ticks.clear();
  for ( timespan_t t = now + tick_time; t <= end_time; t += tick_time )
    ticks.push_back( t );

  sim.print_debug( "{} applied, {} ticks of {:.1f}, ends at {}", name(), ticks.size(), tick_damage, end_time );
}

// dot_t::refresh ===========================================================

// Keeps the existing tick rhythm and appends ticks up to the new end time.
// A refresh after the last tick but before expiry continues from that tick.
void dot_t::refresh( timespan_t duration )
{
  if ( ! ticking )
  {
    trigger( duration );
    return;
  }

  timespan_t now = sim.current_time();
  end_time = now + duration;

  timespan_t last = ticks.empty() ? last_tick_time : ticks.back();
  for ( timespan_t t = last + tick_time; t <= end_time; t += tick_time )
    ticks.push_back( t );

  stack = std::min( stack + 1, max_stack );

  sim.print_debug( "{} refreshed to {} stacks, ends at {}", name(), stack, end_time );
}

// dot_t::extend ============================================================

void dot_t::extend( timespan_t amount )
{
  if ( ! ticking )
    return;

  end_time += amount;
  ticks.push_back( end_time );
}

// dot_t::cancel ============================================================

void dot_t::cancel()
{
  ticking = false;
  ticks.clear();
  stack = 0;
}

// dot_t::tick ==============================================================

roll_result_t dot_t::tick( double multiplier )
{
  roll_result_t r;
  if ( ticks.empty() )
    return r;

  last_tick_time = ticks.front();
  ticks.pop_front();

  double damage = tick_damage * multiplier;

  if ( may_crit )
    r = attack_roll::yellow( sim.rng, damage, damage, 0.0, crit_chance, crit_multiplier );
  else
  {
    r.damage = damage;
    r.result = RESULT_HIT;
  }

  return r;
}

// dot_t::remains ===========================================================

timespan_t dot_t::remains() const
{
  if ( ! ticking )
    return timespan_t::zero();
  return std::max( timespan_t::zero(), end_time - sim.current_time() );
}

const char* dot_t::name() const
{ return util::dot_type_string( type ); }

void sc_format_to( const dot_t& dot, fmt::format_context::iterator out )
{
  fmt::format_to( out, "Dot {} stack={} ticks_left={} remains={}", dot.name(), dot.current_stack(),
                  dot.ticks_left(), dot.remains() );
}
