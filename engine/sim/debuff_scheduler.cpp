// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "debuff_scheduler.hpp"

#include "player/druid.hpp"
#include "player/target.hpp"
#include "sim/sim.hpp"

void debuff_scheduler_t::reset()
{
  target.reset();
}

void debuff_scheduler_t::update( timespan_t now, druid_t& p )
{
  if ( ! target.sunder || target.sunder_stacks >= MAX_SUNDER_STACKS )
    return;

  if ( now < interval * target.sunder_stacks )
    return;

  target.sunder_stacks++;
  sim -> record_event( "Sunder Armor", fmt::format( "applied ({})", target.sunder_stacks ) );
  p.recalculate_damage();
}

timespan_t debuff_scheduler_t::next_event() const
{
  if ( ! target.sunder || target.sunder_stacks >= MAX_SUNDER_STACKS )
    return timespan_t::max();
  return interval * target.sunder_stacks;
}
