// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "sim.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>

#include "util/util.hpp"

namespace { // UNNAMED NAMESPACE ==========================================

// Steps at an unchanged time before the clock is forced forward
constexpr int MAX_SAME_TIME_STEPS = 2;

constexpr double REVITALIZE_CHANCE = 0.15;

// Bleeds take 30% more damage from Mangle
double bleed_multiplier( const simulation_state_t& s )
{ return 1.0 + 0.3 * s.mangle_debuff; }

} // UNNAMED NAMESPACE ====================================================

// sim_t::combat ============================================================

trial_record_t sim_t::combat( int index )
{
  trial_record_t record;
  record.seed = static_cast<uint64_t>( seed ) + static_cast<uint64_t>( index );
  rng.seed( record.seed );

  try
  {
    reset_trial();
    run_combat();
    combat_end( record );
  }
  catch ( const std::exception& e )
  {
    error( "Trial {} on thread {} (seed {}) failed: {}", index, thread_index, record.seed, e.what() );
    record.valid = false;
  }

  return record;
}

// sim_t::reset_trial =======================================================

void sim_t::reset_trial()
{
  // Fight length jitter keeps swing timers from lining up identically in
  // every trial
  double length = fight_length.total_seconds() + rng.gauss( 0.0, vary_combat_length );
  state.reset( timespan_t::from_seconds( std::max( length, 1.0 ) ) );
  state.revitalize_frequency = timespan_t::from_seconds( 15.0 / ( 8 * std::max( hot_uptime, 1e-9 ) ) );

  event_log.clear();
  debuff_scheduler.reset();

  druid -> init();
  for ( const auto& d : stat_deltas )
    apply_delta( *druid, d );

  for ( auto& e : effects )
    e -> reset();

  druid -> next_swing = timespan_t::from_seconds( 0.1 * rng.real() );

  rotation.combat_begin( state, *druid );

  print_debug( "Trial start, fight length {}, {}", state.fight_length, *druid );
}

// sim_t::run_combat ========================================================

void sim_t::run_combat()
{
  druid_t& p = *druid;
  simulation_state_t& s = state;

  auto process_dot = [ & ]( dot_t& dot, ability_e ability ) {
    if ( dot.tick_due( s.time ) )
    {
      roll_result_t r = dot.tick( bleed_multiplier( s ) );
      p.breakdown[ ability ].damage += r.damage;
      s.add_damage( r.damage );
      if ( tracing() )
      {
        record_event( fmt::format( "{} tick", util::ability_type_string( ability ) ),
                      fmt::format( "{}{}", static_cast<int>( r.damage ), r.crit() ? " (crit)" : "" ) );
      }
    }

    if ( dot.expired( s.time ) )
    {
      dot.cancel();
      record_event( util::ability_type_string( ability ), "falls off" );
    }
  };

  auto update_effects = [ & ]() {
    for ( auto& e : effects )
      s.add_damage( e -> update( s.time, p ) );
  };

  timespan_t previous_time = timespan_t::zero();
  int same_time_steps = 0;

  while ( s.time <= s.fight_length )
  {
    timespan_t delta = s.time - previous_time;
    p.regen( delta );
    p.advance_timers( delta );
    previous_time = s.time;

    if ( p.five_second_rule && s.time - p.last_shift >= timespan_t::from_seconds( 5 ) )
      p.five_second_rule = false;

    // Buff expirations
    if ( p.tigers_fury && s.time >= s.tf_end )
      rotation.drop_tigers_fury( s, p );
    if ( p.berserk && s.time >= s.berserk_end )
      rotation.drop_berserk( s, p );
    if ( p.savage_roar && s.time >= s.roar_end )
      rotation.drop_roar( s, p );
    if ( s.mangle_debuff && s.time >= s.mangle_end )
      rotation.drop_mangle( s, p );

    process_dot( s.rip, ABILITY_RIP );
    process_dot( s.rake, ABILITY_RAKE );
    process_dot( s.lacerate, ABILITY_LACERATE );

    // Revitalize from the healers' HoTs
    while ( s.time >= s.revitalize_frequency * ( s.num_hot_ticks + 1 ) )
    {
      s.num_hot_ticks++;
      if ( rng.real() < REVITALIZE_CHANCE )
      {
        if ( p.form == FORM_CAT )
          p.resource_gain( RESOURCE_ENERGY, 8 );
        else if ( p.form == FORM_BEAR )
          p.resource_gain( RESOURCE_RAGE, 4 );
        record_event( "Revitalize", "" );
      }
    }

    update_effects();
    debuff_scheduler.update( s.time, p );

    // Enrage right after entering Dire Bear Form
    if ( p.form == FORM_BEAR && p.cooldown_ready( COOLDOWN_ENRAGE ) &&
         s.time < p.last_shift + timespan_t::from_seconds( 1.5 ) )
    {
      p.resource_gain( RESOURCE_RAGE, 20 );
      p.enrage = true;
      p.start_cooldown( COOLDOWN_ENRAGE, timespan_t::from_seconds( 60 ) );
      record_event( "Enrage", "" );
    }

    if ( s.time >= p.next_swing )
    {
      if ( p.form == FORM_CAT )
        s.add_damage( p.swing() );
      else if ( p.form == FORM_BEAR )
        s.add_damage( rotation.bear_auto_attack( s, p ) );
      p.next_swing += p.swing_time();
    }

    if ( p.gcd <= timespan_t::zero() && s.time >= s.next_action )
      s.add_damage( rotation.execute( s, p ) );

    if ( p.tigers_fury && ! p.cat_form() )
      rotation.drop_tigers_fury( s, p );

    // Procs from this step's attacks become active right away
    update_effects();

    rotation.tigers_fury_rule( s, p );

    timespan_t next = next_event_time();
    if ( next <= s.time )
    {
      next = s.time;
      if ( ++same_time_steps > MAX_SAME_TIME_STEPS )
      {
        next = s.time + timespan_t::from_millis( 1 );
        same_time_steps = 0;
      }
    }
    else
    {
      same_time_steps = 0;
    }

    s.time = next;
  }
}

// sim_t::next_event_time ===================================================

timespan_t sim_t::next_event_time() const
{
  const druid_t& p = *druid;
  const simulation_state_t& s = state;

  timespan_t next = std::max( s.time + p.gcd, s.next_action );
  next = std::min( next, p.next_swing );

  for ( const dot_t* dot : { &s.rip, &s.rake, &s.lacerate } )
  {
    if ( dot -> is_ticking() )
      next = std::min( { next, dot -> next_tick(), dot -> end() } );
  }

  for ( const auto& e : effects )
  {
    timespan_t t = e -> next_event();
    if ( t > s.time )
      next = std::min( next, t );
  }

  timespan_t debuff = debuff_scheduler.next_event();
  if ( debuff > s.time )
    next = std::min( next, debuff );

  if ( p.tigers_fury )
    next = std::min( next, s.tf_end );
  if ( p.berserk )
    next = std::min( next, s.berserk_end );
  if ( p.savage_roar )
    next = std::min( next, s.roar_end );
  if ( s.mangle_debuff )
    next = std::min( next, s.mangle_end );
  if ( ! p.cooldown_ready( COOLDOWN_TIGERS_FURY ) )
    next = std::min( next, s.time + p.cooldown_remains( COOLDOWN_TIGERS_FURY ) );

  return next;
}

// sim_t::combat_end ========================================================

void sim_t::combat_end( trial_record_t& record )
{
  druid_t& p = *druid;
  timespan_t end = state.fight_length;

  for ( auto& e : effects )
  {
    e -> update( end, p );
    if ( e -> state.active )
      e -> deactivate( end, p );
  }

  double length = end.total_seconds();

  if ( ! std::isfinite( state.total_damage ) )
    throw std::runtime_error( fmt::format( "Non-finite damage {} at the end of the fight", state.total_damage ) );

  record.fight_length = length;
  record.damage       = state.total_damage;
  record.dps          = state.total_damage / length;
  record.time_to_oom  = state.oom ? state.time_to_oom.total_seconds() : length;
  record.abilities    = p.breakdown;
  record.damage_samples = std::move( state.damage_samples );
  state.damage_samples.clear();

  record.auras.clear();
  for ( const auto& e : effects )
  {
    aura_stat_t a;
    a.name   = e -> name();
    a.procs  = e -> state.num_procs;
    a.uptime = e -> state.uptime;
    record.auras.push_back( std::move( a ) );
  }

  record.valid = true;

  print_debug( "Trial end, {:.0f} damage, {:.1f} DPS", record.damage, record.dps );
}
