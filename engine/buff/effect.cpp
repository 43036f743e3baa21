// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "effect.hpp"

#include <stdexcept>

#include "action/attack_roll.hpp"
#include "player/druid.hpp"
#include "sim/option.hpp"
#include "sim/sim.hpp"
#include "util/util.hpp"

// ==========================================================================
// Effect Definition
// ==========================================================================

effect_spec_t::effect_spec_t() :
  behavior( EFFECT_FIXED_USE ),
  max_procs( 0 ),
  chance_on_hit( 0 ),
  chance_on_crit( -1 ),
  separate_yellow( false ),
  white_chance( 0 ),
  yellow_chance( 0 ),
  trigger( PROC_TRIGGER_ANY ),
  max_stacks( 0 ),
  aura_trigger( AURA_ACTIVATED ),
  aura_white_chance( 0 ),
  aura_yellow_chance( 0 ),
  damage_low( 0 ),
  damage_high( 0 ),
  miss_chance( 0.17 )
{ }

// effect_spec_t::validate ==================================================

void effect_spec_t::validate() const
{
  if ( name.empty() )
    throw std::invalid_argument( "Effect without a name" );

  if ( cooldown < timespan_t::zero() || delay < timespan_t::zero() )
    throw std::invalid_argument( fmt::format( "Effect '{}' has a negative cooldown or delay", name ) );

  if ( behavior == EFFECT_INSTANT_DAMAGE )
  {
    if ( damage_high < damage_low || damage_low < 0 )
      throw std::invalid_argument( fmt::format( "Effect '{}' has an invalid damage range", name ) );
    return;
  }

  if ( stats.empty() )
    throw std::invalid_argument( fmt::format( "Effect '{}' modifies no stat", name ) );

  for ( const auto& s : stats )
  {
    if ( s.stat == STAT_NONE )
      throw std::invalid_argument( fmt::format( "Effect '{}' modifies an unknown stat", name ) );
  }

  if ( duration <= timespan_t::zero() )
    throw std::invalid_argument( fmt::format( "Effect '{}' needs a positive duration", name ) );

  if ( behavior == EFFECT_STACKING_PROC && max_stacks < 1 )
    throw std::invalid_argument( fmt::format( "Stacking effect '{}' needs max_stacks of at least 1", name ) );
}

// effect_spec_t::parse =====================================================

effect_spec_t effect_spec_t::parse( sim_t* sim, const std::string& options_str )
{
  effect_spec_t spec;
  option_list_t options;

  options.push_back( opt_string( "name", spec.name ) );
  options.push_back( opt_string( "stack_name", spec.stack_name ) );
  options.push_back( opt_func( "behavior", [ &spec ]( sim_t*, const std::string&, const std::string& v ) {
    spec.behavior = util::parse_effect_behavior( v );
    return true;
  } ) );
  options.push_back( opt_func( "stat", [ &spec ]( sim_t*, const std::string&, const std::string& v ) {
    spec.stats.emplace_back( util::parse_stat_type( v ), 0.0 );
    return true;
  } ) );
  options.push_back( opt_func( "amount", [ &spec ]( sim_t*, const std::string& n, const std::string& v ) {
    if ( spec.stats.empty() )
      throw std::invalid_argument( fmt::format( "'{}' given before 'stat'", n ) );
    spec.stats.back().amount = util::to_double( v );
    return true;
  } ) );
  options.push_back( opt_timespan( "duration", spec.duration ) );
  options.push_back( opt_timespan( "cooldown", spec.cooldown ) );
  options.push_back( opt_timespan( "delay", spec.delay ) );
  options.push_back( opt_int( "max_procs", spec.max_procs, 0, 1000 ) );
  options.push_back( opt_float( "chance_on_hit", spec.chance_on_hit, 0.0, 1.0 ) );
  options.push_back( opt_float( "chance_on_crit", spec.chance_on_crit, 0.0, 1.0 ) );
  options.push_back( opt_func( "white_chance", [ &spec ]( sim_t*, const std::string&, const std::string& v ) {
    spec.white_chance = util::to_double( v );
    spec.separate_yellow = true;
    return spec.white_chance >= 0 && spec.white_chance <= 1;
  } ) );
  options.push_back( opt_func( "yellow_chance", [ &spec ]( sim_t*, const std::string&, const std::string& v ) {
    spec.yellow_chance = util::to_double( v );
    spec.separate_yellow = true;
    return spec.yellow_chance >= 0 && spec.yellow_chance <= 1;
  } ) );
  options.push_back( opt_func( "trigger", [ &spec ]( sim_t*, const std::string&, const std::string& v ) {
    spec.trigger = util::parse_proc_trigger( v );
    return true;
  } ) );
  options.push_back( opt_int( "max_stacks", spec.max_stacks, 0, 100 ) );
  options.push_back( opt_func( "aura", [ &spec ]( sim_t*, const std::string&, const std::string& v ) {
    spec.aura_trigger = util::parse_aura_trigger( v );
    return true;
  } ) );
  options.push_back( opt_float( "aura_white_chance", spec.aura_white_chance, 0.0, 1.0 ) );
  options.push_back( opt_float( "aura_yellow_chance", spec.aura_yellow_chance, 0.0, 1.0 ) );
  options.push_back( opt_float( "damage_low", spec.damage_low ) );
  options.push_back( opt_float( "damage_high", spec.damage_high ) );
  options.push_back( opt_float( "miss_chance", spec.miss_chance, 0.0, 1.0 ) );

  opts::parse( sim, "effect", options, options_str );

  if ( spec.stack_name.empty() )
    spec.stack_name = spec.name;

  spec.validate();

  return spec;
}

// ==========================================================================
// Effect
// ==========================================================================

effect_t::effect_t( sim_t* s, effect_spec_t sp ) :
  sim( s ),
  spec( std::move( sp ) )
{
  spec.validate();
  reset();
}

// effect_t::reset ==========================================================

void effect_t::reset()
{
  state.reset();

  switch ( spec.behavior )
  {
    case EFFECT_FIXED_USE:
      // Ready exactly when the delay has passed
      if ( spec.delay > timespan_t::zero() )
      {
        state.activation = spec.delay - spec.cooldown;
        state.can_proc = false;
      }
      break;
    case EFFECT_STACKING_PROC:
      state.can_proc = false;
      break;
    default:
      break;
  }
}

// effect_t::cooldown_ready =================================================

bool effect_t::cooldown_ready( timespan_t now ) const
{
  if ( state.activation == timespan_t::min() )
    return true;
  return now - state.activation >= spec.cooldown;
}

// effect_t::update =========================================================

double effect_t::update( timespan_t now, druid_t& p )
{
  if ( now > state.last_update )
  {
    double dt = ( now - state.last_update ).total_seconds();
    state.uptime = ( state.uptime * state.last_update.total_seconds() + dt * state.active ) / now.total_seconds();
    state.last_update = now;
  }

  if ( state.active && now >= state.deactivation )
    deactivate( state.deactivation, p );

  if ( ! state.can_proc && cooldown_ready( now ) )
    state.can_proc = true;

  if ( apply_proc() )
    return activate( now, p );

  return 0.0;
}

// effect_t::apply_proc =====================================================

bool effect_t::apply_proc()
{
  bool below_max = spec.max_procs == 0 || state.num_procs < spec.max_procs;

  switch ( spec.behavior )
  {
    case EFFECT_FIXED_USE:
      return state.can_proc && below_max;

    case EFFECT_STACKING_PROC:
      if ( spec.aura_trigger == AURA_ACTIVATED && ! state.active && state.can_proc )
        return below_max;

      // No further stack rolls once capped
      if ( state.stacks >= spec.max_stacks )
      {
        state.can_proc = false;
        return false;
      }
      FC_FALLTHROUGH;

    default:
      if ( state.can_proc && state.proc_happened )
      {
        state.proc_happened = false;
        return below_max || state.active;
      }
      return false;
  }
}

// effect_t::check_for_proc =================================================

void effect_t::check_for_proc( bool crit, bool yellow )
{
  if ( ! state.can_proc )
  {
    state.proc_happened = false;
    return;
  }

  state.proc_happened = sim -> rng.real() < proc_chance( crit, yellow );
}

double effect_t::proc_chance( bool crit, bool yellow ) const
{
  if ( spec.behavior == EFFECT_STACKING_PROC )
  {
    if ( state.active )
      return yellow ? spec.yellow_chance : spec.white_chance;
    if ( spec.aura_trigger == AURA_PROC )
      return yellow ? spec.aura_yellow_chance : spec.aura_white_chance;
    return 0.0;
  }

  if ( spec.separate_yellow )
    return yellow ? spec.yellow_chance : spec.white_chance;

  if ( crit && spec.chance_on_crit >= 0 )
    return spec.chance_on_crit;

  return spec.chance_on_hit;
}

// effect_t::activate =======================================================

double effect_t::activate( timespan_t now, druid_t& p )
{
  if ( spec.behavior == EFFECT_INSTANT_DAMAGE )
    return instant_damage( now );

  if ( spec.behavior == EFFECT_STACKING_PROC && state.active )
  {
    modify_stats( p, 1.0 );
    state.stacks++;
    sim -> record_event( spec.stack_name, fmt::format( "applied ({})", state.stacks ) );
    return 0.0;
  }

  // Refreshing procs never stack, the old buff is removed first
  if ( spec.behavior == EFFECT_REFRESHING_PROC && state.active )
    deactivate( now, p );

  state.activation = now;
  state.deactivation = now + spec.duration;
  state.active = true;
  state.can_proc = false;
  state.num_procs++;

  // A stacking aura carries no stats of its own
  if ( spec.behavior == EFFECT_STACKING_PROC )
    state.can_proc = true;
  else
    modify_stats( p, 1.0 );

  sim -> record_event( spec.name, "applied" );

  return 0.0;
}

// effect_t::deactivate =====================================================

void effect_t::deactivate( timespan_t, druid_t& p )
{
  if ( ! state.active )
    return;

  if ( spec.behavior == EFFECT_STACKING_PROC )
  {
    modify_stats( p, -state.stacks );
    state.stacks = 0;
    state.can_proc = false;
    state.proc_happened = false;
  }
  else
    modify_stats( p, -1.0 );

  state.active = false;

  sim -> record_event( spec.name, "falls off" );
}

// effect_t::instant_damage =================================================

double effect_t::instant_damage( timespan_t )
{
  state.num_procs++;

  roll_result_t r = attack_roll::proc_damage( sim -> rng, spec.damage_low, spec.damage_high, spec.miss_chance );
  state.damage += r.damage;

  sim -> record_event( spec.name, r.miss() ? std::string( "miss" )
                                           : fmt::format( "{}", static_cast<int>( r.damage ) ) );
  return r.damage;
}

// effect_t::modify_stats ===================================================

void effect_t::modify_stats( druid_t& p, double scale )
{
  if ( scale == 0 )
    return;

  for ( const auto& s : spec.stats )
    apply_delta( p, s, scale );
}

// effect_t::next_event =====================================================

timespan_t effect_t::next_event() const
{
  if ( spec.behavior == EFFECT_INSTANT_DAMAGE )
    return timespan_t::max();

  if ( state.active )
    return state.deactivation;

  if ( ! state.can_proc && state.activation != timespan_t::min() )
    return state.activation + spec.cooldown;

  return timespan_t::max();
}

void sc_format_to( const effect_t& e, fmt::format_context::iterator out )
{
  fmt::format_to( out, "Effect {} ({}) active={} stacks={} procs={}", e.spec.name,
                  util::effect_behavior_string( e.spec.behavior ), e.state.active, e.state.stacks,
                  e.state.num_procs );
}

// ==========================================================================
// Built-in cooldowns
// ==========================================================================

effect_spec_t effects::bloodlust( timespan_t delay )
{
  effect_spec_t spec;
  spec.name = spec.stack_name = "Bloodlust";
  spec.behavior = EFFECT_FIXED_USE;
  spec.stats.emplace_back( STAT_HASTE_MULTIPLIER, 0.3 );
  spec.duration = timespan_t::from_seconds( 40 );
  spec.cooldown = timespan_t::from_seconds( 600 );
  spec.delay = delay;
  return spec;
}

effect_spec_t effects::haste_potion( timespan_t delay )
{
  effect_spec_t spec;
  spec.name = spec.stack_name = "Haste Potion";
  spec.behavior = EFFECT_FIXED_USE;
  spec.stats.emplace_back( STAT_HASTE_RATING, 400 );
  spec.duration = timespan_t::from_seconds( 15 );
  spec.cooldown = timespan_t::from_seconds( 60 );
  spec.delay = delay;
  spec.max_procs = delay > timespan_t::zero() ? 1 : 2;
  return spec;
}
