// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "rotation.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "player/druid.hpp"
#include "sim/sim.hpp"
#include "sim/simulation_state.hpp"

namespace { // UNNAMED NAMESPACE ==========================================

// Finisher refreshes the rotation pools energy for
struct pending_action_t
{
  timespan_t time;
  double cost;
};

// Rip is not refreshed when it would run past the end of the fight anyway
constexpr double RIP_END_THRESHOLD = 10.0;
constexpr double RAKE_END_THRESHOLD = 9.0;

constexpr double LACERATE_COST = 13;
constexpr double MANGLE_BEAR_COST = 15;

timespan_t energy_wait( double deficit )
{
  return timespan_t::from_seconds_ceil( std::max( 0.0, deficit ) / 10.0 );
}

} // UNNAMED NAMESPACE ====================================================

// ==========================================================================
// Rotation Strategy
// ==========================================================================

rotation_strategy_t::rotation_strategy_t() :
  min_combos_for_rip( 5 ),
  min_combos_for_bite( 5 ),
  use_rake( false ),
  use_bite( true ),
  bite_time( 8.0 ),
  mangle_spam( false ),
  bear_mangle( false ),
  use_berserk( false ),
  prepop_berserk( false ),
  preproc_omen( false ),
  bearweave( false ),
  berserk_bite_thresh( 100 ),
  lacerate_prio( false ),
  lacerate_time( 10.0 ),
  powerbear( false ),
  use_roar( false ),
  max_roar_clip( 10.0 ),
  min_roar_offset( 10.0 ),
  use_ff( false ),
  flowershift( false )
{ }

void rotation_strategy_t::create_options( option_list_t& options )
{
  options.push_back( opt_int( "min_combos_for_rip", min_combos_for_rip, 1, MAX_COMBO_POINTS ) );
  options.push_back( opt_int( "min_combos_for_bite", min_combos_for_bite, 1, MAX_COMBO_POINTS ) );
  options.push_back( opt_bool( "use_rake", use_rake ) );
  options.push_back( opt_bool( "use_bite", use_bite ) );
  options.push_back( opt_float( "bite_time", bite_time ) );
  options.push_back( opt_bool( "mangle_spam", mangle_spam ) );
  options.push_back( opt_bool( "bear_mangle", bear_mangle ) );
  options.push_back( opt_bool( "use_berserk", use_berserk ) );
  options.push_back( opt_bool( "prepop_berserk", prepop_berserk ) );
  options.push_back( opt_bool( "preproc_omen", preproc_omen ) );
  options.push_back( opt_bool( "bearweave", bearweave ) );
  options.push_back( opt_float( "berserk_bite_thresh", berserk_bite_thresh, 0, 100 ) );
  options.push_back( opt_bool( "lacerate_prio", lacerate_prio ) );
  options.push_back( opt_float( "lacerate_time", lacerate_time, 0, 15 ) );
  options.push_back( opt_bool( "powerbear", powerbear ) );
  options.push_back( opt_bool( "use_roar", use_roar ) );
  options.push_back( opt_float( "max_roar_clip", max_roar_clip, 0, 100 ) );
  options.push_back( opt_float( "min_roar_offset", min_roar_offset ) );
  options.push_back( opt_bool( "use_ff", use_ff ) );
  options.push_back( opt_bool( "flowershift", flowershift ) );
}

void rotation_strategy_t::set( const std::string& name, const std::string& value )
{
  option_list_t options;
  create_options( options );
  opts::parse( nullptr, options, name, value );
}

void rotation_strategy_t::validate() const
{
  if ( prepop_berserk && ! use_berserk )
    throw std::invalid_argument( "prepop_berserk requires use_berserk" );
  if ( powerbear && ! bearweave )
    throw std::invalid_argument( "powerbear requires bearweave" );
  if ( lacerate_prio && ! bearweave )
    throw std::invalid_argument( "lacerate_prio requires bearweave" );
  if ( bearweave && flowershift )
    throw std::invalid_argument( "bearweave and flowershift cannot both be enabled" );
}

void sc_format_to( const rotation_strategy_t& s, fmt::format_context::iterator out )
{
  fmt::format_to( out, "Rotation rip_cp={} bite_cp={} bite_time={} rake={} berserk={} bearweave={} roar={}",
                  s.min_combos_for_rip, s.min_combos_for_bite, s.bite_time, s.use_rake, s.use_berserk,
                  s.bearweave, s.use_roar );
}

// ==========================================================================
// Rotation
// ==========================================================================

// rotation_t::combat_begin =================================================

void rotation_t::combat_begin( simulation_state_t& s, druid_t& p )
{
  if ( strategy.bear_mangle )
  {
    s.mangle_debuff = true;
    s.mangle_end = timespan_t::max();
  }

  if ( strategy.prepop_berserk )
    apply_berserk( s, p, true );

  if ( strategy.preproc_omen && p.config.omen )
    p.omen_proc = true;
}

// rotation_t::apply_tigers_fury ============================================

void rotation_t::apply_tigers_fury( simulation_state_t& s, druid_t& p )
{
  p.resource_gain( RESOURCE_ENERGY, 60 );
  p.tigers_fury = true;
  p.recalculate_damage();
  s.tf_end = s.time + timespan_t::from_seconds( 6 );
  p.start_cooldown( COOLDOWN_TIGERS_FURY, timespan_t::from_seconds( 30 ) );
  s.next_action = s.time + sim -> latency;
  sim -> record_event( "Tiger's Fury", "applied" );
}

void rotation_t::drop_tigers_fury( simulation_state_t&, druid_t& p )
{
  p.tigers_fury = false;
  p.recalculate_damage();
  sim -> record_event( "Tiger's Fury", "falls off" );
}

// rotation_t::apply_berserk ================================================

// A prepopped Berserk is used one second before the pull and does not
// trigger the global cooldown.
void rotation_t::apply_berserk( simulation_state_t& s, druid_t& p, bool prepop )
{
  timespan_t start = s.time - ( prepop ? timespan_t::from_seconds( 1 ) : timespan_t::zero() );

  p.berserk = true;
  p.set_ability_costs();
  p.gcd = prepop ? timespan_t::zero() : timespan_t::from_seconds( 1 );
  s.berserk_end = start + timespan_t::from_seconds( 15 + 5 * p.config.berserk_glyph );
  p.start_cooldown( COOLDOWN_BERSERK, start + timespan_t::from_seconds( 180 ) - s.time );
  sim -> record_event( "Berserk", "applied" );
}

void rotation_t::drop_berserk( simulation_state_t&, druid_t& p )
{
  p.berserk = false;
  p.set_ability_costs();
  sim -> record_event( "Berserk", "falls off" );
}

void rotation_t::drop_roar( simulation_state_t&, druid_t& p )
{
  p.savage_roar = false;
  sim -> record_event( "Savage Roar", "falls off" );
}

void rotation_t::drop_mangle( simulation_state_t& s, druid_t& )
{
  s.mangle_debuff = false;
  sim -> record_event( "Mangle", "falls off" );
}

// rotation_t::tigers_fury_rule =============================================

void rotation_t::tigers_fury_rule( simulation_state_t& s, druid_t& p )
{
  double leeway = std::max( p.gcd, sim -> latency ).total_seconds();
  double threshold = 40 - 10 * ( leeway + p.omen_proc );

  if ( p.energy() < threshold && p.cooldown_ready( COOLDOWN_TIGERS_FURY ) && ! p.berserk && p.cat_form() )
    apply_tigers_fury( s, p );
}

// ==========================================================================
// Abilities with fight state
// ==========================================================================

double rotation_t::shred( simulation_state_t& s, druid_t& p )
{
  action_result_t r = p.shred( s.mangle_debuff );

  // Glyph of Shred extends Rip by up to 6 seconds
  if ( r.success && p.config.shred_glyph && s.rip.is_ticking() &&
       s.rip.end() - s.rip.start() < p.rip_duration + timespan_t::from_seconds( 6 ) )
  {
    s.rip.extend( timespan_t::from_seconds( 2 ) );
  }

  return r.damage;
}

double rotation_t::rake( simulation_state_t& s, druid_t& p )
{
  action_result_t r = p.rake( s.mangle_debuff );
  if ( r.success )
  {
    s.rake.snapshot( p.damage.rake_tick, 0, 1, false );
    s.rake.trigger( p.rake_duration );
  }
  return r.damage;
}

double rotation_t::mangle( simulation_state_t& s, druid_t& p )
{
  action_result_t r = p.mangle();
  if ( r.success )
  {
    s.mangle_debuff = true;
    s.mangle_end = strategy.bear_mangle ? timespan_t::max() : s.time + timespan_t::from_seconds( 60 );
  }
  return r.damage;
}

double rotation_t::lacerate( simulation_state_t& s, druid_t& p )
{
  action_result_t r = p.lacerate( s.mangle_debuff );
  if ( r.success )
  {
    s.lacerate.refresh( timespan_t::from_seconds( 15 ) );
    double tick = p.damage.lacerate_tick * s.lacerate.current_stack() * ( 1 + 0.15 * p.enrage );
    s.lacerate.snapshot( tick, p.crit_chance, p.crit_multiplier(), p.config.primal_gore );
  }
  return r.damage;
}

double rotation_t::rip( simulation_state_t& s, druid_t& p )
{
  action_result_t r = p.rip();
  if ( r.success )
  {
    s.rip.snapshot( r.damage, p.crit_chance + p.rip_crit_bonus, p.crit_multiplier(), p.config.primal_gore );
    s.rip.trigger( p.rip_duration );
  }
  return 0;
}

double rotation_t::bite( simulation_state_t&, druid_t& p )
{
  return p.bite().damage;
}

double rotation_t::roar( simulation_state_t& s, druid_t& p )
{
  int cp = p.combo_points();
  action_result_t r = p.roar();
  if ( r.executed )
    s.roar_end = s.time + p.roar_duration( cp );
  return 0;
}

// rotation_t::bear_auto_attack =============================================

// Maul is queued when enough rage remains for the special the druid expects
// to use next.
double rotation_t::bear_auto_attack( simulation_state_t& s, druid_t& p )
{
  double t        = s.time.total_seconds();
  double gcd      = p.gcd.total_seconds();
  double latency  = sim -> latency.total_seconds();
  double furor_cap = std::min( 20.0 * p.config.furor, 85.0 );

  bool rip_refresh_pending = s.rip.is_ticking() &&
                             s.rip.end() < s.fight_length - timespan_t::from_seconds( RIP_END_THRESHOLD );
  double rip_end = s.rip.end().total_seconds();

  double energy_leeway = furor_cap - 15 - 10 * ( gcd + latency );
  bool shift_next = p.energy() > energy_leeway;
  if ( rip_refresh_pending )
    shift_next = shift_next || rip_end < t + gcd + 3;

  bool lacerate_next;
  bool mangle_next;
  bool emergency_lacerate_next = false;
  bool lacerate_up = s.lacerate.is_ticking();
  double lacerate_end = s.lacerate.end().total_seconds();

  if ( strategy.lacerate_prio )
  {
    lacerate_next = ! lacerate_up || ! s.lacerate.at_max_stacks() ||
                    lacerate_end - t <= gcd + strategy.lacerate_time;
    emergency_lacerate_next = lacerate_up && lacerate_end - t <= gcd + 3 + 2 * latency;
    mangle_next = ! lacerate_next &&
                  ( ! s.mangle_debuff || s.mangle_end < s.time + p.gcd + timespan_t::from_seconds( 3 ) );
  }
  else
  {
    mangle_next = p.cooldown_remains( COOLDOWN_MANGLE_BEAR ) < p.gcd;
    lacerate_next = lacerate_up && ( ! s.lacerate.at_max_stacks() || lacerate_end < t + gcd + 4.5 );
  }

  double maul_threshold;
  if ( emergency_lacerate_next )
    maul_threshold = 23;
  else if ( shift_next )
    maul_threshold = 10;
  else if ( mangle_next )
    maul_threshold = 25;
  else if ( lacerate_next )
    maul_threshold = 23;
  else
    maul_threshold = 10;

  if ( p.rage() >= maul_threshold )
    return p.maul( s.mangle_debuff );
  return p.swing();
}

// rotation_t::execute ======================================================

double rotation_t::execute( simulation_state_t& s, druid_t& p )
{
  // A queued shift, or a flowershift that left the druid in caster form
  if ( p.ready_to_shift || p.form == FORM_CASTER )
  {
    p.shift();
    return 0;
  }

  const timespan_t now = s.time;
  double t             = now.total_seconds();
  double latency       = sim -> latency.total_seconds();
  double fight_length  = s.fight_length.total_seconds();
  double energy        = p.energy();
  double rage          = p.rage();
  int cp               = p.combo_points();
  bool omen            = p.omen_proc;
  int rip_cp           = strategy.min_combos_for_rip;
  int bite_cp          = strategy.min_combos_for_bite;

  bool rip_active = s.rip.is_ticking();
  double rip_end  = rip_active ? s.rip.end().total_seconds() : t;

  bool rip_now = cp >= rip_cp && ! rip_active && fight_length - t >= RIP_END_THRESHOLD && ! omen;

  bool bite_at_end = cp >= bite_cp &&
                     ( fight_length - t < RIP_END_THRESHOLD ||
                       ( rip_active && fight_length - rip_end < RIP_END_THRESHOLD ) );
  bool bite_before_rip = cp >= bite_cp && rip_active && strategy.use_bite && can_bite( s, p );
  bool bite_now = ( bite_before_rip || bite_at_end ) && ! omen;
  if ( bite_now && p.berserk )
    bite_now = energy <= strategy.berserk_bite_thresh;

  bool mangle_now = ! rip_now && ! s.mangle_debuff && ! omen;
  bool rake_now = strategy.use_rake && ! s.rake.is_ticking() && fight_length - t > RAKE_END_THRESHOLD && ! omen;

  double berserk_energy_thresh = 90 - 10 * omen;
  bool berserk_now = strategy.use_berserk && p.cooldown_ready( COOLDOWN_BERSERK ) &&
                     p.cooldown_remains( COOLDOWN_TIGERS_FURY ) > timespan_t::from_seconds( 15 ) &&
                     energy < berserk_energy_thresh + FC_EPSILON;

  bool roar_up = p.savage_roar;
  double roar_end = s.roar_end.total_seconds();
  bool roar_now = strategy.use_roar && cp >= 1 && ! roar_up && ! omen;
  bool roar_clip = strategy.use_roar && roar_up && rip_active && cp >= 1 && ! omen &&
                   roar_end - t <= strategy.max_roar_clip && roar_end < rip_end &&
                   ( now + p.roar_duration( cp ) ).total_seconds() >= rip_end + strategy.min_roar_offset;

  // Upcoming refreshes that energy has to be pooled for
  std::vector<pending_action_t> pending;
  bool rip_refresh_pending = false;
  bool float_energy_for_rip = false;

  if ( rip_active && rip_end < fight_length - RIP_END_THRESHOLD )
  {
    double rip_cost = berserk_expected_at( s, p, rip_end ) ? p.costs.base_rip / 2 : p.costs.base_rip;
    pending.push_back( { s.rip.end(), rip_cost } );
    rip_refresh_pending = true;
    float_energy_for_rip = rip_end - t < rip_cost / 10.0;
  }
  if ( s.rake.is_ticking() && s.rake.end().total_seconds() < fight_length - RAKE_END_THRESHOLD )
  {
    double rake_cost = berserk_expected_at( s, p, s.rake.end().total_seconds() ) ? 17.5 : 35;
    pending.push_back( { s.rake.end(), rake_cost } );
  }
  if ( s.mangle_debuff && s.mangle_end < s.fight_length - timespan_t::from_seconds( 1 ) )
  {
    double base = p.costs.base_mangle;
    double mangle_cost = berserk_expected_at( s, p, s.mangle_end.total_seconds() ) ? base / 2 : base;
    pending.push_back( { s.mangle_end, mangle_cost } );
  }
  if ( strategy.use_roar && roar_up && s.roar_end < s.fight_length - timespan_t::from_seconds( 1 ) )
  {
    double roar_cost = berserk_expected_at( s, p, roar_end ) ? 12.5 : 25;
    pending.push_back( { s.roar_end, roar_cost } );
  }

  std::sort( pending.begin(), pending.end(),
             []( const pending_action_t& l, const pending_action_t& r ) { return l.time < r.time; } );

  // Energy that must be left untouched to afford every pending refresh on
  // time
  double floating_energy = 0;
  double previous_time = t;
  for ( const auto& a : pending )
  {
    double delta_t = a.time.total_seconds() - previous_time;
    if ( delta_t < a.cost / 10.0 )
    {
      floating_energy += a.cost - 10 * delta_t;
      previous_time = a.time.total_seconds();
    }
    else
    {
      previous_time += a.cost / 10.0;
    }
  }
  double excess_e = energy - floating_energy;

  // Weaving
  double furor_cap = std::min( 20.0 * p.config.furor, 85.0 );
  double weave_energy = furor_cap - 30 - 20 * latency;
  if ( p.config.furor > 3 )
    weave_energy -= 15;

  double weave_end = t + 4.5 + 2 * latency;
  bool weave_window = energy <= weave_energy && ! omen &&
                      ( ! rip_refresh_pending || rip_end >= weave_end ) &&
                      ! tf_expected_before( s, p, weave_end ) && ! p.berserk;

  bool bearweave_now = strategy.bearweave && weave_window;
  bool flowershift_now = strategy.flowershift && weave_window;

  bool emergency_bearweave = strategy.bearweave && strategy.lacerate_prio && s.lacerate.is_ticking() &&
                             s.lacerate.end().total_seconds() - t < 2.5 + latency;

  // Both weaves need the mana to get back into Cat Form
  if ( ( bearweave_now || emergency_bearweave ) && p.mana() < 2 * p.shift_cost )
  {
    s.mark_oom();
    bearweave_now = false;
    emergency_bearweave = false;
  }
  if ( flowershift_now && p.mana() < GIFT_OF_THE_WILD_COST + p.shift_cost )
  {
    s.mark_oom();
    flowershift_now = false;
  }

  timespan_t wait = timespan_t::zero();
  double damage = 0;

  if ( p.form == FORM_BEAR )
  {
    bool shift_now = energy + 15 + 10 * latency > furor_cap || ( rip_refresh_pending && rip_end < t + 3.0 );

    bool powerbear_now = false;
    if ( strategy.powerbear )
    {
      powerbear_now = ! shift_now && rage < 10;

      // A powershift still has to leave the mana for Cat Form
      if ( powerbear_now && p.mana() < 2 * p.shift_cost )
      {
        s.mark_oom();
        powerbear_now = false;
      }
    }
    else
      shift_now = shift_now || rage < 10;

    if ( ! strategy.lacerate_prio )
      shift_now = shift_now || omen;

    bool lacerate_up = s.lacerate.is_ticking();
    double lacerate_end = s.lacerate.end().total_seconds();
    bool emergency_lacerate = strategy.lacerate_prio && lacerate_up && lacerate_end - t < 3 + 2 * latency;
    bool lacerate_now = strategy.lacerate_prio &&
                        ( ! lacerate_up || ! s.lacerate.at_max_stacks() ||
                          lacerate_end - t <= strategy.lacerate_time );
    bool ff_now = strategy.use_ff && p.cooldown_ready( COOLDOWN_FAERIE_FIRE ) && ! omen;

    if ( emergency_lacerate && ( rage >= LACERATE_COST || omen ) )
      return lacerate( s, p );
    else if ( shift_now )
      p.ready_to_shift = true;
    else if ( powerbear_now )
      p.shift( true );
    else if ( lacerate_now && ( rage >= LACERATE_COST || omen ) )
      return lacerate( s, p );
    else if ( ( rage >= MANGLE_BEAR_COST || omen ) && p.cooldown_ready( COOLDOWN_MANGLE_BEAR ) )
      return mangle( s, p );
    else if ( ff_now )
      return p.faerie_fire();
    else if ( rage >= LACERATE_COST || omen )
      return lacerate( s, p );
    else
      wait = p.next_swing - now;
  }
  else if ( emergency_bearweave )
  {
    p.ready_to_shift = true;
  }
  else if ( berserk_now )
  {
    apply_berserk( s, p );
    return 0;
  }
  else if ( roar_now )
  {
    if ( energy >= p.costs.roar - FC_EPSILON )
      return roar( s, p );
    wait = energy_wait( p.costs.roar - energy );
  }
  else if ( rip_now )
  {
    if ( energy >= p.costs.rip - FC_EPSILON || omen )
      return rip( s, p );
    wait = energy_wait( p.costs.rip - energy );
  }
  else if ( roar_clip )
  {
    if ( energy >= p.costs.roar - FC_EPSILON )
      return roar( s, p );
    wait = energy_wait( p.costs.roar - energy );
  }
  else if ( bite_now && ! float_energy_for_rip )
  {
    if ( energy >= p.costs.bite - FC_EPSILON )
      return bite( s, p );
    wait = energy_wait( p.costs.bite - energy );
  }
  else if ( mangle_now )
  {
    if ( energy >= p.costs.mangle - FC_EPSILON || omen )
      return mangle( s, p );
    wait = energy_wait( p.costs.mangle - energy );
  }
  else if ( rake_now )
  {
    if ( energy >= p.costs.rake - FC_EPSILON || omen )
      return rake( s, p );
    wait = energy_wait( p.costs.rake - energy );
  }
  else if ( bearweave_now )
  {
    p.ready_to_shift = true;
  }
  else if ( flowershift_now )
  {
    p.flowershift();
  }
  else if ( strategy.mangle_spam && ! omen )
  {
    if ( excess_e >= p.costs.mangle - FC_EPSILON )
      return mangle( s, p );
    wait = energy_wait( p.costs.mangle - excess_e );
  }
  else if ( strategy.use_ff && p.cooldown_ready( COOLDOWN_FAERIE_FIRE ) && ! omen &&
            excess_e < p.costs.shred - FC_EPSILON )
  {
    damage = p.faerie_fire();
  }
  else
  {
    if ( excess_e >= p.costs.shred - FC_EPSILON || omen )
      return shred( s, p );
    wait = energy_wait( p.costs.shred - excess_e );
  }

  // Nothing was cast: come back when the wait is over or a pending refresh
  // is due, whichever is first
  timespan_t next = now + wait;
  if ( ! pending.empty() )
    next = std::min( next, pending.front().time );
  s.next_action = std::max( next, now ) + sim -> latency;

  return damage;
}

// ==========================================================================
// Prediction helpers
// ==========================================================================

bool rotation_t::berserk_expected_at( const simulation_state_t& s, const druid_t& p, double future ) const
{
  double t = s.time.total_seconds();
  double berserk_cd = p.cooldown_remains( COOLDOWN_BERSERK ).total_seconds();

  if ( p.berserk )
    return future < s.berserk_end.total_seconds() || future > t + berserk_cd;
  if ( berserk_cd > FC_EPSILON )
    return future > t + berserk_cd;
  if ( p.tigers_fury && strategy.use_berserk )
    return future > s.tf_end.total_seconds();
  return false;
}

bool rotation_t::tf_expected_before( const simulation_state_t& s, const druid_t& p, double future ) const
{
  double tf_cd = p.cooldown_remains( COOLDOWN_TIGERS_FURY ).total_seconds();

  if ( tf_cd > FC_EPSILON )
    return s.time.total_seconds() + tf_cd < future;
  if ( p.berserk )
    return s.berserk_end.total_seconds() < future;
  return true;
}

bool rotation_t::can_bite( const simulation_state_t& s, const druid_t& p ) const
{
  if ( strategy.bite_time >= 0 )
    return ( s.rip.end() - s.time ).total_seconds() >= strategy.bite_time;
  return can_bite_analytical( s, p );
}

// rotation_t::can_bite_analytical ==========================================

// Bite now if the energy expected before Rip falls off covers the Bite, the
// builders for a fresh Rip and the Rip itself, minus the Rip downtime the
// Bite is worth.
bool rotation_t::can_bite_analytical( const simulation_state_t& s, const druid_t& p ) const
{
  double t = s.time.total_seconds();
  timespan_t max_rip = p.rip_duration + timespan_t::from_seconds( 6 * p.config.shred_glyph );
  double ripdur = ( s.rip.start() + max_rip ).total_seconds() - t;

  double expected_energy_gain = 10 * ripdur;
  if ( tf_expected_before( s, p, s.rip.end().total_seconds() ) )
    expected_energy_gain += 60;
  if ( p.config.omen )
    expected_energy_gain += ripdur / p.swing_time().total_seconds() * ( 3.5 / 60 * ( 1 - p.miss_chance ) * 42 );
  expected_energy_gain += ripdur / s.revitalize_frequency.total_seconds() * 0.15 * 8;

  double total_energy_available = p.energy() + expected_energy_gain;

  double rip_cost, bite_cost;
  get_finisher_costs( s, p, rip_cost, bite_cost );

  double cp_per_builder = 1 + p.crit_chance;
  double cost_per_builder = ( 42.0 + 42.0 + 35.0 ) / 3.0 * ( 1 + 0.2 * p.miss_chance );
  double total_energy_cost = bite_cost + 5.0 / cp_per_builder * cost_per_builder + rip_cost;

  double allowed_rip_downtime = calc_allowed_rip_downtime( p, bite_cost, rip_cost );
  allowed_rip_downtime = 22.0 * ( 1 - 1.0 / ( 1.0 + allowed_rip_downtime / 22.0 ) );

  total_energy_cost -= 10 * allowed_rip_downtime;

  return total_energy_available > total_energy_cost;
}

void rotation_t::get_finisher_costs( const simulation_state_t& s, const druid_t& p, double& rip_cost,
                                     double& bite_cost ) const
{
  double rip_end = s.rip.is_ticking() ? s.rip.end().total_seconds() : s.time.total_seconds();
  rip_cost = berserk_expected_at( s, p, rip_end ) ? p.costs.base_rip / 2 : p.costs.base_rip;

  if ( p.energy() >= p.costs.bite )
    bite_cost = std::min( p.costs.bite + 30, p.energy() );
  else
    bite_cost = p.costs.bite + 10 * sim -> latency.total_seconds();
}

// Seconds of Rip uptime a Ferocious Bite is worth
double rotation_t::calc_allowed_rip_downtime( const druid_t& p, double bite_cost, double rip_cost ) const
{
  int rip_cp  = strategy.min_combos_for_rip;
  int bite_cp = strategy.min_combos_for_bite;

  double crit_factor = 2.2 * ( 1 + 0.03 * p.config.meta ) - 1;

  double bite_base_dmg  = 0.5 * ( p.damage.bite[ bite_cp ].low + p.damage.bite[ bite_cp ].high );
  double bite_bonus_dmg = ( bite_cost - p.costs.bite ) * ( 3.4 + p.attack_power / 410.0 ) * p.damage.bite_multiplier;
  double bite_dpc = ( bite_base_dmg + bite_bonus_dmg ) * ( 1 + crit_factor * ( p.crit_chance + 0.25 ) );

  double avg_rip_tick = p.damage.rip_tick[ rip_cp ] * 1.3 *
                        ( 1 + crit_factor * p.crit_chance * p.config.primal_gore );
  double shred_dpc = 0.5 * ( p.damage.shred.low + p.damage.shred.high ) * 1.3 * ( 1 + crit_factor * p.crit_chance );

  return ( bite_dpc - ( bite_cost - rip_cost ) * shred_dpc / 42.0 ) / avg_rip_tick * 2;
}
