// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "druid.hpp"

#include <algorithm>
#include <cmath>

#include "buff/effect.hpp"
#include "player/target.hpp"
#include "sim/sim.hpp"
#include "util/util.hpp"

namespace { // UNNAMED NAMESPACE ==========================================

// Rating needed for 1% melee haste at level 80, multiplied by 100
constexpr double HASTE_RATING_MELEE = 2521;
constexpr double HASTE_RATING_SPELL = 3279;

// Boss crit suppression on melee attacks
constexpr double CRIT_SUPPRESSION = 0.048;

std::string outcome_string( const roll_result_t& r, bool clearcast, double damage )
{
  if ( r.miss() )
    return clearcast ? "miss (clearcast)" : "miss";

  std::string s = fmt::format( "{}", static_cast<int>( damage ) );
  if ( r.crit() && clearcast )
    s += " (crit, clearcast)";
  else if ( r.crit() )
    s += " (crit)";
  else if ( clearcast )
    s += " (clearcast)";
  return s;
}

} // UNNAMED NAMESPACE ====================================================

// ==========================================================================
// Druid Configuration
// ==========================================================================

druid_config_t::druid_config_t() :
  attack_power( 6000 ),
  ap_mod( 1.1 * 1.1 ),
  agility( 1000 ),
  hit_chance( 0.08 ),
  spell_hit_chance( 0.1 ),
  expertise_rating( 50 ),
  crit_chance( 0.5 ),
  spell_crit_chance( 0.2 ),
  armor_pen_rating( 500 ),
  swing_timer( 0.833 ),
  haste_multiplier( 1.2 ),
  mana( 8000 ),
  intellect( 300 ),
  spirit( 250 ),
  mp5( 0 ),
  bonus_damage( 0 ),
  shred_bonus( 0 ),
  rip_bonus( 0 ),
  debuff_ap( 0 ),
  multiplier( 1.1 ),
  spell_damage_multiplier( 1.0 ),
  weapon_speed( 3.0 ),
  gotw_targets( 25 ),
  omen( true ),
  primal_gore( true ),
  feral_aggression( 0 ),
  predatory_instincts( 3 ),
  savage_fury( 2 ),
  furor( 3 ),
  natural_shapeshifter( 3 ),
  intensity( 0 ),
  potp( 2 ),
  improved_mangle( 0 ),
  ilotp( 2 ),
  rip_glyph( true ),
  shred_glyph( true ),
  roar_glyph( false ),
  berserk_glyph( false ),
  mangle_glyph( false ),
  jow( false ),
  rune( true ),
  wolfshead( true ),
  meta( false ),
  t6_2p( false ), t6_4p( false ),
  t7_2p( false ),
  t8_2p( false ), t8_4p( false ),
  t9_2p( false ), t9_4p( false ),
  t10_2p( false ), t10_4p( false )
{ }

// ==========================================================================
// Druid
// ==========================================================================

druid_t::druid_t( sim_t* s, const druid_config_t& c, target_t& t ) :
  sim( s ),
  config( c ),
  target( t ),
  form( FORM_CAT ),
  omen_proc( false ),
  berserk( false ),
  tigers_fury( false ),
  enrage( false ),
  savage_roar( false ),
  five_second_rule( false ),
  ready_to_shift( false )
{
  init();
}

// druid_t::init ============================================================

// Rebuilds live stats from the configuration.
void druid_t::init()
{
  attack_power      = config.attack_power;
  agility           = config.agility;
  crit_chance       = config.crit_chance - CRIT_SUPPRESSION;
  spell_crit_chance = config.spell_crit_chance;
  hit_chance        = config.hit_chance;
  spell_hit_chance  = config.spell_hit_chance;
  expertise_rating  = config.expertise_rating;
  miss_adjust       = 0;
  armor_pen_rating  = config.armor_pen_rating;
  bonus_damage      = config.bonus_damage;
  haste_multiplier  = config.haste_multiplier;
  haste_rating      = HASTE_RATING_MELEE * ( 1.0 / ( config.swing_timer * haste_multiplier ) - 1 );
  mana_pool         = config.mana;
  intellect         = config.intellect;
  spirit            = config.spirit;
  mp5               = config.mp5;

  bear_ap_mod        = config.ap_mod / 1.1 * ( 1 + 0.02 * config.potp );
  roar_fac           = 0.3 + 0.03 * config.roar_glyph;
  rip_duration       = timespan_t::from_seconds( 12 + 4 * config.rip_glyph + 4 * config.t7_2p );
  rake_duration      = timespan_t::from_seconds( 9 + 3 * config.t9_2p );
  lacerate_multi     = ( 1 + 0.05 * config.t7_2p ) * ( 1 + 0.2 * config.t10_2p );
  lacerate_dot_multi = ( 1 + 0.05 * config.t9_2p ) * ( 1 + 0.2 * config.t10_2p );
  bite_crit_bonus    = 0.25 + 0.05 * config.t9_4p;
  rip_crit_bonus     = 0.05 * config.t9_4p;

  costs.base_mangle = 40 - 5 * config.t6_2p - 2 * config.improved_mangle;
  costs.base_rip    = 30 - 10 * config.t10_2p;

  resources.max[ RESOURCE_ENERGY ]      = 100;
  resources.max[ RESOURCE_RAGE ]        = 100;
  resources.max[ RESOURCE_MANA ]        = mana_pool;
  resources.max[ RESOURCE_COMBO_POINT ] = MAX_COMBO_POINTS;

  calc_miss_chance();
  calc_spell_miss_chance();
  set_mana_regen();
  reset();
}

// druid_t::reset ===========================================================

void druid_t::reset()
{
  form = FORM_CAT;
  gcd = timespan_t::zero();
  cooldowns.fill( timespan_t::zero() );
  next_swing = timespan_t::zero();
  last_shift = timespan_t::from_seconds( -3600 );
  omen_proc = false;
  berserk = false;
  tigers_fury = false;
  enrage = false;
  savage_roar = false;
  five_second_rule = false;
  ready_to_shift = false;

  resources.max[ RESOURCE_MANA ] = mana_pool;
  resources.current[ RESOURCE_ENERGY ]      = 100;
  resources.current[ RESOURCE_RAGE ]        = 0;
  resources.current[ RESOURCE_MANA ]        = mana_pool;
  resources.current[ RESOURCE_COMBO_POINT ] = 0;

  for ( auto& b : breakdown )
    b = ability_stats_t();

  set_ability_costs();
  recalculate_damage();
}

// druid_t::calc_miss_chance ================================================

void druid_t::calc_miss_chance()
{
  double miss_reduction  = std::min( hit_chance * 100, 8.0 );
  double dodge_reduction = std::min( 6.5, ( 10 + std::floor( expertise_rating / 8.1974973675 ) ) * 0.25 );

  miss_chance  = 0.01 * ( ( 8.0 - miss_reduction ) + ( 6.5 - dodge_reduction ) ) + miss_adjust;
  dodge_chance = 0.01 * ( 6.5 - dodge_reduction );
}

void druid_t::calc_spell_miss_chance()
{
  double spell_miss_reduction = std::min( spell_hit_chance * 100, 17.0 );
  spell_miss_chance = 0.01 * ( 17.0 - spell_miss_reduction );
}

// druid_t::crit_multiplier =================================================

double druid_t::crit_multiplier() const
{
  double m = 2.0 * ( 1.0 + config.meta * 0.03 );
  if ( form == FORM_CAT )
    m *= 1.0 + util::round( config.predatory_instincts / 30.0, 2 );
  return m;
}

double druid_t::spell_crit_multiplier() const
{
  return 1.5 * ( 1.0 + config.meta * 0.03 );
}

// druid_t::set_mana_regen ==================================================

void druid_t::set_mana_regen()
{
  regen_rates.factor = 0.016725 / 5 * std::sqrt( intellect );
  double base_regen  = spirit * regen_rates.factor;
  double bonus_regen = mp5 / 5;

  regen_rates.base             = base_regen + bonus_regen;
  regen_rates.five_second_rule = 0.5 / 3 * config.intensity * base_regen + bonus_regen;
  shift_cost = 1224 * 0.4 * ( 1 - 0.1 * config.natural_shapeshifter );
}

// druid_t::set_ability_costs ===============================================

void druid_t::set_ability_costs()
{
  double f = 1.0 + berserk;
  costs.shred  = 42.0 / f;
  costs.rake   = 35.0 / f;
  costs.mangle = costs.base_mangle / f;
  costs.bite   = 35.0 / f;
  costs.rip    = costs.base_rip / f;
  costs.roar   = 25.0 / f;
}

// druid_t::recalculate_damage ==============================================

void druid_t::recalculate_damage()
{
  const druid_config_t& c = config;
  damage_params_t& d = damage;

  double bonus = ( attack_power + c.debuff_ap ) / 14 + bonus_damage + 80 * tigers_fury;

  double debuffed_armor = target.debuffed_armor();
  double armor_constant = 467.5 * 80 - 22167.5;
  double arp_cap        = ( debuffed_armor + armor_constant ) / 3.0;
  double armor_pen      = std::min( 1399.0, armor_pen_rating ) / 13.99 / 100 * std::min( arp_cap, debuffed_armor );
  double residual_armor = debuffed_armor - armor_pen;

  d.armor_multiplier  = 1 - residual_armor / ( residual_armor + armor_constant );
  d.damage_multiplier = c.multiplier * ( 1 + 0.04 * target.blood_frenzy );
  d.multiplier        = d.armor_multiplier * d.damage_multiplier;

  double m = d.multiplier;
  d.white = damage_range_t( ( 43.0 + bonus ) * m, ( 66.0 + bonus ) * m );
  d.shred = damage_range_t( 1.2 * ( d.white.low * 2.25 + ( 666 + c.shred_bonus ) * m ),
                            1.2 * ( d.white.high * 2.25 + ( 666 + c.shred_bonus ) * m ) );

  d.bite_multiplier = m * ( 1 + 0.03 * c.feral_aggression ) * ( 1 + 0.15 * c.t6_4p );
  d.bite[ 0 ] = damage_range_t();
  for ( int i = 1; i <= MAX_COMBO_POINTS; i++ )
  {
    d.bite[ i ] = damage_range_t( ( 290 * i + 120 + 0.07 * i * attack_power ) * d.bite_multiplier,
                                  ( 290 * i + 260 + 0.07 * i * attack_power ) * d.bite_multiplier );
  }

  double sf_fac     = 1 + 0.1 * c.savage_fury;
  double mangle_fac = sf_fac * ( 1 + 0.1 * c.mangle_glyph );
  d.mangle = damage_range_t( mangle_fac * ( d.white.low * 2 + 566 * m ),
                             mangle_fac * ( d.white.high * 2 + 566 * m ) );

  double rake_multi = sf_fac * d.damage_multiplier;
  d.rake_hit  = rake_multi * ( 176 + 0.01 * attack_power );
  d.rake_tick = rake_multi * ( 358 + 0.06 * attack_power );

  double rip_multi = d.damage_multiplier * ( 1 + 0.15 * c.t6_4p );
  d.rip_tick[ 0 ] = 0;
  for ( int i = 1; i <= MAX_COMBO_POINTS; i++ )
    d.rip_tick[ i ] = ( 36 + 93 * i + 0.01 * i * attack_power + c.rip_bonus * i ) * rip_multi;

  // Dire Bear Form. Agility only grants attack power in Cat Form.
  double bear_ap    = bear_ap_mod * ( attack_power / c.ap_mod - agility + 80 );
  double bear_bonus = ( bear_ap + c.debuff_ap ) / 14 * 2.5 + bonus_damage;
  double bear_multi = m * 1.04;  // Master Shapeshifter

  d.white_bear = damage_range_t( ( 109.0 + bear_bonus ) * bear_multi, ( 165.0 + bear_bonus ) * bear_multi );

  double maul_multi = sf_fac * 1.2;
  d.maul = damage_range_t( ( d.white_bear.low + 578 * bear_multi ) * maul_multi,
                           ( d.white_bear.high + 578 * bear_multi ) * maul_multi );
  d.mangle_bear = damage_range_t( mangle_fac * ( d.white_bear.low * 1.15 + 299 * bear_multi ),
                                  mangle_fac * ( d.white_bear.high * 1.15 + 299 * bear_multi ) );

  d.lacerate_hit  = ( 88 + 0.01 * bear_ap ) * bear_multi * lacerate_multi;
  // Bleed ticks ignore armor
  d.lacerate_tick = ( 64 + 0.01 * bear_ap ) * bear_multi / d.armor_multiplier * lacerate_dot_multi;

  d.faerie_fire_hit = ( 0.15 * bear_ap + 1.0 ) * ( 1 + 0.13 * target.curse_of_elements ) * c.spell_damage_multiplier;

  if ( target.gift_of_arthas )
  {
    double goa = 8 * d.armor_multiplier;
    d.white.add( goa );
    d.shred.add( goa );
    d.mangle.add( goa );
    d.white_bear.add( goa );
    d.maul.add( goa );
    d.mangle_bear.add( goa );
    for ( int i = 1; i <= MAX_COMBO_POINTS; i++ )
      d.bite[ i ].add( goa );
  }
}

// druid_t::set_haste =======================================================

// An ongoing swing keeps its completed fraction; the remainder is rescaled
// to the new swing timer.
void druid_t::set_haste( double rating, double multiplier )
{
  timespan_t now = sim -> current_time();
  timespan_t old_swing = swing_time();

  haste_rating = rating;
  haste_multiplier = multiplier;

  timespan_t new_swing = swing_time();

  if ( next_swing > now && old_swing > timespan_t::zero() )
    next_swing = now + ( next_swing - now ) * ( new_swing / old_swing );

  sim -> print_debug( "Druid haste rating {:.1f} multiplier {:.3f}, swing timer {}", haste_rating,
                      haste_multiplier, new_swing );
}

timespan_t druid_t::swing_time() const
{
  double base = form == FORM_BEAR ? 2.5 : 1.0;
  return timespan_t::from_seconds( base / ( haste_multiplier * ( 1 + haste_rating / HASTE_RATING_MELEE ) ) );
}

timespan_t druid_t::spell_gcd() const
{
  double t = 1.5 / ( haste_multiplier * ( 1 + haste_rating / HASTE_RATING_SPELL ) );
  return timespan_t::from_seconds( std::max( t, 1.0 ) );
}

// druid_t::resource_gain ===================================================

double druid_t::resource_gain( resource_e r, double amount )
{
  double before = resources.current[ r ];
  resources.current[ r ] = std::min( before + amount, resources.max[ r ] );
  return resources.current[ r ] - before;
}

// druid_t::resource_loss ===================================================

double druid_t::resource_loss( resource_e r, double amount )
{
  double before = resources.current[ r ];
  resources.current[ r ] = std::max( 0.0, before - amount );
  return before - resources.current[ r ];
}

void druid_t::set_resource( resource_e r, double value )
{
  resources.current[ r ] = std::max( 0.0, std::min( value, resources.max[ r ] ) );
}

// druid_t::can_afford ======================================================

bool druid_t::can_afford( resource_e r, double cost ) const
{
  if ( omen_proc && ( r == RESOURCE_ENERGY || r == RESOURCE_RAGE ) )
    return true;
  return resources.current[ r ] >= cost - FC_EPSILON;
}

// druid_t::advance_timers ==================================================

void druid_t::advance_timers( timespan_t delta )
{
  gcd = std::max( timespan_t::zero(), gcd - delta );
  for ( auto& cd : cooldowns )
    cd = std::max( timespan_t::zero(), cd - delta );
}

// druid_t::regen ===========================================================

void druid_t::regen( timespan_t delta )
{
  double dt = delta.total_seconds();
  if ( dt <= 0 )
    return;

  resource_gain( RESOURCE_ENERGY, 10 * dt );
  resource_gain( RESOURCE_MANA, ( five_second_rule ? regen_rates.five_second_rule : regen_rates.base ) * dt );

  if ( enrage )
    resource_gain( RESOURCE_RAGE, dt );
}

// druid_t::use_rune ========================================================

// Dark Rune, only when the whole return fits into the mana pool.
bool druid_t::use_rune()
{
  if ( ! config.rune || ! cooldown_ready( COOLDOWN_RUNE ) || mana() > mana_pool - 1500 )
    return false;

  resource_gain( RESOURCE_MANA, 900 + sim -> rng.real() * 600 );
  start_cooldown( COOLDOWN_RUNE, timespan_t::from_minutes( 15 ) );
  return true;
}

// druid_t::check_procs =====================================================

void druid_t::check_procs( bool yellow, bool crit )
{
  // Omen of Clarity only procs from white hits
  if ( config.omen && ! yellow )
  {
    double rate = form == FORM_CAT ? 3.5 / 60 : 3.5 / 60 * 2.5;
    if ( sim -> rng.real() < rate )
      omen_proc = true;
  }

  if ( config.jow && sim -> rng.real() < 0.25 )
    resource_gain( RESOURCE_MANA, 70 );

  if ( crit && cooldown_ready( COOLDOWN_ILOTP ) )
  {
    resource_gain( RESOURCE_MANA, 0.04 * config.ilotp * mana_pool );
    start_cooldown( COOLDOWN_ILOTP, timespan_t::from_seconds( 6 ) );
  }

  for ( effect_t* e : proc_effects )
  {
    if ( e -> spec.trigger == PROC_TRIGGER_ANY )
      e -> check_for_proc( crit, yellow );
  }
}

// druid_t::check_trigger_procs =============================================

// Effects restricted to specific abilities roll as non-crit yellow hits.
void druid_t::check_trigger_procs( proc_trigger_e trigger )
{
  for ( effect_t* e : proc_effects )
  {
    if ( e -> spec.trigger == trigger )
      e -> check_for_proc( false, true );
  }
}

// druid_t::swing ===========================================================

double druid_t::swing()
{
  bool bear = form == FORM_BEAR;
  const damage_range_t& range = bear ? damage.white_bear : damage.white;

  roll_result_t r = attack_roll::white( sim -> rng, range.low, range.high, miss_chance,
                                        crit_chance - 0.04 * bear, crit_multiplier() );

  // King of the Jungle
  if ( enrage )
    r.damage *= 1.15;

  double roar_damage = ( ! bear && savage_roar ) ? roar_fac * r.damage : 0.0;

  if ( ! r.miss() )
    check_procs( false, r.crit() );

  if ( bear )
  {
    // Misses are re-rolled to separate dodges, which still generate rage
    bool dodge = false;
    if ( r.miss() )
      dodge = sim -> rng.real() < dodge_chance / miss_chance;

    double proxy_damage = dodge ? 0.5 * ( range.low + range.high ) * ( 1 + 0.15 * enrage ) : r.damage;

    if ( ! r.miss() || dodge )
    {
      double rage_gen = 15.0 / 4.0 / 453.3 * proxy_damage + 2.5 / 2 * 3.5 * ( 1 + r.crit() ) + 5 * r.crit();
      rage_gen = std::min( rage_gen, proxy_damage * 15.0 / 453.3 );
      resource_gain( RESOURCE_RAGE, rage_gen );
    }
  }

  breakdown[ ABILITY_MELEE ].casts++;
  breakdown[ ABILITY_MELEE ].damage += r.damage;
  breakdown[ ABILITY_SAVAGE_ROAR ].damage += roar_damage;

  log_ability( ABILITY_MELEE, r, false, r.damage + roar_damage );

  return r.damage + roar_damage;
}

// druid_t::execute_bear_special ============================================

action_result_t druid_t::execute_bear_special( ability_e ability, const damage_range_t& range, double rage_cost,
                                               bool yellow, bool mangle_mod )
{
  action_result_t result;
  if ( ! can_afford( RESOURCE_RAGE, rage_cost ) )
    return result;

  roll_result_t r = attack_roll::yellow( sim -> rng, range.low, range.high, miss_chance, crit_chance - 0.04,
                                         crit_multiplier() );

  if ( mangle_mod )
    r.damage *= 1.3;
  if ( enrage )
    r.damage *= 1.15;

  // Maul is on next swing and does not trigger the global cooldown
  if ( yellow )
    gcd = timespan_t::from_seconds( 1.5 );

  bool clearcast = omen_proc;
  if ( clearcast )
    omen_proc = false;
  else
    resource_loss( RESOURCE_RAGE, rage_cost * ( 1 - 0.8 * r.miss() ) );

  if ( r.crit() )
    resource_gain( RESOURCE_RAGE, 5 );

  if ( ! r.miss() )
    check_procs( true, r.crit() );

  breakdown[ ability ].casts++;
  breakdown[ ability ].damage += r.damage;

  log_ability( ability, r, clearcast, r.damage );

  result.damage   = r.damage;
  result.success  = ! r.miss();
  result.executed = true;
  result.result   = r.result;
  return result;
}

// druid_t::maul ============================================================

double druid_t::maul( bool mangle_debuff )
{
  return execute_bear_special( ABILITY_MAUL, damage.maul, 10, false, mangle_debuff ).damage;
}

// druid_t::execute_builder =================================================

action_result_t druid_t::execute_builder( ability_e ability, const damage_range_t& range, double energy_cost,
                                          bool mangle_mod )
{
  action_result_t result;
  if ( ! can_afford( RESOURCE_ENERGY, energy_cost ) )
    return result;

  roll_result_t r = attack_roll::yellow( sim -> rng, range.low, range.high, miss_chance, crit_chance,
                                         crit_multiplier() );

  if ( mangle_mod )
    r.damage *= 1.3;

  double roar_damage = savage_roar ? roar_fac * r.damage : 0.0;

  gcd = timespan_t::from_seconds( 1.0 );

  bool clearcast = omen_proc;
  if ( clearcast )
    omen_proc = false;
  else
    resource_loss( RESOURCE_ENERGY, energy_cost * ( 1 - 0.8 * r.miss() ) );

  resource_gain( RESOURCE_COMBO_POINT, 1 * ( ! r.miss() ) + r.crit() );

  if ( ! r.miss() )
    check_procs( true, r.crit() );

  breakdown[ ability ].casts++;
  breakdown[ ability ].damage += r.damage;
  breakdown[ ABILITY_SAVAGE_ROAR ].damage += roar_damage;

  log_ability( ability, r, clearcast, r.damage + roar_damage );

  result.damage   = r.damage + roar_damage;
  result.success  = ! r.miss();
  result.executed = true;
  result.result   = r.result;
  return result;
}

// druid_t::shred ===========================================================

action_result_t druid_t::shred( bool mangle_debuff )
{
  action_result_t r = execute_builder( ABILITY_SHRED, damage.shred, costs.shred, mangle_debuff );
  if ( r.success )
    check_trigger_procs( PROC_TRIGGER_SHRED );
  return r;
}

action_result_t druid_t::rake( bool mangle_debuff )
{
  return execute_builder( ABILITY_RAKE, damage_range_t( damage.rake_hit, damage.rake_hit ), costs.rake,
                          mangle_debuff );
}

// druid_t::mangle ==========================================================

action_result_t druid_t::mangle()
{
  action_result_t r;
  if ( form == FORM_CAT )
    r = execute_builder( ABILITY_MANGLE_CAT, damage.mangle, costs.mangle, false );
  else
  {
    r = execute_bear_special( ABILITY_MANGLE_BEAR, damage.mangle_bear, 15, true, false );
    if ( r.executed )
      start_cooldown( COOLDOWN_MANGLE_BEAR, timespan_t::from_seconds( 6 ) );
  }

  if ( r.success )
  {
    check_trigger_procs( PROC_TRIGGER_MANGLE );
    if ( form == FORM_CAT )
      check_trigger_procs( PROC_TRIGGER_CAT_MANGLE );
  }

  return r;
}

action_result_t druid_t::lacerate( bool mangle_debuff )
{
  return execute_bear_special( ABILITY_LACERATE, damage_range_t( damage.lacerate_hit, damage.lacerate_hit ), 13,
                               true, mangle_debuff );
}

// druid_t::bite ============================================================

action_result_t druid_t::bite()
{
  action_result_t result;
  int cp = combo_points();
  if ( cp < 1 || ! can_afford( RESOURCE_ENERGY, costs.bite ) )
    return result;

  bool clearcast = omen_proc;
  if ( clearcast )
    omen_proc = false;
  else
    resource_loss( RESOURCE_ENERGY, costs.bite );

  // Up to 30 extra energy is converted into damage
  double extra_energy = std::min( energy(), 30.0 );
  double bonus = extra_energy * ( 9.4 + attack_power / 410.0 ) * damage.bite_multiplier;

  roll_result_t r = attack_roll::yellow( sim -> rng, damage.bite[ cp ].low + bonus, damage.bite[ cp ].high + bonus,
                                         miss_chance, crit_chance + bite_crit_bonus, crit_multiplier() );

  double roar_damage = savage_roar ? roar_fac * r.damage : 0.0;

  if ( r.miss() )
  {
    if ( ! clearcast )
      resource_gain( RESOURCE_ENERGY, 0.8 * costs.bite );
  }
  else
  {
    resource_loss( RESOURCE_ENERGY, extra_energy );
    set_resource( RESOURCE_COMBO_POINT, 0 );
  }

  gcd = timespan_t::from_seconds( 1.0 );

  if ( ! r.miss() )
    check_procs( true, r.crit() );

  breakdown[ ABILITY_FEROCIOUS_BITE ].casts++;
  breakdown[ ABILITY_FEROCIOUS_BITE ].damage += r.damage;
  breakdown[ ABILITY_SAVAGE_ROAR ].damage += roar_damage;

  log_ability( ABILITY_FEROCIOUS_BITE, r, clearcast, r.damage + roar_damage );

  result.damage   = r.damage + roar_damage;
  result.success  = ! r.miss();
  result.executed = true;
  result.result   = r.result;
  return result;
}

// druid_t::rip =============================================================

// On success, damage holds the damage per tick of the new bleed.
action_result_t druid_t::rip()
{
  action_result_t result;
  int cp = combo_points();
  if ( cp < 1 || ! can_afford( RESOURCE_ENERGY, costs.rip ) )
    return result;

  bool miss = sim -> rng.real() < miss_chance;

  gcd = timespan_t::from_seconds( 1.0 );

  bool clearcast = omen_proc;
  if ( clearcast )
    omen_proc = false;
  else
    resource_loss( RESOURCE_ENERGY, costs.rip * ( 1 - 0.8 * miss ) );

  if ( ! miss )
  {
    set_resource( RESOURCE_COMBO_POINT, 0 );
    check_procs( true, false );
  }

  breakdown[ ABILITY_RIP ].casts++;

  if ( miss )
    log_cast( ABILITY_RIP, clearcast ? "miss (clearcast)" : "miss" );
  else
    log_cast( ABILITY_RIP, clearcast ? "applied (clearcast)" : "applied" );

  result.damage   = miss ? 0.0 : damage.rip_tick[ cp ];
  result.success  = ! miss;
  result.executed = true;
  result.result   = miss ? RESULT_MISS : RESULT_HIT;
  return result;
}

// druid_t::roar ============================================================

timespan_t druid_t::roar_duration( int cp ) const
{
  if ( cp < 1 )
    return timespan_t::zero();
  return timespan_t::from_seconds( 9 + 5 * std::min( cp, MAX_COMBO_POINTS ) + 8 * config.t8_4p );
}

// Savage Roar cannot miss and ignores Clearcasting.
action_result_t druid_t::roar()
{
  action_result_t result;
  if ( combo_points() < 1 || energy() < costs.roar - FC_EPSILON )
    return result;

  gcd = timespan_t::from_seconds( 1.0 );
  resource_loss( RESOURCE_ENERGY, costs.roar );
  savage_roar = true;
  set_resource( RESOURCE_COMBO_POINT, 0 );

  breakdown[ ABILITY_SAVAGE_ROAR ].casts++;
  log_cast( ABILITY_SAVAGE_ROAR, "applied" );

  result.success  = true;
  result.executed = true;
  result.result   = RESULT_HIT;
  return result;
}

// druid_t::shift ===========================================================

// Cat <-> Dire Bear. A powershift re-enters the current form; any other
// shift from caster form lands in Cat Form.
void druid_t::shift( bool powershift )
{
  form_e to = powershift ? form : ( form == FORM_CAT ? FORM_BEAR : FORM_CAT );
  if ( to == FORM_CASTER )
    to = FORM_CAT;

  std::string note;
  ability_e cast;

  if ( to == FORM_BEAR )
  {
    form = FORM_BEAR;
    set_resource( RESOURCE_RAGE, 10.0 * ( sim -> rng.real() < 0.2 * config.furor ) );
    cast = ABILITY_SHIFT_BEAR;

    // Enrage is bundled with the shift when available
    if ( cooldown_ready( COOLDOWN_ENRAGE ) )
    {
      resource_gain( RESOURCE_RAGE, 20 );
      enrage = true;
      start_cooldown( COOLDOWN_ENRAGE, timespan_t::from_seconds( 60 ) );
      note = "use Enrage";
    }
  }
  else
  {
    form = FORM_CAT;
    set_resource( RESOURCE_ENERGY, std::min( energy(), 20.0 * config.furor ) + 20 * config.wolfshead );
    enrage = false;
    cast = ABILITY_SHIFT_CAT;
  }

  gcd = timespan_t::from_seconds( 1.5 );
  breakdown[ cast ].casts++;
  if ( mana() < shift_cost )
    sim -> state.mark_oom();
  resource_loss( RESOURCE_MANA, shift_cost );
  five_second_rule = true;
  last_shift = sim -> current_time();
  ready_to_shift = false;

  if ( use_rune() )
    note = "use Dark Rune";

  std::string name = util::ability_type_string( cast );
  if ( powershift )
    name = "Powers" + name.substr( 1 );

  sim -> record_event( name, note );
}

// druid_t::flowershift =====================================================

// Gift of the Wild cast out of form to fish for Clearcasting.
void druid_t::flowershift()
{
  form = FORM_CASTER;
  gcd = spell_gcd();
  breakdown[ ABILITY_GIFT_OF_THE_WILD ].casts++;
  resource_loss( RESOURCE_MANA, GIFT_OF_THE_WILD_COST );
  five_second_rule = true;
  last_shift = sim -> current_time();
  enrage = false;

  if ( config.omen && sim -> rng.real() < 1 - std::pow( 1 - 0.0875, config.gotw_targets ) )
    omen_proc = true;

  log_cast( ABILITY_GIFT_OF_THE_WILD, omen_proc ? "clearcast" : "" );
}

// druid_t::faerie_fire =====================================================

// Always leaves a Clearcasting proc. Only the Dire Bear version deals damage.
double druid_t::faerie_fire()
{
  gcd = timespan_t::from_seconds( 1.0 );
  omen_proc = true;
  start_cooldown( COOLDOWN_FAERIE_FIRE, timespan_t::from_seconds( 6 ) );

  if ( form != FORM_BEAR )
  {
    breakdown[ ABILITY_FAERIE_FIRE_CAT ].casts++;
    log_cast( ABILITY_FAERIE_FIRE_CAT, "" );
    return 0.0;
  }

  roll_result_t r = attack_roll::spell( sim -> rng, damage.faerie_fire_hit, damage.faerie_fire_hit,
                                        spell_miss_chance, spell_crit_chance, spell_crit_multiplier() );
  if ( enrage )
    r.damage *= 1.15;

  breakdown[ ABILITY_FAERIE_FIRE_BEAR ].casts++;
  breakdown[ ABILITY_FAERIE_FIRE_BEAR ].damage += r.damage;
  log_ability( ABILITY_FAERIE_FIRE_BEAR, r, false, r.damage );

  return r.damage;
}

// druid_t::log_ability =====================================================

void druid_t::log_ability( ability_e ability, const roll_result_t& r, bool clearcast, double shown_damage )
{
  if ( ! sim -> tracing() )
    return;
  log_cast( ability, outcome_string( r, clearcast, shown_damage ) );
}

void druid_t::log_cast( ability_e ability, const std::string& outcome )
{
  sim -> record_event( util::ability_type_string( ability ), outcome );
}

void sc_format_to( const druid_t& d, fmt::format_context::iterator out )
{
  fmt::format_to( out, "Druid form={} energy={:.1f} cp={} mana={:.0f} rage={:.0f}",
                  util::form_type_string( d.form ), d.energy(), d.combo_points(), d.mana(), d.rage() );
}
