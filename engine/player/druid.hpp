// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include <array>
#include <string>
#include <vector>

#include "action/attack_roll.hpp"
#include "fc_enums.hpp"
#include "util/format.hpp"
#include "util/generic.hpp"
#include "util/timespan.hpp"

struct effect_t;
struct sim_t;
struct target_t;

// Mana cost of a Gift of the Wild cast
constexpr double GIFT_OF_THE_WILD_COST = 1119;

// Fully raid buffed character sheet, talents, glyphs and set bonuses.
// Read-only during a simulation.
struct druid_config_t
{
  // Cat Form stats
  double attack_power;
  double ap_mod;
  double agility;
  double hit_chance;
  double spell_hit_chance;
  double expertise_rating;
  double crit_chance;
  double spell_crit_chance;
  double armor_pen_rating;
  double swing_timer;       // hasted Cat Form swing timer in seconds
  double haste_multiplier;  // external multiplicative haste already in swing_timer
  double mana;
  double intellect;
  double spirit;
  double mp5;

  double bonus_damage;
  double shred_bonus;
  double rip_bonus;
  double debuff_ap;
  double multiplier;
  double spell_damage_multiplier;
  double weapon_speed;
  int    gotw_targets;

  // Talents
  bool omen;
  bool primal_gore;
  int  feral_aggression;
  int  predatory_instincts;
  int  savage_fury;
  int  furor;
  int  natural_shapeshifter;
  int  intensity;
  int  potp;
  int  improved_mangle;
  int  ilotp;

  // Glyphs
  bool rip_glyph;
  bool shred_glyph;
  bool roar_glyph;
  bool berserk_glyph;
  bool mangle_glyph;

  // Gear and consumables
  bool jow;
  bool rune;
  bool wolfshead;
  bool meta;
  bool t6_2p, t6_4p;
  bool t7_2p;
  bool t8_2p, t8_4p;
  bool t9_2p, t9_4p;
  bool t10_2p, t10_4p;

  druid_config_t();
};

struct damage_range_t
{
  double low  = 0;
  double high = 0;

  damage_range_t() = default;
  damage_range_t( double l, double h ) : low( l ), high( h ) { }

  void add( double v ) { low += v; high += v; }
};

struct ability_stats_t
{
  int    casts  = 0;
  double damage = 0;
};

// Result of an ability call. executed is false when the druid could not pay
// for the ability; nothing changed in that case.
struct action_result_t
{
  double   damage   = 0;
  bool     success  = false;
  bool     executed = false;
  result_e result   = RESULT_NONE;
};

struct druid_t : private noncopyable
{
  sim_t* const sim;
  const druid_config_t& config;
  target_t& target;

  // Live stats; effects and stat weight runs modify these
  double attack_power;
  double agility;
  double crit_chance;       // against a raid boss
  double spell_crit_chance;
  double hit_chance;
  double spell_hit_chance;
  double expertise_rating;
  double miss_adjust;
  double armor_pen_rating;
  double bonus_damage;
  double haste_rating;
  double haste_multiplier;
  double mana_pool;
  double intellect;
  double spirit;
  double mp5;

  // Derived
  double miss_chance;
  double dodge_chance;
  double spell_miss_chance;
  double bear_ap_mod;
  double roar_fac;
  double rip_crit_bonus;
  double bite_crit_bonus;
  double lacerate_multi;
  double lacerate_dot_multi;
  timespan_t rip_duration;
  timespan_t rake_duration;

  // Mana regeneration per second
  struct regen_t
  {
    double factor = 0;
    double base = 0;
    double five_second_rule = 0;
  } regen_rates;
  double shift_cost;

  // Damage ranges against the current target state
  struct damage_params_t
  {
    double multiplier = 0;
    double armor_multiplier = 0;
    double damage_multiplier = 0;
    damage_range_t white, shred, mangle;
    damage_range_t white_bear, maul, mangle_bear;
    std::array<damage_range_t, MAX_COMBO_POINTS + 1> bite;
    double bite_multiplier = 0;
    double rake_hit = 0, rake_tick = 0;
    std::array<double, MAX_COMBO_POINTS + 1> rip_tick{};
    double lacerate_hit = 0, lacerate_tick = 0;
    double faerie_fire_hit = 0;
  } damage;

  // Energy costs, halved under Berserk
  struct costs_t
  {
    double shred = 0, rake = 0, mangle = 0, bite = 0, rip = 0, roar = 0;
    double base_mangle = 0, base_rip = 0;
  } costs;

  struct resources_t
  {
    std::array<double, RESOURCE_MAX> current{};
    std::array<double, RESOURCE_MAX> max{};
  } resources;

  // Fight state
  form_e form;
  timespan_t gcd;
  std::array<timespan_t, COOLDOWN_MAX> cooldowns;
  timespan_t next_swing;
  timespan_t last_shift;
  bool omen_proc;
  bool berserk;
  bool tigers_fury;
  bool enrage;
  bool savage_roar;
  bool five_second_rule;
  bool ready_to_shift;

  std::array<ability_stats_t, ABILITY_MAX> breakdown;
  std::vector<effect_t*> proc_effects;

  druid_t( sim_t* s, const druid_config_t& c, target_t& t );

  void init();
  void reset();

  // Stat derived quantities
  void calc_miss_chance();
  void calc_spell_miss_chance();
  void set_mana_regen();
  void set_ability_costs();
  void recalculate_damage();
  void set_haste( double rating, double multiplier );
  double crit_multiplier() const;
  double spell_crit_multiplier() const;
  timespan_t swing_time() const;
  timespan_t spell_gcd() const;

  // Resources
  double resource( resource_e r ) const { return resources.current[ r ]; }
  double energy() const { return resources.current[ RESOURCE_ENERGY ]; }
  double rage() const   { return resources.current[ RESOURCE_RAGE ]; }
  double mana() const   { return resources.current[ RESOURCE_MANA ]; }
  int combo_points() const { return static_cast<int>( resources.current[ RESOURCE_COMBO_POINT ] ); }
  double resource_gain( resource_e, double amount );
  double resource_loss( resource_e, double amount );
  void set_resource( resource_e, double value );
  bool can_afford( resource_e, double cost ) const;

  // Cooldowns
  bool cooldown_ready( cooldown_e c ) const { return cooldowns[ c ] <= timespan_t::zero(); }
  timespan_t cooldown_remains( cooldown_e c ) const { return cooldowns[ c ]; }
  void start_cooldown( cooldown_e c, timespan_t duration ) { cooldowns[ c ] = duration; }
  void advance_timers( timespan_t delta );

  // Procs
  void check_procs( bool yellow, bool crit );
  void check_trigger_procs( proc_trigger_e trigger );
  void regen( timespan_t delta );
  bool use_rune();

  // Abilities
  double swing();
  double maul( bool mangle_debuff );
  action_result_t execute_builder( ability_e, const damage_range_t&, double energy_cost, bool mangle_mod );
  action_result_t execute_bear_special( ability_e, const damage_range_t&, double rage_cost, bool yellow,
                                        bool mangle_mod );
  action_result_t shred( bool mangle_debuff );
  action_result_t rake( bool mangle_debuff );
  action_result_t mangle();
  action_result_t lacerate( bool mangle_debuff );
  action_result_t bite();
  action_result_t rip();
  timespan_t roar_duration( int combo_points ) const;
  action_result_t roar();
  void shift( bool powershift = false );
  void flowershift();
  double faerie_fire();

  bool cat_form() const { return form == FORM_CAT; }

private:
  void log_ability( ability_e, const roll_result_t&, bool clearcast, double shown_damage );
  void log_cast( ability_e, const std::string& outcome );
};

void sc_format_to( const druid_t&, fmt::format_context::iterator );
