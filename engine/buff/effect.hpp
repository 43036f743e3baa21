// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include <memory>
#include <string>
#include <vector>

#include "fc_enums.hpp"
#include "player/stat_target.hpp"
#include "util/format.hpp"
#include "util/generic.hpp"
#include "util/timespan.hpp"

struct druid_t;
struct sim_t;

/**
 * Static description of a trinket, consumable or cooldown.
 *
 * Proc chances are either per hit / per crit, or (when separate_yellow is
 * set) per white / per yellow hit. Stacking procs use the chances for
 * stacks while their aura is up, and the aura chances for bringing the aura
 * up when aura_trigger is AURA_PROC.
 */
struct effect_spec_t
{
  std::string name;
  std::string stack_name;
  effect_behavior_e behavior;
  std::vector<stat_delta_t> stats;

  timespan_t duration;
  timespan_t cooldown;
  timespan_t delay;
  int max_procs;  // 0 for unlimited

  double chance_on_hit;
  double chance_on_crit;
  bool   separate_yellow;
  double white_chance;
  double yellow_chance;
  proc_trigger_e trigger;

  // Stacking procs
  int max_stacks;
  aura_trigger_e aura_trigger;
  double aura_white_chance;
  double aura_yellow_chance;

  // Instant damage procs
  double damage_low;
  double damage_high;
  double miss_chance;

  effect_spec_t();

  // Throws std::invalid_argument on inconsistent parameters
  void validate() const;

  // Parses "name=..,behavior=..,stat=..,amount=..,..."
  static effect_spec_t parse( sim_t*, const std::string& options_str );
};

// Bookkeeping shared by all behaviors
struct effect_state_t
{
  timespan_t activation;    // timespan_t::min() when never activated
  timespan_t deactivation;
  timespan_t last_update;
  double uptime;
  int num_procs;
  bool active;
  bool can_proc;
  bool proc_happened;
  int stacks;
  double damage;

  effect_state_t() { reset(); }

  void reset()
  {
    activation = timespan_t::min();
    deactivation = timespan_t::zero();
    last_update = timespan_t::zero();
    uptime = 0;
    num_procs = 0;
    active = false;
    can_proc = true;
    proc_happened = false;
    stacks = 0;
    damage = 0;
  }
};

struct effect_t : private noncopyable
{
  sim_t* const sim;
  const effect_spec_t spec;
  effect_state_t state;

  effect_t( sim_t* s, effect_spec_t spec );

  void reset();

  // Uptime bookkeeping, expiry, cooldown and activation at time now.
  // Returns instant damage dealt by an activation.
  double update( timespan_t now, druid_t& );

  // Rolls for a proc on a successful attack. Draws a random number only when
  // the effect is able to proc.
  void check_for_proc( bool crit, bool yellow );

  void deactivate( timespan_t now, druid_t& );

  // Next time at which update() would change state, timespan_t::max() if none
  timespan_t next_event() const;

  const std::string& name() const { return spec.name; }
  bool is_proc() const { return spec.behavior != EFFECT_FIXED_USE; }

private:
  bool cooldown_ready( timespan_t now ) const;
  bool apply_proc();
  double activate( timespan_t now, druid_t& );
  double instant_damage( timespan_t now );
  void modify_stats( druid_t&, double scale );
  double proc_chance( bool crit, bool yellow ) const;
};

void sc_format_to( const effect_t&, fmt::format_context::iterator );

// Built-in cooldowns
namespace effects {

// +30% multiplicative haste for 40 s
effect_spec_t bloodlust( timespan_t delay = timespan_t::zero() );

// +400 haste rating for 15 s; one potion once combat has started, two when
// the first one is used right at the pull
effect_spec_t haste_potion( timespan_t delay = timespan_t::zero() );

} // namespace effects
