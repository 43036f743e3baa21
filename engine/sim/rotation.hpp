// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include <string>

#include "sim/option.hpp"
#include "util/format.hpp"
#include "util/generic.hpp"
#include "util/timespan.hpp"

struct druid_t;
struct sim_t;
struct simulation_state_t;

// Decision parameters of the Cat Form priority list.
struct rotation_strategy_t
{
  int    min_combos_for_rip;
  int    min_combos_for_bite;
  bool   use_rake;
  bool   use_bite;
  double bite_time;            // negative selects the analytical bite model
  bool   mangle_spam;
  bool   bear_mangle;          // a Bear druid keeps Mangle up
  bool   use_berserk;
  bool   prepop_berserk;
  bool   preproc_omen;
  bool   bearweave;
  double berserk_bite_thresh;
  bool   lacerate_prio;
  double lacerate_time;
  bool   powerbear;
  bool   use_roar;
  double max_roar_clip;
  double min_roar_offset;
  bool   use_ff;
  bool   flowershift;

  rotation_strategy_t();

  void create_options( option_list_t& );
  void set( const std::string& name, const std::string& value );

  // Throws std::invalid_argument on contradictory settings
  void validate() const;
};

void sc_format_to( const rotation_strategy_t&, fmt::format_context::iterator );

/**
 * Priority list executed whenever the druid is off the global cooldown and
 * the scheduled next action time has been reached. Also owns the rules that
 * run outside the action slot: Maul queueing on bear swings, Tiger's Fury
 * and buff bookkeeping.
 */
struct rotation_t : private noncopyable
{
  sim_t* const sim;
  const rotation_strategy_t& strategy;

  rotation_t( sim_t* s, const rotation_strategy_t& st ) : sim( s ), strategy( st ) { }

  // Opening state: prepopped Berserk, precast Clearcasting, Bear Mangle
  void combat_begin( simulation_state_t&, druid_t& );

  // One rotation step; returns the direct damage dealt
  double execute( simulation_state_t&, druid_t& );

  // Auto attack in Dire Bear Form, turned into Maul when rage allows
  double bear_auto_attack( simulation_state_t&, druid_t& );

  void tigers_fury_rule( simulation_state_t&, druid_t& );

  void apply_tigers_fury( simulation_state_t&, druid_t& );
  void drop_tigers_fury( simulation_state_t&, druid_t& );
  void apply_berserk( simulation_state_t&, druid_t&, bool prepop = false );
  void drop_berserk( simulation_state_t&, druid_t& );
  void drop_roar( simulation_state_t&, druid_t& );
  void drop_mangle( simulation_state_t&, druid_t& );

  // Abilities with their fight state side effects
  double shred( simulation_state_t&, druid_t& );
  double rake( simulation_state_t&, druid_t& );
  double mangle( simulation_state_t&, druid_t& );
  double lacerate( simulation_state_t&, druid_t& );
  double rip( simulation_state_t&, druid_t& );
  double bite( simulation_state_t&, druid_t& );
  double roar( simulation_state_t&, druid_t& );

  // Prediction helpers, times in seconds of fight time
  bool berserk_expected_at( const simulation_state_t&, const druid_t&, double future ) const;
  bool tf_expected_before( const simulation_state_t&, const druid_t&, double future ) const;
  bool can_bite( const simulation_state_t&, const druid_t& ) const;
  bool can_bite_analytical( const simulation_state_t&, const druid_t& ) const;
  void get_finisher_costs( const simulation_state_t&, const druid_t&, double& rip_cost,
                           double& bite_cost ) const;
  double calc_allowed_rip_downtime( const druid_t&, double bite_cost, double rip_cost ) const;
};
