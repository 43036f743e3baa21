// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "fc_enums.hpp"
#include "player/druid.hpp"
#include "util/format.hpp"
#include "util/timespan.hpp"

struct aura_stat_t
{
  std::string name;
  int    procs  = 0;
  double uptime = 0;
};

// Damage dealt by one event
struct damage_sample_t
{
  double time;
  double damage;
};

// Result of one trial. Failed trials keep valid == false and are skipped by
// the aggregation.
struct trial_record_t
{
  bool valid = false;
  uint64_t seed = 0;
  double fight_length = 0;
  double damage = 0;
  double dps = 0;
  double time_to_oom = 0;  // fight length when mana never ran out
  std::vector<damage_sample_t> damage_samples;  // only kept for traced runs
  std::array<ability_stats_t, ABILITY_MAX> abilities;
  std::vector<aura_stat_t> auras;
};

// One line of the combat log
struct event_log_entry_t
{
  timespan_t time;
  std::string event;
  std::string outcome;
  double energy;
  int    combo_points;
  double mana;
  double rage;
};

void sc_format_to( const event_log_entry_t&, fmt::format_context::iterator );
