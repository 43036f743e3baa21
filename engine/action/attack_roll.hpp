// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include "fc_enums.hpp"
#include "util/rng.hpp"

// Outcome of a single damage roll
struct roll_result_t
{
  double   damage = 0;
  result_e result = RESULT_NONE;

  bool miss() const { return result == RESULT_MISS; }
  bool crit() const { return result == RESULT_CRIT; }
  bool hit() const  { return result != RESULT_MISS && result != RESULT_NONE; }
};

namespace attack_roll {

// Width of the glancing blow band of white attacks against a raid boss
constexpr double GLANCE_CHANCE = 0.24;

/**
 * Single-roll attack table for white swings: miss, glance, crit, hit in that
 * order on one uniform draw. The bands are not clamped; when
 * miss + glance + crit exceeds 1 the hit band vanishes and the crit band is
 * whatever is left below 1.
 */
roll_result_t white( rng_t&, double low, double high,
                     double miss_chance, double crit_chance, double crit_multiplier );

// Two-roll table for specials: miss roll, then an independent crit roll.
roll_result_t yellow( rng_t&, double low, double high,
                      double miss_chance, double crit_chance, double crit_multiplier );

// Yellow roll followed by a partial resistance roll on landed hits.
roll_result_t spell( rng_t&, double low, double high,
                     double miss_chance, double crit_chance, double crit_multiplier );

// Damage trinket procs: own miss chance, no crits, coarser resistance table.
roll_result_t proc_damage( rng_t&, double low, double high, double miss_chance );

} // namespace attack_roll
