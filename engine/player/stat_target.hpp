// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include <string>

#include "fc_enums.hpp"
#include "util/format.hpp"

struct druid_t;

// One attribute change carried by an effect or a stat weight perturbation
struct stat_delta_t
{
  stat_e stat;
  double amount;

  stat_delta_t() : stat( STAT_NONE ), amount( 0 ) { }
  stat_delta_t( stat_e s, double a ) : stat( s ), amount( a ) { }
};

/**
 * Adds amount to the druid attribute named by stat and runs the dependent
 * recalculation (damage ranges, miss chance, swing timer, mana regen).
 *
 * STAT_AGILITY also moves attack power and crit chance. STAT_HASTE_MULTIPLIER
 * is multiplicative: +x multiplies by (1 + x), -x divides by (1 + x), so an
 * effect undoes itself exactly.
 */
void apply_delta( druid_t& druid, stat_e stat, double amount );

inline void apply_delta( druid_t& druid, const stat_delta_t& d, double scale = 1.0 )
{ apply_delta( druid, d.stat, d.amount * scale ); }

// Crit chance gained per point of Agility
constexpr double AGILITY_PER_CRIT_PERCENT = 83.33;

void sc_format_to( const stat_delta_t&, fmt::format_context::iterator );
