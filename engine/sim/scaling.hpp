// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include <string>
#include <vector>

#include "fc_enums.hpp"
#include "util/format.hpp"
#include "util/generic.hpp"

struct sim_t;

// DPS gained from one unit of a stat
struct scale_factor_t
{
  std::string name;
  double value  = 0;  // DPS per unit
  double error  = 0;  // standard error of value
  double weight = 0;  // value relative to 1 Attack Power
};

/**
 * Stat weights by finite differences.
 *
 * Every stat is perturbed by a delta large enough to stand out of the noise
 * and the DPS change is scaled back down to one unit. Each perturbed sim uses
 * the same trial seeds as the baseline, so the error is taken from the
 * per-trial differences.
 */
struct scaling_t : private noncopyable
{
  sim_t* const sim;

  std::vector<scale_factor_t> scale_factors;
  std::vector<scale_factor_t> mana_weights;

  explicit scaling_t( sim_t* s ) : sim( s ) { }

  void analyze();
  void analyze_stats();
  void analyze_mana();

  // Runs a copy of the baseline with stat changed by amount, and scales the
  // paired DPS difference by unit_scale
  scale_factor_t analyze_delta( const std::string& name, stat_e stat, double amount, double unit_scale );

  const scale_factor_t* find( const std::string& name ) const;

private:
  void normalize( std::vector<scale_factor_t>& );
};

void sc_format_to( const scale_factor_t&, fmt::format_context::iterator );
