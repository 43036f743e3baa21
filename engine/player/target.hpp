// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include "util/format.hpp"

// Raid boss and the debuffs the raid keeps on it
struct target_t
{
  double armor;
  bool sunder;              // Sunder Armor is stacked up during the fight
  bool faerie_fire;
  bool blood_frenzy;
  bool gift_of_arthas;
  bool curse_of_elements;
  bool shattering_throw;

  int sunder_stacks;

  target_t() :
    armor( 10643 ),
    sunder( false ),
    faerie_fire( true ),
    blood_frenzy( false ),
    gift_of_arthas( true ),
    curse_of_elements( false ),
    shattering_throw( false ),
    sunder_stacks( 0 )
  { }

  void reset()
  { sunder_stacks = 0; }

  double debuffed_armor() const
  {
    return armor * ( 1 - 0.04 * sunder_stacks ) * ( 1 - 0.05 * faerie_fire ) *
           ( 1 - 0.2 * shattering_throw );
  }
};

inline void sc_format_to( const target_t& t, fmt::format_context::iterator out )
{
  fmt::format_to( out, "Target armor={:.0f} sunder={}", t.debuffed_armor(), t.sunder_stacks );
}
