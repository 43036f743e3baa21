// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "attack_roll.hpp"

namespace { // UNNAMED NAMESPACE ==========================================

struct resist_band_t
{
  double chance;
  double multiplier;
};

// Partial resistance against a level 83 target
const resist_band_t spell_resists[] = {
  { 0.55, 1.0 }, { 0.30, 0.75 }, { 0.14, 0.5 }, { 0.01, 0.25 }
};

const resist_band_t proc_resists[] = {
  { 0.84, 1.0 }, { 0.11, 0.75 }, { 0.04, 0.5 }, { 0.01, 0.25 }
};

template <size_t N>
double resist_multiplier( rng_t& rng, const resist_band_t ( &table )[ N ] )
{
  double random = rng.real();
  double total  = 0;
  for ( size_t i = 0; i < N; i++ )
  {
    total += table[ i ].chance;
    if ( random < total )
      return table[ i ].multiplier;
  }
  return table[ N - 1 ].multiplier;
}

} // UNNAMED NAMESPACE ====================================================

// attack_roll::white =======================================================

roll_result_t attack_roll::white( rng_t& rng, double low, double high,
                                  double miss_chance, double crit_chance, double crit_multiplier )
{
  roll_result_t r;

  double random = rng.real();
  if ( random < miss_chance )
  {
    r.result = RESULT_MISS;
    return r;
  }

  r.damage = low + rng.real() * ( high - low );

  if ( random < miss_chance + GLANCE_CHANCE )
  {
    r.result = RESULT_GLANCE;
    r.damage *= 1.0 - ( 0.15 + rng.real() * 0.2 );
  }
  else if ( random < miss_chance + GLANCE_CHANCE + crit_chance )
  {
    r.result = RESULT_CRIT;
    r.damage *= crit_multiplier;
  }
  else
    r.result = RESULT_HIT;

  return r;
}

// attack_roll::yellow ======================================================

roll_result_t attack_roll::yellow( rng_t& rng, double low, double high,
                                   double miss_chance, double crit_chance, double crit_multiplier )
{
  roll_result_t r;

  if ( rng.real() < miss_chance )
  {
    r.result = RESULT_MISS;
    return r;
  }

  r.damage = low + rng.real() * ( high - low );

  if ( rng.real() < crit_chance )
  {
    r.result = RESULT_CRIT;
    r.damage *= crit_multiplier;
  }
  else
    r.result = RESULT_HIT;

  return r;
}

// attack_roll::spell =======================================================

roll_result_t attack_roll::spell( rng_t& rng, double low, double high,
                                  double miss_chance, double crit_chance, double crit_multiplier )
{
  roll_result_t r = yellow( rng, low, high, miss_chance, crit_chance, crit_multiplier );

  if ( ! r.miss() )
    r.damage *= resist_multiplier( rng, spell_resists );

  return r;
}

// attack_roll::proc_damage =================================================

roll_result_t attack_roll::proc_damage( rng_t& rng, double low, double high, double miss_chance )
{
  roll_result_t r;

  if ( rng.real() < miss_chance )
  {
    r.result = RESULT_MISS;
    return r;
  }

  r.result = RESULT_HIT;
  r.damage = low + rng.real() * ( high - low );
  r.damage *= resist_multiplier( rng, proc_resists );

  return r;
}
