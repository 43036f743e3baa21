// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

// Pseudo-Random Number Generation ==========================================

#include "config.hpp"

#include <cmath>
#include <cstdint>

namespace rng {

/**
 * xoshiro256+ engine (Blackman & Vigna), producing doubles in [0, 1).
 * State is expanded from a 64-bit seed with splitmix64.
 */
class xoshiro256plus_t
{
  uint64_t s[ 4 ];

public:
  xoshiro256plus_t() { seed( 0 ); }

  void seed( uint64_t start );
  uint64_t next();

  double operator()()
  {
    // Upper 53 bits mapped onto the mantissa
    return static_cast<double>( next() >> 11 ) * ( 1.0 / 9007199254740992.0 );
  }
};

// This is a hybrid between distribution functions and a RNG engine, specified as the template type

template <typename RNG_GENERATOR>
class rng_base_t
{
private:
  RNG_GENERATOR engine;
  double gauss_pair_value;
  bool   gauss_pair_use;

public:
  explicit rng_base_t( uint64_t value = 0 ) :
    gauss_pair_value( 0 ),
    gauss_pair_use( false )
  { seed( value ); }

  void seed( uint64_t value )
  {
    engine.seed( value );
    gauss_pair_use = false;
  }

  double real() { return engine(); }

  double gauss( double mean, double stddev );
};

template <typename T>
double rng_base_t<T>::gauss( double mean, double stddev )
{
  // Polar form of the Box-Muller transformation; the second value of each
  // generated pair is cached for the next call.
  double z;

  if ( stddev != 0 )
  {
    if ( gauss_pair_use )
    {
      z = gauss_pair_value;
      gauss_pair_use = false;
    }
    else
    {
      double x1, x2, w;
      do
      {
        x1 = 2.0 * real() - 1.0;
        x2 = 2.0 * real() - 1.0;
        w = x1 * x1 + x2 * x2;
      }
      while ( w >= 1.0 || w == 0.0 );

      w = std::sqrt( ( -2.0 * std::log( w ) ) / w );

      z = x1 * w;
      gauss_pair_value = x2 * w;
      gauss_pair_use = true;
    }
  }
  else
    z = 0.0;

  return mean + z * stddev;
}

} // namespace rng

// Standard RNG-Container
typedef rng::rng_base_t<rng::xoshiro256plus_t> rng_t;
