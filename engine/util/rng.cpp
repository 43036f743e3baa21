// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "rng.hpp"

namespace {

inline uint64_t rotl( uint64_t x, int k )
{ return ( x << k ) | ( x >> ( 64 - k ) ); }

uint64_t splitmix64( uint64_t& x )
{
  uint64_t z = ( x += 0x9E3779B97F4A7C15ULL );
  z = ( z ^ ( z >> 30 ) ) * 0xBF58476D1CE4E5B9ULL;
  z = ( z ^ ( z >> 27 ) ) * 0x94D049BB133111EBULL;
  return z ^ ( z >> 31 );
}

} // unnamed namespace

void rng::xoshiro256plus_t::seed( uint64_t start )
{
  uint64_t x = start;
  for ( auto& word : s )
    word = splitmix64( x );
}

uint64_t rng::xoshiro256plus_t::next()
{
  const uint64_t result = s[ 0 ] + s[ 3 ];
  const uint64_t t = s[ 1 ] << 17;

  s[ 2 ] ^= s[ 0 ];
  s[ 3 ] ^= s[ 1 ];
  s[ 1 ] ^= s[ 2 ];
  s[ 0 ] ^= s[ 3 ];

  s[ 2 ] ^= t;
  s[ 3 ] = rotl( s[ 3 ], 45 );

  return result;
}
