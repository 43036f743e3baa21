// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "feralcraft.hpp"

#include <locale>
#include <string>
#include <vector>

// ==========================================================================
// MAIN
// ==========================================================================

int main( int argc, char** argv )
{
  std::locale::global( std::locale( "C" ) );

  std::vector<std::string> args( argv + 1, argv + argc );

  sim_t sim;
  return sim.main( args );
}
