// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "reports.hpp"

#include "sim/scaling.hpp"
#include "sim/sim.hpp"
#include "util/util.hpp"

namespace { // ANONYMOUS NAMESPACE ==========================================

// print_text_dps ===========================================================

void print_text_dps( std::FILE* file, sim_t& sim )
{
  sample_data_t& dps = sim.dps;

  fmt::print( file, "\nDPS Ranking:\n" );
  fmt::print( file, "  DPS={:.1f}  Error={:.1f}/{:.2f}%  StdDev={:.1f}  Median={:.1f}  Min={:.1f}  Max={:.1f}\n",
              dps.mean, 2.0 * dps.mean_std_dev, dps.mean > 0 ? 200.0 * dps.mean_std_dev / dps.mean : 0.0,
              dps.population_std_dev, dps.percentile( 0.5 ), dps.min, dps.max );
  fmt::print( file, "  Damage={:.0f}  FightLength={:.1f}  Trials={}/{}\n", sim.damage.mean,
              sim.simulation_length.mean, sim.valid_trials, sim.records.size() );

  if ( sim.oom_trials == 0 )
    fmt::print( file, "  TimeToOOM=none\n" );
  else
    fmt::print( file, "  TimeToOOM={:.1f}  OOM Trials={:.1f}%\n", sim.time_to_oom.mean,
                100.0 * sim.oom_trials / sim.valid_trials );
}

// print_text_abilities =====================================================

void print_text_abilities( std::FILE* file, sim_t& sim )
{
  double total = 0;
  for ( const auto& a : sim.abilities )
    total += a.damage;

  double minutes = sim.simulation_length.mean / 60.0;

  fmt::print( file, "\nAbilities:\n" );
  for ( ability_e i = ABILITY_MELEE; i < ABILITY_MAX; i++ )
  {
    const ability_summary_t& a = sim.abilities[ i ];
    if ( a.casts == 0 && a.damage == 0 )
      continue;

    fmt::print( file, "    {:<22}  Count={:6.1f}|{:5.2f}/min  DPE={:7.0f}  {:5.1f}%\n",
                util::ability_type_string( i ), a.casts, minutes > 0 ? a.casts / minutes : 0.0,
                a.casts > 0 ? a.damage / a.casts : 0.0, total > 0 ? 100.0 * a.damage / total : 0.0 );
  }
}

// print_text_auras =========================================================

void print_text_auras( std::FILE* file, sim_t& sim )
{
  if ( sim.auras.empty() )
    return;

  fmt::print( file, "\nAuras:\n" );
  for ( const auto& a : sim.auras )
    fmt::print( file, "    {:<30}  Procs={:6.1f}  Uptime={:5.1f}%\n", a.name, a.procs, 100.0 * a.uptime );
}

// print_text_scale_factors =================================================

void print_text_scale_factors( std::FILE* file, sim_t& sim )
{
  const scaling_t& s = *sim.scaling;

  if ( ! s.scale_factors.empty() )
  {
    fmt::print( file, "\nScale Factors:\n" );
    for ( const auto& sf : s.scale_factors )
      fmt::print( file, "    {}\n", sf );
  }

  if ( ! s.mana_weights.empty() )
  {
    fmt::print( file, "\nMana Weights:\n" );
    for ( const auto& sf : s.mana_weights )
      fmt::print( file, "    {}\n", sf );
  }
}

// print_text_errors ========================================================

void print_text_errors( std::FILE* file, sim_t& sim )
{
  if ( sim.error_list.empty() )
    return;

  fmt::print( file, "\nErrors:\n" );
  for ( const auto& e : sim.error_list )
    fmt::print( file, "  {}\n", e );
}

} // ANONYMOUS NAMESPACE ====================================================

// report::print_text =======================================================

void report::print_text( std::FILE* file, sim_t& sim )
{
  print_text_dps( file, sim );
  print_text_abilities( file, sim );
  print_text_auras( file, sim );
  print_text_scale_factors( file, sim );
  print_text_errors( file, sim );
  fmt::print( file, "\n" );
}

void report::print_text( sim_t& sim )
{
  print_text( sim.output_file, sim );
}

// report::print_event_log ==================================================

void report::print_event_log( std::FILE* file, const sim_t& sim )
{
  for ( const auto& e : sim.event_log )
    fmt::print( file, "{}\n", e );
}
