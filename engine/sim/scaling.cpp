// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "scaling.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>

#include "player/druid.hpp"
#include "player/stat_target.hpp"
#include "sim/sim.hpp"
#include "util/sample_data.hpp"

namespace { // UNNAMED NAMESPACE ==========================================

// Below this the stat weight error bars are wider than most weights
constexpr int MIN_SCALING_ITERATIONS = 20000;

// Haste rating for 1% melee haste at level 80
constexpr double HASTE_RATING_PER_PERCENT = 25.21;

} // UNNAMED NAMESPACE ====================================================

// ==========================================================================
// Scaling
// ==========================================================================

// scaling_t::analyze =======================================================

void scaling_t::analyze()
{
  if ( ! sim -> calculate_scale_factors && ! sim -> calculate_mana_weights )
    return;

  if ( sim -> iterations < MIN_SCALING_ITERATIONS )
  {
    sim -> error( "Stat weights from {} iterations are unreliable, use at least {}.", sim -> iterations,
                  MIN_SCALING_ITERATIONS );
  }

  // Stat driven quantities are read from a freshly initialized druid
  sim -> druid -> init();

  if ( sim -> calculate_scale_factors )
    analyze_stats();

  if ( sim -> calculate_mana_weights )
    analyze_mana();
}

// scaling_t::analyze_stats =================================================

void scaling_t::analyze_stats()
{
  const druid_t& p = *sim -> druid;

  scale_factors.clear();

  // Attack power from gear is raised by Heart of the Wild and friends
  scale_factors.push_back( analyze_delta( "1 AP", STAT_ATTACK_POWER, 80 * p.config.ap_mod, 1.0 / 80 ) );

  // Below 2% miss chance the increment is taken above the current value
  double sign = 1 - 2 * ( p.miss_chance > 0.02 );
  scale_factors.push_back( analyze_delta( "1% hit", STAT_MISS_CHANCE, sign * 0.02, -0.5 * sign ) );

  scale_factors.push_back( analyze_delta( "1% crit", STAT_CRIT_CHANCE, 0.02, 0.5 ) );

  double agility = 40 * sim -> scale_agility_multiplier;
  scale_factors.push_back( analyze_delta( "1 Agility", STAT_AGILITY, agility, 1.0 / 40 ) );

  scale_factors.push_back( analyze_delta( "1% haste", STAT_HASTE_RATING, 4 * HASTE_RATING_PER_PERCENT, 0.25 ) );
  scale_factors.push_back( analyze_delta( "1 Armor Pen Rating", STAT_ARMOR_PEN_RATING, 50, 1.0 / 50 ) );
  scale_factors.push_back( analyze_delta( "1 Weapon Damage", STAT_WEAPON_DAMAGE, 12, 1.0 / 12 ) );

  normalize( scale_factors );
}

// scaling_t::analyze_mana ==================================================

void scaling_t::analyze_mana()
{
  const druid_t& p = *sim -> druid;

  mana_weights.clear();

  // One extra shapeshift worth of mana
  double shift_cost = p.shift_cost;
  scale_factor_t mana = analyze_delta( "1 mana", STAT_MANA, shift_cost, 1.0 / shift_cost );

  // Spirit regenerating one extra shapeshift over Innervate
  double spirit_delta = shift_cost / 10 / 5 / p.regen_rates.factor;
  scale_factor_t spirit = analyze_delta( "1 Spirit", STAT_SPIRIT, spirit_delta, 1.0 / spirit_delta );

  // Intellect adds 15 mana and raises Spirit based regeneration
  double spirit_share = p.spirit / ( 2 * p.intellect );
  scale_factor_t intellect;
  intellect.name  = "1 Int";
  intellect.value = 15 * mana.value + spirit_share * spirit.value;
  intellect.error = std::sqrt( std::pow( 15 * mana.error, 2 ) + std::pow( spirit_share * spirit.error, 2 ) );

  double mp5_delta = std::ceil( shift_cost / ( sim -> fight_length.total_seconds() / 5 ) );
  scale_factor_t mp5 = analyze_delta( "1 mp5", STAT_MP5, mp5_delta, 1.0 / mp5_delta );

  mana_weights.push_back( mana );
  mana_weights.push_back( spirit );
  mana_weights.push_back( intellect );
  mana_weights.push_back( mp5 );

  normalize( mana_weights );
}

// scaling_t::analyze_delta =================================================

scale_factor_t scaling_t::analyze_delta( const std::string& name, stat_e stat, double amount, double unit_scale )
{
  fmt::print( "Generating scale factors for {}...\n", name );

  auto delta_sim = std::make_unique<sim_t>( sim );
  delta_sim -> calculate_scale_factors = false;
  delta_sim -> calculate_mana_weights  = false;
  delta_sim -> stat_deltas.push_back( stat_delta_t( stat, amount ) );
  delta_sim -> execute();

  // Paired differences; both sims ran trial i with the same seed
  sample_data_t diffs( name, false );
  for ( size_t i = 0; i < sim -> records.size() && i < delta_sim -> records.size(); i++ )
  {
    const trial_record_t& base  = sim -> records[ i ];
    const trial_record_t& delta = delta_sim -> records[ i ];
    if ( base.valid && delta.valid )
      diffs.add( delta.dps - base.dps );
  }

  if ( diffs.size() == 0 )
    throw std::runtime_error( fmt::format( "No paired trials for scale factor '{}'", name ) );

  diffs.analyze();

  scale_factor_t sf;
  sf.name  = name;
  sf.value = diffs.mean * unit_scale;
  sf.error = diffs.mean_std_dev * std::fabs( unit_scale );
  return sf;
}

// scaling_t::normalize =====================================================

void scaling_t::normalize( std::vector<scale_factor_t>& factors )
{
  const scale_factor_t* ap = find( "1 AP" );

  scale_factor_t computed;
  if ( ! ap )
  {
    computed = analyze_delta( "1 AP", STAT_ATTACK_POWER, 80 * sim -> druid_config.ap_mod, 1.0 / 80 );
    scale_factors.push_back( computed );
    ap = &scale_factors.back();
  }

  double ap_value = ap -> value;
  for ( auto& f : factors )
    f.weight = ap_value != 0 ? f.value / ap_value : 0.0;
}

const scale_factor_t* scaling_t::find( const std::string& name ) const
{
  for ( const auto& f : scale_factors )
  {
    if ( f.name == name )
      return &f;
  }
  return nullptr;
}

void sc_format_to( const scale_factor_t& sf, fmt::format_context::iterator out )
{
  fmt::format_to( out, "{:<20} {:8.4f} +/- {:6.4f}  weight {:6.3f}", sf.name, sf.value, sf.error, sf.weight );
}
