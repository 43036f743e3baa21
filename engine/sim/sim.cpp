// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "sim.hpp"

#include <algorithm>
#include <exception>
#include <limits>
#include <stdexcept>

#include "report/reports.hpp"
#include "sim/scaling.hpp"
#include "util/util.hpp"

namespace { // UNNAMED NAMESPACE ==========================================

constexpr int MAX_THREADS = 256;

} // UNNAMED NAMESPACE ====================================================

// ==========================================================================
// Simulator
// ==========================================================================

// sim_t::sim_t =============================================================

sim_t::sim_t( sim_t* p, int index ) :
  parent( p ),
  thread_index( index ),
  iterations( 1000 ),
  threads( 1 ),
  seed( 0 ),
  log( false ),
  debug( false ),
  trace( false ),
  output_file( stdout ),
  calculate_scale_factors( false ),
  calculate_mana_weights( false ),
  scale_agility_multiplier( 1.0 ),
  fight_length( timespan_t::from_seconds( 180 ) ),
  vary_combat_length( 1.0 ),
  latency( timespan_t::from_millis( 10 ) ),
  hot_uptime( 0.0 ),
  cooldown_delay( timespan_t::zero() ),
  bloodlust( false ),
  haste_potion( false ),
  debuff_scheduler( this, target ),
  rotation( this, strategy ),
  state( *this ),
  first_iteration( 0 ),
  work_iterations( 0 ),
  valid_trials( 0 ),
  dps( "DPS", false ),
  damage( "Damage" ),
  simulation_length( "Fight Length" ),
  time_to_oom( "Time to OOM" ),
  oom_trials( 0 ),
  scaling( std::make_unique<scaling_t>( this ) )
{
  create_options();

  if ( parent )
  {
    iterations               = parent -> iterations;
    threads                  = parent -> threads;
    seed                     = parent -> seed;
    log                      = parent -> log;
    debug                    = parent -> debug;
    trace                    = parent -> trace;
    output_file              = parent -> output_file;
    scale_agility_multiplier = parent -> scale_agility_multiplier;
    fight_length             = parent -> fight_length;
    vary_combat_length       = parent -> vary_combat_length;
    latency                  = parent -> latency;
    hot_uptime               = parent -> hot_uptime;
    cooldown_delay           = parent -> cooldown_delay;
    bloodlust                = parent -> bloodlust;
    haste_potion             = parent -> haste_potion;
    druid_config             = parent -> druid_config;
    target                   = parent -> target;
    strategy                 = parent -> strategy;
    effect_specs             = parent -> effect_specs;
    stat_deltas              = parent -> stat_deltas;
  }
}

sim_t::~sim_t()
{
  for ( sim_t* child : children )
    delete child;

  if ( ! parent && output_file && output_file != stdout )
    std::fclose( output_file );
}

// sim_t::create_options ====================================================

void sim_t::create_options()
{
  // Sim
  options.push_back( opt_int( "iterations", iterations, 1, std::numeric_limits<int>::max() ) );
  options.push_back( opt_int( "threads", threads, 1, MAX_THREADS ) );
  options.push_back( opt_uint( "seed", seed ) );
  options.push_back( opt_bool( "log", log ) );
  options.push_back( opt_bool( "debug", debug ) );
  options.push_back( opt_bool( "trace", trace ) );
  options.push_back( opt_string( "output", output_file_str ) );
  options.push_back( opt_bool( "calculate_scale_factors", calculate_scale_factors ) );
  options.push_back( opt_bool( "calculate_mana_weights", calculate_mana_weights ) );
  options.push_back( opt_float( "scale_agility_multiplier", scale_agility_multiplier, 0, 10 ) );

  // Fight
  options.push_back( opt_timespan( "fight_length", fight_length ) );
  options.push_back( opt_float( "vary_combat_length", vary_combat_length, 0, 3600 ) );
  options.push_back( opt_timespan( "latency", latency ) );
  options.push_back( opt_float( "hot_uptime", hot_uptime, 0, 1 ) );
  options.push_back( opt_timespan( "cooldown_delay", cooldown_delay ) );
  options.push_back( opt_bool( "bloodlust", bloodlust ) );
  options.push_back( opt_bool( "haste_potion", haste_potion ) );

  // Target
  options.push_back( opt_float( "target.armor", target.armor, 0, 100000 ) );
  options.push_back( opt_bool( "target.sunder", target.sunder ) );
  options.push_back( opt_bool( "target.faerie_fire", target.faerie_fire ) );
  options.push_back( opt_bool( "target.blood_frenzy", target.blood_frenzy ) );
  options.push_back( opt_bool( "target.gift_of_arthas", target.gift_of_arthas ) );
  options.push_back( opt_bool( "target.curse_of_elements", target.curse_of_elements ) );
  options.push_back( opt_bool( "target.shattering_throw", target.shattering_throw ) );

  // Druid stats
  druid_config_t& c = druid_config;
  options.push_back( opt_float( "druid.attack_power", c.attack_power ) );
  options.push_back( opt_float( "druid.ap_mod", c.ap_mod ) );
  options.push_back( opt_float( "druid.agility", c.agility ) );
  options.push_back( opt_float( "druid.hit_chance", c.hit_chance, 0, 1 ) );
  options.push_back( opt_float( "druid.spell_hit_chance", c.spell_hit_chance, 0, 1 ) );
  options.push_back( opt_float( "druid.expertise_rating", c.expertise_rating ) );
  options.push_back( opt_float( "druid.crit_chance", c.crit_chance, 0, 1 ) );
  options.push_back( opt_float( "druid.spell_crit_chance", c.spell_crit_chance, 0, 1 ) );
  options.push_back( opt_float( "druid.armor_pen_rating", c.armor_pen_rating ) );
  options.push_back( opt_float( "druid.swing_timer", c.swing_timer, 0.1, 10 ) );
  options.push_back( opt_float( "druid.haste_multiplier", c.haste_multiplier, 0.1, 10 ) );
  options.push_back( opt_float( "druid.mana", c.mana, 0, 100000 ) );
  options.push_back( opt_float( "druid.intellect", c.intellect, 0, 100000 ) );
  options.push_back( opt_float( "druid.spirit", c.spirit, 0, 100000 ) );
  options.push_back( opt_float( "druid.mp5", c.mp5 ) );
  options.push_back( opt_float( "druid.bonus_damage", c.bonus_damage ) );
  options.push_back( opt_float( "druid.shred_bonus", c.shred_bonus ) );
  options.push_back( opt_float( "druid.rip_bonus", c.rip_bonus ) );
  options.push_back( opt_float( "druid.debuff_ap", c.debuff_ap ) );
  options.push_back( opt_float( "druid.multiplier", c.multiplier ) );
  options.push_back( opt_float( "druid.spell_damage_multiplier", c.spell_damage_multiplier ) );
  options.push_back( opt_float( "druid.weapon_speed", c.weapon_speed, 0.1, 10 ) );
  options.push_back( opt_int( "druid.gotw_targets", c.gotw_targets, 0, 40 ) );

  // Talents
  options.push_back( opt_bool( "druid.omen", c.omen ) );
  options.push_back( opt_bool( "druid.primal_gore", c.primal_gore ) );
  options.push_back( opt_int( "druid.feral_aggression", c.feral_aggression, 0, 5 ) );
  options.push_back( opt_int( "druid.predatory_instincts", c.predatory_instincts, 0, 3 ) );
  options.push_back( opt_int( "druid.savage_fury", c.savage_fury, 0, 2 ) );
  options.push_back( opt_int( "druid.furor", c.furor, 0, 5 ) );
  options.push_back( opt_int( "druid.natural_shapeshifter", c.natural_shapeshifter, 0, 3 ) );
  options.push_back( opt_int( "druid.intensity", c.intensity, 0, 3 ) );
  options.push_back( opt_int( "druid.potp", c.potp, 0, 2 ) );
  options.push_back( opt_int( "druid.improved_mangle", c.improved_mangle, 0, 3 ) );
  options.push_back( opt_int( "druid.ilotp", c.ilotp, 0, 2 ) );

  // Glyphs
  options.push_back( opt_bool( "druid.rip_glyph", c.rip_glyph ) );
  options.push_back( opt_bool( "druid.shred_glyph", c.shred_glyph ) );
  options.push_back( opt_bool( "druid.roar_glyph", c.roar_glyph ) );
  options.push_back( opt_bool( "druid.berserk_glyph", c.berserk_glyph ) );
  options.push_back( opt_bool( "druid.mangle_glyph", c.mangle_glyph ) );

  // Gear
  options.push_back( opt_bool( "druid.jow", c.jow ) );
  options.push_back( opt_bool( "druid.rune", c.rune ) );
  options.push_back( opt_bool( "druid.wolfshead", c.wolfshead ) );
  options.push_back( opt_bool( "druid.meta", c.meta ) );
  options.push_back( opt_bool( "druid.t6_2p", c.t6_2p ) );
  options.push_back( opt_bool( "druid.t6_4p", c.t6_4p ) );
  options.push_back( opt_bool( "druid.t7_2p", c.t7_2p ) );
  options.push_back( opt_bool( "druid.t8_2p", c.t8_2p ) );
  options.push_back( opt_bool( "druid.t8_4p", c.t8_4p ) );
  options.push_back( opt_bool( "druid.t9_2p", c.t9_2p ) );
  options.push_back( opt_bool( "druid.t9_4p", c.t9_4p ) );
  options.push_back( opt_bool( "druid.t10_2p", c.t10_2p ) );
  options.push_back( opt_bool( "druid.t10_4p", c.t10_4p ) );

  strategy.create_options( options );

  options.push_back( opt_func( "effect", []( sim_t* sim, const std::string&, const std::string& value ) {
    sim -> effect_specs.push_back( effect_spec_t::parse( sim, value ) );
    return true;
  } ) );
}

// sim_t::setup =============================================================

void sim_t::setup( const option_db_t& db )
{
  for ( const auto& o : db )
    opts::parse( this, options, o.name, o.value );

  validate();

  if ( ! output_file_str.empty() )
  {
    output_file = std::fopen( output_file_str.c_str(), "w" );
    if ( ! output_file )
    {
      output_file = stdout;
      throw std::runtime_error( fmt::format( "Unable to open output file '{}'", output_file_str ) );
    }
  }
}

// sim_t::validate ==========================================================

void sim_t::validate()
{
  strategy.validate();

  if ( fight_length <= timespan_t::zero() )
    throw std::invalid_argument( fmt::format( "Fight length must be positive, got {}", fight_length ) );
  if ( latency < timespan_t::zero() )
    throw std::invalid_argument( fmt::format( "Latency cannot be negative, got {}", latency ) );

  for ( const auto& spec : effect_specs )
    spec.validate();

  if ( debug )
    log = true;

  // A combat log only makes sense for a single trial
  if ( log || trace )
  {
    iterations = 1;
    threads = 1;
  }

  if ( threads > iterations )
    threads = iterations;
}

// sim_t::init ==============================================================

void sim_t::init()
{
  druid = std::make_unique<druid_t>( this, druid_config, target );

  effects.clear();
  for ( const auto& spec : effect_specs )
    effects.push_back( std::make_unique<effect_t>( this, spec ) );
  if ( bloodlust )
    effects.push_back( std::make_unique<effect_t>( this, effects::bloodlust( cooldown_delay ) ) );
  if ( haste_potion )
    effects.push_back( std::make_unique<effect_t>( this, effects::haste_potion( cooldown_delay ) ) );

  druid -> proc_effects.clear();
  for ( const auto& e : effects )
  {
    if ( e -> is_proc() )
      druid -> proc_effects.push_back( e.get() );
  }

  event_log.clear();
}

// sim_t::iterate ===========================================================

void sim_t::iterate()
{
  init();

  for ( int i = first_iteration; i < first_iteration + work_iterations; i++ )
  {
    trial_record_t record = combat( i );
    if ( ! tracing() )
      record.damage_samples = std::vector<damage_sample_t>();

    if ( parent && thread_index > 0 )
    {
      auto_lock_t lock( parent -> mutex );
      parent -> records[ i ] = std::move( record );
    }
    else
    {
      records[ i ] = std::move( record );
    }
  }
}

// sim_t::run ===============================================================

void sim_t::run()
{
  iterate();
}

// sim_t::partition =========================================================

void sim_t::partition()
{
  first_iteration = 0;
  work_iterations = iterations;

  if ( threads <= 1 || FC_NO_THREADING_ON )
    return;
  if ( iterations < threads )
    return;

  int block = iterations / threads;
  int remainder = iterations % threads;

  work_iterations = block + ( remainder > 0 );
  int next = work_iterations;

  int num_children = threads - 1;
  for ( int i = 0; i < num_children; i++ )
  {
    sim_t* child = new sim_t( this, i + 1 );
    children.push_back( child );
    child -> first_iteration = next;
    child -> work_iterations = block + ( i + 1 < remainder );
    next += child -> work_iterations;
  }

  for ( sim_t* child : children )
    child -> launch();
}

// sim_t::merge =============================================================

void sim_t::merge()
{
  for ( sim_t* child : children )
  {
    child -> wait();
    delete child;
  }

  children.clear();
}

// sim_t::analyze ===========================================================

// Folds the trial records in trial order.
void sim_t::analyze()
{
  valid_trials = 0;
  oom_trials = 0;
  abilities.fill( ability_summary_t() );
  auras.clear();
  dps.clear();
  damage.clear();
  simulation_length.clear();
  time_to_oom.clear();

  for ( const auto& r : records )
  {
    if ( ! r.valid )
      continue;

    valid_trials++;
    dps.add( r.dps );
    damage.add( r.damage );
    simulation_length.add( r.fight_length );
    time_to_oom.add( r.time_to_oom );
    if ( r.time_to_oom < r.fight_length )
      oom_trials++;

    for ( ability_e a = ABILITY_MELEE; a < ABILITY_MAX; a++ )
    {
      abilities[ a ].casts  += r.abilities[ a ].casts;
      abilities[ a ].damage += r.abilities[ a ].damage;
    }

    for ( const auto& aura : r.auras )
    {
      auto it = std::find_if( auras.begin(), auras.end(),
                              [ &aura ]( const aura_summary_t& s ) { return s.name == aura.name; } );
      if ( it == auras.end() )
      {
        auras.push_back( aura_summary_t() );
        it = auras.end() - 1;
        it -> name = aura.name;
      }
      it -> procs  += aura.procs;
      it -> uptime += aura.uptime;
    }
  }

  if ( valid_trials == 0 )
    throw std::runtime_error( fmt::format( "All {} trials failed", records.size() ) );

  for ( auto& a : abilities )
  {
    a.casts  /= valid_trials;
    a.damage /= valid_trials;
  }
  for ( auto& a : auras )
  {
    a.procs  /= valid_trials;
    a.uptime /= valid_trials;
  }

  dps.analyze();
  damage.analyze();
  simulation_length.analyze();
  time_to_oom.analyze();
}

// sim_t::execute ===========================================================

void sim_t::execute()
{
  records.assign( iterations, trial_record_t() );

  partition();
  iterate();
  merge();
  analyze();
}

// sim_t::record_event ======================================================

void sim_t::record_event( const std::string& event, const std::string& outcome )
{
  if ( ! tracing() )
    return;

  event_log_entry_t e;
  e.time         = current_time();
  e.event        = event;
  e.outcome      = outcome;
  e.energy       = druid ? druid -> energy() : 0;
  e.combo_points = druid ? druid -> combo_points() : 0;
  e.mana         = druid ? druid -> mana() : 0;
  e.rage         = druid ? druid -> rage() : 0;

  if ( log )
    fmt::print( output_file, "{}\n", e );

  event_log.push_back( std::move( e ) );
}

void sc_format_to( const event_log_entry_t& e, fmt::format_context::iterator out )
{
  fmt::format_to( out, "{:8.3f} {:<24} {:<20} energy={:5.1f} cp={} mana={:6.0f} rage={:5.1f}",
                  e.time.total_seconds(), e.event, e.outcome, e.energy, e.combo_points, e.mana, e.rage );
}

// sim_t::main ==============================================================

int sim_t::main( const std::vector<std::string>& args )
{
  try
  {
    fmt::print( "Feralcraft {}\n", FC_VERSION );

    option_db_t db;

    try
    {
      db.parse_args( args );
    }
    catch ( const std::exception& )
    {
      std::throw_with_nested( std::invalid_argument( "Incorrect option format" ) );
    }

    try
    {
      setup( db );
    }
    catch ( const std::exception& )
    {
      std::throw_with_nested( std::runtime_error( "Setup failure" ) );
    }

    fmt::print( "\nSimulating... ( iterations={}, threads={}, seed={}, fight_length={:.0f}, "
                "vary_combat_length={:0.2f} )\n\n",
                iterations, threads, seed, fight_length.total_seconds(), vary_combat_length );

    try
    {
      execute();
      if ( calculate_scale_factors || calculate_mana_weights )
        scaling -> analyze();
    }
    catch ( const std::exception& )
    {
      std::throw_with_nested( std::runtime_error( "Simulation failure" ) );
    }

    report::print_text( *this );
    if ( trace && ! log )
      report::print_event_log( output_file, *this );

    return 0;
  }
  catch ( const std::nested_exception& e )
  {
    fmt::print( stderr, "Error: " );
    util::print_chained_exception( e.nested_ptr(), stderr );
    fmt::print( stderr, "\n" );
    return 1;
  }
  catch ( const std::exception& e )
  {
    fmt::print( stderr, "Error: {}\n", e.what() );
    return 1;
  }
}
