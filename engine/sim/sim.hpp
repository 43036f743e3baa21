// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include <array>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "buff/effect.hpp"
#include "fc_enums.hpp"
#include "player/druid.hpp"
#include "player/stat_target.hpp"
#include "player/target.hpp"
#include "sim/debuff_scheduler.hpp"
#include "sim/option.hpp"
#include "sim/rotation.hpp"
#include "sim/simulation_state.hpp"
#include "sim/trial_record.hpp"
#include "util/format.hpp"
#include "util/rng.hpp"
#include "util/sample_data.hpp"
#include "util/thread.hpp"
#include "util/timespan.hpp"

struct scaling_t;

// Per trial means over all valid trials
struct ability_summary_t
{
  double casts  = 0;
  double damage = 0;
};

struct aura_summary_t
{
  std::string name;
  double procs  = 0;
  double uptime = 0;
};

// Simulation engine ========================================================

/**
 * One simulation: the configuration, and the worker running a block of
 * trials on it.
 *
 * The root sim partitions its trials over child sims running in their own
 * threads. Trial i is always seeded with seed + i and its record is stored
 * at index i of the root, so the number of threads never changes results.
 */
struct sim_t : private fc_thread_t
{
  sim_t* const parent;
  const int thread_index;

  // Sim options
  int iterations;
  int threads;
  unsigned seed;
  bool log;
  bool debug;
  bool trace;
  std::string output_file_str;
  std::FILE* output_file;
  bool calculate_scale_factors;
  bool calculate_mana_weights;
  double scale_agility_multiplier;

  // Fight options
  timespan_t fight_length;
  double vary_combat_length;  // standard deviation in seconds
  timespan_t latency;
  double hot_uptime;
  timespan_t cooldown_delay;
  bool bloodlust;
  bool haste_potion;

  druid_config_t druid_config;
  target_t target;
  rotation_strategy_t strategy;
  std::vector<effect_spec_t> effect_specs;

  // Applied to the druid at the start of every trial
  std::vector<stat_delta_t> stat_deltas;

  // Per sim state
  rng_t rng;
  std::unique_ptr<druid_t> druid;
  std::vector<std::unique_ptr<effect_t>> effects;
  debuff_scheduler_t debuff_scheduler;
  rotation_t rotation;
  simulation_state_t state;
  std::vector<event_log_entry_t> event_log;
  std::vector<std::string> error_list;
  option_list_t options;

  // Threading
  mutex_t mutex;
  std::vector<sim_t*> children;
  int first_iteration;  // trials [first_iteration, first_iteration + work_iterations) run here
  int work_iterations;

  // Results, indexed by trial
  std::vector<trial_record_t> records;

  // Aggregates over valid trials
  int valid_trials;
  sample_data_t dps;
  sample_data_t damage;
  sample_data_t simulation_length;
  sample_data_t time_to_oom;
  int oom_trials;
  std::array<ability_summary_t, ABILITY_MAX> abilities;
  std::vector<aura_summary_t> auras;

  std::unique_ptr<scaling_t> scaling;

  sim_t( sim_t* parent = nullptr, int thread_index = 0 );
  ~sim_t() override;

  int main( const std::vector<std::string>& args );
  void setup( const option_db_t& );
  void create_options();
  void validate();
  void init();

  void execute();
  void partition();
  void iterate();
  void merge();
  void analyze();
  void run() override;

  // One trial with its own seed; a failed trial comes back invalid
  trial_record_t combat( int index );

  timespan_t current_time() const
  { return state.time; }

  bool tracing() const
  { return trace || log; }

  // Combat log entry. Only collected and printed when tracing.
  void record_event( const std::string& event, const std::string& outcome );

  template <typename... Args>
  void print_log( fmt::format_string<Args...> format, Args&&... args )
  {
    if ( ! log )
      return;
    fmt::print( output_file, "{:8.3f} ", current_time().total_seconds() );
    fmt::print( output_file, format, std::forward<Args>( args )... );
    fmt::print( output_file, "\n" );
  }

  template <typename... Args>
  void print_debug( fmt::format_string<Args...> format, Args&&... args )
  {
    if ( ! debug )
      return;
    print_log( format, std::forward<Args>( args )... );
  }

  template <typename... Args>
  void error( fmt::format_string<Args...> format, Args&&... args )
  {
    std::string s = fmt::format( format, std::forward<Args>( args )... );
    fmt::print( stderr, "{}\n", s );

    sim_t* root = this;
    while ( root -> parent )
      root = root -> parent;
    auto_lock_t lock( root -> mutex );
    root -> error_list.push_back( std::move( s ) );
  }

private:
  void reset_trial();
  void run_combat();
  void combat_end( trial_record_t& );
  timespan_t next_event_time() const;
};
