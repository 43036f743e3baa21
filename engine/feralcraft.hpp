// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include "action/attack_roll.hpp"
#include "action/dot.hpp"
#include "buff/effect.hpp"
#include "fc_enums.hpp"
#include "player/druid.hpp"
#include "player/stat_target.hpp"
#include "player/target.hpp"
#include "report/reports.hpp"
#include "sim/debuff_scheduler.hpp"
#include "sim/option.hpp"
#include "sim/rotation.hpp"
#include "sim/scaling.hpp"
#include "sim/sim.hpp"
#include "sim/simulation_state.hpp"
#include "sim/trial_record.hpp"
#include "util/format.hpp"
#include "util/generic.hpp"
#include "util/rng.hpp"
#include "util/sample_data.hpp"
#include "util/thread.hpp"
#include "util/timespan.hpp"
#include "util/util.hpp"
