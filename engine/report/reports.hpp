// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include <cstdio>

struct sim_t;

// Global report functions to be called after simulation finished.
namespace report
{
void print_text( sim_t& );
void print_text( std::FILE*, sim_t& );
void print_event_log( std::FILE*, const sim_t& );
}  // namespace report
