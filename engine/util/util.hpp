// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include <cstdio>
#include <exception>
#include <string>
#include <vector>

#include "fc_enums.hpp"

/**
 * Defines various utility, string and enum <-> string translation functions.
 */
namespace util
{
const char* form_type_string          ( form_e );
const char* resource_type_string      ( resource_e );
const char* result_type_string        ( result_e );
const char* stat_type_string          ( stat_e );
const char* ability_type_string       ( ability_e );
const char* dot_type_string           ( dot_e );
const char* cooldown_type_string      ( cooldown_e );
const char* effect_behavior_string    ( effect_behavior_e );
const char* proc_trigger_string       ( proc_trigger_e );

// parse_* functions throw std::invalid_argument on unknown names
stat_e            parse_stat_type      ( const std::string& name );
effect_behavior_e parse_effect_behavior( const std::string& name );
proc_trigger_e    parse_proc_trigger   ( const std::string& name );
aura_trigger_e    parse_aura_trigger   ( const std::string& name );

std::vector<std::string> string_split( const std::string& str, const std::string& delim );
std::string string_strip( const std::string& str );

bool str_compare_ci( const std::string& l, const std::string& r );
bool str_begins_with( const std::string& str, const std::string& beginsWith );

// Strict conversions: the whole string must be consumed, otherwise
// std::invalid_argument is thrown.
double   to_double  ( const std::string& str );
int      to_int     ( const std::string& str );
unsigned to_unsigned( const std::string& str );
bool     to_bool    ( const std::string& str );

double round( double X, unsigned int decplaces = 0 );

void print_chained_exception( const std::exception& e, std::FILE* out = stderr, int level = 0 );
void print_chained_exception( std::exception_ptr eptr, std::FILE* out = stderr, int level = 0 );

} // namespace util
