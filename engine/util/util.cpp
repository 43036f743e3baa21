// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "util.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#include "generic.hpp"

namespace { // UNNAMED NAMESPACE ============================================

// parse_enum ===============================================================

template <typename T, T Min, T Max, const char* F( T )>
inline T parse_enum( const std::string& name, const char* what )
{
  for ( T i = Min; i < Max; ++i )
    if ( util::str_compare_ci( name, F( i ) ) )
      return i;
  throw std::invalid_argument( fmt::format( "Unknown {} '{}'", what, name ) );
}

bool pred_ci( char a, char b )
{
  return std::tolower( static_cast<unsigned char>( a ) ) ==
         std::tolower( static_cast<unsigned char>( b ) );
}

} // UNNAMED NAMESPACE =======================================================

// form_type_string =========================================================

const char* util::form_type_string( form_e f )
{
  switch ( f )
  {
    case FORM_CAT:    return "cat";
    case FORM_BEAR:   return "bear";
    case FORM_CASTER: return "caster";
    default:          return "unknown";
  }
}

// resource_type_string =====================================================

const char* util::resource_type_string( resource_e r )
{
  switch ( r )
  {
    case RESOURCE_NONE:        return "none";
    case RESOURCE_MANA:        return "mana";
    case RESOURCE_RAGE:        return "rage";
    case RESOURCE_ENERGY:      return "energy";
    case RESOURCE_COMBO_POINT: return "combo_points";
    default:                   return "unknown";
  }
}

// result_type_string =======================================================

const char* util::result_type_string( result_e r )
{
  switch ( r )
  {
    case RESULT_NONE:   return "none";
    case RESULT_MISS:   return "miss";
    case RESULT_GLANCE: return "glance";
    case RESULT_CRIT:   return "crit";
    case RESULT_HIT:    return "hit";
    default:            return "unknown";
  }
}

// stat_type_string =========================================================

const char* util::stat_type_string( stat_e stat )
{
  switch ( stat )
  {
    case STAT_NONE:             return "none";
    case STAT_ATTACK_POWER:     return "attack_power";
    case STAT_AGILITY:          return "agility";
    case STAT_CRIT_CHANCE:      return "crit_chance";
    case STAT_HIT_CHANCE:       return "hit_chance";
    case STAT_MISS_CHANCE:      return "miss_chance";
    case STAT_EXPERTISE_RATING: return "expertise_rating";
    case STAT_HASTE_RATING:     return "haste_rating";
    case STAT_HASTE_MULTIPLIER: return "haste_multiplier";
    case STAT_ARMOR_PEN_RATING: return "armor_pen_rating";
    case STAT_WEAPON_DAMAGE:    return "weapon_damage";
    case STAT_MANA:             return "mana";
    case STAT_INTELLECT:        return "intellect";
    case STAT_SPIRIT:           return "spirit";
    case STAT_MP5:              return "mp5";
    default:                    return "unknown";
  }
}

// ability_type_string ======================================================

const char* util::ability_type_string( ability_e a )
{
  switch ( a )
  {
    case ABILITY_MELEE:             return "Melee";
    case ABILITY_MANGLE_CAT:        return "Mangle (Cat)";
    case ABILITY_RAKE:              return "Rake";
    case ABILITY_SHRED:             return "Shred";
    case ABILITY_SAVAGE_ROAR:       return "Savage Roar";
    case ABILITY_RIP:               return "Rip";
    case ABILITY_FEROCIOUS_BITE:    return "Ferocious Bite";
    case ABILITY_FAERIE_FIRE_CAT:   return "Faerie Fire (Cat)";
    case ABILITY_SHIFT_BEAR:        return "Shift (Bear)";
    case ABILITY_MAUL:              return "Maul";
    case ABILITY_MANGLE_BEAR:       return "Mangle (Bear)";
    case ABILITY_LACERATE:          return "Lacerate";
    case ABILITY_SHIFT_CAT:         return "Shift (Cat)";
    case ABILITY_GIFT_OF_THE_WILD:  return "Gift of the Wild";
    case ABILITY_FAERIE_FIRE_BEAR:  return "Faerie Fire (Bear)";
    default:                        return "unknown";
  }
}

// dot_type_string ==========================================================

const char* util::dot_type_string( dot_e d )
{
  switch ( d )
  {
    case DOT_RIP:      return "rip";
    case DOT_RAKE:     return "rake";
    case DOT_LACERATE: return "lacerate";
    default:           return "unknown";
  }
}

// cooldown_type_string =====================================================

const char* util::cooldown_type_string( cooldown_e c )
{
  switch ( c )
  {
    case COOLDOWN_TIGERS_FURY: return "tigers_fury";
    case COOLDOWN_BERSERK:     return "berserk";
    case COOLDOWN_ENRAGE:      return "enrage";
    case COOLDOWN_MANGLE_BEAR: return "mangle_bear";
    case COOLDOWN_FAERIE_FIRE: return "faerie_fire";
    case COOLDOWN_RUNE:        return "rune";
    case COOLDOWN_ILOTP:       return "improved_leader_of_the_pack";
    default:                   return "unknown";
  }
}

// effect_behavior_string ===================================================

const char* util::effect_behavior_string( effect_behavior_e b )
{
  switch ( b )
  {
    case EFFECT_FIXED_USE:       return "fixed_use";
    case EFFECT_CHANCE_PROC:     return "chance_proc";
    case EFFECT_STACKING_PROC:   return "stacking_proc";
    case EFFECT_REFRESHING_PROC: return "refreshing_proc";
    case EFFECT_INSTANT_DAMAGE:  return "instant_damage";
    default:                     return "unknown";
  }
}

// proc_trigger_string ======================================================

const char* util::proc_trigger_string( proc_trigger_e t )
{
  switch ( t )
  {
    case PROC_TRIGGER_ANY:        return "any";
    case PROC_TRIGGER_MANGLE:     return "mangle";
    case PROC_TRIGGER_CAT_MANGLE: return "cat_mangle";
    case PROC_TRIGGER_SHRED:      return "shred";
    default:                      return "unknown";
  }
}

// parse_stat_type ==========================================================

stat_e util::parse_stat_type( const std::string& name )
{
  if ( str_compare_ci( name, "ap" ) )  return STAT_ATTACK_POWER;
  if ( str_compare_ci( name, "agi" ) ) return STAT_AGILITY;
  if ( str_compare_ci( name, "arp" ) ) return STAT_ARMOR_PEN_RATING;

  return parse_enum<stat_e, STAT_ATTACK_POWER, STAT_MAX, stat_type_string>( name, "stat" );
}

// parse_effect_behavior ====================================================

effect_behavior_e util::parse_effect_behavior( const std::string& name )
{
  return parse_enum<effect_behavior_e, EFFECT_FIXED_USE, EFFECT_BEHAVIOR_MAX, effect_behavior_string>( name, "effect behavior" );
}

// parse_proc_trigger =======================================================

proc_trigger_e util::parse_proc_trigger( const std::string& name )
{
  return parse_enum<proc_trigger_e, PROC_TRIGGER_ANY, PROC_TRIGGER_MAX, proc_trigger_string>( name, "proc trigger" );
}

// parse_aura_trigger =======================================================

aura_trigger_e util::parse_aura_trigger( const std::string& name )
{
  if ( str_compare_ci( name, "activated" ) ) return AURA_ACTIVATED;
  if ( str_compare_ci( name, "proc" ) )      return AURA_PROC;
  throw std::invalid_argument( fmt::format( "Unknown aura trigger '{}'", name ) );
}

// string_split =============================================================

std::vector<std::string> util::string_split( const std::string& str, const std::string& delim )
{
  std::vector<std::string> results;
  if ( str.empty() )
    return results;

  std::string::size_type cut_pt, start = 0;

  while ( ( cut_pt = str.find_first_of( delim, start ) ) != std::string::npos )
  {
    if ( cut_pt > start ) // Found something, push to the vector
      results.push_back( str.substr( start, cut_pt - start ) );

    start = cut_pt + 1; // skip the found delimeter
  }

  if ( start < str.size() )
    results.push_back( str.substr( start ) );

  return results;
}

// string_strip =============================================================

std::string util::string_strip( const std::string& str )
{
  const char* ws = " \t\r\n";
  auto first = str.find_first_not_of( ws );
  if ( first == std::string::npos )
    return std::string();
  auto last = str.find_last_not_of( ws );
  return str.substr( first, last - first + 1 );
}

// str_compare_ci ===========================================================

bool util::str_compare_ci( const std::string& l, const std::string& r )
{
  if ( l.size() != r.size() )
    return false;

  return std::equal( l.begin(), l.end(), r.begin(), pred_ci );
}

// str_begins_with ==========================================================

bool util::str_begins_with( const std::string& str, const std::string& beginsWith )
{
  return str.compare( 0, beginsWith.size(), beginsWith ) == 0;
}

// to_double ================================================================

double util::to_double( const std::string& str )
{
  std::size_t pos = 0;
  double v = std::stod( str, &pos );
  if ( pos != str.size() )
    throw std::invalid_argument( fmt::format( "'{}' is not a number", str ) );
  return v;
}

// to_int ===================================================================

int util::to_int( const std::string& str )
{
  std::size_t pos = 0;
  int v = std::stoi( str, &pos );
  if ( pos != str.size() )
    throw std::invalid_argument( fmt::format( "'{}' is not an integer", str ) );
  return v;
}

// to_unsigned ==============================================================

unsigned util::to_unsigned( const std::string& str )
{
  int v = to_int( str );
  if ( v < 0 )
    throw std::invalid_argument( fmt::format( "'{}' is negative", str ) );
  return static_cast<unsigned>( v );
}

// to_bool ==================================================================

bool util::to_bool( const std::string& str )
{
  if ( str == "1" || str_compare_ci( str, "true" ) )  return true;
  if ( str == "0" || str_compare_ci( str, "false" ) ) return false;
  throw std::invalid_argument( fmt::format( "'{}' is not a boolean (0/1)", str ) );
}

// round ====================================================================

double util::round( double X, unsigned int decplaces )
{
  double p = std::pow( 10.0, static_cast<double>( decplaces ) );
  return std::round( X * p ) / p;
}

// print_chained_exception ==================================================

void util::print_chained_exception( const std::exception& e, std::FILE* out, int level )
{
  fmt::print( out, "{}{}", level > 0 ? ": " : "", e.what() );
  try
  {
    std::rethrow_if_nested( e );
  }
  catch ( const std::exception& nested )
  {
    print_chained_exception( nested, out, level + 1 );
  }
}

void util::print_chained_exception( std::exception_ptr eptr, std::FILE* out, int level )
{
  try
  {
    if ( eptr )
      std::rethrow_exception( eptr );
  }
  catch ( const std::exception& e )
  {
    print_chained_exception( e, out, level );
  }
}
