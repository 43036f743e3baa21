// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

// ==========================================================================
// Collection of generic programming code
// ==========================================================================

#pragma once

#include "config.hpp"

#include <type_traits>

// iterable enumeration templates ===========================================

/*
 * Enumeration types implicitly convert to int but not from int, so
 * "for ( ability_e i = ABILITY_MELEE; i < ABILITY_MAX; ++i )" would not
 * compile. The operators below convert through int and back for every type
 * for which is_iterable_enum<T> is true.
 */

// All enumerations are iterable by default.
template <typename T>
struct is_iterable_enum : public std::is_enum<T> {};

template <typename T>
inline std::enable_if_t<is_iterable_enum<T>::value, T&>
operator ++ ( T& s )
{ return s = static_cast<T>( s + 1 ); }

template <typename T>
inline std::enable_if_t<is_iterable_enum<T>::value, T>
operator ++ ( T& s, int )
{
  T tmp = s;
  ++s;
  return tmp;
}

// Generic programming tools ================================================

class noncopyable
{
public:
  noncopyable() = default;
  noncopyable( const noncopyable& ) = delete;
  noncopyable& operator = ( const noncopyable& ) = delete;
};
