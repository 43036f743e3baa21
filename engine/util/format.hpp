// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include <type_traits>
#include <utility>

#include <fmt/format.h>

// Any type providing a free sc_format_to( const T&, fmt::format_context::iterator )
// found through ADL can be used directly in a format string.

namespace util {
namespace detail {

template <typename T, typename = void>
struct has_format_to : std::false_type {};

template <typename T>
struct has_format_to<T, std::void_t<decltype( sc_format_to( std::declval<const T&>(),
                                                            std::declval<fmt::format_context::iterator>() ) )>>
  : std::true_type {};

} // namespace detail
} // namespace util

namespace fmt {

template <typename T>
struct formatter<T, char, std::enable_if_t<util::detail::has_format_to<T>::value>> {
  constexpr auto parse( format_parse_context& ctx ) { return ctx.begin(); }

  auto format( const T& v, format_context& ctx ) const
  {
    sc_format_to( v, ctx.out() );
    return ctx.out();
  }
};

} // namespace fmt
