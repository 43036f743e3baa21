// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

// ==========================================================================
// Custom Time class
// ==========================================================================

#pragma once

#include "config.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <type_traits>

#include <fmt/format.h>

namespace fc
{

  /**
   * @brief Class for representing combat time.
   *
   * Combat events are resolved on a millisecond clock. The class keeps that
   * format exact and type-safe: there is no implicit conversion from or to
   * integral or floating point numbers.
   */
  class timespan_t
  {
  private:
    using time_t = int_least64_t;

    time_t time;

    template<typename Rep>
    explicit constexpr timespan_t(Rep t) :
        time(static_cast<time_t>(t))
    {
    }

  public:
    constexpr timespan_t() : time( 0 )
    { }

    constexpr double total_minutes() const
    {
      return static_cast<double>(time) * (1.0 / (60 * 1000));
    }
    constexpr double total_seconds() const
    {
      return static_cast<double>(time) * (1.0 / 1000);
    }
    constexpr time_t total_millis() const
    {
      return time;
    }

    template <typename Rep, typename = std::enable_if_t<std::is_arithmetic<Rep>::value>>
    static constexpr timespan_t from_millis(Rep millis)
    {
      return timespan_t(millis);
    }

    template <typename Rep, typename = std::enable_if_t<std::is_arithmetic<Rep>::value>>
    static constexpr timespan_t from_seconds(Rep seconds)
    {
      if constexpr (std::is_floating_point<Rep>::value)
        return timespan_t(static_cast<time_t>(seconds * 1000 + (seconds < 0 ? -0.5 : 0.5)));
      else
        return timespan_t(static_cast<time_t>(seconds * 1000));
    }

    // Rounds up to the next whole millisecond. Used for "resource becomes
    // available at" predictions, which must never wake up early.
    static timespan_t from_seconds_ceil(double seconds)
    {
      return timespan_t(static_cast<time_t>(std::ceil(seconds * 1000 - FC_EPSILON)));
    }

    template <typename Rep, typename = std::enable_if_t<std::is_arithmetic<Rep>::value>>
    static constexpr timespan_t from_minutes(Rep minutes)
    {
      return timespan_t(static_cast<time_t>(minutes * (60 * 1000)));
    }

    constexpr bool operator==(timespan_t right) const
    { return time == right.time; }
    constexpr bool operator!=(timespan_t right) const
    { return time != right.time; }
    constexpr bool operator>(timespan_t right) const
    { return time > right.time; }
    constexpr bool operator>=(timespan_t right) const
    { return time >= right.time; }
    constexpr bool operator<(timespan_t right) const
    { return time < right.time; }
    constexpr bool operator<=(timespan_t right) const
    { return time <= right.time; }

    constexpr timespan_t& operator+=(timespan_t right)
    {
      time += right.time;
      return *this;
    }
    constexpr timespan_t& operator-=(timespan_t right)
    {
      time -= right.time;
      return *this;
    }

    template <typename Rep, typename = std::enable_if_t<std::is_arithmetic<Rep>::value>>
    constexpr timespan_t& operator*=(Rep right)
    {
      time = static_cast<time_t>(time * right);
      return *this;
    }

    template <typename Rep, typename = std::enable_if_t<std::is_arithmetic<Rep>::value>>
    constexpr timespan_t& operator/=(Rep right)
    {
      time = static_cast<time_t>(time / right);
      return *this;
    }

    friend constexpr timespan_t operator-(timespan_t right)
    { return timespan_t(-right.time); }

    friend constexpr timespan_t operator+(timespan_t left, timespan_t right)
    { return left += right; }

    friend constexpr timespan_t operator-(timespan_t left, timespan_t right)
    { return left -= right; }

    template <typename Rep>
    friend constexpr auto operator*(timespan_t left, Rep right) -> std::enable_if_t<std::is_arithmetic<Rep>::value, timespan_t>
    { return left *= right; }

    template <typename Rep>
    friend constexpr auto operator*(Rep left, timespan_t right) -> std::enable_if_t<std::is_arithmetic<Rep>::value, timespan_t>
    { return right *= left; }

    template <typename Rep>
    friend constexpr auto operator/(timespan_t left, Rep right) -> std::enable_if_t<std::is_arithmetic<Rep>::value, timespan_t>
    { return left /= right; }

    friend constexpr double operator/(timespan_t left, timespan_t right)
    { return static_cast<double>(left.time) / right.time; }

    static constexpr timespan_t zero()
    { return timespan_t(); }
    static constexpr timespan_t max()
    { return timespan_t( std::numeric_limits<time_t>::max() ); }
    static constexpr timespan_t min()
    { return timespan_t( std::numeric_limits<time_t>::min() ); }
  };

  void sc_format_to( timespan_t, fmt::format_context::iterator );
} // namespace fc

using fc::timespan_t;
