// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

// Statistical Sample Data Container

class sample_data_t
{
public:
  std::string name_str;

  // Analyzed Results
  double sum;
  double min;
  double max;

  double mean;
  double variance;
  double std_dev;
  double population_std_dev;
  double mean_std_dev;
  bool simple;

private:
  std::vector<double> _data;
  std::vector<double> _sorted_data;
  size_t count;

  bool analyzed_basics;
  bool analyzed_variance;
  bool is_sorted;

public:
  sample_data_t( bool s = true ) : sample_data_t( std::string(), s )
  { }

  sample_data_t( const std::string& n, bool s = true ) :
    name_str( n ),
    sum( 0 ),
    min( d_max() ),
    max( d_min() ),
    mean( 0 ),
    variance( 0 ),
    std_dev( 0 ),
    population_std_dev( 0 ),
    mean_std_dev( 0 ),
    simple( s ), count( 0 ),
    analyzed_basics( false ), analyzed_variance( false ),
    is_sorted( false )
  { }

  // Add a sample
  void add( double x )
  {
    if ( simple )
    {
      if ( x < min ) min = x;
      if ( x > max ) max = x;
      sum += x;
      ++count;
    }
    else
    {
      _data.push_back( x );
    }

    analyzed_basics = analyzed_variance = is_sorted = false;
  }

  size_t size() const { return simple ? count : _data.size(); }

  // Analyze collected data
  void analyze()
  {
    sort();
    analyze_basics();
    analyze_variance();
  }

  /*
   *  Analyze Basics:
   *  Simple: Mean, min/max
   *  !Simple: Sum, Mean, min/max
   */
  void analyze_basics()
  {
    if ( analyzed_basics )
      return;
    analyzed_basics = true;

    if ( simple )
    {
      if ( count > 0 )
        mean = sum / count;
      return;
    }

    if ( _data.empty() )
      return;

    // Summed in insertion order so the result does not depend on sorting
    sum = std::accumulate( _data.begin(), _data.end(), 0.0 );
    auto mm = std::minmax_element( _data.begin(), _data.end() );
    min = *mm.first;
    max = *mm.second;
    mean = sum / _data.size();
  }

  /*
   *  Analyze Variance: sample and population standard deviation, and
   *  standard deviation of the mean
   */
  void analyze_variance()
  {
    if ( analyzed_variance )
      return;
    analyzed_variance = true;

    if ( simple )
      return;

    analyze_basics();

    size_t sample_size = _data.size();
    if ( sample_size == 0 )
      return;

    double sq_sum = 0;
    for ( double v : _data )
    {
      double delta = v - mean;
      sq_sum += delta * delta;
    }

    population_std_dev = std::sqrt( sq_sum / sample_size );

    variance = sample_size > 1 ? sq_sum / ( sample_size - 1 ) : 0.0;
    std_dev = std::sqrt( variance );

    // Standard Deviation of the Mean ( Central Limit Theorem )
    if ( sample_size > 1 )
      mean_std_dev = std::sqrt( variance / sample_size );
  }

  void sort()
  {
    if ( is_sorted || simple )
      return;

    _sorted_data = _data;
    std::sort( _sorted_data.begin(), _sorted_data.end() );
    is_sorted = true;
  }

  void clear()
  {
    count = 0; sum = 0; mean = 0;
    variance = std_dev = population_std_dev = mean_std_dev = 0;
    min = d_max(); max = d_min();
    _sorted_data.clear(); _data.clear();
    analyzed_basics = analyzed_variance = is_sorted = false;
  }

  // Nearest-rank percentile of sorted data
  double percentile( double x ) const
  {
    assert( x >= 0 && x <= 1.0 );

    if ( simple || ! is_sorted || _sorted_data.empty() )
      return 0;

    return _sorted_data[ static_cast<size_t>( x * ( _sorted_data.size() - 1 ) ) ];
  }

private:
  static double d_min() { return -std::numeric_limits<double>::infinity(); }
  static double d_max() { return  std::numeric_limits<double>::infinity(); }
}; // sample_data_t
