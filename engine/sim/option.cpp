// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "option.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include "util/util.hpp"

namespace { // UNNAMED NAMESPACE ==========================================

struct opts_string_t : public option_t
{
  std::string& ref;
  opts_string_t( std::string n, std::string& r ) : option_t( std::move( n ) ), ref( r ) { }

  opts::parse_status do_parse( sim_t*, const std::string& n, const std::string& v ) const override
  {
    if ( n != name() )
      return opts::parse_status::NOT_FOUND;
    ref = v;
    return opts::parse_status::OK;
  }
};

template <typename T>
struct opts_numeric_t : public option_t
{
  T& ref;
  T min, max;
  bool bounded;

  opts_numeric_t( std::string n, T& r ) :
    option_t( std::move( n ) ), ref( r ), min( T() ), max( T() ), bounded( false ) { }
  opts_numeric_t( std::string n, T& r, T mn, T mx ) :
    option_t( std::move( n ) ), ref( r ), min( mn ), max( mx ), bounded( true ) { }

  static T convert( const std::string& v );

  opts::parse_status do_parse( sim_t*, const std::string& n, const std::string& v ) const override
  {
    if ( n != name() )
      return opts::parse_status::NOT_FOUND;

    T value = convert( v );
    if ( bounded && ( value < min || value > max ) )
    {
      throw std::invalid_argument(
          fmt::format( "Option '{}' value '{}' not within valid range [{}, {}]", n, v, min, max ) );
    }
    ref = value;
    return opts::parse_status::OK;
  }
};

template <> int opts_numeric_t<int>::convert( const std::string& v )
{ return util::to_int( v ); }

template <> unsigned opts_numeric_t<unsigned>::convert( const std::string& v )
{ return util::to_unsigned( v ); }

template <> double opts_numeric_t<double>::convert( const std::string& v )
{ return util::to_double( v ); }

struct opts_bool_t : public option_t
{
  bool& ref;
  opts_bool_t( std::string n, bool& r ) : option_t( std::move( n ) ), ref( r ) { }

  opts::parse_status do_parse( sim_t*, const std::string& n, const std::string& v ) const override
  {
    if ( n != name() )
      return opts::parse_status::NOT_FOUND;
    ref = util::to_bool( v );
    return opts::parse_status::OK;
  }
};

struct opts_timespan_t : public option_t
{
  timespan_t& ref;
  opts_timespan_t( std::string n, timespan_t& r ) : option_t( std::move( n ) ), ref( r ) { }

  opts::parse_status do_parse( sim_t*, const std::string& n, const std::string& v ) const override
  {
    if ( n != name() )
      return opts::parse_status::NOT_FOUND;
    ref = timespan_t::from_seconds( util::to_double( v ) );
    return opts::parse_status::OK;
  }
};

struct opts_func_t : public option_t
{
  opts::function_t fun;
  opts_func_t( std::string n, opts::function_t f ) : option_t( std::move( n ) ), fun( std::move( f ) ) { }

  opts::parse_status do_parse( sim_t* sim, const std::string& n, const std::string& v ) const override
  {
    if ( n != name() )
      return opts::parse_status::NOT_FOUND;
    return fun( sim, n, v ) ? opts::parse_status::OK : opts::parse_status::FAILURE;
  }
};

} // UNNAMED NAMESPACE ====================================================

std::unique_ptr<option_t> opt_string( std::string n, std::string& v )
{ return std::make_unique<opts_string_t>( std::move( n ), v ); }

std::unique_ptr<option_t> opt_int( std::string n, int& v )
{ return std::make_unique<opts_numeric_t<int>>( std::move( n ), v ); }

std::unique_ptr<option_t> opt_int( std::string n, int& v, int min, int max )
{ return std::make_unique<opts_numeric_t<int>>( std::move( n ), v, min, max ); }

std::unique_ptr<option_t> opt_uint( std::string n, unsigned& v )
{ return std::make_unique<opts_numeric_t<unsigned>>( std::move( n ), v ); }

std::unique_ptr<option_t> opt_uint( std::string n, unsigned& v, unsigned min, unsigned max )
{ return std::make_unique<opts_numeric_t<unsigned>>( std::move( n ), v, min, max ); }

std::unique_ptr<option_t> opt_float( std::string n, double& v )
{ return std::make_unique<opts_numeric_t<double>>( std::move( n ), v ); }

std::unique_ptr<option_t> opt_float( std::string n, double& v, double min, double max )
{ return std::make_unique<opts_numeric_t<double>>( std::move( n ), v, min, max ); }

std::unique_ptr<option_t> opt_bool( std::string n, bool& v )
{ return std::make_unique<opts_bool_t>( std::move( n ), v ); }

std::unique_ptr<option_t> opt_timespan( std::string n, timespan_t& v )
{ return std::make_unique<opts_timespan_t>( std::move( n ), v ); }

std::unique_ptr<option_t> opt_func( std::string n, opts::function_t f )
{ return std::make_unique<opts_func_t>( std::move( n ), std::move( f ) ); }

// opts::parse ==============================================================

void opts::parse( sim_t* sim, const option_list_t& options, const std::string& name, const std::string& value )
{
  for ( const auto& option : options )
  {
    switch ( option -> parse( sim, name, value ) )
    {
      case opts::parse_status::OK:
        return;
      case opts::parse_status::FAILURE:
        throw std::invalid_argument( fmt::format( "Option '{}' rejected value '{}'", name, value ) );
      default:
        break;
    }
  }

  throw std::invalid_argument( fmt::format( "Unknown option '{}' with value '{}'", name, value ) );
}

void opts::parse( sim_t* sim, const std::string& context, const option_list_t& options,
                  const std::string& options_str )
{
  for ( const std::string& token : util::string_split( options_str, "," ) )
  {
    std::string::size_type cut_pt = token.find( '=' );
    if ( cut_pt == std::string::npos )
    {
      throw std::invalid_argument(
          fmt::format( "{}: Unexpected parameter '{}'. Expected format: name=value", context, token ) );
    }

    try
    {
      parse( sim, options, token.substr( 0, cut_pt ), token.substr( cut_pt + 1 ) );
    }
    catch ( const std::exception& )
    {
      std::throw_with_nested( std::invalid_argument( fmt::format( "{}: Cannot parse '{}'", context, token ) ) );
    }
  }
}

// ==========================================================================
// Option Database
// ==========================================================================

// option_db_t::parse_file ==================================================

void option_db_t::parse_file( std::FILE* file )
{
  char buffer[ 1024 ];
  while ( std::fgets( buffer, sizeof( buffer ), file ) )
  {
    std::string line = util::string_strip( buffer );
    if ( line.empty() || line[ 0 ] == '#' )
      continue;
    parse_line( line );
  }
}

void option_db_t::parse_text( const std::string& text )
{
  for ( const std::string& line : util::string_split( text, "\n\r" ) )
  {
    std::string l = util::string_strip( line );
    if ( l.empty() || l[ 0 ] == '#' )
      continue;
    parse_line( l );
  }
}

// option_db_t::parse_line ==================================================

void option_db_t::parse_line( const std::string& line )
{
  if ( line.empty() || line[ 0 ] == '#' )
    return;

  for ( const std::string& token : util::string_split( line, " \t\n\r" ) )
    parse_token( token );
}

// option_db_t::parse_token =================================================

// A token without '=' names a file of further options.
void option_db_t::parse_token( const std::string& token )
{
  std::string::size_type cut_pt = token.find( '=' );

  std::string file_name;
  if ( cut_pt == std::string::npos )
    file_name = token;
  else if ( token.compare( 0, cut_pt, "input" ) == 0 )
    file_name = token.substr( cut_pt + 1 );

  if ( ! file_name.empty() )
  {
    std::FILE* file = std::fopen( file_name.c_str(), "r" );
    if ( ! file )
    {
      throw std::invalid_argument(
          fmt::format( "Unexpected parameter '{}'. Expected format: name=value", token ) );
    }
    try
    {
      parse_file( file );
    }
    catch ( ... )
    {
      std::fclose( file );
      throw;
    }
    std::fclose( file );
    return;
  }

  add( "global", token.substr( 0, cut_pt ), token.substr( cut_pt + 1 ) );
}

// option_db_t::parse_args ==================================================

void option_db_t::parse_args( const std::vector<std::string>& args )
{
  for ( const auto& arg : args )
    parse_line( arg );
}
