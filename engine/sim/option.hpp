// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include <cstdio>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "util/timespan.hpp"

struct sim_t;

namespace opts {

enum class parse_status : unsigned
{
  FAILURE,
  OK,
  NOT_FOUND
};

using function_t = std::function<bool( sim_t*, const std::string&, const std::string& )>;

} // namespace opts

// Named, typed reference to a configuration field. Parsing a value that does
// not convert throws std::invalid_argument.
struct option_t
{
public:
  explicit option_t( std::string name ) : _name( std::move( name ) ) { }
  virtual ~option_t() = default;

  opts::parse_status parse( sim_t* sim, const std::string& name, const std::string& value ) const
  { return do_parse( sim, name, value ); }

  const std::string& name() const
  { return _name; }

protected:
  virtual opts::parse_status do_parse( sim_t*, const std::string& name, const std::string& value ) const = 0;

private:
  std::string _name;
};

using option_list_t = std::vector<std::unique_ptr<option_t>>;

std::unique_ptr<option_t> opt_string( std::string name, std::string& addr );
std::unique_ptr<option_t> opt_int( std::string name, int& addr );
std::unique_ptr<option_t> opt_int( std::string name, int& addr, int min, int max );
std::unique_ptr<option_t> opt_uint( std::string name, unsigned& addr );
std::unique_ptr<option_t> opt_uint( std::string name, unsigned& addr, unsigned min, unsigned max );
std::unique_ptr<option_t> opt_float( std::string name, double& addr );
std::unique_ptr<option_t> opt_float( std::string name, double& addr, double min, double max );
std::unique_ptr<option_t> opt_bool( std::string name, bool& addr );
std::unique_ptr<option_t> opt_timespan( std::string name, timespan_t& addr );
std::unique_ptr<option_t> opt_func( std::string name, opts::function_t fun );

namespace opts {

// Applies one name=value pair; throws std::invalid_argument when no option
// of that name exists or the value is rejected.
void parse( sim_t*, const option_list_t&, const std::string& name, const std::string& value );

// Comma separated name=value list, e.g. an effect definition.
void parse( sim_t*, const std::string& context, const option_list_t&, const std::string& options_str );

} // namespace opts

// Ordered name=value tokens collected from the command line and input files
struct option_tuple_t
{
  std::string scope, name, value;
  option_tuple_t( const std::string& s, const std::string& n, const std::string& v ) :
    scope( s ), name( n ), value( v ) { }
};

struct option_db_t : public std::vector<option_tuple_t>
{
  void add( const std::string& scope, const std::string& name, const std::string& value )
  { push_back( option_tuple_t( scope, name, value ) ); }

  void parse_file( std::FILE* file );
  void parse_text( const std::string& text );
  void parse_line( const std::string& line );
  void parse_token( const std::string& token );
  void parse_args( const std::vector<std::string>& args );
};
