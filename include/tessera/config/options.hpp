#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

namespace tessera::config {

// "log-level,l" -> "log-level"
std::string long_name( std::string_view option );

// Loads <basedir>/config.yml, falling back to config.yaml. Null when neither exists.
YAML::Node load( const std::filesystem::path& basedir );

template< typename T >
std::optional< T > find_option( const std::string& name, const YAML::Node& node )
{
  if( !node.IsDefined() || !node.IsMap() )
    return {};

  if( auto value = node[ name ]; value )
    return value.as< T >();

  return {};
}

/**
 * Resolves an option from the command line first, then from each YAML node in
 * the order given, then falls back to the default.
 */
template< typename T, typename... Nodes >
T get_option( std::string_view option,
              const T& default_value,
              const boost::program_options::variables_map& args,
              const Nodes&... nodes )
{
  const auto name = long_name( option );

  if( args.count( name ) )
    return args[ name ].as< T >();

  std::optional< T > value;
  ( ( value = value ? value : find_option< T >( name, nodes ) ), ... );

  return value.value_or( default_value );
}

} // namespace tessera::config
