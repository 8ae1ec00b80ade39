#include <tessera/config/options.hpp>

namespace tessera::config {

std::string long_name( std::string_view option )
{
  return std::string( option.substr( 0, option.find( ',' ) ) );
}

YAML::Node load( const std::filesystem::path& basedir )
{
  for( const auto* file: { "config.yml", "config.yaml" } )
  {
    if( auto path = basedir / file; std::filesystem::exists( path ) )
      return YAML::LoadFile( path.string() );
  }

  return {};
}

} // namespace tessera::config
