#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <tessera/config.hpp>
#include <tessera/ledger.hpp>
#include <tessera/log.hpp>
#include <tessera/script.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto service = "tessera"s;
constexpr auto version = "v0.1.0"s;

constexpr auto help_option            = "help,h"s;
constexpr auto version_option         = "version,v"s;
constexpr auto basedir_option         = "basedir,d"s;
constexpr auto log_level_option       = "log-level,l"s;
constexpr auto log_level_default      = "info"s;
constexpr auto name_option            = "name,n"s;
constexpr auto symbol_option          = "symbol,s"s;
constexpr auto decimals_option        = "decimals"s;
constexpr auto initial_supply_option  = "initial-supply"s;
constexpr auto creator_option         = "creator,c"s;
constexpr auto creator_default        = ""s;
constexpr auto script_option          = "script,x"s;
constexpr auto script_default         = ""s;

} // namespace constants

auto main( int argc, char** argv ) -> int
{
  try
  {
    boost::program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()          , "Print this help message and exit" )
      ( constants::version_option.data()       , "Print version string and exit" )
      ( constants::basedir_option.data()       , boost::program_options::value< std::string >()->default_value( std::filesystem::current_path().string() ), "Base directory holding config.yml" )
      ( constants::log_level_option.data()     , boost::program_options::value< std::string >(), "The log filtering level" )
      ( constants::name_option.data()          , boost::program_options::value< std::string >(), "The token name" )
      ( constants::symbol_option.data()        , boost::program_options::value< std::string >(), "The token symbol" )
      ( constants::decimals_option.data()      , boost::program_options::value< unsigned int >(), "The number of decimal places" )
      ( constants::initial_supply_option.data(), boost::program_options::value< std::uint64_t >(), "The initial supply in whole units" )
      ( constants::creator_option.data()       , boost::program_options::value< std::string >(), "The hex encoded creator account" )
      ( constants::script_option.data()        , boost::program_options::value< std::string >(), "A YAML script of ledger calls to run (absolute path or relative to basedir)" );
    // clang-format on

    boost::program_options::variables_map args;
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );

    if( args.count( tessera::config::long_name( constants::help_option ) ) )
    {
      options.print( std::cout );
      return EXIT_SUCCESS;
    }

    if( args.count( tessera::config::long_name( constants::version_option ) ) )
    {
      std::cout << constants::version << '\n';
      return EXIT_SUCCESS;
    }

    auto basedir =
      std::filesystem::path( args[ tessera::config::long_name( constants::basedir_option ) ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node config = tessera::config::load( basedir );
    YAML::Node global_config;
    YAML::Node tessera_config;

    if( config.IsMap() )
    {
      global_config  = config[ "global" ];
      tessera_config = config[ constants::service ];
    }

    // clang-format off
    auto log_level      = tessera::config::get_option< std::string >( constants::log_level_option, constants::log_level_default, args, tessera_config, global_config );
    auto name           = tessera::config::get_option< std::string >( constants::name_option, std::string( tessera::ledger::defaults::name ), args, tessera_config, global_config );
    auto symbol         = tessera::config::get_option< std::string >( constants::symbol_option, std::string( tessera::ledger::defaults::symbol ), args, tessera_config, global_config );
    auto decimals       = tessera::config::get_option< unsigned int >( constants::decimals_option, tessera::ledger::defaults::decimals, args, tessera_config, global_config );
    auto initial_supply = tessera::config::get_option< std::uint64_t >( constants::initial_supply_option, tessera::ledger::defaults::supply_units, args, tessera_config, global_config );
    auto creator_hex    = tessera::config::get_option< std::string >( constants::creator_option, constants::creator_default, args, tessera_config, global_config );
    auto script_file    = tessera::config::get_option< std::string >( constants::script_option, constants::script_default, args, tessera_config, global_config );
    // clang-format on

    tessera::log::initialize();
    tessera::log::set_level( log_level );

    LOG_INFO( tessera::log::instance(), "tessera {}", constants::version );

    if( config.IsNull() )
      LOG_WARNING( tessera::log::instance(),
                   "Could not find config (config.yml or config.yaml expected). Using default values" );

    if( decimals > std::numeric_limits< std::uint8_t >::max() )
      throw std::runtime_error( "decimals must not exceed " +
                                std::to_string( std::numeric_limits< std::uint8_t >::max() ) );

    if( creator_hex.empty() )
      throw std::runtime_error( "a creator account is required" );

    auto creator = tessera::protocol::account_from_hex( creator_hex );
    if( !creator )
      throw std::runtime_error( "creator '" + creator_hex + "': " + creator.error().message() );

    auto genesis = tessera::ledger::make_genesis( *creator, initial_supply, static_cast< std::uint8_t >( decimals ) );
    if( !genesis )
      throw std::runtime_error( "unable to scale initial supply: " + genesis.error().message() );

    genesis->name   = name;
    genesis->symbol = symbol;

    tessera::ledger::ledger ledger( *genesis );

    if( !script_file.empty() )
    {
      auto script_path = std::filesystem::path( script_file );
      if( script_path.is_relative() )
        script_path = basedir / script_path;

      LOG_INFO( tessera::log::instance(), "Running script: {}", script_path.string() );

      auto outcomes = tessera::script::execute_file( ledger, script_path );

      std::size_t rejected = 0;
      for( const auto& o: outcomes )
        if( o.error )
          ++rejected;

      LOG_INFO( tessera::log::instance(), "Script complete - Calls: {}, Rejected: {}", outcomes.size(), rejected );
    }

    auto owner = ledger.owner();

    LOG_INFO( tessera::log::instance(),
              "Total supply: {}, Owner: {}, Events: {}",
              ledger.total_supply(),
              tessera::log::hex{ owner.data(), owner.size() },
              ledger.events().size() );
  }
  catch( const std::exception& e )
  {
    tessera::log::initialize();
    LOG_ERROR( tessera::log::instance(), "{}", e.what() );
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
