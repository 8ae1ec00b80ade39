#include <tessera/script/script.hpp>

#include <functional>
#include <map>
#include <stdexcept>
#include <string_view>

#include <tessera/log.hpp>

namespace tessera::script {

namespace {

class entry_reader
{
public:
  entry_reader( const YAML::Node& node, std::size_t index ):
      _node( node ),
      _index( index )
  {
    if( !_node.IsMap() )
      fail( "expected a map" );
  }

  std::string text( const std::string& field ) const
  {
    auto value = _node[ field ];
    if( !value || !value.IsScalar() )
      fail( "missing field '" + field + "'" );

    return value.as< std::string >();
  }

  protocol::account account( const std::string& field ) const
  {
    auto a = protocol::account_from_hex( text( field ) );
    if( !a )
      fail( "field '" + field + "': " + a.error().message() );

    return *a;
  }

  math::amount amount( const std::string& field ) const
  {
    auto value = math::from_string( text( field ) );
    if( !value )
      fail( "field '" + field + "': " + value.error().message() );

    return *value;
  }

  bool flag( const std::string& field ) const
  {
    auto value = _node[ field ];
    if( !value || !value.IsScalar() )
      fail( "missing field '" + field + "'" );

    try
    {
      return value.as< bool >();
    }
    catch( const YAML::Exception& )
    {
      fail( "field '" + field + "' is not a boolean" );
    }
  }

  [[noreturn]] void fail( const std::string& reason ) const
  {
    throw std::runtime_error( "script entry " + std::to_string( _index ) + ": " + reason );
  }

private:
  const YAML::Node& _node;
  std::size_t _index;
};

outcome from_result( const std::string& operation, const ledger::result< bool >& r )
{
  if( r )
    return outcome{ operation, {}, *r };

  return outcome{ operation, r.error(), {} };
}

outcome from_error( const std::string& operation, std::error_code ec )
{
  return outcome{ operation, ec, {} };
}

using handler = std::function< outcome( ledger::ledger&, const protocol::account&, const entry_reader& ) >;

const std::map< std::string, handler, std::less<> >& handlers()
{
  // clang-format off
  static const std::map< std::string, handler, std::less<> > table{
    { "transfer", []( ledger::ledger& l, const protocol::account& caller, const entry_reader& e ) {
        return from_result( "transfer", l.transfer( caller, e.account( "to" ), e.amount( "value" ) ) );
      } },
    { "transfer_from", []( ledger::ledger& l, const protocol::account& caller, const entry_reader& e ) {
        return from_result( "transfer_from", l.transfer_from( caller, e.account( "from" ), e.account( "to" ), e.amount( "value" ) ) );
      } },
    { "approve", []( ledger::ledger& l, const protocol::account& caller, const entry_reader& e ) {
        return from_result( "approve", l.approve( caller, e.account( "spender" ), e.amount( "value" ) ) );
      } },
    { "increase_approval", []( ledger::ledger& l, const protocol::account& caller, const entry_reader& e ) {
        return from_result( "increase_approval", l.increase_approval( caller, e.account( "spender" ), e.amount( "value" ) ) );
      } },
    { "decrease_approval", []( ledger::ledger& l, const protocol::account& caller, const entry_reader& e ) {
        return from_result( "decrease_approval", l.decrease_approval( caller, e.account( "spender" ), e.amount( "value" ) ) );
      } },
    { "mint", []( ledger::ledger& l, const protocol::account& caller, const entry_reader& e ) {
        return from_error( "mint", l.mint( caller, e.amount( "amount" ) ) );
      } },
    { "burn_from", []( ledger::ledger& l, const protocol::account& caller, const entry_reader& e ) {
        return from_error( "burn_from", l.burn_from( caller, e.account( "from" ), e.amount( "amount" ) ) );
      } },
    { "burn_self", []( ledger::ledger& l, const protocol::account& caller, const entry_reader& e ) {
        return from_error( "burn_self", l.burn_self( caller, e.amount( "amount" ) ) );
      } },
    { "transfer_ownership", []( ledger::ledger& l, const protocol::account& caller, const entry_reader& e ) {
        return from_error( "transfer_ownership", l.transfer_ownership( caller, e.account( "new_owner" ) ) );
      } },
    { "set_mint_agent", []( ledger::ledger& l, const protocol::account& caller, const entry_reader& e ) {
        return from_error( "set_mint_agent", l.set_mint_agent( caller, e.account( "agent" ), e.flag( "enabled" ) ) );
      } }
  };
  // clang-format on

  return table;
}

} // namespace

std::vector< outcome > execute( ledger::ledger& l, const YAML::Node& script )
{
  if( !script.IsSequence() )
    throw std::runtime_error( "script must be a sequence of operations" );

  std::vector< outcome > outcomes;
  outcomes.reserve( script.size() );

  for( std::size_t i = 0; i < script.size(); ++i )
  {
    const YAML::Node node = script[ i ];
    entry_reader entry( node, i );

    auto operation = entry.text( "op" );
    auto handler   = handlers().find( operation );
    if( handler == handlers().end() )
      entry.fail( "unknown operation '" + operation + "'" );

    auto caller = entry.account( "caller" );
    auto result = handler->second( l, caller, entry );

    if( result.error )
      LOG_INFO( tessera::log::instance(), "[{}] {} failed: {}", i, operation, result.error.message() );
    else if( result.value )
      LOG_INFO( tessera::log::instance(), "[{}] {} returned {}", i, operation, *result.value );
    else
      LOG_INFO( tessera::log::instance(), "[{}] {} succeeded", i, operation );

    outcomes.emplace_back( std::move( result ) );
  }

  return outcomes;
}

std::vector< outcome > execute_file( ledger::ledger& l, const std::filesystem::path& path )
{
  if( !std::filesystem::exists( path ) )
    throw std::runtime_error( "unable to locate script at " + path.string() );

  return execute( l, YAML::LoadFile( path.string() ) );
}

} // namespace tessera::script
