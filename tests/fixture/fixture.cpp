// NOLINTBEGIN

#include <test/fixture.hpp>

#include <stdexcept>

#include <tessera/log.hpp>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level ):
    _creator( make_account( 0xc0 ) ),
    _alice( make_account( 0xa1 ) ),
    _bob( make_account( 0xb0 ) ),
    _charlie( make_account( 0xc4 ) )
{
  tessera::log::initialize();
  tessera::log::set_level( log_level );

  auto genesis = tessera::ledger::make_genesis( _creator );
  if( !genesis )
    throw std::runtime_error( "unable to create genesis: " + genesis.error().message() );

  _genesis_data = *genesis;
  _ledger       = std::make_unique< tessera::ledger::ledger >( _genesis_data );

  LOG_INFO( tessera::log::instance(), "Initialized fixture {}", name );
}

fixture::~fixture() = default;

tessera::protocol::account fixture::make_account( std::uint8_t id ) noexcept
{
  tessera::protocol::account a{};
  a.front() = std::byte{ id };
  a.back()  = std::byte{ id };
  return a;
}

tessera::math::amount fixture::units( std::uint64_t value ) const
{
  auto scaled = tessera::ledger::scale_supply( value, _genesis_data.decimals );
  if( !scaled )
    throw std::runtime_error( "unable to scale amount: " + scaled.error().message() );

  return *scaled;
}

tessera::math::amount fixture::sum_of_balances() const
{
  tessera::math::amount sum = 0;
  for( const auto& a: { _creator, _alice, _bob, _charlie } )
    sum += _ledger->balance_of( a );

  return sum;
}

std::vector< tessera::protocol::event > fixture::events_named( std::string_view name ) const
{
  std::vector< tessera::protocol::event > matches;
  for( auto& ev: _ledger->events() )
    if( ev.name == name )
      matches.push_back( ev );

  return matches;
}

} // namespace test

// NOLINTEND
