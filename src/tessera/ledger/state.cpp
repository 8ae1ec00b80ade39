#include <tessera/ledger/state.hpp>

#include <algorithm>
#include <initializer_list>
#include <span>
#include <stdexcept>

#include <boost/endian.hpp>

namespace tessera::ledger { namespace state {

namespace key {

constexpr std::byte owner{ 0x00 };

} // namespace key

static state_db::object_key make_key( std::uint32_t space, std::initializer_list< std::span< const std::byte > > parts )
{
  std::uint32_t prefix = boost::endian::native_to_big( space );
  auto prefix_bytes    = std::as_bytes( std::span( &prefix, 1 ) );

  state_db::object_key key( prefix_bytes.begin(), prefix_bytes.end() );
  for( const auto& part: parts )
    key.insert( key.end(), part.begin(), part.end() );

  return key;
}

static math::amount read_amount( const state_db::state_delta& state, const state_db::object_key& key )
{
  auto object = state.get( key );
  if( !object )
    return 0;

  if( object->size() != math::amount_size )
    throw std::runtime_error( "encountered unexpected object while reading an amount" );

  return math::from_bytes( object->first< math::amount_size >() );
}

static void write_amount( state_db::state_delta& state, state_db::object_key&& key, const math::amount& value )
{
  if( value == 0 )
  {
    state.remove( std::move( key ) );
    return;
  }

  state.put( std::move( key ), math::to_bytes( value ) );
}

math::amount total_supply( const state_db::state_delta& state )
{
  return read_amount( state, make_key( space::supply, {} ) );
}

void set_total_supply( state_db::state_delta& state, const math::amount& value )
{
  write_amount( state, make_key( space::supply, {} ), value );
}

math::amount balance( const state_db::state_delta& state, const protocol::account& account )
{
  return read_amount( state, make_key( space::balance, { account } ) );
}

void set_balance( state_db::state_delta& state, const protocol::account& account, const math::amount& value )
{
  write_amount( state, make_key( space::balance, { account } ), value );
}

math::amount
allowance( const state_db::state_delta& state, const protocol::account& owner, const protocol::account& spender )
{
  return read_amount( state, make_key( space::allowance, { owner, spender } ) );
}

void set_allowance( state_db::state_delta& state,
                    const protocol::account& owner,
                    const protocol::account& spender,
                    const math::amount& value )
{
  write_amount( state, make_key( space::allowance, { owner, spender } ), value );
}

protocol::account owner( const state_db::state_delta& state )
{
  protocol::account account{};

  auto object = state.get( make_key( space::metadata, { std::span( &key::owner, 1 ) } ) );
  if( !object )
    return account;

  if( object->size() != account.size() )
    throw std::runtime_error( "encountered unexpected object while reading the owner" );

  std::ranges::copy( *object, account.begin() );
  return account;
}

void set_owner( state_db::state_delta& state, const protocol::account& account )
{
  state.put( make_key( space::metadata, { std::span( &key::owner, 1 ) } ), account );
}

bool mint_agent( const state_db::state_delta& state, const protocol::account& account )
{
  auto object = state.get( make_key( space::mint_agent, { account } ) );
  return object && !object->empty() && object->front() != std::byte{ 0x00 };
}

void set_mint_agent( state_db::state_delta& state, const protocol::account& account, bool enabled )
{
  if( !enabled )
  {
    state.remove( make_key( space::mint_agent, { account } ) );
    return;
  }

  constexpr std::byte flag{ 0x01 };
  state.put( make_key( space::mint_agent, { account } ), std::span( &flag, 1 ) );
}

}} // namespace tessera::ledger::state
