#include <tessera/ledger/ledger.hpp>
#include <tessera/ledger/state.hpp>

#include <tessera/log.hpp>

#include <stdexcept>
#include <utility>

namespace tessera::ledger {

ledger::ledger( const genesis_data& data ):
    _state( std::make_shared< state_db::state_delta >() ),
    _name( data.name ),
    _symbol( data.symbol ),
    _decimals( data.decimals )
{
  if( data.creator.null() )
    throw std::runtime_error( "genesis creator must not be the null account" );

  state::set_total_supply( *_state, data.initial_supply );
  state::set_balance( *_state, data.creator, data.initial_supply );
  state::set_owner( *_state, data.creator );
  state::set_mint_agent( *_state, data.creator, true );

  LOG_INFO( tessera::log::instance(),
            "Created ledger {} ({}) - Supply: {}, Decimals: {}, Owner: {}",
            _name,
            _symbol,
            data.initial_supply,
            static_cast< unsigned int >( _decimals ),
            tessera::log::hex{ data.creator.data(), data.creator.size() } );
}

template< typename T, typename Operation >
result< T > ledger::apply( std::string_view operation, const protocol::account& caller, Operation&& op )
{
  std::lock_guard< std::mutex > lock( _mutex );

  auto state   = _state->make_child();
  auto session = std::make_shared< chronicler_session >();
  _chronicler.set_session( session );

  result< T > r = std::forward< Operation >( op )( *state );

  _chronicler.set_session( {} );

  if( !r )
  {
    LOG_DEBUG( tessera::log::instance(),
               "Rejected {} - Caller: {}, Reason: {}",
               operation,
               tessera::log::hex{ caller.data(), caller.size() },
               r.error().message() );
    return r;
  }

  state->squash();
  _chronicler.commit( *session );

  LOG_DEBUG( tessera::log::instance(),
             "Applied {} - Caller: {}",
             operation,
             tessera::log::hex{ caller.data(), caller.size() } );

  return r;
}

const std::string& ledger::name() const noexcept
{
  return _name;
}

const std::string& ledger::symbol() const noexcept
{
  return _symbol;
}

std::uint8_t ledger::decimals() const noexcept
{
  return _decimals;
}

math::amount ledger::total_supply() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return state::total_supply( *_state );
}

math::amount ledger::balance_of( const protocol::account& account ) const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return state::balance( *_state, account );
}

math::amount ledger::allowance( const protocol::account& owner, const protocol::account& spender ) const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return state::allowance( *_state, owner, spender );
}

protocol::account ledger::owner() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return state::owner( *_state );
}

bool ledger::mint_agent( const protocol::account& account ) const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return state::mint_agent( *_state, account );
}

result< bool > ledger::transfer( const protocol::account& caller, const protocol::account& to, const math::amount& value )
{
  return apply< bool >(
    "transfer",
    caller,
    [ & ]( state_db::state_delta& s ) -> result< bool >
    {
      if( to.null() )
        return std::unexpected( ledger_errc::invalid_argument );

      auto from_balance = state::balance( s, caller );

      if( value == 0 || from_balance < value )
        return false;

      auto debited = math::sub( from_balance, value );
      if( !debited )
        return std::unexpected( debited.error() );

      state::set_balance( s, caller, *debited );

      auto credited = math::add( state::balance( s, to ), value );
      if( !credited )
        return std::unexpected( credited.error() );

      state::set_balance( s, to, *credited );

      _chronicler.push_event( protocol::make_event( protocol::transfer_event{ caller, to, value } ) );
      return true;
    } );
}

result< bool > ledger::transfer_from( const protocol::account& caller,
                                      const protocol::account& from,
                                      const protocol::account& to,
                                      const math::amount& value )
{
  return apply< bool >(
    "transfer_from",
    caller,
    [ & ]( state_db::state_delta& s ) -> result< bool >
    {
      if( to.null() )
        return std::unexpected( ledger_errc::invalid_argument );

      if( value > state::balance( s, from ) )
        return std::unexpected( ledger_errc::insufficient_balance );

      auto allowance = state::allowance( s, from, caller );

      if( value > allowance )
        return std::unexpected( ledger_errc::insufficient_allowance );

      auto credited = math::add( state::balance( s, to ), value );
      if( !credited )
        return std::unexpected( credited.error() );

      state::set_balance( s, to, *credited );

      // Read after the credit so a transfer to oneself nets out
      auto debited = math::sub( state::balance( s, from ), value );
      if( !debited )
        return std::unexpected( debited.error() );

      state::set_balance( s, from, *debited );

      auto remaining = math::sub( allowance, value );
      if( !remaining )
        return std::unexpected( remaining.error() );

      state::set_allowance( s, from, caller, *remaining );

      _chronicler.push_event( protocol::make_event( protocol::transfer_event{ from, to, value } ) );
      return true;
    } );
}

result< bool > ledger::approve( const protocol::account& caller, const protocol::account& spender, const math::amount& value )
{
  return apply< bool >(
    "approve",
    caller,
    [ & ]( state_db::state_delta& s ) -> result< bool >
    {
      if( spender.null() )
        return std::unexpected( ledger_errc::invalid_argument );

      if( value != 0 && state::allowance( s, caller, spender ) != 0 )
        return std::unexpected( ledger_errc::allowance_race_condition );

      state::set_allowance( s, caller, spender, value );

      _chronicler.push_event( protocol::make_event( protocol::approval_event{ caller, spender, value } ) );
      return true;
    } );
}

result< bool > ledger::increase_approval( const protocol::account& caller,
                                          const protocol::account& spender,
                                          const math::amount& added_value )
{
  return apply< bool >(
    "increase_approval",
    caller,
    [ & ]( state_db::state_delta& s ) -> result< bool >
    {
      auto allowance = math::add( state::allowance( s, caller, spender ), added_value );
      if( !allowance )
        return std::unexpected( allowance.error() );

      state::set_allowance( s, caller, spender, *allowance );

      _chronicler.push_event( protocol::make_event( protocol::approval_event{ caller, spender, *allowance } ) );
      return true;
    } );
}

result< bool > ledger::decrease_approval( const protocol::account& caller,
                                          const protocol::account& spender,
                                          const math::amount& subtracted_value )
{
  return apply< bool >(
    "decrease_approval",
    caller,
    [ & ]( state_db::state_delta& s ) -> result< bool >
    {
      auto current = state::allowance( s, caller, spender );

      math::amount allowance = 0;
      if( subtracted_value <= current )
      {
        auto reduced = math::sub( current, subtracted_value );
        if( !reduced )
          return std::unexpected( reduced.error() );

        allowance = *reduced;
      }

      state::set_allowance( s, caller, spender, allowance );

      _chronicler.push_event( protocol::make_event( protocol::approval_event{ caller, spender, allowance } ) );
      return true;
    } );
}

std::error_code ledger::mint( const protocol::account& caller, const math::amount& amount )
{
  auto r = apply< void >( "mint",
                          caller,
                          [ & ]( state_db::state_delta& s ) -> result< void >
                          {
                            if( !state::mint_agent( s, caller ) )
                              return std::unexpected( ledger_errc::unauthorized );

                            auto supply = math::add( state::total_supply( s ), amount );
                            if( !supply )
                              return std::unexpected( supply.error() );

                            auto balance = math::add( state::balance( s, caller ), amount );
                            if( !balance )
                              return std::unexpected( balance.error() );

                            state::set_total_supply( s, *supply );
                            state::set_balance( s, caller, *balance );

                            _chronicler.push_event( protocol::make_event(
                              protocol::transfer_event{ protocol::null_account, caller, amount } ) );
                            _chronicler.push_event( protocol::make_event( protocol::mint_event{ caller, amount } ) );
                            return {};
                          } );

  return r ? std::error_code{} : r.error();
}

std::error_code ledger::burn( state_db::state_delta& s, const protocol::account& from, const math::amount& amount )
{
  auto balance = state::balance( s, from );

  if( amount == 0 || balance < amount )
    return ledger_errc::invalid_argument;

  auto remaining = math::sub( balance, amount );
  if( !remaining )
    return remaining.error();

  auto supply = math::sub( state::total_supply( s ), amount );
  if( !supply )
    return supply.error();

  state::set_balance( s, from, *remaining );
  state::set_total_supply( s, *supply );

  _chronicler.push_event( protocol::make_event( protocol::transfer_event{ from, protocol::null_account, amount } ) );
  _chronicler.push_event( protocol::make_event( protocol::burn_event{ from, amount } ) );
  return {};
}

std::error_code ledger::burn_from( const protocol::account& caller, const protocol::account& from, const math::amount& amount )
{
  auto r = apply< void >( "burn_from",
                          caller,
                          [ & ]( state_db::state_delta& s ) -> result< void >
                          {
                            if( state::owner( s ) != caller )
                              return std::unexpected( ledger_errc::unauthorized );

                            if( auto ec = burn( s, from, amount ); ec )
                              return std::unexpected( ec );

                            return {};
                          } );

  return r ? std::error_code{} : r.error();
}

std::error_code ledger::burn_self( const protocol::account& caller, const math::amount& amount )
{
  auto r = apply< void >( "burn_self",
                          caller,
                          [ & ]( state_db::state_delta& s ) -> result< void >
                          {
                            if( !state::mint_agent( s, caller ) )
                              return std::unexpected( ledger_errc::unauthorized );

                            if( auto ec = burn( s, caller, amount ); ec )
                              return std::unexpected( ec );

                            return {};
                          } );

  return r ? std::error_code{} : r.error();
}

std::error_code ledger::transfer_ownership( const protocol::account& caller, const protocol::account& new_owner )
{
  auto r = apply< void >( "transfer_ownership",
                          caller,
                          [ & ]( state_db::state_delta& s ) -> result< void >
                          {
                            auto current = state::owner( s );

                            if( current != caller )
                              return std::unexpected( ledger_errc::unauthorized );

                            if( new_owner.null() || new_owner == current )
                              return std::unexpected( ledger_errc::invalid_argument );

                            state::set_owner( s, new_owner );
                            return {};
                          } );

  if( !r )
    return r.error();

  LOG_INFO( tessera::log::instance(),
            "Ownership transferred - From: {}, To: {}",
            tessera::log::hex{ caller.data(), caller.size() },
            tessera::log::hex{ new_owner.data(), new_owner.size() } );

  return {};
}

std::error_code ledger::set_mint_agent( const protocol::account& caller, const protocol::account& agent, bool enabled )
{
  auto r = apply< void >( "set_mint_agent",
                          caller,
                          [ & ]( state_db::state_delta& s ) -> result< void >
                          {
                            if( state::owner( s ) != caller )
                              return std::unexpected( ledger_errc::unauthorized );

                            state::set_mint_agent( s, agent, enabled );

                            _chronicler.push_event(
                              protocol::make_event( protocol::mint_agent_changed_event{ agent, enabled } ) );
                            return {};
                          } );

  return r ? std::error_code{} : r.error();
}

std::vector< protocol::event > ledger::events() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _chronicler.events();
}

void ledger::subscribe( chronicler::observer o )
{
  std::lock_guard< std::mutex > lock( _mutex );
  _chronicler.subscribe( std::move( o ) );
}

} // namespace tessera::ledger
