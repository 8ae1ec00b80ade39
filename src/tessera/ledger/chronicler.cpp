#include <tessera/ledger/chronicler.hpp>

#include <exception>

#include <tessera/log.hpp>

namespace tessera::ledger {

/*
 * Chronicler session
 */

void chronicler_session::push_event( protocol::event&& ev )
{
  _events.emplace_back( std::move( ev ) );
}

std::vector< protocol::event >& chronicler_session::events() noexcept
{
  return _events;
}

/*
 * Chronicler
 */

void chronicler::set_session( const std::shared_ptr< chronicler_session >& s ) noexcept
{
  _session = s;
}

void chronicler::push_event( protocol::event&& ev )
{
  if( auto session = _session.lock() )
  {
    session->push_event( std::move( ev ) );
    return;
  }

  const auto first = _events.size();
  append( std::move( ev ) );
  notify( first );
}

void chronicler::commit( chronicler_session& s )
{
  const auto first = _events.size();

  for( auto& ev: s.events() )
    append( std::move( ev ) );

  s.events().clear();
  notify( first );
}

void chronicler::subscribe( observer o )
{
  _observers.emplace_back( std::move( o ) );
}

const std::vector< protocol::event >& chronicler::events() const noexcept
{
  return _events;
}

void chronicler::append( protocol::event&& ev )
{
  ev.sequence = _seq_no++;
  _events.emplace_back( std::move( ev ) );
}

void chronicler::notify( std::size_t first ) const noexcept
{
  for( auto i = first; i < _events.size(); ++i )
  {
    for( const auto& o: _observers )
    {
      try
      {
        o( _events[ i ] );
      }
      catch( const std::exception& e )
      {
        LOG_ERROR( tessera::log::instance(),
                   "Observer failed on event {} ({}): {}",
                   _events[ i ].sequence,
                   _events[ i ].name,
                   e.what() );
      }
    }
  }
}

} // namespace tessera::ledger
